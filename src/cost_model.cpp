#include "cost_model.hpp"

CostModel::CostModel(const FrsModel& frs, const Eigen::Vector2d& goal_frs)
    : x_des_(frs.x_des),
      y_des_(frs.y_des),
      dx_dk_(gradient(frs.x_des)),
      dy_dk_(gradient(frs.y_des)),
      goal_(goal_frs) {}

double CostModel::evaluate(const Eigen::VectorXd& k, Eigen::VectorXd& grad) const {
    const double ex = x_des_.evaluate(k) - goal_.x();
    const double ey = y_des_.evaluate(k) - goal_.y();

    grad.resize(k.size());
    for (int i = 0; i < k.size(); ++i) {
        grad(i) = 2.0 * ex * dx_dk_[i].evaluate(k) + 2.0 * ey * dy_dk_[i].evaluate(k);
    }
    return ex * ex + ey * ey;
}
