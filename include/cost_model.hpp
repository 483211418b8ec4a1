#pragma once
#include <vector>
#include <Eigen/Dense>
#include "frs_model.hpp"
#include "polynomial.hpp"

// 目标代价：FRS 预测终点与局部目标点的距离平方
// f(k) = (x_des(k) - gx)^2 + (y_des(k) - gy)^2，梯度按链式法则解析求得
class CostModel {
public:
    CostModel(const FrsModel& frs, const Eigen::Vector2d& goal_frs);

    double evaluate(const Eigen::VectorXd& k, Eigen::VectorXd& grad) const;

    const Eigen::Vector2d& goal() const { return goal_; }

private:
    Polynomial x_des_;
    Polynomial y_des_;
    std::vector<Polynomial> dx_dk_;
    std::vector<Polynomial> dy_dk_;
    Eigen::Vector2d goal_;
};
