#pragma once
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "frs_model.hpp"
#include "polynomial.hpp"

// 按状态变量指数模式分组的 FRS 多项式
// p(k, z) = sum_i sum_j coeffs(i, j) * z^state_exps.row(i) * k^param_exps.row(j)
struct FrsPolynomialStructure {
    std::vector<std::string> param_vars;
    std::vector<std::string> state_vars;
    Eigen::MatrixXi param_exps; // M_k x n_k
    Eigen::MatrixXi state_exps; // M_z x n_z
    Eigen::MatrixXd coeffs;     // M_z x M_k
};

// 障碍物约束集合：第 j 项对应第 j 个采样点
// 约定 g_j(k) = 1 - I(k, z_j)，g_j >= margin 表示该点不在 FRS(k) 内
struct ConstraintSet {
    std::vector<Polynomial> polynomials;
    std::vector<std::vector<Polynomial>> gradients;

    size_t size() const { return polynomials.size(); }
    bool empty() const { return polynomials.empty(); }

    // values: m，jacobian: m x n_k
    void evaluate(const Eigen::VectorXd& k, Eigen::VectorXd& values,
                  Eigen::MatrixXd& jacobian) const;
};

// 分解多项式，state_vars ∪ param_vars 必须恰好是 poly 的变量
FrsPolynomialStructure decompose(const Polynomial& poly,
                                 const std::vector<std::string>& state_vars,
                                 const std::vector<std::string>& param_vars);

// 在每个采样点（points 每列一个 z）代入状态变量，输出与点同序
std::vector<Polynomial> evaluateOnPoints(const FrsPolynomialStructure& structure,
                                         const Eigen::MatrixXd& points);

// h(k, z) = 1 - I(k, z)：FRS 外部为非负
Polynomial frsConstraintPolynomial(const FrsModel& frs);

// 完整流程：取负偏移 -> 分解 -> 代入 -> 求梯度
ConstraintSet buildConstraintSet(const FrsModel& frs, const Eigen::Matrix2Xd& points_frs);
