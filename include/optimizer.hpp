#pragma once
#include <functional>
#include <string>
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include "frs_model.hpp"

struct OptimizationConfig {
    int max_iterations = 1000;          // SQP 迭代上限
    int max_evaluations = 100000;       // 代价/约束求值上限
    double optimality_tolerance = 1e-3; // 一阶最优性、互补松弛与收敛步长 (|d|∞)
    double constraint_tolerance = 1e-6; // 允许的约束违反量
    double step_tolerance = 1e-8;
    double constraint_margin = 0.0;     // 要求 g(k) >= margin
    double elastic_weight = 1e4;        // QP 子问题中松弛变量的权重
    bool verbose = false;
};

enum class OptimizationStatus {
    Converged,         // 找到可行局部最优
    MaxIterations,
    MaxEvaluations,
    QpFailure,
    LineSearchFailure,
    Infeasible,
    EmptyBounds,
};

const char* toString(OptimizationStatus status);

// 参数盒约束
struct ParameterBounds {
    Eigen::VectorXd lower;
    Eigen::VectorXd upper;

    bool empty() const { return (lower.array() > upper.array()).any(); }
};

// 优化结果：只有 ok() 时 k 才可用于生成轨迹
struct OptimizationResult {
    OptimizationStatus status = OptimizationStatus::Infeasible;
    Eigen::VectorXd k;
    double cost = 0.0;
    double max_violation = 0.0;
    int iterations = 0;
    int evaluations = 0;
    std::string message;

    bool ok() const { return status == OptimizationStatus::Converged; }
};

// f(k)，同时写出梯度
using CostFunction = std::function<double(const Eigen::VectorXd&, Eigen::VectorXd&)>;
// g(k) 与雅可比 (m x n)，约定 g >= margin 为可行
using ConstraintFunction =
    std::function<void(const Eigen::VectorXd&, Eigen::VectorXd&, Eigen::MatrixXd&)>;

// k1 ∈ [-k1_bound, k1_bound]
// k2 由 [v0 - delta_v, v0 + delta_v] ∩ [v_min, v_max] 经 k2 = (v - v_max/2) * 2 / v_max 映射
ParameterBounds computeParameterBounds(const FrsModel& frs, double v0, double k1_bound = 1.0);

class TrajectoryOptimizer {
public:
    TrajectoryOptimizer() = default;

    // 带盒约束的非线性规划入口（SQP + OSQP 子问题）
    OptimizationResult solve(
        const CostFunction& cost,
        const ConstraintFunction& constraints,
        const ParameterBounds& bounds,
        const Eigen::VectorXd& initial_guess,
        OptimizationConfig config = OptimizationConfig()
    );

private:
    struct QpSolution {
        Eigen::VectorXd step;
        double slack = 0.0;
        Eigen::VectorXd duals; // 非线性约束行的对偶变量（OSQP 符号约定）
    };

    bool solveQpSubproblem(const Eigen::MatrixXd& B,
                           const Eigen::VectorXd& grad,
                           const Eigen::VectorXd& g,
                           const Eigen::MatrixXd& J,
                           const Eigen::VectorXd& step_lower,
                           const Eigen::VectorXd& step_upper,
                           const OptimizationConfig& config,
                           QpSolution& sol);
};
