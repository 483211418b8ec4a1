#include <iostream>
#include <OsqpEigen/OsqpEigen.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "optimizer.hpp"

// ---------------------------------------------------------
// 辅助函数
// ---------------------------------------------------------
const char* toString(OptimizationStatus status) {
    switch (status) {
        case OptimizationStatus::Converged:         return "Converged";
        case OptimizationStatus::MaxIterations:     return "MaxIterations";
        case OptimizationStatus::MaxEvaluations:    return "MaxEvaluations";
        case OptimizationStatus::QpFailure:         return "QpFailure";
        case OptimizationStatus::LineSearchFailure: return "LineSearchFailure";
        case OptimizationStatus::Infeasible:        return "Infeasible";
        case OptimizationStatus::EmptyBounds:       return "EmptyBounds";
    }
    return "Unknown";
}

ParameterBounds computeParameterBounds(const FrsModel& frs, double v0, double k1_bound) {
    const double v_max = frs.v_max;
    const double v_des_lo = std::max(v0 - frs.delta_v, frs.v_min);
    const double v_des_hi = std::min(v0 + frs.delta_v, frs.v_max);

    ParameterBounds bounds;
    bounds.lower.resize(2);
    bounds.upper.resize(2);
    bounds.lower << -k1_bound, (v_des_lo - v_max / 2.0) * (2.0 / v_max);
    bounds.upper <<  k1_bound, (v_des_hi - v_max / 2.0) * (2.0 / v_max);
    return bounds;
}

// 违反量之和 sum max(0, margin - g)
static double totalViolation(const Eigen::VectorXd& g, double margin) {
    return (margin - g.array()).max(0.0).sum();
}

static double maxViolation(const Eigen::VectorXd& g, double margin) {
    if (g.size() == 0) return 0.0;
    return std::max(0.0, (margin - g.array()).maxCoeff());
}

// ---------------------------------------------------------
// QP 子问题
// min 0.5 d'Bd + grad'd + rho t
// s.t. J d + t >= margin - g,  step_lower <= d <= step_upper,  t >= 0
// 松弛变量 t 保证线性化约束不相容时子问题仍可解
// ---------------------------------------------------------
bool TrajectoryOptimizer::solveQpSubproblem(const Eigen::MatrixXd& B,
                                            const Eigen::VectorXd& grad,
                                            const Eigen::VectorXd& g,
                                            const Eigen::MatrixXd& J,
                                            const Eigen::VectorXd& step_lower,
                                            const Eigen::VectorXd& step_upper,
                                            const OptimizationConfig& config,
                                            QpSolution& sol) {
    const int n = static_cast<int>(grad.size());
    const int m = static_cast<int>(g.size());
    const int total_vars = n + 1;
    const int num_constraints = m + n + 1;

    // 1. Hessian（上三角）
    Eigen::SparseMatrix<double> P(total_vars, total_vars);
    std::vector<Eigen::Triplet<double>> p_triplets;
    for (int i = 0; i < n; ++i) {
        for (int j = i; j < n; ++j) {
            if (B(i, j) != 0.0) p_triplets.emplace_back(i, j, B(i, j));
        }
    }
    p_triplets.emplace_back(n, n, 1e-8);
    P.setFromTriplets(p_triplets.begin(), p_triplets.end());

    Eigen::VectorXd q(total_vars);
    q << grad, config.elastic_weight;

    // 2. 约束
    std::vector<Eigen::Triplet<double>> A_triplets;
    Eigen::VectorXd l_e(num_constraints), u_e(num_constraints);
    int row = 0;
    for (int j = 0; j < m; ++j, ++row) {
        for (int i = 0; i < n; ++i) {
            if (J(j, i) != 0.0) A_triplets.emplace_back(row, i, J(j, i));
        }
        A_triplets.emplace_back(row, n, 1.0);
        l_e(row) = config.constraint_margin - g(j);
        u_e(row) = OsqpEigen::INFTY;
    }
    for (int i = 0; i < n; ++i, ++row) {
        A_triplets.emplace_back(row, i, 1.0);
        l_e(row) = step_lower(i);
        u_e(row) = step_upper(i);
    }
    A_triplets.emplace_back(row, n, 1.0);
    l_e(row) = 0.0;
    u_e(row) = OsqpEigen::INFTY;

    Eigen::SparseMatrix<double> A(num_constraints, total_vars);
    A.setFromTriplets(A_triplets.begin(), A_triplets.end());

    // 3. 求解
    OsqpEigen::Solver solver;
    solver.settings()->setVerbosity(false);
    solver.settings()->setWarmStart(false);
    solver.settings()->setPolish(true);
    solver.settings()->setAbsoluteTolerance(1e-9);
    solver.settings()->setRelativeTolerance(1e-9);
    solver.settings()->setMaxIteration(20000);

    solver.data()->setNumberOfVariables(total_vars);
    solver.data()->setNumberOfConstraints(num_constraints);
    if (!solver.data()->setHessianMatrix(P)) return false;
    if (!solver.data()->setGradient(q)) return false;
    if (!solver.data()->setLinearConstraintsMatrix(A)) return false;
    if (!solver.data()->setLowerBound(l_e)) return false;
    if (!solver.data()->setUpperBound(u_e)) return false;

    if (!solver.initSolver() || solver.solveProblem() != OsqpEigen::ErrorExitFlag::NoError) {
        std::cerr << "[Optimizer] OSQP Solve Error!" << std::endl;
        return false;
    }
    const OsqpEigen::Status status = solver.getStatus();
    if (status != OsqpEigen::Status::Solved && status != OsqpEigen::Status::SolvedInaccurate) {
        std::cerr << "[Optimizer] OSQP status " << static_cast<int>(status) << std::endl;
        return false;
    }

    const Eigen::VectorXd x = solver.getSolution();
    const Eigen::VectorXd y = solver.getDualSolution();
    if (!x.allFinite() || !y.allFinite()) return false;

    sol.step = x.head(n);
    sol.slack = std::max(0.0, x(n));
    sol.duals = y.head(m);
    return true;
}

// ---------------------------------------------------------
// 核心求解逻辑：SQP + 阻尼 BFGS + L1 罚函数回溯线搜索
// ---------------------------------------------------------
OptimizationResult TrajectoryOptimizer::solve(
    const CostFunction& cost,
    const ConstraintFunction& constraints,
    const ParameterBounds& bounds,
    const Eigen::VectorXd& initial_guess,
    OptimizationConfig config
) {
    OptimizationResult result;
    const int n = static_cast<int>(initial_guess.size());
    if (bounds.lower.size() != n || bounds.upper.size() != n) {
        result.status = OptimizationStatus::EmptyBounds;
        result.message = "bounds dimension does not match the initial guess";
        return result;
    }
    if (bounds.empty()) {
        result.status = OptimizationStatus::EmptyBounds;
        result.message = "parameter bounds are empty";
        std::cerr << "[Optimizer] " << result.message << std::endl;
        return result;
    }

    const double margin = config.constraint_margin;
    auto clampToBox = [&](const Eigen::VectorXd& v) {
        return Eigen::VectorXd(v.cwiseMax(bounds.lower).cwiseMin(bounds.upper));
    };

    // 1. 初值与首次求值
    Eigen::VectorXd k = clampToBox(initial_guess);
    Eigen::VectorXd grad_f, g;
    Eigen::MatrixXd J;
    double f = cost(k, grad_f);
    constraints(k, g, J);
    int evaluations = 1;

    Eigen::MatrixXd B = Eigen::MatrixXd::Identity(n, n);
    double mu = 1.0; // L1 罚参数，只增不减
    OptimizationStatus status = OptimizationStatus::MaxIterations;
    int iter = 0;

    for (iter = 1; iter <= config.max_iterations; ++iter) {
        const double viol = totalViolation(g, margin);
        const double max_viol = maxViolation(g, margin);

        // 2. QP 子问题
        QpSolution qp;
        if (!solveQpSubproblem(B, grad_f, g, J, bounds.lower - k, bounds.upper - k, config, qp)) {
            status = OptimizationStatus::QpFailure;
            break;
        }
        const Eigen::VectorXd& d = qp.step;
        const double step_norm = d.lpNorm<Eigen::Infinity>();
        // QP 的 KKT：B d + grad_f + A'y = 0，因此 |B d| 即原问题拉格朗日梯度
        const double kkt_residual = (B * d).lpNorm<Eigen::Infinity>();
        // 互补松弛 |y_j (g_j - margin)|
        const double complementarity = qp.duals.size() > 0
            ? (qp.duals.array() * (g.array() - margin)).abs().maxCoeff() : 0.0;

        if (config.verbose) {
            std::cout << "[Optimizer] iter " << iter << " f = " << f
                      << " max_viol = " << max_viol << " |d| = " << step_norm
                      << " |Bd| = " << kkt_residual << " compl = " << complementarity
                      << " slack = " << qp.slack << std::endl;
        }

        // 3. 收敛判断
        // |Bd| 依赖 B 的尺度（拉格朗日曲率退化时 B 趋于 0），必须同时要求步长足够小
        const bool stationary = kkt_residual <= config.optimality_tolerance &&
                                complementarity <= config.optimality_tolerance &&
                                step_norm <= config.optimality_tolerance;
        if (max_viol <= config.constraint_tolerance &&
            (step_norm <= config.step_tolerance || stationary)) {
            status = OptimizationStatus::Converged;
            break;
        }
        if (step_norm <= config.step_tolerance) {
            // 不可行点上的驻点：线性化约束无法满足
            status = OptimizationStatus::Infeasible;
            break;
        }

        // 4. 罚参数更新
        if (qp.duals.size() > 0) {
            mu = std::max(mu, 1.1 * qp.duals.cwiseAbs().maxCoeff() + 1e-3);
        }

        // 5. 回溯线搜索
        const double lin_viol = g.size() > 0
            ? (margin - (g + J * d).array()).max(0.0).sum() : 0.0;
        const double phi0 = f + mu * viol;
        const double D = std::min(grad_f.dot(d) + mu * (lin_viol - viol), -1e-12);

        double alpha = 1.0;
        bool accepted = false;
        bool out_of_budget = false;
        Eigen::VectorXd k_new, grad_new, g_new;
        Eigen::MatrixXd J_new;
        double f_new = f;
        while (alpha >= 1e-10) {
            if (evaluations >= config.max_evaluations) {
                out_of_budget = true;
                break;
            }
            k_new = clampToBox(k + alpha * d);
            f_new = cost(k_new, grad_new);
            constraints(k_new, g_new, J_new);
            ++evaluations;
            const double phi = f_new + mu * totalViolation(g_new, margin);
            if (std::isfinite(phi) && phi <= phi0 + 1e-4 * alpha * D) {
                accepted = true;
                break;
            }
            alpha *= 0.5;
        }
        if (out_of_budget) {
            status = OptimizationStatus::MaxEvaluations;
            break;
        }
        if (!accepted) {
            status = max_viol > config.constraint_tolerance
                ? OptimizationStatus::Infeasible : OptimizationStatus::LineSearchFailure;
            break;
        }

        // 6. 阻尼 BFGS（Powell）
        const Eigen::VectorXd s = k_new - k;
        Eigen::VectorXd y = grad_new - grad_f;
        if (qp.duals.size() > 0) {
            y += (J_new - J).transpose() * qp.duals;
        }
        const Eigen::VectorXd Bs = B * s;
        const double sBs = s.dot(Bs);
        if (sBs > 1e-16) {
            const double sy = s.dot(y);
            const double theta = sy >= 0.2 * sBs ? 1.0 : 0.8 * sBs / (sBs - sy);
            const Eigen::VectorXd r = theta * y + (1.0 - theta) * Bs;
            B += r * r.transpose() / s.dot(r) - Bs * Bs.transpose() / sBs;
        }

        k = k_new;
        f = f_new;
        grad_f = grad_new;
        g = g_new;
        J = J_new;
    }
    if (iter > config.max_iterations) {
        status = OptimizationStatus::MaxIterations;
        iter = config.max_iterations;
    }

    result.iterations = iter;
    result.evaluations = evaluations;
    result.cost = f;
    result.max_violation = maxViolation(g, margin);

    // 7. 不接受任何违反约束或盒约束的解
    const bool in_box = ((k - bounds.lower).array() >= -config.constraint_tolerance).all() &&
                        ((bounds.upper - k).array() >= -config.constraint_tolerance).all();
    if (status == OptimizationStatus::Converged &&
        (result.max_violation > config.constraint_tolerance || !in_box || !k.allFinite())) {
        status = OptimizationStatus::Infeasible;
    }

    result.status = status;
    if (status == OptimizationStatus::Converged) {
        result.k = k;
        result.message = "feasible local optimum";
        std::cout << "[Optimizer] Converged after " << iter << " iterations, cost = "
                  << f << std::endl;
    } else {
        result.message = std::string("no feasible trajectory parameter: ") + toString(status);
        std::cerr << "[Optimizer] " << result.message << " (iterations = " << iter
                  << ", max violation = " << result.max_violation << ")" << std::endl;
    }
    return result;
}
