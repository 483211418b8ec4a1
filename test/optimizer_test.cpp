#include <cassert>
#include <cmath>
#include <cstdio>
#include <string>
#include "frs_model.hpp"
#include "optimizer.hpp"

static inline bool near(double a, double b, double tol=1e-9) {
    return std::abs(a-b) <= tol;
}

static ParameterBounds unitBox() {
    ParameterBounds b;
    b.lower = Eigen::Vector2d(-1.0, -1.0);
    b.upper = Eigen::Vector2d(1.0, 1.0);
    return b;
}

// (k1 - a)^2 + (k2 - b)^2
static CostFunction shiftedQuadratic(double a, double b) {
    return [a, b](const Eigen::VectorXd& k, Eigen::VectorXd& grad) {
        grad.resize(2);
        grad << 2.0 * (k(0) - a), 2.0 * (k(1) - b);
        return (k(0) - a) * (k(0) - a) + (k(1) - b) * (k(1) - b);
    };
}

static void noConstraints(const Eigen::VectorXd& k, Eigen::VectorXd& g, Eigen::MatrixXd& J) {
    g.resize(0);
    J.resize(0, k.size());
}

int main() {
    TrajectoryOptimizer optimizer;
    const Eigen::VectorXd zero = Eigen::VectorXd::Zero(2);

    // 参数范围
    {
        FrsModel frs = makeTurtlebotFrs(0.5, 1.0);
        assert(near(frs.v_min, 0.0) && near(frs.v_max, 1.5));
        ParameterBounds b = computeParameterBounds(frs, 0.5);
        assert(near(b.lower(0), -1.0) && near(b.upper(0), 1.0));
        assert(near(b.lower(1), -1.0, 1e-12));
        assert(near(b.upper(1), 1.0 / 3.0, 1e-12));
        assert(!b.empty());

        ParameterBounds b2 = computeParameterBounds(frs, 1.0, 0.5);
        assert(near(b2.upper(0), 0.5));
        assert(near(b2.upper(1), 1.0, 1e-12));

        // 初速度超出 FRS 速度范围：空
        FrsModel slow = makeTurtlebotFrs(0.0, 0.5);
        assert(computeParameterBounds(slow, 3.0).empty());
    }

    // 无约束二次函数
    {
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.3, -0.2), noConstraints,
                                               unitBox(), zero);
        assert(r.ok());
        assert(near(r.k(0), 0.3, 1e-4));
        assert(near(r.k(1), -0.2, 1e-4));
        assert(r.cost < 1e-8);
        assert(r.iterations >= 1 && r.evaluations >= 1);
    }

    // 最优点在盒约束边界上
    {
        OptimizationResult r = optimizer.solve(shiftedQuadratic(2.0, 0.0), noConstraints,
                                               unitBox(), zero);
        assert(r.ok());
        assert(near(r.k(0), 1.0, 1e-6));
        assert(near(r.k(1), 0.0, 1e-4));
    }

    // 圆形禁区：g = (k1 - 0.5)^2 + k2^2 - 0.09 >= 0
    {
        ConstraintFunction disk = [](const Eigen::VectorXd& k, Eigen::VectorXd& g,
                                     Eigen::MatrixXd& J) {
            g.resize(1);
            J.resize(1, 2);
            g(0) = (k(0) - 0.5) * (k(0) - 0.5) + k(1) * k(1) - 0.09;
            J << 2.0 * (k(0) - 0.5), 2.0 * k(1);
        };
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.5, 0.0), disk, unitBox(), zero);
        assert(r.ok());
        assert(near(r.cost, 0.09, 1e-4));
        Eigen::VectorXd g;
        Eigen::MatrixXd J;
        disk(r.k, g, J);
        assert(g(0) >= -1e-6);
        assert(r.max_violation <= 1e-6);
        // 拉格朗日曲率在圆上为 0：必须停在圆上，而不是圆内侧
        assert(g(0) <= 1e-4);
        assert(near(r.k(0), 0.2, 1e-4));
        assert(std::abs(r.k(1)) < 1e-4);

        // 要求余量
        OptimizationConfig config;
        config.constraint_margin = 0.05;
        OptimizationResult rm = optimizer.solve(shiftedQuadratic(0.5, 0.0), disk, unitBox(),
                                                zero, config);
        assert(rm.ok());
        disk(rm.k, g, J);
        assert(g(0) >= 0.05 - 1e-6);
        assert(g(0) <= 0.05 + 1e-4);
        assert(near(rm.cost, 0.14, 1e-4));
    }

    // 约束处处不可满足
    {
        ConstraintFunction impossible = [](const Eigen::VectorXd& k, Eigen::VectorXd& g,
                                           Eigen::MatrixXd& J) {
            g.resize(1);
            J.resize(1, 2);
            g(0) = -1.0 - k(0) * k(0);
            J << -2.0 * k(0), 0.0;
        };
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.0, 0.0), impossible,
                                               unitBox(), zero);
        assert(!r.ok());
        assert(r.k.size() == 0);
        assert(r.max_violation >= 1.0);
        assert(!r.message.empty());
    }

    // 空参数范围
    {
        ParameterBounds b;
        b.lower = Eigen::Vector2d(0.0, 1.0);
        b.upper = Eigen::Vector2d(1.0, 0.0);
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.0, 0.0), noConstraints, b, zero);
        assert(r.status == OptimizationStatus::EmptyBounds);
        assert(!r.ok());
        assert(r.iterations == 0);
    }

    // 宽度为 0 的参数范围：k2 固定
    {
        ParameterBounds b = unitBox();
        b.lower(1) = 0.2;
        b.upper(1) = 0.2;
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.3, -0.2), noConstraints, b, zero);
        assert(r.ok());
        assert(near(r.k(0), 0.3, 1e-4));
        assert(near(r.k(1), 0.2, 1e-9));
    }

    // 迭代上限
    {
        OptimizationConfig config;
        config.max_iterations = 1;
        OptimizationResult r = optimizer.solve(shiftedQuadratic(0.3, -0.2), noConstraints,
                                               unitBox(), zero, config);
        assert(r.status == OptimizationStatus::MaxIterations);
        assert(!r.ok());
        assert(r.iterations == 1);
    }

    assert(std::string(toString(OptimizationStatus::Converged)) == "Converged");

    std::printf("PASS: optimizer checks\n");
    return 0;
}
