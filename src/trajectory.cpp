#include "trajectory.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

// 0, dt, 2dt, ...，并保证包含 t_total
static std::vector<double> timeSamples(double t_total, double dt) {
    if (!(dt > 0.0)) {
        throw std::invalid_argument("trajectory: time step must be positive");
    }
    std::vector<double> T;
    const int n = static_cast<int>(std::floor(t_total / dt + 1e-9));
    T.reserve(n + 2);
    for (int i = 0; i <= n; ++i) T.push_back(i * dt);
    if (t_total - T.back() > 1e-9) T.push_back(t_total);
    return T;
}

// 恒定 (w, v) 下走 dt 的圆弧
static void unicycleStep(double& x, double& y, double& h, double w, double v, double dt) {
    if (std::abs(w) < 1e-9) {
        x += v * dt * std::cos(h);
        y += v * dt * std::sin(h);
    } else {
        const double h_next = h + w * dt;
        x += v / w * (std::sin(h_next) - std::sin(h));
        y += v / w * (std::cos(h) - std::cos(h_next));
        h = h_next;
    }
}

Trajectory makeBrakingTrajectory(const AgentState& s0,
                                 double t_plan,
                                 double t_stop,
                                 double w_des,
                                 double v_des,
                                 double dt) {
    if (t_plan < 0.0 || t_stop < 0.0) {
        throw std::invalid_argument("makeBrakingTrajectory: negative duration");
    }
    // t_plan 之后控制量线性衰减
    auto scale = [&](double t) {
        if (t <= t_plan) return 1.0;
        if (t_stop <= 0.0) return 0.0;
        return std::max(0.0, 1.0 - (t - t_plan) / t_stop);
    };

    Trajectory traj;
    traj.T = timeSamples(t_plan + t_stop, dt);
    const int N = static_cast<int>(traj.T.size());
    traj.U.resize(2, N);
    traj.Z.resize(4, N);

    double x = s0.x, y = s0.y, h = s0.h;
    for (int i = 0; i < N; ++i) {
        const double s = scale(traj.T[i]);
        traj.U(0, i) = w_des * s;
        traj.U(1, i) = v_des * s;
        traj.Z.col(i) << x, y, h, v_des * s;
        if (i + 1 < N) {
            const double step = traj.T[i + 1] - traj.T[i];
            const double s_mid = scale(0.5 * (traj.T[i] + traj.T[i + 1]));
            unicycleStep(x, y, h, w_des * s_mid, v_des * s_mid, step);
        }
    }
    return traj;
}

Trajectory makeStoppingTrajectory(const AgentState& s0, double max_decel, double dt) {
    if (!(max_decel > 0.0)) {
        throw std::invalid_argument("makeStoppingTrajectory: max deceleration must be positive");
    }
    const double v0 = std::max(0.0, s0.v);

    Trajectory traj;
    if (v0 == 0.0) {
        // 已静止：单个零速样本
        traj.T = {0.0};
        traj.U = Eigen::Matrix2Xd::Zero(2, 1);
        traj.Z.resize(4, 1);
        traj.Z.col(0) << s0.x, s0.y, s0.h, 0.0;
        return traj;
    }

    const double t_stop = v0 / max_decel;
    traj.T = timeSamples(t_stop, dt);
    const int N = static_cast<int>(traj.T.size());
    traj.U.resize(2, N);
    traj.Z.resize(4, N);

    const double c = std::cos(s0.h), s = std::sin(s0.h);
    for (int i = 0; i < N; ++i) {
        const double t = traj.T[i];
        const double v = (i + 1 == N) ? 0.0 : std::max(0.0, v0 - max_decel * t);
        // 匀减速位移
        const double d = v0 * t - 0.5 * max_decel * t * t;
        traj.U(0, i) = 0.0;
        traj.U(1, i) = v;
        traj.Z.col(i) << s0.x + d * c, s0.y + d * s, s0.h, v;
    }
    return traj;
}

MaterializedPlan materializeTrajectory(const OptimizationResult& result,
                                       const FrsModel& frs,
                                       const AgentState& state,
                                       double max_decel,
                                       double dt) {
    MaterializedPlan plan;
    if (!result.ok() || result.k.size() != static_cast<int>(frs.k_vars.size())) {
        std::cerr << "[Trajectory] 无安全轨迹参数，执行制动 (" << result.message << ")\n";
        plan.braking_only = true;
        plan.trajectory = makeStoppingTrajectory(state, max_decel, dt);
        return plan;
    }
    if (!(max_decel > 0.0)) {
        throw std::invalid_argument("materializeTrajectory: max deceleration must be positive");
    }

    plan.braking_only = false;
    plan.w_des = frs.w_des.evaluate(result.k);
    plan.v_des = std::max(0.0, frs.v_des.evaluate(result.k));
    const double t_stop = plan.v_des / max_decel;
    plan.trajectory = makeBrakingTrajectory(state, frs.t_plan, t_stop,
                                            plan.w_des, plan.v_des, dt);
    std::cout << "[Trajectory] w_des = " << plan.w_des << " rad/s, v_des = " << plan.v_des
              << " m/s, t_stop = " << t_stop << " s\n";
    return plan;
}
