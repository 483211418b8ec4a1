#include "agent.hpp"
#include <algorithm>
#include <stdexcept>

UnicycleAgent::UnicycleAgent(double footprint, double max_decel)
    : footprint_(footprint), max_decel_(max_decel) {
    if (!(footprint > 0.0) || !(max_decel > 0.0)) {
        throw std::invalid_argument("UnicycleAgent: footprint and max deceleration must be positive");
    }
    history_.push_back(state_);
}

void UnicycleAgent::reset(const AgentState& s) {
    state_ = s;
    time_ = 0.0;
    history_.assign(1, s);
}

static AgentState sampleAt(const Trajectory& traj, int i) {
    return {traj.Z(0, i), traj.Z(1, i), traj.Z(2, i), traj.Z(3, i)};
}

void UnicycleAgent::execute(double duration, const Trajectory& traj) {
    if (traj.empty() || duration <= 0.0) return;

    // 轨迹样本与实际时间对齐，跟踪误差视为 0
    const double t_end = std::min(duration, traj.duration());
    const int N = static_cast<int>(traj.size());
    int i = 1;
    for (; i < N && traj.T[i] <= t_end + 1e-12; ++i) {
        history_.push_back(sampleAt(traj, i));
    }

    AgentState last = sampleAt(traj, i - 1);
    if (i < N && traj.T[i - 1] < t_end) {
        // 在 t_end 处线性插值
        const double a = (t_end - traj.T[i - 1]) / (traj.T[i] - traj.T[i - 1]);
        const Eigen::Vector4d z = (1.0 - a) * traj.Z.col(i - 1) + a * traj.Z.col(i);
        last = {z(0), z(1), z(2), z(3)};
        history_.push_back(last);
    }
    state_ = last;
    time_ += t_end;
}
