#pragma once
#include <vector>
#include "trajectory.hpp"

// 机器人接口：规划核心只需要当前状态、机身尺寸、最大减速度和轨迹执行
class Agent {
public:
    virtual ~Agent() = default;

    virtual AgentState state() const = 0;
    virtual double footprintRadius() const = 0;
    virtual double maxDecel() const = 0;

    // 执行 [0, duration] 内的轨迹
    virtual void execute(double duration, const Trajectory& traj) = 0;
};

// 理想跟踪的运动学独轮车（Turtlebot 尺寸）
class UnicycleAgent : public Agent {
public:
    explicit UnicycleAgent(double footprint = 0.175, double max_decel = 2.0);

    void reset(const AgentState& s);

    AgentState state() const override { return state_; }
    double footprintRadius() const override { return footprint_; }
    double maxDecel() const override { return max_decel_; }

    void execute(double duration, const Trajectory& traj) override;

    // 已执行的状态历史（含初始状态）
    const std::vector<AgentState>& history() const { return history_; }
    double time() const { return time_; }

private:
    double footprint_;
    double max_decel_;
    double time_ = 0.0;
    AgentState state_;
    std::vector<AgentState> history_;
};
