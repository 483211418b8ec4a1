#pragma once
#include <vector>
#include <Eigen/Dense>
#include "frs_model.hpp"
#include "optimizer.hpp"

// 独轮车状态：位置、航向、速度
struct AgentState {
    double x = 0.0;
    double y = 0.0;
    double h = 0.0;
    double v = 0.0;
};

// 时间参数化轨迹：T(i) 时刻的控制 (w, v) 与状态 (x, y, h, v)
struct Trajectory {
    std::vector<double> T;
    Eigen::Matrix2Xd U;
    Eigen::Matrix4Xd Z;

    bool empty() const { return T.empty(); }
    double duration() const { return T.empty() ? 0.0 : T.back(); }
    size_t size() const { return T.size(); }
};

// [0, t_plan] 内保持 (w_des, v_des)，之后在 t_stop 内线性减到 0
// 状态从 s0 出发逐段按圆弧积分
Trajectory makeBrakingTrajectory(const AgentState& s0,
                                 double t_plan,
                                 double t_stop,
                                 double w_des,
                                 double v_des,
                                 double dt = 0.01);

// 仅制动：w = 0，以 max_decel 从当前速度减到 0
Trajectory makeStoppingTrajectory(const AgentState& s0, double max_decel, double dt = 0.01);

struct MaterializedPlan {
    bool braking_only = true;
    double w_des = 0.0;
    double v_des = 0.0;
    Trajectory trajectory;
};

// 优化成功：代入 w_des(k)、v_des(k) 生成制动轨迹；失败：退回仅制动轨迹
MaterializedPlan materializeTrajectory(const OptimizationResult& result,
                                       const FrsModel& frs,
                                       const AgentState& state,
                                       double max_decel,
                                       double dt = 0.01);
