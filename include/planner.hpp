#pragma once
#include <vector>
#include <Eigen/Dense>
#include "agent.hpp"
#include "constraint_builder.hpp"
#include "frs_model.hpp"
#include "obstacle_discretizer.hpp"
#include "optimizer.hpp"
#include "polygon.hpp"
#include "trajectory.hpp"

struct PlannerConfig {
    double obstacle_buffer = 0.05;  // 障碍物外扩 (m)
    double point_spacing = 0.0;     // <= 0 时由机身半径与外扩量计算
    double k1_bound = 1.0;
    double trajectory_dt = 0.01;
    OptimizationConfig optimization;
};

// 单次规划的全部结果
struct PlanResult {
    OptimizationResult optimization;
    MaterializedPlan plan;
    std::vector<DiscretizedObstacle> obstacles;
    ConstraintSet constraints;
    ParameterBounds bounds;
    Eigen::Vector2d goal_frs = Eigen::Vector2d::Zero();

    bool ok() const { return optimization.ok(); }
};

// 生成约束 -> 优化 -> 生成轨迹（失败时为仅制动轨迹）
// 配置错误（机身/减速度/外扩量非法、FRS 不合法）抛 std::invalid_argument
PlanResult planTrajectory(const FrsModel& frs,
                          const AgentState& state,
                          double footprint_radius,
                          double max_decel,
                          const std::vector<Polygon>& obstacles,
                          const Eigen::Vector2d& goal_world,
                          const PlannerConfig& config = PlannerConfig());

// 从 agent 读取状态，规划并执行
PlanResult planAndExecute(const FrsModel& frs,
                          Agent& agent,
                          const std::vector<Polygon>& obstacles,
                          const Eigen::Vector2d& goal_world,
                          const PlannerConfig& config = PlannerConfig());
