#include "planner.hpp"
#include <iostream>
#include <stdexcept>
#include "cost_model.hpp"
#include "frame_transform.hpp"

PlanResult planTrajectory(const FrsModel& frs,
                          const AgentState& state,
                          double footprint_radius,
                          double max_decel,
                          const std::vector<Polygon>& obstacles,
                          const Eigen::Vector2d& goal_world,
                          const PlannerConfig& config) {
    // 配置检查：任何一项失败都不产生部分结果
    frs.validate();
    if (!(max_decel > 0.0)) {
        throw std::invalid_argument("planTrajectory: max deceleration must be positive");
    }
    const double spacing = config.point_spacing > 0.0
        ? config.point_spacing
        : computePointSpacing(footprint_radius, config.obstacle_buffer);

    PlanResult result;
    const Pose2D pose{state.x, state.y, state.h};

    // 1. 障碍物离散，采样点依障碍物顺序拼接
    int num_points = 0;
    for (const auto& obs : obstacles) {
        result.obstacles.push_back(
            discretizeObstacle(obs, pose, config.obstacle_buffer, spacing, frs));
        num_points += static_cast<int>(result.obstacles.back().points_frs.cols());
    }
    Eigen::Matrix2Xd points_frs(2, num_points);
    int col = 0;
    for (const auto& d : result.obstacles) {
        points_frs.middleCols(col, d.points_frs.cols()) = d.points_frs;
        col += static_cast<int>(d.points_frs.cols());
    }

    // 2. 约束多项式与梯度
    result.constraints = buildConstraintSet(frs, points_frs);
    std::cout << "[Planner] " << obstacles.size() << " obstacle(s), "
              << result.constraints.size() << " constraint point(s), spacing = "
              << spacing << " m\n";

    // 3. 代价：目标点变换到 FRS 系
    Eigen::Matrix2Xd goal(2, 1);
    goal.col(0) = goal_world;
    result.goal_frs = worldToFrs(goal, pose, frs.initial_x, frs.initial_y,
                                 frs.distance_scale).col(0);
    const CostModel cost_model(frs, result.goal_frs);

    // 4. 优化
    result.bounds = computeParameterBounds(frs, state.v, config.k1_bound);
    const ConstraintSet& cons = result.constraints;
    CostFunction cost = [&cost_model](const Eigen::VectorXd& k, Eigen::VectorXd& grad) {
        return cost_model.evaluate(k, grad);
    };
    ConstraintFunction nonlcon = [&cons](const Eigen::VectorXd& k, Eigen::VectorXd& g,
                                         Eigen::MatrixXd& J) {
        cons.evaluate(k, g, J);
    };

    TrajectoryOptimizer optimizer;
    const Eigen::VectorXd initial_guess = Eigen::VectorXd::Zero(2);
    result.optimization = optimizer.solve(cost, nonlcon, result.bounds, initial_guess,
                                          config.optimization);

    // 5. 生成轨迹
    result.plan = materializeTrajectory(result.optimization, frs, state, max_decel,
                                        config.trajectory_dt);
    return result;
}

PlanResult planAndExecute(const FrsModel& frs,
                          Agent& agent,
                          const std::vector<Polygon>& obstacles,
                          const Eigen::Vector2d& goal_world,
                          const PlannerConfig& config) {
    PlanResult result = planTrajectory(frs, agent.state(), agent.footprintRadius(),
                                       agent.maxDecel(), obstacles, goal_world, config);
    const Trajectory& traj = result.plan.trajectory;
    agent.execute(traj.duration(), traj);
    return result;
}
