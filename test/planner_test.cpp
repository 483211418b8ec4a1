#include <cassert>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include "agent.hpp"
#include "frs_model.hpp"
#include "planner.hpp"

static inline bool near(double a, double b, double tol=1e-9) {
    return std::abs(a-b) <= tol;
}

// 以 (cx, cy) 为中心、半边长 h 的正方形
static Polygon squareAt(double cx, double cy, double h) {
    return {{cx - h, cy - h}, {cx + h, cy - h}, {cx + h, cy + h}, {cx - h, cy + h}};
}

static double minConstraint(const PlanResult& r) {
    Eigen::VectorXd g;
    Eigen::MatrixXd J;
    r.constraints.evaluate(r.optimization.k, g, J);
    return g.size() > 0 ? g.minCoeff() : INFINITY;
}

static bool inBounds(const PlanResult& r, double tol) {
    const Eigen::VectorXd& k = r.optimization.k;
    return ((k - r.bounds.lower).array() >= -tol).all() &&
           ((r.bounds.upper - k).array() >= -tol).all();
}

static bool deceleratesToZero(const Trajectory& traj, double v0) {
    if (traj.empty() || !(std::abs(traj.Z(3, 0) - v0) < 1e-9)) return false;
    for (size_t i = 1; i < traj.size(); ++i) {
        if (!(traj.Z(3, i) < traj.Z(3, i - 1))) return false;
    }
    return traj.Z(3, traj.size() - 1) == 0.0;
}

int main() {
    const FrsLibrary library = loadTurtlebotFrsLibrary();
    const double footprint = 0.175;
    const double max_decel = 2.0;

    // FRS 选择：取包含 v0 的最快区间
    {
        assert(library.size() == 3u);
        const FrsModel& a = library.select(0.2);
        assert(near(a.v_min, 0.0) && near(a.v_max, 1.0));
        const FrsModel& b = library.select(0.5);
        assert(near(b.v_min, 0.0) && near(b.v_max, 1.5));
        const FrsModel& c = library.select(1.5);
        assert(near(c.v_min, 0.5) && near(c.v_max, 1.5));

        bool thrown = false;
        try { library.select(1.6); } catch (const std::out_of_range&) { thrown = true; }
        assert(thrown);
        thrown = false;
        try { library.select(-0.1); } catch (const std::out_of_range&) { thrown = true; }
        assert(thrown);
    }

    // 障碍物远离：直行到目标
    {
        const FrsModel& frs = library.select(0.5);
        PlannerConfig config;
        std::vector<Polygon> obstacles = {Polygon{{0.0, -3.0}}};
        AgentState s0{0.0, 0.0, 0.0, 0.5};

        PlanResult r = planTrajectory(frs, s0, footprint, max_decel, obstacles,
                                      Eigen::Vector2d(0.6, 0.0), config);
        assert(r.ok());
        assert(r.obstacles.size() == 1u);
        assert(r.constraints.size() == static_cast<size_t>(r.obstacles[0].points_frs.cols()));
        assert(std::abs(r.optimization.k(0)) < 0.05);
        assert(!r.plan.braking_only);
        assert(std::abs(r.plan.v_des - 0.6) < 0.02);
        assert(minConstraint(r) >= -1e-6);
        assert(inBounds(r, 1e-9));
    }

    // 前方障碍物：成功则约束满足，失败则只制动
    {
        const FrsModel& frs = library.select(0.5);
        std::vector<Polygon> obstacles = {squareAt(0.5, 0.0, 0.1)};
        AgentState s0{0.0, 0.0, 0.0, 0.5};

        PlanResult r = planTrajectory(frs, s0, footprint, max_decel, obstacles,
                                      Eigen::Vector2d(1.0, 0.0));
        assert(r.constraints.size() > 0u);
        if (r.ok()) {
            assert(minConstraint(r) >= -1e-6);
            assert(inBounds(r, 1e-6));
            assert(!r.plan.braking_only);
            // 不能径直穿过障碍物
            const bool detour = std::abs(r.optimization.k(0)) > 1e-3;
            const bool slow = r.plan.v_des < 0.5;
            assert(detour || slow);
        } else {
            assert(r.plan.braking_only);
            assert(deceleratesToZero(r.plan.trajectory, 0.5));
        }
    }

    // 多个障碍物：约束按障碍物顺序拼接
    {
        const FrsModel& frs = library.select(0.5);
        std::vector<Polygon> obstacles = {squareAt(0.0, 2.0, 0.1), squareAt(0.0, -2.0, 0.2)};
        AgentState s0{0.0, 0.0, 0.0, 0.5};
        PlanResult r = planTrajectory(frs, s0, footprint, max_decel, obstacles,
                                      Eigen::Vector2d(0.8, 0.0));
        assert(r.obstacles.size() == 2u);
        const size_t n0 = r.obstacles[0].points_frs.cols();
        const size_t n1 = r.obstacles[1].points_frs.cols();
        assert(r.constraints.size() == n0 + n1);
        assert(n1 > n0);
        assert(r.ok());
    }

    // delta_v = 0 且 v0 在速度上限：k2 范围宽度为 0
    {
        TurtlebotFrsParams params;
        params.delta_v = 0.0;
        FrsModel frs = makeTurtlebotFrs(1.0, 1.5, params);
        AgentState s0{0.0, 0.0, 0.0, 1.5};
        PlanResult r = planTrajectory(frs, s0, footprint, max_decel, {},
                                      Eigen::Vector2d(1.0, 0.0));
        assert(near(r.bounds.lower(1), r.bounds.upper(1), 1e-12));
        assert(r.constraints.empty());
        if (r.ok()) {
            assert(near(r.optimization.k(1), r.bounds.upper(1), 1e-9));
            assert(near(r.plan.v_des, 1.5, 1e-9));
        } else {
            assert(r.plan.braking_only);
        }
    }

    // 被障碍物包围：无可行参数，只制动
    {
        const FrsModel& frs = library.select(1.5);
        std::vector<Polygon> obstacles = {squareAt(0.0, 0.0, 0.15)};
        AgentState s0{0.0, 0.0, 0.0, 1.5};
        PlanResult r = planTrajectory(frs, s0, footprint, max_decel, obstacles,
                                      Eigen::Vector2d(1.0, 0.0));
        assert(!r.ok());
        assert(r.optimization.k.size() == 0);
        assert(r.plan.braking_only);
        assert(deceleratesToZero(r.plan.trajectory, 1.5));
        assert(near(r.plan.trajectory.duration(), 0.75, 1e-9));
    }

    // 配置错误
    {
        const FrsModel& frs = library.select(0.5);
        AgentState s0{0.0, 0.0, 0.0, 0.5};
        bool thrown = false;
        try {
            planTrajectory(frs, s0, 0.0, max_decel, {}, Eigen::Vector2d(1.0, 0.0));
        } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try {
            planTrajectory(frs, s0, footprint, 0.0, {}, Eigen::Vector2d(1.0, 0.0));
        } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);

        FrsModel broken = frs;
        broken.distance_scale = 0.0;
        thrown = false;
        try {
            planTrajectory(broken, s0, footprint, max_decel, {}, Eigen::Vector2d(1.0, 0.0));
        } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    // 规划并执行一个周期
    {
        const FrsModel& frs = library.select(0.5);
        UnicycleAgent agent(footprint, max_decel);
        agent.reset(AgentState{0.0, 0.0, 0.0, 0.5});
        PlanResult r = planAndExecute(frs, agent, {}, Eigen::Vector2d(0.6, 0.3));
        assert(r.ok());
        assert(agent.history().size() == r.plan.trajectory.size());
        assert(near(agent.time(), r.plan.trajectory.duration()));
        assert(near(agent.state().v, 0.0, 1e-9));
        assert(agent.state().x > 0.0);
        assert(agent.state().y > 0.0);
    }

    std::printf("PASS: planner checks\n");
    return 0;
}
