#include <iostream>
#include <stdexcept>
#include "agent.hpp"
#include "frs_model.hpp"
#include "planner.hpp"
#include "polygon.hpp"
#include "visualize.hpp"

int main()
{
    // -----------------------------
    // 用户参数
    // -----------------------------
    const double v_0 = 0.5;            // 初始速度 (m/s)
    const double x_des = 0.75;         // 目标位置
    const double y_des = 0.5;

    const P2 obstacle_location{1.0, 0.0};
    const double obstacle_scale = 1.0;
    const int N_vertices = 5;
    const unsigned int obstacle_seed = 7;

    PlannerConfig config;
    config.obstacle_buffer = 0.05;     // m

    // -----------------------------
    // 1. 按初始速度选择 FRS
    // -----------------------------
    std::cout << "Loading fastest feasible FRS\n";
    FrsLibrary library = loadTurtlebotFrsLibrary();
    const FrsModel* frs = nullptr;
    try {
        frs = &library.select(v_0);
    } catch (const std::out_of_range& e) {
        std::cerr << "请选择 0.0 到 1.5 m/s 之间的初始速度: " << e.what() << "\n";
        return -1;
    }

    // -----------------------------
    // 2. 机器人与障碍物
    // -----------------------------
    UnicycleAgent agent;
    agent.reset(AgentState{0.0, 0.0, 0.0, v_0});

    std::vector<Polygon> obstacles = {
        makeRandomPolygon(N_vertices, obstacle_location, obstacle_scale, obstacle_seed)
    };

    // -----------------------------
    // 3. 生成约束、优化并执行
    // -----------------------------
    const Eigen::Vector2d goal(x_des, y_des);
    PlanResult result;
    try {
        result = planAndExecute(*frs, agent, obstacles, goal, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "配置错误: " << e.what() << "\n";
        return -1;
    }

    print_plan_summary(result);

    const AgentState s = agent.state();
    std::cout << "机器人终止状态: x = " << s.x << ", y = " << s.y
              << ", h = " << s.h << ", v = " << s.v << "\n";

    // -----------------------------
    // 4. 可视化
    // -----------------------------
    if (write_world_ppm("world_frame.ppm", obstacles, result, goal)) {
        std::cout << "已生成 world_frame.ppm\n";
    }

    return 0;
}
