#pragma once
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "planner.hpp"
#include "polygon.hpp"

// 世界系绘图范围 (m)
struct ViewBox {
    double x_min = -0.5;
    double x_max = 1.5;
    double y_min = -1.0;
    double y_max = 1.0;
};

// 打印规划结果摘要
void print_plan_summary(const PlanResult& result);

// 世界系 PPM：障碍物、外扩障碍物、离散点、目标点与规划轨迹
// scale 为每米像素数
bool write_world_ppm(
    const std::string& filename,
    const std::vector<Polygon>& obstacles,
    const PlanResult& result,
    const Eigen::Vector2d& goal,
    const ViewBox& view = ViewBox(),
    int scale = 200
);
