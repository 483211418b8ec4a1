#include "visualize.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <iostream>

void print_plan_summary(const PlanResult& result) {
    const auto& opt = result.optimization;
    std::cout << "\n================ 规划结果 ================\n";
    std::cout << "状态: " << toString(opt.status) << "  (" << opt.message << ")\n";
    std::cout << "迭代次数: " << opt.iterations << ", 求值次数: " << opt.evaluations << "\n";
    std::cout << "约束点数: " << result.constraints.size() << "\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "k 上下界: k1 ∈ [" << result.bounds.lower(0) << ", " << result.bounds.upper(0)
              << "], k2 ∈ [" << result.bounds.lower(1) << ", " << result.bounds.upper(1) << "]\n";
    if (opt.ok()) {
        std::cout << "k_opt = (" << opt.k(0) << ", " << opt.k(1) << "), cost = " << opt.cost << "\n";
        std::cout << "w_des = " << result.plan.w_des << " rad/s, v_des = " << result.plan.v_des << " m/s\n";
    } else {
        std::cout << "未找到安全轨迹参数，执行制动\n";
    }
    std::cout << "轨迹时长: " << result.plan.trajectory.duration() << " s, 样本数: "
              << result.plan.trajectory.size() << "\n";
    std::cout << "==========================================\n";
    std::cout.unsetf(std::ios::fixed);
}

static bool nearAny(const Eigen::Matrix2Xd& pts, double x, double y, double r2) {
    for (int i = 0; i < pts.cols(); ++i) {
        double dx = pts(0, i) - x;
        double dy = pts(1, i) - y;
        if (dx * dx + dy * dy <= r2) return true;
    }
    return false;
}

bool write_world_ppm(
    const std::string& filename,
    const std::vector<Polygon>& obstacles,
    const PlanResult& result,
    const Eigen::Vector2d& goal,
    const ViewBox& view,
    int scale
){
    const int outW = static_cast<int>(std::ceil((view.x_max - view.x_min) * scale));
    const int outH = static_cast<int>(std::ceil((view.y_max - view.y_min) * scale));
    if (outW <= 0 || outH <= 0) {
        std::cerr << "[Visualize] 绘图范围为空\n";
        return false;
    }

    FILE* f = fopen(filename.c_str(), "wb");
    if (!f) {
        std::cerr << "无法创建 PPM 文件 " << filename << "\n";
        return false;
    }
    fprintf(f, "P6\n%d %d\n255\n", outW, outH);

    // 所有离散点拼到一起
    int num_points = 0;
    for (const auto& d : result.obstacles) num_points += static_cast<int>(d.points_world.cols());
    Eigen::Matrix2Xd points(2, num_points);
    int col = 0;
    for (const auto& d : result.obstacles) {
        points.middleCols(col, d.points_world.cols()) = d.points_world;
        col += static_cast<int>(d.points_world.cols());
    }
    const Eigen::Matrix2Xd path = result.plan.trajectory.Z.topRows(2);

    const double px = 1.0 / scale;
    const double point_r2 = (2.5 * px) * (2.5 * px);
    const double path_r2 = (1.5 * px) * (1.5 * px);
    const double goal_r2 = (5.0 * px) * (5.0 * px);

    unsigned char pixel[3];
    for (int row = 0; row < outH; ++row) {
        const double y = view.y_max - (row + 0.5) * px;
        for (int c = 0; c < outW; ++c) {
            const double x = view.x_min + (c + 0.5) * px;
            const P2 p{x, y};

            bool in_obs = false, in_buf = false;
            for (const auto& o : obstacles) in_obs = in_obs || pointInPolygon(o, p);
            for (const auto& d : result.obstacles) in_buf = in_buf || pointInPolygon(d.buffered, p);

            const double gx = x - goal.x(), gy = y - goal.y();
            if (gx * gx + gy * gy <= goal_r2) {
                pixel[0]=0; pixel[1]=0; pixel[2]=0;          // 目标点
            } else if (nearAny(path, x, y, path_r2)) {
                if (result.plan.braking_only) { pixel[0]=230; pixel[1]=120; pixel[2]=0; }
                else { pixel[0]=0; pixel[1]=0; pixel[2]=255; } // 规划轨迹
            } else if (nearAny(points, x, y, point_r2)) {
                pixel[0]=128; pixel[1]=26; pixel[2]=26;      // 离散点
            } else if (in_obs) {
                pixel[0]=255; pixel[1]=179; pixel[2]=204;
            } else if (in_buf) {
                pixel[0]=255; pixel[1]=128; pixel[2]=153;
            } else {
                pixel[0]=255; pixel[1]=255; pixel[2]=255;
            }
            fwrite(pixel, 1, 3, f);
        }
    }
    fclose(f);
    return true;
}
