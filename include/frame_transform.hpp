#pragma once
#include <Eigen/Dense>

// 机器人位姿（世界系）
struct Pose2D {
    double x = 0.0;
    double y = 0.0;
    double h = 0.0; // 航向，弧度
};

// 世界系 -> 机器人局部系：先平移 -pos，再旋转 -h
Eigen::Matrix2Xd worldToLocal(const Eigen::Matrix2Xd& pts, const Pose2D& pose);
Eigen::Matrix2Xd localToWorld(const Eigen::Matrix2Xd& pts, const Pose2D& pose);

// 世界系 -> FRS 归一化系：局部坐标除以距离尺度 D，再加上 FRS 原点 (x0, y0)
// D <= 0 抛 std::invalid_argument
Eigen::Matrix2Xd worldToFrs(const Eigen::Matrix2Xd& pts, const Pose2D& pose,
                            double x0, double y0, double D);
Eigen::Matrix2Xd frsToWorld(const Eigen::Matrix2Xd& pts, const Pose2D& pose,
                            double x0, double y0, double D);
