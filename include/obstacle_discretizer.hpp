#pragma once
#include <Eigen/Dense>
#include "frame_transform.hpp"
#include "frs_model.hpp"
#include "polygon.hpp"

// 障碍物离散结果（每个规划周期重新计算）
struct DiscretizedObstacle {
    Polygon buffered;            // 外扩后的多边形（世界系）
    Eigen::Matrix2Xd points_world;
    Eigen::Matrix2Xd points_frs;
};

// 由圆形机身半径 R 与外扩量 b 计算边界采样间距：
// 半径 R 的圆从两个相距 r 的点之间穿过时，侵入深度不超过 b
// r = 2 R sin(acos((R - b) / R))；b > R 时截断为 R
double computePointSpacing(double footprint_radius, double buffer);

// 外扩、按间距采样并变换到 FRS 系；不裁剪可达范围外的点
DiscretizedObstacle discretizeObstacle(const Polygon& obstacle,
                                       const Pose2D& pose,
                                       double buffer,
                                       double spacing,
                                       const FrsModel& frs);
