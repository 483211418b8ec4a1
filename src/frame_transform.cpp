#include "frame_transform.hpp"
#include <cmath>
#include <stdexcept>

static Eigen::Matrix2d rotation(double h) {
    Eigen::Matrix2d R;
    R << std::cos(h), -std::sin(h),
         std::sin(h),  std::cos(h);
    return R;
}

Eigen::Matrix2Xd worldToLocal(const Eigen::Matrix2Xd& pts, const Pose2D& pose) {
    Eigen::Vector2d p0(pose.x, pose.y);
    Eigen::Matrix2Xd shifted = pts.colwise() - p0;
    return rotation(-pose.h) * shifted;
}

Eigen::Matrix2Xd localToWorld(const Eigen::Matrix2Xd& pts, const Pose2D& pose) {
    Eigen::Vector2d p0(pose.x, pose.y);
    Eigen::Matrix2Xd rotated = rotation(pose.h) * pts;
    return rotated.colwise() + p0;
}

Eigen::Matrix2Xd worldToFrs(const Eigen::Matrix2Xd& pts, const Pose2D& pose,
                            double x0, double y0, double D) {
    if (!(D > 0.0)) {
        throw std::invalid_argument("worldToFrs: distance scale must be positive");
    }
    Eigen::Vector2d origin(x0, y0);
    Eigen::Matrix2Xd scaled = worldToLocal(pts, pose) / D;
    return scaled.colwise() + origin;
}

Eigen::Matrix2Xd frsToWorld(const Eigen::Matrix2Xd& pts, const Pose2D& pose,
                            double x0, double y0, double D) {
    if (!(D > 0.0)) {
        throw std::invalid_argument("frsToWorld: distance scale must be positive");
    }
    Eigen::Vector2d origin(x0, y0);
    Eigen::Matrix2Xd local = D * (pts.colwise() - origin);
    return localToWorld(local, pose);
}
