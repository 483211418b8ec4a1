#include "obstacle_discretizer.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

double computePointSpacing(double footprint_radius, double buffer) {
    if (!(footprint_radius > 0.0) || !(buffer > 0.0)) {
        throw std::invalid_argument("computePointSpacing: footprint and buffer must be positive");
    }
    double b = buffer;
    if (b > footprint_radius) {
        std::cerr << "[Discretizer] buffer " << b << " m exceeds footprint radius, clamped to "
                  << footprint_radius << " m\n";
        b = footprint_radius;
    }
    const double R = footprint_radius;
    const double theta = std::acos((R - b) / R);
    return 2.0 * R * std::sin(theta);
}

DiscretizedObstacle discretizeObstacle(const Polygon& obstacle,
                                       const Pose2D& pose,
                                       double buffer,
                                       double spacing,
                                       const FrsModel& frs) {
    DiscretizedObstacle out;
    out.buffered = bufferPolygon(obstacle, buffer);
    out.points_world = interpolatePolygon(out.buffered, spacing);
    out.points_frs = worldToFrs(out.points_world, pose,
                                frs.initial_x, frs.initial_y, frs.distance_scale);
    return out;
}
