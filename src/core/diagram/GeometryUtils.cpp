#include "GeometryUtils.h"

#include <gp_Vec2d.hxx>

#include <cmath>
#include <numbers>

namespace circuitsketch::core::diagram::geometry {

gp_Pnt2d closestPointOnSegment(const gp_Pnt2d& point, const gp_Pnt2d& a, const gp_Pnt2d& b) {
    const gp_Vec2d segment(a, b);
    const double lengthSquared = segment.SquareMagnitude();
    if (lengthSquared == 0.0) {
        return a;
    }

    const gp_Vec2d toPoint(a, point);
    const double t = toPoint.Dot(segment) / lengthSquared;
    if (t <= 0.0) {
        return a;
    }
    if (t >= 1.0) {
        return b;
    }
    return gp_Pnt2d(a.X() + t * segment.X(), a.Y() + t * segment.Y());
}

double squaredDistanceToSegment(const gp_Pnt2d& point, const gp_Pnt2d& a, const gp_Pnt2d& b) {
    return point.SquareDistance(closestPointOnSegment(point, a, b));
}

int findHitSegment(const std::vector<gp_Pnt2d>& polyline, const gp_Pnt2d& point, double tolerance) {
    if (polyline.size() < 2) {
        return -1;
    }

    const double toleranceSquared = tolerance * tolerance;
    for (size_t i = 0; i + 1 < polyline.size(); ++i) {
        if (squaredDistanceToSegment(point, polyline[i], polyline[i + 1]) <= toleranceSquared) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

gp_Pnt2d rotateAbout(const gp_Pnt2d& point, const gp_Pnt2d& center, double degrees) {
    const double theta = degrees * std::numbers::pi / 180.0;
    const double cosTheta = std::cos(theta);
    const double sinTheta = std::sin(theta);
    const double vx = point.X() - center.X();
    const double vy = point.Y() - center.Y();
    return gp_Pnt2d(center.X() + vx * cosTheta - vy * sinTheta,
                    center.Y() + vx * sinTheta + vy * cosTheta);
}

gp_Pnt2d snapToGrid(const gp_Pnt2d& point, double cellSize) {
    if (!(cellSize > 0.0)) {
        return point;
    }
    return gp_Pnt2d(std::round(point.X() / cellSize) * cellSize,
                    std::round(point.Y() / cellSize) * cellSize);
}

double normalizeDegrees(double degrees) {
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    // fmod of a tiny negative can round back up to exactly 360
    return wrapped >= 360.0 ? 0.0 : wrapped;
}

} // namespace circuitsketch::core::diagram::geometry
