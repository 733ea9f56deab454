/**
 * @file GeometryUtils.h
 * @brief Planar helpers for picking and placement
 */

#ifndef CIRCUITSKETCH_CORE_DIAGRAM_GEOMETRYUTILS_H
#define CIRCUITSKETCH_CORE_DIAGRAM_GEOMETRYUTILS_H

#include <gp_Pnt2d.hxx>

#include <vector>

namespace circuitsketch::core::diagram::geometry {

/**
 * @brief Closest point to @p point on the segment [a, b]
 *
 * The projection parameter onto the infinite line is clamped: t <= 0 gives
 * a, t >= 1 gives b. A zero-length segment returns a.
 */
gp_Pnt2d closestPointOnSegment(const gp_Pnt2d& point, const gp_Pnt2d& a, const gp_Pnt2d& b);

/**
 * @brief Squared distance from @p point to the segment [a, b]
 */
double squaredDistanceToSegment(const gp_Pnt2d& point, const gp_Pnt2d& a, const gp_Pnt2d& b);

/**
 * @brief Index of the first segment of @p polyline within @p tolerance of @p point
 * @return Segment index (segment i joins points i and i+1), or -1 on miss
 */
int findHitSegment(const std::vector<gp_Pnt2d>& polyline, const gp_Pnt2d& point, double tolerance);

/**
 * @brief Rotate @p point about @p center by @p degrees (clockwise on a y-down surface)
 */
gp_Pnt2d rotateAbout(const gp_Pnt2d& point, const gp_Pnt2d& center, double degrees);

/**
 * @brief Round both coordinates to the nearest multiple of @p cellSize
 *
 * Non-positive cell sizes leave the point unchanged.
 */
gp_Pnt2d snapToGrid(const gp_Pnt2d& point, double cellSize);

/**
 * @brief Wrap an angle in degrees into [0, 360)
 */
double normalizeDegrees(double degrees);

} // namespace circuitsketch::core::diagram::geometry

#endif // CIRCUITSKETCH_CORE_DIAGRAM_GEOMETRYUTILS_H
