#pragma once

#include "mapedit/core/types.h"

#include <optional>
#include <vector>

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kPiOverTwo = 0.5 * kPi;

double distance2D(const Coordinate& a, const Coordinate& b);
double distance3D(const Coordinate& a, const Coordinate& b);
Coordinate midPoint(const Coordinate& a, const Coordinate& b);

// Bearing of the segment a -> b, clockwise from north, in [0, 2pi).
double cartesianBearing(const Coordinate& a, const Coordinate& b);

// Closest point to `point` on the infinite 2D line through start and end. The z value is
// taken from `point`. A zero-length line is treated as the direction (1, 1).
Coordinate closestPointOn2DLine(const Coordinate& start, const Coordinate& end, const Coordinate& point);

// Closest point on the 2D segment, z interpolated between the segment ends.
Coordinate closestPointOnSegment(const Coordinate& start, const Coordinate& end, const Coordinate& point);

// Intersection of two infinite 2D lines, empty when they are parallel.
std::optional<Coordinate> lineIntersection2D(
    const Coordinate& a0,
    const Coordinate& a1,
    const Coordinate& b0,
    const Coordinate& b1);

Extent createEmptyExtent();
bool isEmptyExtent(const Extent& extent);
void extendExtent(Extent& extent, const Coordinate& c, bool withZ);
void extendExtent(Extent& extent, const Geometry& geometry);
Coordinate extentCenter(const Extent& extent, bool withZ);

// Coordinates of a geometry as a flat list; circles yield the center and the point on
// the circle east of it.
std::vector<Coordinate> flatCoordinates(const Geometry& geometry);

void translateGeometry(Geometry& geometry, double dx, double dy, double dz);
void rotateGeometry(Geometry& geometry, double angle, const Coordinate& center);
void scaleGeometry(Geometry& geometry, double sx, double sy, const Coordinate& center);
