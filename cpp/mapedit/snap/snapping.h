#pragma once

#include "mapedit/snap/snap_types.h"
#include <optional>
#include <vector>

class MapView;

// Bearing of every segment; polygons include the closing segment.
std::vector<double> getBearings(const std::vector<Coordinate>& coordinates, bool isPolygon);

// Closest point to `point` on the line through `end` perpendicular to start -> end.
Coordinate getClosestOrthogonal(const Coordinate& start, const Coordinate& end, const Coordinate& point);

// Closest point to `point` on the line through origin with the given bearing.
Coordinate getClosestInDirection(const Coordinate& origin, const Coordinate& point, double bearing);

// Snaps `coordinate`, to be placed after p1, which follows p2. Orthogonal snapping is tried
// first; otherwise the first bearing >= 0 parallel to p1 -> coordinate is used. Masked
// bearings are negative.
std::optional<SnapResult> snapToSegment(
    const Coordinate& coordinate,
    const Coordinate& p1,
    const Coordinate& p2,
    const std::vector<double>& bearings,
    int orthogonalIndex,
    SnapType snapTo = SnapType::All);

// snapToSegment, rejecting results further than the snap tolerance at the coordinate.
std::optional<SnapResult> getSnapResultForSegment(
    const Coordinate& coordinate,
    const Coordinate& p1,
    const Coordinate& p2,
    const std::vector<double>& bearings,
    int orthogonalIndex,
    double resolution,
    SnapType snapTo = SnapType::All);

// Combines the results of the previous and next segment. Two results are intersected as 2D
// lines through their reference vertices; the intersection is used if it lies within the
// snap tolerance of `coordinate`, else the result closer to `coordinate` is used alone.
std::optional<Coordinate> getSnappedCoordinateForResults(
    const std::optional<SnapResult>& first,
    const std::optional<SnapResult>& second,
    const std::vector<Coordinate>& coordinates,
    const Coordinate& coordinate,
    double resolution);

double snapTolerance(double resolution);
