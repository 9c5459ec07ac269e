#include "mapedit/snap/snapping.h"
#include "mapedit/core/editor_constants.h"
#include "mapedit/core/geometry_math.h"

#include <cmath>

namespace snapping_detail {
using editor_constants::SNAP_ANGLE_RAD;

inline bool near(double value, double target) {
    return value > target - SNAP_ANGLE_RAD && value < target + SNAP_ANGLE_RAD;
}

inline bool isOrthogonalDiff(double diff) {
    return diff < SNAP_ANGLE_RAD
        || near(diff, kPiOverTwo)
        || near(diff, kPi)
        || near(diff, 3.0 * kPiOverTwo)
        || diff > kTwoPi - SNAP_ANGLE_RAD;
}

inline bool isParallelDiff(double diff) {
    return diff < SNAP_ANGLE_RAD
        || near(diff, kPi)
        || diff > kTwoPi - SNAP_ANGLE_RAD;
}

Coordinate closestOrthogonalOrLinear(const Coordinate& start, const Coordinate& end, const Coordinate& point) {
    const Coordinate onLine = closestPointOn2DLine(start, end, point);
    const Coordinate onOrthogonal = getClosestOrthogonal(start, end, point);
    if (distance2D(onLine, point) > distance2D(onOrthogonal, point)) {
        return onOrthogonal;
    }
    return onLine;
}
} // namespace snapping_detail

double snapTolerance(double resolution) {
    return resolution * editor_constants::SNAP_TOLERANCE_PX;
}

std::vector<double> getBearings(const std::vector<Coordinate>& coordinates, bool isPolygon) {
    if (coordinates.empty()) return {};
    const std::size_t count = isPolygon ? coordinates.size() : coordinates.size() - 1;
    std::vector<double> bearings(count);
    for (std::size_t i = 0; i < count; i++) {
        const Coordinate& next = (i == coordinates.size() - 1) ? coordinates.front() : coordinates[i + 1];
        bearings[i] = cartesianBearing(coordinates[i], next);
    }
    return bearings;
}

Coordinate getClosestOrthogonal(const Coordinate& start, const Coordinate& end, const Coordinate& point) {
    // Segment rotated by 90 degrees.
    double nx = -(end.y - start.y);
    double ny = end.x - start.x;
    const double len = std::sqrt(nx * nx + ny * ny);
    if (len > 0.0) {
        nx = nx / len * editor_constants::ORTHOGONAL_OFFSET_LENGTH;
        ny = ny / len * editor_constants::ORTHOGONAL_OFFSET_LENGTH;
    }
    const Coordinate through{end.x + nx, end.y + ny, point.z};
    return closestPointOn2DLine(end, through, point);
}

Coordinate getClosestInDirection(const Coordinate& origin, const Coordinate& point, double bearing) {
    double alpha = bearing + kPiOverTwo;
    if (alpha > kTwoPi) alpha -= kTwoPi;
    const Coordinate through{
        origin.x + editor_constants::PARALLEL_OFFSET_LENGTH * std::cos(alpha),
        origin.y - editor_constants::PARALLEL_OFFSET_LENGTH * std::sin(alpha),
        origin.z,
    };
    return closestPointOn2DLine(origin, through, point);
}

std::optional<SnapResult> snapToSegment(
    const Coordinate& coordinate,
    const Coordinate& p1,
    const Coordinate& p2,
    const std::vector<double>& bearings,
    int orthogonalIndex,
    SnapType snapTo) {
    const double currentBearing = cartesianBearing(p1, coordinate);
    const double previousBearing = cartesianBearing(p2, p1);
    const double previousDiff = std::abs(previousBearing - currentBearing);

    if (snapping_detail::isOrthogonalDiff(previousDiff)) {
        if (!hasFlag(snapTo, SnapType::Orthogonal)) return std::nullopt;
        SnapResult result;
        result.type = SnapType::Orthogonal;
        result.snapped = snapping_detail::closestOrthogonalOrLinear(p2, p1, coordinate);
        result.orthogonalIndex = orthogonalIndex;
        return result;
    }

    if (!hasFlag(snapTo, SnapType::Parallel)) return std::nullopt;
    for (std::size_t i = 0; i < bearings.size(); i++) {
        const double bearing = bearings[i];
        if (bearing < 0.0) continue;
        if (!snapping_detail::isParallelDiff(std::abs(bearing - currentBearing))) continue;
        SnapResult result;
        result.type = SnapType::Parallel;
        result.snapped = getClosestInDirection(p1, coordinate, bearing);
        result.orthogonalIndex = orthogonalIndex;
        result.parallelIndex = static_cast<int>(i);
        return result;
    }
    return std::nullopt;
}

std::optional<SnapResult> getSnapResultForSegment(
    const Coordinate& coordinate,
    const Coordinate& p1,
    const Coordinate& p2,
    const std::vector<double>& bearings,
    int orthogonalIndex,
    double resolution,
    SnapType snapTo) {
    std::optional<SnapResult> result = snapToSegment(coordinate, p1, p2, bearings, orthogonalIndex, snapTo);
    if (result && distance2D(result->snapped, coordinate) <= snapTolerance(resolution)) {
        return result;
    }
    return std::nullopt;
}

std::optional<Coordinate> getSnappedCoordinateForResults(
    const std::optional<SnapResult>& first,
    const std::optional<SnapResult>& second,
    const std::vector<Coordinate>& coordinates,
    const Coordinate& coordinate,
    double resolution) {
    const auto validIndex = [&coordinates](int index) {
        return index >= 0 && static_cast<std::size_t>(index) < coordinates.size();
    };

    if (first && second) {
        if (validIndex(first->orthogonalIndex) && validIndex(second->orthogonalIndex)) {
            const std::optional<Coordinate> intersection = lineIntersection2D(
                first->snapped,
                coordinates[first->orthogonalIndex],
                second->snapped,
                coordinates[second->orthogonalIndex]);
            if (intersection && distance2D(*intersection, coordinate) <= snapTolerance(resolution)) {
                return Coordinate{intersection->x, intersection->y, first->snapped.z};
            }
        }
        return distance2D(second->snapped, coordinate) < distance2D(first->snapped, coordinate)
            ? second->snapped
            : first->snapped;
    }
    if (second) return second->snapped;
    if (first) return first->snapped;
    return std::nullopt;
}
