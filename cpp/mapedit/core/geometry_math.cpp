#include "mapedit/core/geometry_math.h"

#include <algorithm>
#include <cmath>
#include <limits>

double distance2D(const Coordinate& a, const Coordinate& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

double distance3D(const Coordinate& a, const Coordinate& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double dz = b.z - a.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

Coordinate midPoint(const Coordinate& a, const Coordinate& b) {
    return {(a.x + b.x) * 0.5, (a.y + b.y) * 0.5, (a.z + b.z) * 0.5};
}

double cartesianBearing(const Coordinate& a, const Coordinate& b) {
    double theta = std::atan2(b.x - a.x, b.y - a.y);
    if (theta < 0.0) theta += kTwoPi;
    return theta;
}

Coordinate closestPointOn2DLine(const Coordinate& start, const Coordinate& end, const Coordinate& point) {
    double dirX = end.x - start.x;
    double dirY = end.y - start.y;
    if (dirX == 0.0 && dirY == 0.0) {
        dirX = 1.0;
        dirY = 1.0;
    }
    const double len = std::sqrt(dirX * dirX + dirY * dirY);
    dirX /= len;
    dirY /= len;
    const double lambda = dirX * (point.x - start.x) + dirY * (point.y - start.y);
    return {start.x + dirX * lambda, start.y + dirY * lambda, point.z};
}

Coordinate closestPointOnSegment(const Coordinate& start, const Coordinate& end, const Coordinate& point) {
    const double dx = end.x - start.x;
    const double dy = end.y - start.y;
    const double lenSq = dx * dx + dy * dy;
    if (lenSq <= 0.0) return start;
    double t = ((point.x - start.x) * dx + (point.y - start.y) * dy) / lenSq;
    t = std::clamp(t, 0.0, 1.0);
    return {
        start.x + dx * t,
        start.y + dy * t,
        start.z + (end.z - start.z) * t,
    };
}

std::optional<Coordinate> lineIntersection2D(
    const Coordinate& a0,
    const Coordinate& a1,
    const Coordinate& b0,
    const Coordinate& b1) {
    const double rX = a1.x - a0.x;
    const double rY = a1.y - a0.y;
    const double sX = b1.x - b0.x;
    const double sY = b1.y - b0.y;
    const double denom = rX * sY - rY * sX;
    if (std::abs(denom) < 1e-12) return std::nullopt;
    const double t = ((b0.x - a0.x) * sY - (b0.y - a0.y) * sX) / denom;
    return Coordinate{a0.x + rX * t, a0.y + rY * t, 0.0};
}

Extent createEmptyExtent() {
    constexpr double inf = std::numeric_limits<double>::infinity();
    return {inf, inf, inf, -inf, -inf, -inf};
}

bool isEmptyExtent(const Extent& extent) {
    return extent.maxX < extent.minX || extent.maxY < extent.minY;
}

void extendExtent(Extent& extent, const Coordinate& c, bool withZ) {
    extent.minX = std::min(extent.minX, c.x);
    extent.minY = std::min(extent.minY, c.y);
    extent.maxX = std::max(extent.maxX, c.x);
    extent.maxY = std::max(extent.maxY, c.y);
    if (withZ) {
        extent.minZ = std::min(extent.minZ, c.z);
        extent.maxZ = std::max(extent.maxZ, c.z);
    }
}

void extendExtent(Extent& extent, const Geometry& geometry) {
    const bool withZ = geometry.layout == GeometryLayout::XYZ;
    if (geometry.kind == GeometryKind::Circle) {
        if (geometry.coordinates.empty()) return;
        const Coordinate& c = geometry.coordinates.front();
        extendExtent(extent, {c.x - geometry.radius, c.y - geometry.radius, c.z}, withZ);
        extendExtent(extent, {c.x + geometry.radius, c.y + geometry.radius, c.z}, withZ);
        return;
    }
    for (const Coordinate& c : geometry.coordinates) {
        extendExtent(extent, c, withZ);
    }
}

Coordinate extentCenter(const Extent& extent, bool withZ) {
    Coordinate center{(extent.minX + extent.maxX) * 0.5, (extent.minY + extent.maxY) * 0.5, 0.0};
    if (withZ && extent.maxZ >= extent.minZ) {
        center.z = (extent.minZ + extent.maxZ) * 0.5;
    }
    return center;
}

std::vector<Coordinate> flatCoordinates(const Geometry& geometry) {
    if (geometry.kind == GeometryKind::Circle) {
        if (geometry.coordinates.empty()) return {};
        const Coordinate& c = geometry.coordinates.front();
        return {c, {c.x + geometry.radius, c.y, c.z}};
    }
    return geometry.coordinates;
}

namespace {
    template <typename Fn>
    void forEachCoordinate(Geometry& geometry, Fn&& fn) {
        for (Coordinate& c : geometry.coordinates) fn(c);
        for (auto& hole : geometry.holes) {
            for (Coordinate& c : hole) fn(c);
        }
    }
}

void translateGeometry(Geometry& geometry, double dx, double dy, double dz) {
    const bool withZ = geometry.layout == GeometryLayout::XYZ;
    forEachCoordinate(geometry, [&](Coordinate& c) {
        c.x += dx;
        c.y += dy;
        if (withZ) c.z += dz;
    });
}

void rotateGeometry(Geometry& geometry, double angle, const Coordinate& center) {
    const double cosA = std::cos(angle);
    const double sinA = std::sin(angle);
    forEachCoordinate(geometry, [&](Coordinate& c) {
        const double dx = c.x - center.x;
        const double dy = c.y - center.y;
        c.x = center.x + dx * cosA - dy * sinA;
        c.y = center.y + dx * sinA + dy * cosA;
    });
}

void scaleGeometry(Geometry& geometry, double sx, double sy, const Coordinate& center) {
    forEachCoordinate(geometry, [&](Coordinate& c) {
        c.x = center.x + (c.x - center.x) * sx;
        c.y = center.y + (c.y - center.y) * sy;
    });
    if (geometry.kind == GeometryKind::Circle) {
        geometry.radius *= std::abs(sx);
    }
}
