#include "mapedit/validation/geometry_validation.h"

#include <cmath>
#include <set>

namespace {
    bool allFinite(const std::vector<Coordinate>& coordinates) {
        for (const Coordinate& c : coordinates) {
            if (!isCoordinateFinite(c)) return false;
        }
        return true;
    }

    bool isRingValid(const std::vector<Coordinate>& ring) {
        return ring.size() >= 3 && allFinite(ring);
    }

    bool isBoxValid(const std::vector<Coordinate>& ring) {
        if (ring.size() != 4 || !allFinite(ring)) return false;
        std::set<double> xs;
        std::set<double> ys;
        for (const Coordinate& c : ring) {
            xs.insert(c.x);
            ys.insert(c.y);
        }
        return xs.size() == 2 && ys.size() == 2;
    }
}

bool isCoordinateFinite(const Coordinate& c) {
    return std::isfinite(c.x) && std::isfinite(c.y) && std::isfinite(c.z);
}

bool isGeometryValid(const Geometry& geometry) {
    switch (geometry.kind) {
        case GeometryKind::Point:
            return geometry.coordinates.size() == 1 && allFinite(geometry.coordinates);
        case GeometryKind::LineString:
            return geometry.coordinates.size() >= 2 && allFinite(geometry.coordinates);
        case GeometryKind::Polygon:
            if (!isRingValid(geometry.coordinates)) return false;
            for (const auto& hole : geometry.holes) {
                if (!isRingValid(hole)) return false;
            }
            return true;
        case GeometryKind::Box:
            return isBoxValid(geometry.coordinates);
        case GeometryKind::Circle:
            return geometry.coordinates.size() == 1
                && allFinite(geometry.coordinates)
                && std::isfinite(geometry.radius)
                && geometry.radius > 0.0;
    }
    return false;
}
