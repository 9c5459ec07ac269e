#include "mapedit/edit/editor_helpers.h"
#include "mapedit/map/map_view.h"

#include <algorithm>
#include <limits>

namespace {
    template <typename Fn>
    void forEachRingCoordinate(Geometry& geometry, Fn&& fn) {
        for (Coordinate& c : geometry.coordinates) fn(c);
        for (auto& hole : geometry.holes) {
            for (Coordinate& c : hole) fn(c);
        }
    }
}

bool drapeGeometryOnTerrain(Geometry& geometry, const MapView& map) {
    if (!map.is3D()) return false;
    forEachRingCoordinate(geometry, [&map](Coordinate& c) {
        if (const auto height = map.sampleTerrainHeight(c)) c.z = *height;
    });
    geometry.layout = GeometryLayout::XYZ;
    return true;
}

bool placeGeometryOnTerrain(Geometry& geometry, const MapView& map) {
    if (!map.is3D()) return false;
    double minHeight = std::numeric_limits<double>::infinity();
    forEachRingCoordinate(geometry, [&map, &minHeight](Coordinate& c) {
        if (const auto height = map.sampleTerrainHeight(c)) minHeight = std::min(minHeight, *height);
    });
    if (minHeight == std::numeric_limits<double>::infinity()) return false;
    forEachRingCoordinate(geometry, [minHeight](Coordinate& c) { c.z = minHeight; });
    geometry.layout = GeometryLayout::XYZ;
    return true;
}

bool ensureFeatureAbsolute(Feature& feature, const MapView& map) {
    if (feature.altitudeMode == AltitudeMode::Absolute) return true;
    if (!map.is3D()) return false;

    Geometry& geometry = feature.geometry;
    if (feature.altitudeMode == AltitudeMode::ClampToGround) {
        if (!placeGeometryOnTerrain(geometry, map)) return false;
    } else {
        const bool hadHeight = geometry.layout == GeometryLayout::XYZ;
        forEachRingCoordinate(geometry, [&map, hadHeight](Coordinate& c) {
            const double offset = hadHeight ? c.z : 0.0;
            c.z = map.sampleTerrainHeight(c).value_or(0.0) + offset;
        });
        geometry.layout = GeometryLayout::XYZ;
    }
    feature.altitudeMode = AltitudeMode::Absolute;
    return true;
}
