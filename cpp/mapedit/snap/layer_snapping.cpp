#include "mapedit/snap/layer_snapping.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_view.h"
#include "mapedit/snap/snapping.h"

#include <limits>

namespace {
    bool useDistance3D(const Feature& feature, bool is3D) {
        return is3D
            && feature.altitudeMode != AltitudeMode::ClampToGround
            && feature.geometry.layout == GeometryLayout::XYZ;
    }

    // Rings of a feature that form segments; points and circles have none.
    void forEachSegment(
        const Geometry& geometry,
        const std::function<void(const Coordinate&, const Coordinate&)>& fn) {
        const auto visitRing = [&fn](const std::vector<Coordinate>& ring, bool closed) {
            for (std::size_t i = 1; i < ring.size(); i++) fn(ring[i - 1], ring[i]);
            if (closed && ring.size() > 2) fn(ring.back(), ring.front());
        };
        switch (geometry.kind) {
            case GeometryKind::LineString:
                visitRing(geometry.coordinates, false);
                break;
            case GeometryKind::Polygon:
            case GeometryKind::Box:
                visitRing(geometry.coordinates, true);
                for (const auto& hole : geometry.holes) visitRing(hole, true);
                break;
            case GeometryKind::Point:
            case GeometryKind::Circle:
                break;
        }
    }
}

LayerSnapping::LayerSnapping(
    std::vector<FeatureLayer*> layers,
    FeatureLayer& scratchLayer,
    FeatureFilter filter,
    EventType eventType)
    : Interaction(eventType),
      layers_(std::move(layers)),
      scratchLayer_(scratchLayer),
      filter_(std::move(filter)) {}

std::optional<SnapResult> LayerSnapping::findSnap(const Coordinate& candidate, double resolution, bool is3D) const {
    const double tolerance = snapTolerance(resolution);
    const bool snapVertex = hasFlag(snapTo_, SnapType::Vertex);
    const bool snapEdge = hasFlag(snapTo_, SnapType::Edge);
    if (!snapVertex && !snapEdge) return std::nullopt;

    double bestVertexDistance = std::numeric_limits<double>::infinity();
    std::optional<Coordinate> bestVertex;
    double bestEdgeDistance = std::numeric_limits<double>::infinity();
    std::optional<Coordinate> bestEdge;

    for (const FeatureLayer* layer : layers_) {
        if (!layer) continue;
        for (const std::uint32_t id : layer->featureIds()) {
            if (filter_ && !filter_(layer, id)) continue;
            const Feature* feature = layer->getFeature(id);
            if (!feature) continue;
            const Geometry& geometry = feature->geometry;
            const bool use3D = useDistance3D(*feature, is3D);
            const bool is2DGeometry = geometry.layout == GeometryLayout::XY;
            const auto measure = [use3D](const Coordinate& a, const Coordinate& b) {
                return use3D ? distance3D(a, b) : distance2D(a, b);
            };

            if (snapVertex) {
                const auto visitVertex = [&](const Coordinate& vertex) {
                    const double d = measure(vertex, candidate);
                    if (d <= tolerance && d < bestVertexDistance) {
                        bestVertexDistance = d;
                        bestVertex = Coordinate{vertex.x, vertex.y, is2DGeometry ? candidate.z : vertex.z};
                    }
                };
                for (const Coordinate& c : flatCoordinates(geometry)) visitVertex(c);
                for (const auto& hole : geometry.holes) {
                    for (const Coordinate& c : hole) visitVertex(c);
                }
            }

            if (snapEdge) {
                forEachSegment(geometry, [&](const Coordinate& start, const Coordinate& end) {
                    Coordinate closest = closestPointOnSegment(start, end, candidate);
                    if (is2DGeometry) closest.z = candidate.z;
                    const double d = measure(closest, candidate);
                    if (d <= tolerance && d < bestEdgeDistance) {
                        bestEdgeDistance = d;
                        bestEdge = closest;
                    }
                });
            }
        }
    }

    if (bestVertex) {
        SnapResult result;
        result.type = SnapType::Vertex;
        result.snapped = *bestVertex;
        return result;
    }
    if (bestEdge) {
        SnapResult result;
        result.type = SnapType::Edge;
        result.snapped = *bestEdge;
        return result;
    }
    return std::nullopt;
}

void LayerSnapping::pipe(InteractionEvent& event) {
    removeMarker();
    if (!event.map) return;

    const bool is3D = event.map->is3D();
    const Coordinate candidate = event.positionOrPixel;
    const std::optional<SnapResult> result = findSnap(candidate, event.map->resolutionAt(candidate), is3D);
    if (!result) return;

    event.unsnappedPositionOrPixel = candidate;
    event.positionOrPixel = result->snapped;
    event.alreadySnapped = true;
    setMarker(*result, is3D);
}

void LayerSnapping::setMarker(const SnapResult& result, bool is3D) {
    Feature marker;
    marker.geometry.kind = GeometryKind::Point;
    marker.geometry.layout = is3D ? GeometryLayout::XYZ : GeometryLayout::XY;
    marker.geometry.coordinates = {result.snapped};
    marker.allowPicking = false;
    marker.label = result.type == SnapType::Vertex ? "vertex" : "edge";
    markerId_ = scratchLayer_.addFeature(std::move(marker));
}

void LayerSnapping::removeMarker() {
    if (markerId_ == 0) return;
    scratchLayer_.removeFeature(markerId_);
    markerId_ = 0;
}

void LayerSnapping::destroy() {
    removeMarker();
    layers_.clear();
}
