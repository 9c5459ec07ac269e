#include "mapedit/edit/insert_vertex_interaction.h"
#include "mapedit/core/editor_constants.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_view.h"

#include <limits>

InsertVertexInteraction::InsertVertexInteraction(FeatureLayer& layer, std::uint32_t featureId, bool isPolygon)
    : Interaction(EventType::Click, ModificationKey::None),
      layer_(layer),
      featureId_(featureId),
      isPolygon_(isPolygon) {}

void InsertVertexInteraction::pipe(InteractionEvent& event) {
    if (!event.map || event.featureLayer != &layer_ || event.featureId != featureId_) return;
    const Geometry* geometry = layer_.geometry(featureId_);
    if (!geometry || geometry->coordinates.size() < 2) return;

    const std::vector<Coordinate>& coordinates = geometry->coordinates;
    const Coordinate& position = event.positionOrPixel;
    const double tolerance = event.map->resolutionAt(position) * editor_constants::INSERT_TOLERANCE_PX;
    const std::size_t segmentCount = isPolygon_ ? coordinates.size() : coordinates.size() - 1;

    double bestDistance = std::numeric_limits<double>::infinity();
    std::size_t bestSegment = 0;
    Coordinate bestPoint{};
    for (std::size_t i = 0; i < segmentCount; i++) {
        const Coordinate& start = coordinates[i];
        const Coordinate& end = coordinates[(i + 1) % coordinates.size()];
        const Coordinate closest = closestPointOnSegment(start, end, position);
        const double d = distance2D(closest, position);
        if (d < bestDistance) {
            bestDistance = d;
            bestSegment = i;
            bestPoint = closest;
        }
    }
    if (bestDistance > tolerance) return;

    if (geometry->layout == GeometryLayout::XY) bestPoint.z = 0.0;
    vertexInserted.raise(bestSegment + 1, bestPoint);
}

void InsertVertexInteraction::destroy() {
    vertexInserted.clear();
}
