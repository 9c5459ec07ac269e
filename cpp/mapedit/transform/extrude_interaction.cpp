#include "mapedit/transform/extrude_interaction.h"
#include "mapedit/map/map_view.h"
#include "mapedit/transform/transformation_handler.h"

ExtrudeInteraction::ExtrudeInteraction(TransformationHandler& handler)
    : Interaction(EventType::DragEvents),
      handler_(handler) {}

void ExtrudeInteraction::pipe(InteractionEvent& event) {
    if (getHeightDelta_) {
        extruded.raise(getHeightDelta_(event));
        if (event.type == EventType::DragEnd) {
            getHeightDelta_ = nullptr;
            handler_.setShowAxis(AxisAndPlanes::None);
        }
        return;
    }
    if (event.type != EventType::DragStart || !event.map || !event.map->is3D()) return;
    if (handler_.axisOf(event.featureLayer, event.featureId) != AxisAndPlanes::Z) return;

    handler_.setShowAxis(AxisAndPlanes::Z);
    const MapView* map = event.map;
    const Plane plane = map->verticalPlaneAt(handler_.center());
    Coordinate start = handler_.center();
    if (!map->pickOnPlane(plane, event.windowPosition, start)) start = handler_.center();
    double currentHeight = start.z;

    getHeightDelta_ = [map, plane, currentHeight](const InteractionEvent& e) mutable {
        Coordinate position;
        if (!map->pickOnPlane(plane, e.windowPosition, position)) return 0.0;
        const double delta = position.z - currentHeight;
        currentHeight = position.z;
        return delta;
    };
}

void ExtrudeInteraction::destroy() {
    getHeightDelta_ = nullptr;
}
