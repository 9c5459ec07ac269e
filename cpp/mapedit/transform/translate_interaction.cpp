#include "mapedit/transform/translate_interaction.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/map/map_view.h"
#include "mapedit/transform/transformation_handler.h"

TranslateInteraction::TranslateInteraction(TransformationHandler& handler)
    : Interaction(EventType::DragEvents),
      handler_(handler) {}

void TranslateInteraction::pipe(InteractionEvent& event) {
    if (getDelta_) {
        const Coordinate delta = getDelta_(event);
        translated.raise(delta.x, delta.y, delta.z);
        if (event.type == EventType::DragEnd) {
            getDelta_ = nullptr;
            handler_.setShowAxis(AxisAndPlanes::None);
        }
    } else if (event.type == EventType::DragStart) {
        const AxisAndPlanes axis = handler_.axisOf(event.featureLayer, event.featureId);
        if (axis == AxisAndPlanes::None) return;
        handler_.setShowAxis(axis);
        if (event.map && event.map->is3D()) {
            getDelta_ = dragAlongPlane3D(axis, event);
        } else {
            getDelta_ = dragAlongAxis2D(axis, event);
        }
    }
}

TranslateInteraction::DeltaCallback TranslateInteraction::dragAlongAxis2D(
    AxisAndPlanes axis,
    const InteractionEvent& event) const {
    if (is1DAxis(axis)) {
        const Coordinate start = handler_.center();
        const Coordinate end = axis == AxisAndPlanes::X
            ? Coordinate{start.x + 1.0, start.y, start.z}
            : Coordinate{start.x, start.y + 1.0, start.z};
        Coordinate current = closestPointOn2DLine(start, end, event.positionOrPixel);
        return [start, end, current](const InteractionEvent& e) mutable {
            const Coordinate next = closestPointOn2DLine(start, end, e.positionOrPixel);
            const Coordinate delta{next.x - current.x, next.y - current.y, 0.0};
            current = next;
            return delta;
        };
    }

    Coordinate current = event.positionOrPixel;
    return [current](const InteractionEvent& e) mutable {
        const Coordinate delta{e.positionOrPixel.x - current.x, e.positionOrPixel.y - current.y, 0.0};
        current = e.positionOrPixel;
        return delta;
    };
}

TranslateInteraction::DeltaCallback TranslateInteraction::dragAlongPlane3D(
    AxisAndPlanes axis,
    const InteractionEvent& event) const {
    const MapView* map = event.map;
    const Coordinate center = handler_.center();
    Plane plane;
    if (axis == AxisAndPlanes::Z) {
        plane = map->verticalPlaneAt(center);
    } else if (axis == AxisAndPlanes::XZ) {
        plane = {center, {0.0, 1.0, 0.0}};
    } else if (axis == AxisAndPlanes::YZ) {
        plane = {center, {1.0, 0.0, 0.0}};
    } else {
        plane = {center, {0.0, 0.0, 1.0}};
    }

    Coordinate current = center;
    if (!map->pickOnPlane(plane, event.windowPosition, current)) current = center;

    return [map, plane, axis, current](const InteractionEvent& e) mutable {
        Coordinate next;
        if (!map->pickOnPlane(plane, e.windowPosition, next)) return Coordinate{};
        Coordinate delta{next.x - current.x, next.y - current.y, next.z - current.z};
        current = next;
        switch (axis) {
            case AxisAndPlanes::X: delta.y = 0.0; delta.z = 0.0; break;
            case AxisAndPlanes::Y: delta.x = 0.0; delta.z = 0.0; break;
            case AxisAndPlanes::Z: delta.x = 0.0; delta.y = 0.0; break;
            case AxisAndPlanes::XY: delta.z = 0.0; break;
            case AxisAndPlanes::XZ: delta.y = 0.0; break;
            case AxisAndPlanes::YZ: delta.x = 0.0; break;
            default: break;
        }
        return delta;
    };
}

void TranslateInteraction::destroy() {
    getDelta_ = nullptr;
}
