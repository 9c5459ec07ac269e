#include "mapedit/transform/rotate_interaction.h"
#include "mapedit/map/map_view.h"
#include "mapedit/transform/transformation_handler.h"

#include <algorithm>
#include <cmath>

double signedAngleBetween(double x1, double y1, double x2, double y2) {
    const double l1 = std::hypot(x1, y1);
    const double l2 = std::hypot(x2, y2);
    if (l1 == 0.0 || l2 == 0.0) return 0.0;
    const double cosAngle = std::clamp((x1 * x2 + y1 * y2) / (l1 * l2), -1.0, 1.0);
    const double angle = std::acos(cosAngle);
    return x1 * y2 - y1 * x2 > 0.0 ? angle : -angle;
}

RotateInteraction::RotateInteraction(TransformationHandler& handler)
    : Interaction(EventType::DragEvents),
      handler_(handler) {}

void RotateInteraction::pipe(InteractionEvent& event) {
    if (getAngle_) {
        rotated.raise(getAngle_(event));
        if (event.type == EventType::DragEnd) {
            getAngle_ = nullptr;
            handler_.setShowAxis(AxisAndPlanes::None);
        }
        return;
    }
    if (event.type != EventType::DragStart) return;

    const AxisAndPlanes axis = handler_.axisOf(event.featureLayer, event.featureId);
    if (axis == AxisAndPlanes::None) return;
    handler_.setShowAxis(axis);

    const Coordinate center = handler_.center();
    const MapView* map = event.map;
    const bool is3D = map && map->is3D();
    const Plane plane{center, {0.0, 0.0, 1.0}};

    // Vector from the pointer to the pivot; empty when the pointer misses the plane.
    auto vectorTo = [center, map, is3D, plane](const InteractionEvent& e, Coordinate& out) {
        Coordinate position = e.positionOrPixel;
        if (is3D && !map->pickOnPlane(plane, e.windowPosition, position)) return false;
        out = {center.x - position.x, center.y - position.y, 0.0};
        return true;
    };

    Coordinate current;
    if (!vectorTo(event, current)) current = Coordinate{};
    getAngle_ = [vectorTo, current](const InteractionEvent& e) mutable {
        Coordinate next;
        if (!vectorTo(e, next)) return 0.0;
        const double angle = signedAngleBetween(current.x, current.y, next.x, next.y);
        current = next;
        return angle;
    };
}

void RotateInteraction::destroy() {
    getAngle_ = nullptr;
}
