#include "mapedit/transform/scale_interaction.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/map/map_view.h"
#include "mapedit/transform/transformation_handler.h"

#include <cmath>

namespace {
    struct PivotDistance {
        double distance;
        double dx;
        double dy;
        double dz;
    };

    PivotDistance distanceToPivot(AxisAndPlanes axis, const Coordinate& center, const Coordinate& position) {
        const double dx = position.x - center.x;
        const double dy = position.y - center.y;
        const double dz = std::isfinite(position.z - center.z) ? position.z - center.z : 0.0;
        double distance;
        switch (axis) {
            case AxisAndPlanes::X: distance = std::abs(dx); break;
            case AxisAndPlanes::Y: distance = std::abs(dy); break;
            case AxisAndPlanes::Z: distance = std::abs(dz); break;
            case AxisAndPlanes::XYZ: distance = distance3D(center, position); break;
            default: distance = distance2D(center, position); break;
        }
        return {distance, dx, dy, dz};
    }
}

ScaleInteraction::ScaleInteraction(TransformationHandler& handler)
    : Interaction(EventType::DragEvents),
      handler_(handler) {}

void ScaleInteraction::pipe(InteractionEvent& event) {
    if (getScale_) {
        const ScaleFactors factors = getScale_(event);
        scaled.raise(factors.sx, factors.sy, factors.sz);
        if (event.type == EventType::DragEnd) {
            getScale_ = nullptr;
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
    const Plane plane = axis == AxisAndPlanes::Z
        ? Plane{center, {0.0, 1.0, 0.0}}
        : Plane{center, {0.0, 0.0, 1.0}};

    auto positionOf = [map, is3D, plane](const InteractionEvent& e, Coordinate& out) {
        out = e.positionOrPixel;
        return !is3D || map->pickOnPlane(plane, e.windowPosition, out);
    };

    Coordinate start;
    if (!positionOf(event, start)) start = center;
    const PivotDistance initial = distanceToPivot(axis, center, start);
    double currentDistance = initial.distance;
    // Side of the pivot the pointer is on, starting from where the drag began.
    bool flippedX = initial.dx < 0.0;
    bool flippedY = initial.dy < 0.0;
    bool flippedZ = initial.dz < 0.0;

    getScale_ = [positionOf, axis, center, currentDistance, flippedX, flippedY, flippedZ](
                    const InteractionEvent& e) mutable {
        Coordinate position;
        if (!positionOf(e, position)) return ScaleFactors{};
        const PivotDistance current = distanceToPivot(axis, center, position);
        const double ratio = currentDistance > 0.0 ? current.distance / currentDistance : 1.0;
        double sx = ratio;
        double sy = ratio;
        double sz = ratio;
        if ((current.dx < 0.0) != flippedX) {
            flippedX = current.dx < 0.0;
            sx = -sx;
        }
        if ((current.dy < 0.0) != flippedY) {
            flippedY = current.dy < 0.0;
            sy = -sy;
        }
        if ((current.dz < 0.0) != flippedZ) {
            flippedZ = current.dz < 0.0;
            sz = -sz;
        }
        currentDistance = current.distance;

        switch (axis) {
            case AxisAndPlanes::X: return ScaleFactors{sx, 1.0, 1.0};
            case AxisAndPlanes::Y: return ScaleFactors{1.0, sy, 1.0};
            case AxisAndPlanes::Z: return ScaleFactors{1.0, 1.0, sz};
            case AxisAndPlanes::XY: return ScaleFactors{sx, sy, 1.0};
            case AxisAndPlanes::XYZ: return ScaleFactors{sx, sy, sz};
            default: return ScaleFactors{};
        }
    };
}

void ScaleInteraction::destroy() {
    getScale_ = nullptr;
}
