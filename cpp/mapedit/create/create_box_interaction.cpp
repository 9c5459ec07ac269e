#include "mapedit/create/create_box_interaction.h"
#include "mapedit/edit/box_corners.h"

CreateBoxInteraction::CreateBoxInteraction()
    : CreateInteraction(GeometryKind::Box, EventType::ClickMove) {}

void CreateBoxInteraction::pipe(InteractionEvent& event) {
    if (event.type == EventType::Click) {
        if (!isStarted()) {
            start(event);
            origin_ = eventCoordinate(event);
            geometry_.coordinates = {origin_};
            created.raise(geometry_);
            return;
        }
        updateCorners(eventCoordinate(event));
        notifyChanged();
        finish();
    } else if (event.type == EventType::Move && isStarted()) {
        updateCorners(eventCoordinate(event));
        notifyChanged();
    }
}

void CreateBoxInteraction::updateCorners(const Coordinate& corner) {
    geometry_.coordinates = boxCornersFromOrigin(origin_, corner);
}
