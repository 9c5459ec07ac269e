#include "mapedit/create/create_circle_interaction.h"
#include "mapedit/core/geometry_math.h"

CreateCircleInteraction::CreateCircleInteraction()
    : CreateInteraction(GeometryKind::Circle, EventType::ClickMove) {}

void CreateCircleInteraction::pipe(InteractionEvent& event) {
    if (event.type == EventType::Click && !isStarted()) {
        start(event);
        geometry_.coordinates = {eventCoordinate(event)};
        geometry_.radius = 0.0;
        created.raise(geometry_);
        return;
    }
    if (!isStarted()) return;
    if (event.type != EventType::Click && event.type != EventType::Move) return;

    geometry_.radius = distance2D(geometry_.coordinates.front(), eventCoordinate(event));
    notifyChanged();
    if (event.type == EventType::Click) finish();
}
