#include "mapedit/create/create_point_interaction.h"

CreatePointInteraction::CreatePointInteraction()
    : CreateInteraction(GeometryKind::Point, EventType::Click) {}

void CreatePointInteraction::pipe(InteractionEvent& event) {
    if (event.type != EventType::Click || isStarted()) return;
    start(event);
    geometry_.coordinates = {eventCoordinate(event)};
    created.raise(geometry_);
    finish();
}
