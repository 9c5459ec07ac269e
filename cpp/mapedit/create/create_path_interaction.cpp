#include "mapedit/create/create_path_interaction.h"

CreatePathInteraction::CreatePathInteraction(GeometryKind kind)
    : CreateInteraction(kind, EventType::ClickMove | EventType::DblClick) {}

void CreatePathInteraction::pipe(InteractionEvent& event) {
    if (event.type == EventType::Click) {
        if (!isStarted()) {
            start(event);
            committed_.push_back(eventCoordinate(event));
            updateGeometry();
            created.raise(geometry_);
            return;
        }
        const Coordinate c = eventCoordinate(event);
        const Coordinate& last = committed_.back();
        // The click preceding a double click lands on the last vertex.
        if (c.x == last.x && c.y == last.y) return;
        committed_.push_back(c);
        hasPreview_ = false;
        updateGeometry();
        notifyChanged();
    } else if (event.type == EventType::Move && isStarted()) {
        preview_ = eventCoordinate(event);
        hasPreview_ = true;
        updateGeometry();
        notifyChanged();
    } else if (event.type == EventType::DblClick && isStarted()) {
        finish();
    }
}

void CreatePathInteraction::prepareFinish() {
    hasPreview_ = false;
    updateGeometry();
}

void CreatePathInteraction::updateGeometry() {
    geometry_.coordinates = committed_;
    if (hasPreview_) geometry_.coordinates.push_back(preview_);
}
