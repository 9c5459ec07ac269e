#include "mapedit/edit/translate_vertex_interaction.h"
#include "mapedit/edit/vertex_list.h"
#include "mapedit/feature/feature_layer.h"

TranslateVertexInteraction::TranslateVertexInteraction(VertexList& vertices)
    : Interaction(EventType::DragEvents),
      vertices_(vertices) {}

void TranslateVertexInteraction::setPickable(std::uint32_t id, bool pickable) {
    Feature* feature = vertices_.layer().getFeature(id);
    if (!feature) return;
    if (pickable) {
        feature->allowPicking.reset();
    } else {
        feature->allowPicking = false;
    }
}

void TranslateVertexInteraction::pipe(InteractionEvent& event) {
    if (event.type == EventType::DragStart) {
        if (!hasPickedFeature(event) || !vertices_.contains(event.featureLayer, event.featureId)) return;
        draggedId_ = event.featureId;
        setPickable(draggedId_, false);
        return;
    }
    if (draggedId_ == 0) return;

    const int index = vertices_.indexOf(draggedId_);
    if (index >= 0) {
        vertices_.setCoordinateAt(static_cast<std::size_t>(index), event.positionOrPixel);
        vertexChanged.raise(static_cast<std::size_t>(index));
    }
    if (event.type == EventType::DragEnd) {
        setPickable(draggedId_, true);
        draggedId_ = 0;
    }
}

void TranslateVertexInteraction::destroy() {
    if (draggedId_ != 0) {
        setPickable(draggedId_, true);
        draggedId_ = 0;
    }
    vertexChanged.clear();
}
