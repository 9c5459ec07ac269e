#include "mapedit/edit/remove_vertex_interaction.h"
#include "mapedit/edit/vertex_list.h"

RemoveVertexInteraction::RemoveVertexInteraction(const VertexList& vertices)
    : Interaction(EventType::Click, ModificationKey::Shift),
      vertices_(vertices) {}

void RemoveVertexInteraction::pipe(InteractionEvent& event) {
    if (!hasPickedFeature(event) || !vertices_.contains(event.featureLayer, event.featureId)) return;
    vertexRemoved.raise(event.featureId);
    event.stopPropagation = true;
}

void RemoveVertexInteraction::destroy() {
    vertexRemoved.clear();
}
