#include "mapedit/select/select_feature_interaction.h"

SelectFeatureInteraction::SelectFeatureInteraction(const FeatureLayer& layer)
    : Interaction(EventType::Click),
      layer_(layer) {}

void SelectFeatureInteraction::pipe(InteractionEvent& event) {
    const bool onLayer = hasPickedFeature(event) && event.featureLayer == &layer_;
    clicked.raise(onLayer ? event.featureId : 0, event.key);
}
