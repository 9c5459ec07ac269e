#include "mapedit/interaction/feature_interaction.h"
#include "mapedit/feature/feature_layer.h"

FeatureInteraction::FeatureInteraction()
    : Interaction(
        static_cast<EventType>(static_cast<std::uint32_t>(EventType::All) ^ static_cast<std::uint32_t>(EventType::Move)),
        ModificationKey::All,
        PointerKey::All) {}

void FeatureInteraction::pipe(InteractionEvent& event) {
    if (event.type == EventType::Drag && !hasFlag(pickPosition_, EventType::Drag)) {
        event.featureLayer = draggingLayer_;
        event.featureId = draggingId_;
        return;
    }

    if (hasPickedFeature(event)) {
        const Feature* feature = event.featureLayer->getFeature(event.featureId);
        if (!feature || (feature->allowPicking.has_value() && !*feature->allowPicking)) {
            event.featureLayer = nullptr;
            event.featureId = 0;
        }
    }

    if (hasFlag(pickPosition_, event.type) && hasPickedFeature(event)
        && !isExcludedFromPickPosition(event.featureLayer, event.featureId)) {
        event.exactPosition = true;
    }

    if (event.type == EventType::DragStart) {
        draggingLayer_ = event.featureLayer;
        draggingId_ = event.featureId;
    } else if ((event.type == EventType::Drag || event.type == EventType::DragEnd) && draggingId_ != 0) {
        event.featureLayer = draggingLayer_;
        event.featureId = draggingId_;
    }

    if (event.type == EventType::DragEnd) {
        draggingLayer_ = nullptr;
        draggingId_ = 0;
    }
}

void FeatureInteraction::destroy() {
    draggingLayer_ = nullptr;
    draggingId_ = 0;
    excluded_.clear();
}

void FeatureInteraction::excludeFromPickPosition(const FeatureLayer* layer, std::uint32_t id) {
    excluded_.insert({layer, id});
}

void FeatureInteraction::includeInPickPosition(const FeatureLayer* layer, std::uint32_t id) {
    excluded_.erase({layer, id});
}

bool FeatureInteraction::isExcludedFromPickPosition(const FeatureLayer* layer, std::uint32_t id) const {
    return excluded_.find({layer, id}) != excluded_.end();
}
