#include "mapedit/session/session_helpers.h"
#include "mapedit/feature/layer_collection.h"
#include "mapedit/interaction/event_dispatcher.h"

InteractionChainSetup setupInteractionChain(EventDispatcher& dispatcher, const std::string& interactionId) {
    InteractionChainSetup setup;
    setup.chain = std::make_shared<InteractionChain>();
    setup.removed = std::make_shared<Signal<>>();

    std::shared_ptr<Signal<>> removed = setup.removed;
    std::function<void()> unlisten = dispatcher.addExclusiveInteraction(
        setup.chain,
        [removed]() { removed->raise(); },
        -1,
        interactionId);

    FeatureInteraction& featureInteraction = dispatcher.featureInteraction();
    const EventType previousActive = featureInteraction.active();
    featureInteraction.setActive(EventType::ClickMove | EventType::DragEvents);

    std::shared_ptr<InteractionChain> chain = setup.chain;
    setup.destroy = [unlisten, removed, chain, &featureInteraction, previousActive]() {
        unlisten();
        removed->clear();
        chain->destroy();
        featureInteraction.setActive(previousActive);
    };
    return setup;
}

ScratchLayerSetup setupScratchLayer(LayerCollection& layers, FeatureInteraction& featureInteraction) {
    ScratchLayerSetup setup;
    setup.layer = std::make_unique<FeatureLayer>("_editorScratchLayer", layers.maxZIndex() + 1);
    FeatureLayer* layer = setup.layer.get();
    layer->setVolatile(true);
    layers.add(layer);

    const auto addedId = layer->featureAdded.addListener([layer, &featureInteraction](std::uint32_t id) {
        featureInteraction.excludeFromPickPosition(layer, id);
    });
    const auto removedId = layer->featureRemoved.addListener([layer, &featureInteraction](std::uint32_t id) {
        featureInteraction.includeInPickPosition(layer, id);
    });

    setup.destroy = [layer, &layers, &featureInteraction, addedId, removedId]() {
        layer->featureAdded.removeListener(addedId);
        layer->featureRemoved.removeListener(removedId);
        for (const std::uint32_t id : layer->featureIds()) {
            featureInteraction.includeInPickPosition(layer, id);
        }
        layers.remove(layer);
        layer->clear();
    };
    return setup;
}

std::function<void()> setupPickingBehavior(EventDispatcher& dispatcher) {
    FeatureInteraction& featureInteraction = dispatcher.featureInteraction();
    const EventType previous = featureInteraction.pickPosition();
    featureInteraction.setPickPosition(EventType::ClickMove | EventType::DragEvents);
    return [&featureInteraction, previous]() {
        featureInteraction.setPickPosition(previous);
    };
}
