#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/interaction/interaction_chain.h"
#include <functional>
#include <memory>
#include <string>

class EventDispatcher;
class FeatureInteraction;
class LayerCollection;

struct InteractionChainSetup {
    std::shared_ptr<InteractionChain> chain;
    // Raised when the dispatcher displaces the chain.
    std::shared_ptr<Signal<>> removed;
    std::function<void()> destroy;
};

struct ScratchLayerSetup {
    std::unique_ptr<FeatureLayer> layer;
    std::function<void()> destroy;
};

// Registers a new chain as the exclusive interaction and widens the feature interaction to
// ClickMove | DragEvents until destroy() is called.
InteractionChainSetup setupInteractionChain(EventDispatcher& dispatcher, const std::string& interactionId = {});

// Creates a volatile layer above all others, whose features never provide a pick position.
ScratchLayerSetup setupScratchLayer(LayerCollection& layers, FeatureInteraction& featureInteraction);

// Picks positions on features for ClickMove | DragEvents; returns the restore function.
std::function<void()> setupPickingBehavior(EventDispatcher& dispatcher);
