#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/feature_interaction.h"
#include "mapedit/interaction/interaction_chain.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Entry point for host input. Owns the root chain, starting with the feature interaction,
// and arbitrates the exclusive registration used by editor sessions.
class EventDispatcher {
public:
    EventDispatcher();
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void dispatch(InteractionEvent& event);

    // Broadcasts a modifier change to the chain when it differs from the last one.
    void setModifier(ModificationKey modifier);
    ModificationKey modifier() const noexcept { return modifier_; }

    // Registers an interaction as the exclusive consumer. A registration with another id
    // displaces the current one; its interactions are removed and its removed callbacks
    // called. Registrations sharing an id are kept together. The returned function removes
    // the interaction without calling `removed`.
    std::function<void()> addExclusiveInteraction(
        std::shared_ptr<Interaction> interaction,
        std::function<void()> removed,
        int index = -1,
        std::string id = {});
    void removeExclusive();
    bool hasExclusive() const { return exclusive_.active; }
    const std::string& exclusiveId() const { return exclusive_.id; }

    // Non-exclusive registration; returns a remover.
    std::function<void()> addPersistentInteraction(std::shared_ptr<Interaction> interaction, int index = -1);

    FeatureInteraction& featureInteraction() { return *featureInteraction_; }
    InteractionChain& interactionChain() { return chain_; }

    Signal<ModificationKey> modifierChanged;
    Signal<> exclusiveAdded;
    Signal<> exclusiveRemoved;

private:
    struct ExclusiveState {
        bool active = false;
        std::string id;
        std::vector<std::shared_ptr<Interaction>> interactions;
        std::vector<std::function<void()>> callbacks;
    };

    int removeExclusiveInteraction(const Interaction* interaction, const std::string& id);

    std::shared_ptr<FeatureInteraction> featureInteraction_;
    InteractionChain chain_;
    ExclusiveState exclusive_;
    ModificationKey modifier_ = ModificationKey::None;
    std::uint32_t nextExclusiveId_ = 1;
};
