#include "mapedit/interaction/event_dispatcher.h"
#include "mapedit/core/logging.h"

#include <algorithm>

EventDispatcher::EventDispatcher()
    : featureInteraction_(std::make_shared<FeatureInteraction>()) {
    chain_.addInteraction(featureInteraction_);
}

EventDispatcher::~EventDispatcher() {
    exclusive_ = ExclusiveState{};
    chain_.destroy();
}

void EventDispatcher::dispatch(InteractionEvent& event) {
    if (!featureInteraction_->accepts(event)) {
        event.featureLayer = nullptr;
        event.featureId = 0;
    }
    chain_.pipe(event);
}

void EventDispatcher::setModifier(ModificationKey modifier) {
    if (modifier == modifier_) return;
    modifier_ = modifier;
    chain_.modifierChanged(modifier);
    modifierChanged.raise(modifier);
}

std::function<void()> EventDispatcher::addExclusiveInteraction(
    std::shared_ptr<Interaction> interaction,
    std::function<void()> removed,
    int index,
    std::string id) {
    if (!interaction) return [] {};

    if (exclusive_.active && exclusive_.id != id) {
        removeExclusive();
    }
    chain_.addInteraction(interaction, index);
    if (exclusive_.active) {
        exclusive_.interactions.push_back(interaction);
        exclusive_.callbacks.push_back(std::move(removed));
    } else {
        exclusive_.active = true;
        exclusive_.id = id.empty() ? "exclusive-" + std::to_string(nextExclusiveId_++) : std::move(id);
        exclusive_.interactions = {interaction};
        exclusive_.callbacks.clear();
        exclusive_.callbacks.push_back(std::move(removed));
    }
    MAPEDIT_LOG_DEBUG("exclusive interaction added (%s)", exclusive_.id.c_str());
    exclusiveAdded.raise();

    const Interaction* raw = interaction.get();
    const std::string registeredId = exclusive_.id;
    return [this, raw, registeredId]() { removeExclusiveInteraction(raw, registeredId); };
}

void EventDispatcher::removeExclusive() {
    if (!exclusive_.active) return;
    ExclusiveState displaced;
    std::swap(displaced, exclusive_);
    for (const auto& interaction : displaced.interactions) {
        if (interaction) chain_.removeInteraction(interaction.get());
    }
    MAPEDIT_LOG_DEBUG("exclusive interaction removed (%s)", displaced.id.c_str());
    for (const auto& callback : displaced.callbacks) {
        if (callback) callback();
    }
    exclusiveRemoved.raise();
}

int EventDispatcher::removeExclusiveInteraction(const Interaction* interaction, const std::string& id) {
    if (!exclusive_.active || exclusive_.id != id) return 0;
    const int removed = chain_.removeInteraction(interaction);
    const auto it = std::find_if(exclusive_.interactions.begin(), exclusive_.interactions.end(), [interaction](const auto& entry) {
        return entry.get() == interaction;
    });
    if (it != exclusive_.interactions.end()) {
        const auto slot = it - exclusive_.interactions.begin();
        exclusive_.interactions[slot].reset();
        exclusive_.callbacks[slot] = nullptr;
    }
    const bool empty = std::none_of(exclusive_.interactions.begin(), exclusive_.interactions.end(), [](const auto& entry) {
        return static_cast<bool>(entry);
    });
    if (empty) {
        exclusive_ = ExclusiveState{};
    }
    if (removed > -1) {
        exclusiveRemoved.raise();
    }
    return removed != -1 ? 1 : 0;
}

std::function<void()> EventDispatcher::addPersistentInteraction(std::shared_ptr<Interaction> interaction, int index) {
    if (!interaction) return [] {};
    const Interaction* raw = interaction.get();
    chain_.addInteraction(std::move(interaction), index);
    return [this, raw]() { chain_.removeInteraction(raw); };
}
