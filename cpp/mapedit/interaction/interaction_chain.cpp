#include "mapedit/interaction/interaction_chain.h"

#include <algorithm>

InteractionChain::InteractionChain()
    : Interaction(EventType::All, ModificationKey::All, PointerKey::All) {}

InteractionChain::InteractionChain(std::vector<std::shared_ptr<Interaction>> interactions)
    : Interaction(EventType::All, ModificationKey::All, PointerKey::All),
      chain_(std::move(interactions)) {}

void InteractionChain::pipe(InteractionEvent& event) {
    // Interactions may add or remove chain members while handling the event.
    const std::vector<std::shared_ptr<Interaction>> snapshot = chain_;
    for (const auto& interaction : snapshot) {
        if (!interaction->accepts(event)) continue;
        interaction->pipe(event);
        if (event.stopPropagation) break;
    }
}

void InteractionChain::modifierChanged(ModificationKey modifier) {
    const std::vector<std::shared_ptr<Interaction>> snapshot = chain_;
    for (const auto& interaction : snapshot) {
        interaction->modifierChanged(modifier);
    }
}

void InteractionChain::destroy() {
    std::vector<std::shared_ptr<Interaction>> registered;
    registered.swap(chain_);
    for (const auto& interaction : registered) {
        interaction->destroy();
    }
}

void InteractionChain::addInteraction(std::shared_ptr<Interaction> interaction, int index) {
    if (!interaction) return;
    if (index < 0 || static_cast<std::size_t>(index) >= chain_.size()) {
        chain_.push_back(std::move(interaction));
        return;
    }
    chain_.insert(chain_.begin() + index, std::move(interaction));
}

int InteractionChain::removeInteraction(const Interaction* interaction) {
    const auto it = std::find_if(chain_.begin(), chain_.end(), [interaction](const auto& entry) {
        return entry.get() == interaction;
    });
    if (it == chain_.end()) return -1;
    const int index = static_cast<int>(it - chain_.begin());
    chain_.erase(it);
    return index;
}

bool InteractionChain::contains(const Interaction* interaction) const {
    return std::any_of(chain_.begin(), chain_.end(), [interaction](const auto& entry) {
        return entry.get() == interaction;
    });
}
