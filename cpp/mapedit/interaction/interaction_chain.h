#pragma once

#include "mapedit/interaction/interaction.h"
#include <memory>
#include <vector>

// Ordered list of interactions. Events are threaded through the accepting interactions in
// list order until one sets stopPropagation.
class InteractionChain : public Interaction {
public:
    InteractionChain();
    explicit InteractionChain(std::vector<std::shared_ptr<Interaction>> interactions);

    void pipe(InteractionEvent& event) override;
    void modifierChanged(ModificationKey modifier) override;
    // Destroys the interactions still registered and empties the chain.
    void destroy() override;

    // index < 0 or past the end appends.
    void addInteraction(std::shared_ptr<Interaction> interaction, int index = -1);
    // Returns the index the interaction had, or -1 if it was not registered.
    int removeInteraction(const Interaction* interaction);

    bool contains(const Interaction* interaction) const;
    std::size_t size() const noexcept { return chain_.size(); }
    const std::vector<std::shared_ptr<Interaction>>& interactions() const { return chain_; }

private:
    std::vector<std::shared_ptr<Interaction>> chain_;
};
