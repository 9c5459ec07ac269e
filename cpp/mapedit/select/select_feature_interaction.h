#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/interaction.h"
#include <cstdint>

class FeatureLayer;

// Reports clicks to the selection: the id of the clicked feature of the layer, or 0 for a
// click on anything else.
class SelectFeatureInteraction : public Interaction {
public:
    explicit SelectFeatureInteraction(const FeatureLayer& layer);

    void pipe(InteractionEvent& event) override;

    Signal<std::uint32_t, ModificationKey> clicked;

private:
    const FeatureLayer& layer_;
};
