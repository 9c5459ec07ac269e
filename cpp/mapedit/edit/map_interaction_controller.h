#pragma once

#include "mapedit/interaction/interaction.h"

class FeatureLayer;
class MapView;

// Disables camera navigation while a handle on the scratch layer is dragged.
class MapInteractionController : public Interaction {
public:
    explicit MapInteractionController(const FeatureLayer& scratchLayer);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    // Re-enables navigation on the view it was disabled on.
    void reset();

private:
    const FeatureLayer& scratchLayer_;
    MapView* disabledOn_ = nullptr;
};
