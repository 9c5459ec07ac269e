#pragma once

#include "mapedit/create/create_interaction.h"

// A single click creates and finishes the point.
class CreatePointInteraction : public CreateInteraction {
public:
    CreatePointInteraction();
    void pipe(InteractionEvent& event) override;
};
