#pragma once

#include "mapedit/create/create_interaction.h"

// The first click fixes the center, moves set the radius to the 2D distance of the
// pointer and the second click commits the circle.
class CreateCircleInteraction : public CreateInteraction {
public:
    CreateCircleInteraction();
    void pipe(InteractionEvent& event) override;
};
