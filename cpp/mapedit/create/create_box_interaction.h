#pragma once

#include "mapedit/create/create_interaction.h"

// The first click fixes the origin corner, moves span an axis aligned box to the pointer
// and the second click commits it.
class CreateBoxInteraction : public CreateInteraction {
public:
    CreateBoxInteraction();
    void pipe(InteractionEvent& event) override;

private:
    void updateCorners(const Coordinate& corner);

    Coordinate origin_{};
};
