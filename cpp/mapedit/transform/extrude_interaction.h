#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include "mapedit/interaction/interaction.h"
#include <functional>

class TransformationHandler;

// Drags the Z glyph of an extrude handler along the vertical plane through the pivot and
// raises the height change to the previous event.
class ExtrudeInteraction : public Interaction {
public:
    explicit ExtrudeInteraction(TransformationHandler& handler);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    bool dragging() const noexcept { return static_cast<bool>(getHeightDelta_); }

    Signal<double> extruded;

private:
    using HeightCallback = std::function<double(const InteractionEvent&)>;

    TransformationHandler& handler_;
    HeightCallback getHeightDelta_;
};
