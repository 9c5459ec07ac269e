#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include "mapedit/interaction/interaction.h"
#include "mapedit/transform/transformation_types.h"
#include <functional>

class TransformationHandler;

// Drags the glyphs of a translate handler. Raises the delta to the previous event on every
// Drag and on DragEnd.
class TranslateInteraction : public Interaction {
public:
    explicit TranslateInteraction(TransformationHandler& handler);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    bool dragging() const noexcept { return static_cast<bool>(getDelta_); }

    Signal<double, double, double> translated;

private:
    using DeltaCallback = std::function<Coordinate(const InteractionEvent&)>;

    DeltaCallback dragAlongAxis2D(AxisAndPlanes axis, const InteractionEvent& event) const;
    DeltaCallback dragAlongPlane3D(AxisAndPlanes axis, const InteractionEvent& event) const;

    TransformationHandler& handler_;
    DeltaCallback getDelta_;
};
