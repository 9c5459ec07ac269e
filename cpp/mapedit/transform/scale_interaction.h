#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include "mapedit/interaction/interaction.h"
#include "mapedit/transform/transformation_types.h"
#include <functional>

class TransformationHandler;

struct ScaleFactors {
    double sx{1.0};
    double sy{1.0};
    double sz{1.0};
};

// Drags the glyphs of a scale handler. Each event yields factors relative to the previous
// event: the ratio of the pointer distances to the pivot, negated on the axes where the
// pointer crossed the pivot.
class ScaleInteraction : public Interaction {
public:
    explicit ScaleInteraction(TransformationHandler& handler);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    bool dragging() const noexcept { return static_cast<bool>(getScale_); }

    Signal<double, double, double> scaled;

private:
    using ScaleCallback = std::function<ScaleFactors(const InteractionEvent&)>;

    TransformationHandler& handler_;
    ScaleCallback getScale_;
};
