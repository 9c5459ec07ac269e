#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include "mapedit/interaction/interaction.h"
#include <functional>

class TransformationHandler;

// Signed angle in radians from (x1, y1) to (x2, y2), positive counter-clockwise. Zero if
// either vector has no length.
double signedAngleBetween(double x1, double y1, double x2, double y2);

// Drags the ring of a rotate handler. Raises the angle to the previous event, measured
// about the pivot.
class RotateInteraction : public Interaction {
public:
    explicit RotateInteraction(TransformationHandler& handler);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    bool dragging() const noexcept { return static_cast<bool>(getAngle_); }

    Signal<double> rotated;

private:
    using AngleCallback = std::function<double(const InteractionEvent&)>;

    TransformationHandler& handler_;
    AngleCallback getAngle_;
};
