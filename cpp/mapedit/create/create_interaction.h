#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include "mapedit/interaction/interaction.h"

// Contract shared by the creation state machines. `created` is raised after the first
// click, `changed` whenever the nascent geometry is updated and `finished` exactly once,
// with the geometry if it is valid and nullptr otherwise. A finished interaction is
// inactive.
class CreateInteraction : public Interaction {
public:
    CreateInteraction(GeometryKind kind, EventType defaultActive);

    GeometryKind geometryKind() const noexcept { return geometry_.kind; }
    const Geometry& geometry() const { return geometry_; }
    bool isStarted() const noexcept { return started_; }
    bool isFinished() const noexcept { return finished_; }

    void finish();
    void destroy() override;

    Signal<const Geometry&> created;
    Signal<const Geometry&> changed;
    Signal<const Geometry*> finished;

protected:
    // Called once before validation; drops preview state.
    virtual void prepareFinish() {}

    void start(const InteractionEvent& event);
    // positionOrPixel in the layout of the geometry.
    Coordinate eventCoordinate(const InteractionEvent& event) const;
    void notifyChanged() { changed.raise(geometry_); }

    Geometry geometry_;

private:
    bool started_ = false;
    bool finished_ = false;
};
