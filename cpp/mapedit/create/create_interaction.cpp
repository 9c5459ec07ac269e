#include "mapedit/create/create_interaction.h"
#include "mapedit/core/logging.h"
#include "mapedit/map/map_view.h"
#include "mapedit/validation/geometry_validation.h"

CreateInteraction::CreateInteraction(GeometryKind kind, EventType defaultActive)
    : Interaction(defaultActive, ModificationKey::All, PointerKey::Left) {
    geometry_.kind = kind;
}

void CreateInteraction::start(const InteractionEvent& event) {
    geometry_.layout = (event.map && event.map->is3D()) ? GeometryLayout::XYZ : GeometryLayout::XY;
    started_ = true;
}

Coordinate CreateInteraction::eventCoordinate(const InteractionEvent& event) const {
    Coordinate c = event.positionOrPixel;
    if (geometry_.layout == GeometryLayout::XY) c.z = 0.0;
    return c;
}

void CreateInteraction::finish() {
    if (finished_) return;
    finished_ = true;
    setActive(EventType::None);
    prepareFinish();

    const bool valid = started_ && isGeometryValid(geometry_);
    if (started_ && !valid) {
        MAPEDIT_LOG_DEBUG("discarding invalid %s", geometryKindName(geometry_.kind));
    }
    finished.raise(valid ? &geometry_ : nullptr);
}

void CreateInteraction::destroy() {
    created.clear();
    changed.clear();
    finished.clear();
}
