#include "mapedit/edit/map_interaction_controller.h"
#include "mapedit/map/map_view.h"

MapInteractionController::MapInteractionController(const FeatureLayer& scratchLayer)
    : Interaction(EventType::DragEvents),
      scratchLayer_(scratchLayer) {}

void MapInteractionController::pipe(InteractionEvent& event) {
    if (event.type == EventType::DragStart) {
        if (event.map && event.featureLayer == &scratchLayer_ && event.featureId != 0) {
            reset();
            event.map->setNavigationEnabled(false);
            disabledOn_ = event.map;
        }
    } else if (event.type == EventType::DragEnd) {
        reset();
    }
}

void MapInteractionController::reset() {
    if (!disabledOn_) return;
    disabledOn_->setNavigationEnabled(true);
    disabledOn_ = nullptr;
}

void MapInteractionController::destroy() {
    reset();
}
