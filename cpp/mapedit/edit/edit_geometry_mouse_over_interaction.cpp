#include "mapedit/edit/edit_geometry_mouse_over_interaction.h"

EditGeometryMouseOverInteraction::EditGeometryMouseOverInteraction(
    const FeatureLayer& scratchLayer,
    bool denyRemoval,
    bool denyInsertion)
    : Interaction(EventType::Move),
      scratchLayer_(scratchLayer),
      denyRemoval_(denyRemoval),
      denyInsertion_(denyInsertion) {}

void EditGeometryMouseOverInteraction::pipe(InteractionEvent& event) {
    modifier_ = event.key;
    if (!hasPickedFeature(event)) {
        hover_ = Hover::Nothing;
    } else if (event.featureLayer == &scratchLayer_) {
        hover_ = Hover::Handle;
    } else if (event.featureLayer == editedLayer_ && event.featureId == editedId_) {
        hover_ = Hover::EditedFeature;
    } else {
        hover_ = Hover::Nothing;
    }
    update();
}

void EditGeometryMouseOverInteraction::modifierChanged(ModificationKey modifier) {
    modifier_ = modifier;
    update();
}

void EditGeometryMouseOverInteraction::update() {
    EditCursor next = EditCursor::Auto;
    if (hover_ == Hover::Handle) {
        next = (modifier_ == ModificationKey::Shift && !denyRemoval_) ? EditCursor::Remove : EditCursor::Translate;
    } else if (hover_ == Hover::EditedFeature && insertable_ && !denyInsertion_ && modifier_ == ModificationKey::None) {
        next = EditCursor::Insert;
    }
    if (next == cursor_) return;
    cursor_ = next;
    cursorChanged.raise(cursor_);
}

void EditGeometryMouseOverInteraction::setEditedFeature(const FeatureLayer* layer, std::uint32_t featureId, bool insertable) {
    editedLayer_ = layer;
    editedId_ = featureId;
    insertable_ = insertable;
}

void EditGeometryMouseOverInteraction::reset() {
    hover_ = Hover::Nothing;
    update();
}

void EditGeometryMouseOverInteraction::destroy() {
    reset();
    cursorChanged.clear();
}
