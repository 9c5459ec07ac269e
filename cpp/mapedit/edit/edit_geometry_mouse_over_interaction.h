#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/interaction.h"
#include <cstdint>

class FeatureLayer;

enum class EditCursor : std::uint8_t {
    Auto = 0,
    Translate = 1, // over a handle
    Remove = 2,    // over a handle with SHIFT held
    Insert = 3,    // over an edge of the edited feature
};

// Tracks what the pointer hovers during geometry editing and reports the cursor to show.
class EditGeometryMouseOverInteraction : public Interaction {
public:
    EditGeometryMouseOverInteraction(const FeatureLayer& scratchLayer, bool denyRemoval, bool denyInsertion);

    void pipe(InteractionEvent& event) override;
    void modifierChanged(ModificationKey modifier) override;
    void destroy() override;

    // `insertable` is false for kinds without vertex insertion.
    void setEditedFeature(const FeatureLayer* layer, std::uint32_t featureId, bool insertable);
    void reset();

    EditCursor cursor() const noexcept { return cursor_; }
    Signal<EditCursor> cursorChanged;

private:
    enum class Hover : std::uint8_t { Nothing, Handle, EditedFeature };

    void update();

    const FeatureLayer& scratchLayer_;
    bool denyRemoval_;
    bool denyInsertion_;
    const FeatureLayer* editedLayer_ = nullptr;
    std::uint32_t editedId_ = 0;
    bool insertable_ = false;
    Hover hover_ = Hover::Nothing;
    ModificationKey modifier_ = ModificationKey::None;
    EditCursor cursor_ = EditCursor::Auto;
};
