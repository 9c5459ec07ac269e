#pragma once

#include "mapedit/edit/edit_geometry_mouse_over_interaction.h"
#include "mapedit/edit/edit_interaction_sets.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/session/editor_session.h"
#include "mapedit/session/session_helpers.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class FeatureLayer;
class MapContext;
class MapInteractionController;

// Edits the vertices of one feature of a layer at a time.
class EditGeometrySession : public EditorSession {
public:
    EditGeometrySession(
        MapContext& context,
        FeatureLayer& layer,
        const std::string& interactionId = {},
        EditGeometrySessionOptions options = {});
    ~EditGeometrySession() override;

    void stop() override;

    // Starts editing the feature; any previously edited feature is released first. Returns
    // false and clears the feature if it does not exist or its geometry is not supported.
    bool setFeature(std::uint32_t featureId);
    void clearFeature();
    std::uint32_t feature() const noexcept { return currentFeatureId_; }

    SnapType snapTo() const noexcept { return snapTo_; }
    void setSnapTo(SnapType snapTo);
    const std::vector<FeatureLayer*>& snapToLayers() const { return snapToLayers_; }
    void setSnapToLayers(std::vector<FeatureLayer*> layers);

    FeatureLayer& layer() { return layer_; }
    FeatureLayer* scratchLayer() { return scratch_.layer.get(); }
    EditInteractionSet* currentInteractionSet() { return currentSet_.get(); }
    const EditGeometrySessionOptions& options() const { return options_; }
    EditCursor cursor() const;

    Signal<EditCursor> cursorChanged;

private:
    void createCurrentInteractionSet(std::uint32_t featureId);
    void destroyCurrentInteractionSet();

    MapContext& context_;
    FeatureLayer& layer_;
    EditGeometrySessionOptions options_;
    InteractionChainSetup chainSetup_;
    ScratchLayerSetup scratch_;
    std::function<void()> resetPickingBehavior_;
    std::shared_ptr<MapInteractionController> mapController_;
    std::shared_ptr<EditGeometryMouseOverInteraction> mouseOver_;
    std::unique_ptr<EditInteractionSet> currentSet_;
    std::uint32_t currentFeatureId_ = 0;
    std::vector<FeatureLayer*> snapToLayers_;
    SnapType snapTo_ = SnapType::All;
    DisposerList listeners_;
};

std::unique_ptr<EditGeometrySession> startEditGeometrySession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId = {},
    EditGeometrySessionOptions options = {});
