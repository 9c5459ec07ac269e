#pragma once

#include "mapedit/core/types.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/session/editor_session.h"
#include "mapedit/session/session_helpers.h"
#include "mapedit/transform/transformation_types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class FeatureLayer;
class Interaction;
class MapContext;
class MapInteractionController;
class MapView;
class TransformationHandler;

// Translates, rotates, scales and extrudes a set of features of one layer as a whole.
// Selected features are not pickable while transformed, unless CTRL is held.
class EditFeaturesSession : public EditorSession {
public:
    EditFeaturesSession(
        MapContext& context,
        FeatureLayer& layer,
        const std::string& interactionId = {},
        TransformationMode initialMode = TransformationMode::Translate);
    ~EditFeaturesSession() override;

    void stop() override;

    TransformationMode mode() const noexcept { return mode_; }
    // Rebuilds the handler for the new mode. Extrude needs a 3D view; returns false and
    // keeps the mode otherwise.
    bool setMode(TransformationMode mode);

    void setFeatures(const std::vector<std::uint32_t>& ids);
    const std::vector<std::uint32_t>& features() const { return currentFeatures_; }

    void translate(double dx, double dy, double dz);
    // Rotates about the handler pivot, or the center of the features without a handler.
    void rotate(double angle);
    void scale(double sx, double sy);
    // Raises the extrusion of every feature, after giving it an absolute height.
    void extrude(double dz);

    FeatureLayer& layer() { return layer_; }
    FeatureLayer* scratchLayer() { return scratch_.layer.get(); }
    TransformationHandler* transformationHandler() { return handler_.get(); }
    Interaction* transformationInteraction() { return transformationInteraction_.get(); }

    Signal<TransformationMode> modeChanged;

private:
    void createTransformations();
    void destroyTransformations();
    void setupActiveMap(MapView* map);
    Coordinate pivot() const;

    void setAllowPicking(std::uint32_t id);
    void clearAllowPicking(std::uint32_t id);

    MapContext& context_;
    FeatureLayer& layer_;
    TransformationMode mode_;
    InteractionChainSetup chainSetup_;
    ScratchLayerSetup scratch_;
    std::shared_ptr<MapInteractionController> mapController_;
    std::unique_ptr<TransformationHandler> handler_;
    std::shared_ptr<Interaction> transformationInteraction_;
    DisposerList transformationListeners_;
    std::vector<std::uint32_t> currentFeatures_;
    // Feature id to its allowPicking value before it was selected.
    std::unordered_map<std::uint32_t, std::optional<bool>> allowPickingMap_;
    ModificationKey modificationKey_ = ModificationKey::None;
    std::function<void()> imageChangedListener_;
    DisposerList listeners_;
};

std::unique_ptr<EditFeaturesSession> startEditFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId = {},
    TransformationMode initialMode = TransformationMode::Translate);
