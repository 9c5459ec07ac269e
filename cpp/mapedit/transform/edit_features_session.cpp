#include "mapedit/transform/edit_features_session.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/core/logging.h"
#include "mapedit/edit/editor_helpers.h"
#include "mapedit/edit/map_interaction_controller.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_context.h"
#include "mapedit/map/map_view.h"
#include "mapedit/transform/extrude_interaction.h"
#include "mapedit/transform/rotate_interaction.h"
#include "mapedit/transform/scale_interaction.h"
#include "mapedit/transform/transformation_handler.h"
#include "mapedit/transform/translate_interaction.h"

#include <algorithm>

EditFeaturesSession::EditFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId,
    TransformationMode initialMode)
    : EditorSession(SessionKind::EditFeatures),
      context_(context),
      layer_(layer),
      mode_(initialMode),
      chainSetup_(setupInteractionChain(context.dispatcher(), interactionId)),
      scratch_(setupScratchLayer(context.layers(), context.dispatcher().featureInteraction())) {
    modificationKey_ = context_.dispatcher().modifier();
    mapController_ = std::make_shared<MapInteractionController>(*scratch_.layer);
    chainSetup_.chain->addInteraction(mapController_);

    listeners_.push(chainSetup_.removed->connect([this]() { stop(); }));
    listeners_.push(context_.dispatcher().modifierChanged.connect([this](ModificationKey key) {
        modificationKey_ = key;
        const bool allowPicking = key == ModificationKey::Ctrl;
        for (const std::uint32_t id : currentFeatures_) {
            if (Feature* feature = layer_.getFeature(id)) feature->allowPicking = allowPicking;
        }
    }));
    listeners_.push(context_.mapActivated.connect([this](MapView* map) { setupActiveMap(map); }));
    listeners_.push(layer_.featureRemoved.connect([this](std::uint32_t id) {
        const auto it = std::find(currentFeatures_.begin(), currentFeatures_.end(), id);
        if (it == currentFeatures_.end()) return;
        currentFeatures_.erase(it);
        allowPickingMap_.erase(id);
        if (handler_) handler_->setFeatures(layer_, currentFeatures_);
    }));
    listeners_.push([this]() {
        if (imageChangedListener_) imageChangedListener_();
        imageChangedListener_ = nullptr;
    });

    setupActiveMap(context_.activeMap());
}

EditFeaturesSession::~EditFeaturesSession() {
    stop();
}

// ============================================================================
// Picking
// ============================================================================

void EditFeaturesSession::setAllowPicking(std::uint32_t id) {
    Feature* feature = layer_.getFeature(id);
    if (!feature) return;
    if (allowPickingMap_.find(id) == allowPickingMap_.end()) {
        allowPickingMap_.emplace(id, feature->allowPicking);
    }
    if (modificationKey_ != ModificationKey::Ctrl) {
        feature->allowPicking = false;
    }
}

void EditFeaturesSession::clearAllowPicking(std::uint32_t id) {
    const auto it = allowPickingMap_.find(id);
    if (it == allowPickingMap_.end()) return;
    if (Feature* feature = layer_.getFeature(id)) {
        feature->allowPicking = it->second;
    }
    allowPickingMap_.erase(it);
}

// ============================================================================
// Transformations
// ============================================================================

void EditFeaturesSession::setupActiveMap(MapView* map) {
    if (imageChangedListener_) imageChangedListener_();
    imageChangedListener_ = nullptr;
    mapController_->reset();

    if (map && map->isOblique()) {
        imageChangedListener_ = map->imageChanged.connect([this]() { createTransformations(); });
    }

    if (mode_ == TransformationMode::Extrude && !(map && map->is3D())) {
        setMode(TransformationMode::Translate);
    } else {
        createTransformations();
    }
}

void EditFeaturesSession::destroyTransformations() {
    transformationListeners_.dispose();
    if (transformationInteraction_) {
        chainSetup_.chain->removeInteraction(transformationInteraction_.get());
        transformationInteraction_->destroy();
        transformationInteraction_.reset();
    }
    if (handler_) {
        handler_->destroy();
        handler_.reset();
    }
}

void EditFeaturesSession::createTransformations() {
    destroyTransformations();
    MapView* map = context_.activeMap();
    if (!map) return;

    handler_ = std::make_unique<TransformationHandler>(*map, *scratch_.layer, mode_);
    handler_->setFeatures(layer_, currentFeatures_);

    switch (mode_) {
        case TransformationMode::Translate: {
            auto interaction = std::make_shared<TranslateInteraction>(*handler_);
            transformationListeners_.push(interaction->translated.connect(
                [this](double dx, double dy, double dz) { translate(dx, dy, dz); }));
            transformationInteraction_ = std::move(interaction);
            break;
        }
        case TransformationMode::Rotate: {
            auto interaction = std::make_shared<RotateInteraction>(*handler_);
            transformationListeners_.push(interaction->rotated.connect([this](double angle) { rotate(angle); }));
            transformationInteraction_ = std::move(interaction);
            break;
        }
        case TransformationMode::Scale: {
            auto interaction = std::make_shared<ScaleInteraction>(*handler_);
            transformationListeners_.push(interaction->scaled.connect(
                [this](double sx, double sy, double) { scale(sx, sy); }));
            transformationInteraction_ = std::move(interaction);
            break;
        }
        case TransformationMode::Extrude: {
            auto interaction = std::make_shared<ExtrudeInteraction>(*handler_);
            transformationListeners_.push(interaction->extruded.connect([this](double dz) { extrude(dz); }));
            transformationInteraction_ = std::move(interaction);
            break;
        }
    }
    chainSetup_.chain->addInteraction(transformationInteraction_);
}

bool EditFeaturesSession::setMode(TransformationMode mode) {
    if (isStopped()) return setError(EditorError::SessionStopped);
    if (mode == mode_) return setError(EditorError::Ok);

    if (mode == TransformationMode::Extrude) {
        const MapView* map = context_.activeMap();
        if (!map || !map->is3D()) {
            MAPEDIT_LOG_WARN("Cannot set extrude mode if map is not a 3D map");
            return setError(EditorError::InvalidModeTransition);
        }
    }

    mode_ = mode;
    MAPEDIT_LOG_DEBUG("transformation mode set to %s", transformationModeName(mode_));
    createTransformations();
    modeChanged.raise(mode_);
    return setError(EditorError::Ok);
}

void EditFeaturesSession::setFeatures(const std::vector<std::uint32_t>& ids) {
    if (isStopped()) return;

    for (const std::uint32_t id : currentFeatures_) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) clearAllowPicking(id);
    }

    currentFeatures_.clear();
    for (const std::uint32_t id : ids) {
        if (!layer_.hasFeature(id)) continue;
        if (std::find(currentFeatures_.begin(), currentFeatures_.end(), id) != currentFeatures_.end()) continue;
        currentFeatures_.push_back(id);
        setAllowPicking(id);
    }

    if (handler_) handler_->setFeatures(layer_, currentFeatures_);
}

Coordinate EditFeaturesSession::pivot() const {
    if (handler_ && handler_->showing()) return handler_->center();
    Extent extent = createEmptyExtent();
    for (const std::uint32_t id : currentFeatures_) {
        if (const Geometry* geometry = layer_.geometry(id)) extendExtent(extent, *geometry);
    }
    return isEmptyExtent(extent) ? Coordinate{} : extentCenter(extent, false);
}

void EditFeaturesSession::translate(double dx, double dy, double dz) {
    if (isStopped()) return;
    for (const std::uint32_t id : currentFeatures_) {
        Geometry* geometry = layer_.geometry(id);
        if (!geometry) continue;
        translateGeometry(*geometry, dx, dy, dz);
        layer_.markGeometryChanged(id);
    }
    if (handler_) handler_->translate(dx, dy, dz);
}

void EditFeaturesSession::rotate(double angle) {
    if (isStopped()) return;
    const Coordinate center = pivot();
    for (const std::uint32_t id : currentFeatures_) {
        Geometry* geometry = layer_.geometry(id);
        if (!geometry) continue;
        rotateGeometry(*geometry, angle, center);
        layer_.markGeometryChanged(id);
    }
}

void EditFeaturesSession::scale(double sx, double sy) {
    if (isStopped()) return;
    const Coordinate center = pivot();
    for (const std::uint32_t id : currentFeatures_) {
        Geometry* geometry = layer_.geometry(id);
        if (!geometry) continue;
        scaleGeometry(*geometry, sx, sy, center);
        layer_.markGeometryChanged(id);
    }
}

void EditFeaturesSession::extrude(double dz) {
    if (isStopped()) return;
    const MapView* map = context_.activeMap();
    if (!map || !map->is3D()) return;
    for (const std::uint32_t id : currentFeatures_) {
        Feature* feature = layer_.getFeature(id);
        if (!feature) continue;
        ensureFeatureAbsolute(*feature, *map);
        feature->extrudedHeight = feature->extrudedHeight.value_or(0.0) + dz;
        layer_.markGeometryChanged(id);
    }
}

void EditFeaturesSession::stop() {
    if (!markStopped()) return;

    listeners_.dispose();
    mapController_->reset();
    destroyTransformations();
    chainSetup_.destroy();
    for (const std::uint32_t id : currentFeatures_) {
        clearAllowPicking(id);
    }
    allowPickingMap_.clear();
    currentFeatures_.clear();
    scratch_.destroy();
    MAPEDIT_LOG_DEBUG("%s session stopped", sessionKindName(kind()));
    stopped.raise();
    stopped.clear();
    modeChanged.clear();
}

std::unique_ptr<EditFeaturesSession> startEditFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId,
    TransformationMode initialMode) {
    return std::make_unique<EditFeaturesSession>(context, layer, interactionId, initialMode);
}
