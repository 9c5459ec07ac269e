#include "mapedit/edit/edit_geometry_session.h"
#include "mapedit/core/logging.h"
#include "mapedit/edit/map_interaction_controller.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_context.h"
#include "mapedit/snap/layer_snapping.h"
#include "mapedit/validation/geometry_validation.h"

EditGeometrySession::EditGeometrySession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId,
    EditGeometrySessionOptions options)
    : EditorSession(SessionKind::EditGeometry),
      context_(context),
      layer_(layer),
      options_(std::move(options)),
      chainSetup_(setupInteractionChain(context.dispatcher(), interactionId)),
      scratch_(setupScratchLayer(context.layers(), context.dispatcher().featureInteraction())),
      resetPickingBehavior_(setupPickingBehavior(context.dispatcher())) {
    snapTo_ = options_.snapTo;
    snapToLayers_ = options_.initialSnapToLayers.empty()
        ? std::vector<FeatureLayer*>{&layer_}
        : options_.initialSnapToLayers;

    mapController_ = std::make_shared<MapInteractionController>(*scratch_.layer);
    chainSetup_.chain->addInteraction(mapController_);
    mouseOver_ = std::make_shared<EditGeometryMouseOverInteraction>(
        *scratch_.layer, options_.denyRemoval, options_.denyInsertion);
    chainSetup_.chain->addInteraction(mouseOver_);
    mouseOver_->cursorChanged.addListener([this](EditCursor cursor) { cursorChanged.raise(cursor); });

    listeners_.push(chainSetup_.removed->connect([this]() { stop(); }));
    listeners_.push(context_.mapActivated.connect([this](MapView*) {
        mapController_->reset();
        mouseOver_->reset();
        destroyCurrentInteractionSet();
    }));
    listeners_.push(layer_.featureRemoved.connect([this](std::uint32_t id) {
        if (id == currentFeatureId_) destroyCurrentInteractionSet();
    }));
}

EditGeometrySession::~EditGeometrySession() {
    stop();
}

EditCursor EditGeometrySession::cursor() const {
    return mouseOver_ ? mouseOver_->cursor() : EditCursor::Auto;
}

void EditGeometrySession::destroyCurrentInteractionSet() {
    if (currentSet_) {
        chainSetup_.chain->removeInteraction(currentSet_->chain().get());
        currentSet_->destroy();
        currentSet_.reset();
    }
    if (currentFeatureId_ != 0) {
        const std::uint32_t featureId = currentFeatureId_;
        currentFeatureId_ = 0;
        context_.dispatcher().featureInteraction().includeInPickPosition(&layer_, featureId);
        const Geometry* geometry = layer_.geometry(featureId);
        if (geometry && !isGeometryValid(*geometry)) {
            MAPEDIT_LOG_DEBUG("removing feature %u with invalid geometry", featureId);
            layer_.removeFeature(featureId);
        }
    }
    mouseOver_->setEditedFeature(nullptr, 0, false);
}

void EditGeometrySession::createCurrentInteractionSet(std::uint32_t featureId) {
    destroyCurrentInteractionSet();
    if (featureId == 0) {
        setError(EditorError::Ok);
        return;
    }

    const Geometry* geometry = layer_.geometry(featureId);
    if (!geometry) {
        setError(EditorError::FeatureNotFound);
        return;
    }

    currentSet_ = createEditInteractionSet(layer_, featureId, *scratch_.layer, options_, snapTo_);
    if (!currentSet_) {
        MAPEDIT_LOG_WARN("Geometry of type %s is currently not supported", geometryKindName(geometry->kind));
        setError(EditorError::UnsupportedGeometry);
        return;
    }

    currentFeatureId_ = featureId;
    context_.dispatcher().featureInteraction().excludeFromPickPosition(&layer_, featureId);

    FeatureLayer* editedLayer = &layer_;
    auto layerSnapping = std::make_shared<LayerSnapping>(
        snapToLayers_,
        *scratch_.layer,
        [editedLayer, featureId](const FeatureLayer* layer, std::uint32_t id) {
            return !(layer == editedLayer && id == featureId);
        },
        EventType::DragEvents);
    layerSnapping->setSnapTo(snapTo_);
    currentSet_->setLayerSnapping(std::move(layerSnapping));

    chainSetup_.chain->addInteraction(currentSet_->chain());
    mouseOver_->setEditedFeature(&layer_, featureId, currentSet_->allowsInsertion());
    setError(EditorError::Ok);
}

bool EditGeometrySession::setFeature(std::uint32_t featureId) {
    if (isStopped()) return setError(EditorError::SessionStopped);
    createCurrentInteractionSet(featureId);
    return lastError() == EditorError::Ok && currentFeatureId_ == featureId;
}

void EditGeometrySession::clearFeature() {
    if (isStopped()) return;
    destroyCurrentInteractionSet();
}

void EditGeometrySession::setSnapTo(SnapType snapTo) {
    snapTo_ = snapTo;
    if (currentSet_) currentSet_->setSnapTo(snapTo_);
}

void EditGeometrySession::setSnapToLayers(std::vector<FeatureLayer*> layers) {
    snapToLayers_ = std::move(layers);
    if (currentSet_ && currentSet_->layerSnapping()) {
        currentSet_->layerSnapping()->setLayers(snapToLayers_);
    }
}

void EditGeometrySession::stop() {
    if (!markStopped()) return;

    listeners_.dispose();
    mapController_->reset();
    mouseOver_->reset();
    destroyCurrentInteractionSet();
    chainSetup_.destroy();
    scratch_.destroy();
    resetPickingBehavior_();
    MAPEDIT_LOG_DEBUG("%s session stopped", sessionKindName(kind()));
    stopped.raise();
    stopped.clear();
}

std::unique_ptr<EditGeometrySession> startEditGeometrySession(
    MapContext& context,
    FeatureLayer& layer,
    const std::string& interactionId,
    EditGeometrySessionOptions options) {
    return std::make_unique<EditGeometrySession>(context, layer, interactionId, std::move(options));
}
