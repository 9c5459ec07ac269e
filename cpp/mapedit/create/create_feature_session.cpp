#include "mapedit/create/create_feature_session.h"
#include "mapedit/core/logging.h"
#include "mapedit/create/create_box_interaction.h"
#include "mapedit/create/create_circle_interaction.h"
#include "mapedit/create/create_path_interaction.h"
#include "mapedit/create/create_point_interaction.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_context.h"
#include "mapedit/map/map_view.h"
#include "mapedit/validation/geometry_validation.h"

namespace {
    template <typename T>
    std::shared_ptr<CreateInteraction> makeCreateInteraction() {
        return std::make_shared<T>();
    }
}

const std::array<CreateInteractionFactory, geometryKindCount>& createInteractionFactories() {
    static const std::array<CreateInteractionFactory, geometryKindCount> factories = {
        &makeCreateInteraction<CreatePointInteraction>,      // Point
        &makeCreateInteraction<CreateLineStringInteraction>, // LineString
        &makeCreateInteraction<CreatePolygonInteraction>,    // Polygon
        &makeCreateInteraction<CreateBoxInteraction>,        // Box
        &makeCreateInteraction<CreateCircleInteraction>,     // Circle
    };
    return factories;
}

std::shared_ptr<CreateInteraction> createInteractionForKind(GeometryKind kind) {
    const auto index = static_cast<std::size_t>(kind);
    if (index >= geometryKindCount) return nullptr;
    return createInteractionFactories()[index]();
}

CreateFeatureSession::CreateFeatureSession(MapContext& context, FeatureLayer& layer, GeometryKind kind)
    : EditorSession(SessionKind::Create),
      context_(context),
      layer_(layer),
      kind_(kind),
      chainSetup_(setupInteractionChain(context.dispatcher())) {
    listeners_.push(chainSetup_.removed->connect([this]() { stop(); }));
    listeners_.push(context_.mapActivated.connect([this](MapView*) {
        setupActiveMap();
        resetCurrentInteraction();
    }));
    listeners_.push([this]() {
        if (imageChangedListener_) imageChangedListener_();
        imageChangedListener_ = nullptr;
    });
    setupActiveMap();
    createInteraction();
}

CreateFeatureSession::~CreateFeatureSession() {
    stop();
}

void CreateFeatureSession::setupActiveMap() {
    if (imageChangedListener_) imageChangedListener_();
    imageChangedListener_ = nullptr;
    obliqueMap_ = nullptr;

    MapView* map = context_.activeMap();
    if (map && map->isOblique()) {
        obliqueMap_ = map;
        imageChangedListener_ = map->imageChanged.connect([this]() { resetCurrentInteraction(); });
    }
}

void CreateFeatureSession::destroyCurrentInteraction() {
    interactionListeners_.dispose();
    if (currentInteraction_) {
        chainSetup_.chain->removeInteraction(currentInteraction_.get());
        currentInteraction_->destroy();
        currentInteraction_.reset();
    }
}

void CreateFeatureSession::createInteraction() {
    destroyCurrentInteraction();
    currentInteraction_ = createInteractionForKind(kind_);
    if (!currentInteraction_) {
        setError(EditorError::UnsupportedGeometry);
        return;
    }

    CreateInteraction& interaction = *currentInteraction_;
    interactionListeners_.push(interaction.created.connect([this](const Geometry& g) { onCreated(g); }));
    interactionListeners_.push(interaction.changed.connect([this](const Geometry& g) { onChanged(g); }));
    interactionListeners_.push(interaction.finished.connect([this](const Geometry* g) { onFinished(g); }));
    chainSetup_.chain->addInteraction(currentInteraction_);
}

void CreateFeatureSession::resetCurrentInteraction() {
    if (currentInteraction_ && currentInteraction_->isStarted() && !currentInteraction_->isFinished()) {
        // Keep the instance alive while its finished listeners run; they start the next one.
        std::shared_ptr<CreateInteraction> interaction = currentInteraction_;
        interaction->finish();
    } else if (!isStopped()) {
        createInteraction();
    }
}

void CreateFeatureSession::onCreated(const Geometry& geometry) {
    if (obliqueMap_) obliqueMap_->setSwitchEnabled(false);
    currentFeatureId_ = layer_.addFeature(geometry);
    featureCreated.raise(currentFeatureId_);
}

void CreateFeatureSession::onChanged(const Geometry& geometry) {
    if (currentFeatureId_ != 0) layer_.setGeometry(currentFeatureId_, geometry);
}

void CreateFeatureSession::onFinished(const Geometry* geometry) {
    if (obliqueMap_) obliqueMap_->setSwitchEnabled(true);

    std::uint32_t featureId = currentFeatureId_;
    currentFeatureId_ = 0;
    if (featureId != 0) {
        if (geometry && isGeometryValid(*geometry)) {
            layer_.setGeometry(featureId, *geometry);
        } else {
            MAPEDIT_LOG_DEBUG("removing invalid %s feature %u", geometryKindName(kind_), featureId);
            layer_.removeFeature(featureId);
            featureId = 0;
        }
    }
    creationFinished.raise(featureId);

    if (!isStopped()) createInteraction();
}

void CreateFeatureSession::finish() {
    if (isStopped() || !currentInteraction_) return;
    std::shared_ptr<CreateInteraction> interaction = currentInteraction_;
    interaction->finish();
}

void CreateFeatureSession::stop() {
    if (!markStopped()) return;

    listeners_.dispose();
    if (currentInteraction_) {
        std::shared_ptr<CreateInteraction> interaction = currentInteraction_;
        interaction->finish();
    }
    destroyCurrentInteraction();
    chainSetup_.destroy();
    MAPEDIT_LOG_DEBUG("%s session stopped", sessionKindName(kind()));
    stopped.raise();
    stopped.clear();
    featureCreated.clear();
}

std::unique_ptr<CreateFeatureSession> startCreateFeatureSession(
    MapContext& context,
    FeatureLayer& layer,
    GeometryKind kind) {
    return std::make_unique<CreateFeatureSession>(context, layer, kind);
}
