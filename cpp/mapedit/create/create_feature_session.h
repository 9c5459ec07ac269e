#pragma once

#include "mapedit/create/create_interaction.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/session/editor_session.h"
#include "mapedit/session/session_helpers.h"
#include <array>
#include <cstdint>
#include <functional>
#include <memory>

class FeatureLayer;
class MapContext;
class MapView;

using CreateInteractionFactory = std::shared_ptr<CreateInteraction> (*)();

const std::array<CreateInteractionFactory, geometryKindCount>& createInteractionFactories();
std::shared_ptr<CreateInteraction> createInteractionForKind(GeometryKind kind);

// Adds features of one geometry kind to a layer, one after the other. The feature exists
// from the first click on and follows the nascent geometry; it is removed again when the
// finished geometry is invalid.
class CreateFeatureSession : public EditorSession {
public:
    CreateFeatureSession(MapContext& context, FeatureLayer& layer, GeometryKind kind);
    ~CreateFeatureSession() override;

    void stop() override;
    // Finishes the geometry being drawn; a new one can be started right away.
    void finish();

    GeometryKind geometryKind() const noexcept { return kind_; }
    CreateInteraction* currentInteraction() const { return currentInteraction_.get(); }
    std::uint32_t currentFeature() const noexcept { return currentFeatureId_; }

    Signal<std::uint32_t> featureCreated;
    // Id of the created feature, 0 when the geometry was discarded.
    Signal<std::uint32_t> creationFinished;

private:
    void createInteraction();
    void destroyCurrentInteraction();
    void resetCurrentInteraction();
    void setupActiveMap();

    void onCreated(const Geometry& geometry);
    void onChanged(const Geometry& geometry);
    void onFinished(const Geometry* geometry);

    MapContext& context_;
    FeatureLayer& layer_;
    GeometryKind kind_;
    InteractionChainSetup chainSetup_;
    std::shared_ptr<CreateInteraction> currentInteraction_;
    std::uint32_t currentFeatureId_ = 0;
    MapView* obliqueMap_ = nullptr;
    DisposerList interactionListeners_;
    std::function<void()> imageChangedListener_;
    DisposerList listeners_;
};

std::unique_ptr<CreateFeatureSession> startCreateFeatureSession(
    MapContext& context,
    FeatureLayer& layer,
    GeometryKind kind);
