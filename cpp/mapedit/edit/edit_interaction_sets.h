#pragma once

#include "mapedit/core/types.h"
#include "mapedit/edit/vertex_list.h"
#include "mapedit/interaction/interaction_chain.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/snap/snap_types.h"
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

class FeatureLayer;
class LayerSnapping;
class TranslationSnapping;

struct EditGeometrySessionOptions {
    bool denyInsertion = false;
    bool denyRemoval = false;
    bool hideSegmentLength = false;
    // Empty means the edited layer.
    std::vector<FeatureLayer*> initialSnapToLayers;
    SnapType snapTo = SnapType::All;
};

// The handles and interactions editing one feature. The chain is added to the session
// chain; the handles live on the session's scratch layer. Destroying the set removes both.
class EditInteractionSet {
public:
    EditInteractionSet(FeatureLayer& layer, std::uint32_t featureId, FeatureLayer& scratchLayer);
    ~EditInteractionSet();

    EditInteractionSet(const EditInteractionSet&) = delete;
    EditInteractionSet& operator=(const EditInteractionSet&) = delete;

    const std::shared_ptr<InteractionChain>& chain() const { return chain_; }
    VertexList& vertices() { return vertices_; }
    const VertexList& vertices() const { return vertices_; }
    FeatureLayer& layer() { return layer_; }
    std::uint32_t featureId() const noexcept { return featureId_; }
    bool allowsInsertion() const noexcept { return allowsInsertion_; }

    void setLayerSnapping(std::shared_ptr<LayerSnapping> layerSnapping);
    LayerSnapping* layerSnapping() const { return layerSnapping_.get(); }
    TranslationSnapping* translationSnapping() const { return translationSnapping_.get(); }
    void setSnapTo(SnapType snapTo);

    void destroy();

private:
    friend struct EditInteractionSetBuilder;

    FeatureLayer& layer_;
    std::uint32_t featureId_;
    VertexList vertices_;
    std::shared_ptr<InteractionChain> chain_;
    std::shared_ptr<TranslationSnapping> translationSnapping_;
    std::shared_ptr<LayerSnapping> layerSnapping_;
    DisposerList disposers_;
    bool suspend_ = false;
    bool allowsInsertion_ = false;
    bool destroyed_ = false;
};

using EditInteractionSetFactory = std::unique_ptr<EditInteractionSet> (*)(
    FeatureLayer& layer,
    std::uint32_t featureId,
    FeatureLayer& scratchLayer,
    const EditGeometrySessionOptions& options,
    SnapType snapTo);

// Null entries and null results mean the geometry is not editable.
const std::array<EditInteractionSetFactory, geometryKindCount>& editInteractionSetFactories();

// Builds the set for the feature's geometry, nullptr when the geometry is not supported.
std::unique_ptr<EditInteractionSet> createEditInteractionSet(
    FeatureLayer& layer,
    std::uint32_t featureId,
    FeatureLayer& scratchLayer,
    const EditGeometrySessionOptions& options,
    SnapType snapTo);
