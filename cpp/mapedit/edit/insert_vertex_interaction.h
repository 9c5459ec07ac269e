#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/interaction.h"
#include <cstdint>

class FeatureLayer;

// Click on an edge of the edited line or polygon inserts a vertex at the closest point of
// that edge. The new vertex goes after the edge's first vertex; the closing edge of a
// polygon appends.
class InsertVertexInteraction : public Interaction {
public:
    InsertVertexInteraction(FeatureLayer& layer, std::uint32_t featureId, bool isPolygon);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    Signal<std::size_t, const Coordinate&> vertexInserted;

private:
    FeatureLayer& layer_;
    std::uint32_t featureId_;
    bool isPolygon_;
};
