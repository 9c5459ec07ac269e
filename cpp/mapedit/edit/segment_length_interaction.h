#pragma once

#include "mapedit/interaction/interaction.h"
#include <cstdint>
#include <string>
#include <vector>

class FeatureLayer;
class VertexList;

// While a handle is dragged, labels the segments meeting at it with their length. Circles
// show the radius segment and its length.
class SegmentLengthInteraction : public Interaction {
public:
    SegmentLengthInteraction(FeatureLayer& scratchLayer, FeatureLayer& layer, std::uint32_t featureId,
                             const VertexList& vertices);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    const std::vector<std::uint32_t>& labelIds() const { return labelIds_; }

private:
    void removeLabels();
    void addLabel(const Coordinate& a, const Coordinate& b, bool is3D);

    FeatureLayer& scratchLayer_;
    FeatureLayer& layer_;
    std::uint32_t featureId_;
    const VertexList& vertices_;
    std::vector<std::uint32_t> labelIds_;
};

// "12.34 m"
std::string formatSegmentLength(double length);
