#pragma once

#include "mapedit/interaction/interaction.h"
#include "mapedit/snap/snap_types.h"
#include <cstdint>
#include <optional>
#include <vector>

class FeatureLayer;
class VertexList;

// Snaps a dragged vertex of a line or polygon orthogonal or parallel to the segments
// around it. Skipped while CTRL is held. The coordinates are read from the vertex list on
// DragStart; the last snapped coordinate is reapplied on DragEnd.
class TranslationSnapping : public Interaction {
public:
    TranslationSnapping(FeatureLayer& scratchLayer, const VertexList& vertices, bool isPolygon);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    SnapType snapTo() const noexcept { return snapTo_; }
    // Only Orthogonal and Parallel are relevant here.
    void setSnapTo(SnapType snapTo) noexcept { snapTo_ = snapTo; }

    const std::vector<std::uint32_t>& indicatorIds() const { return indicatorIds_; }

private:
    void refreshCoordinates();
    std::optional<SnapResult> previousSegmentResult(const Coordinate& coordinate, int index,
                                                    const std::vector<double>& bearings, double resolution) const;
    std::optional<SnapResult> nextSegmentResult(const Coordinate& candidate, int index,
                                                const std::vector<double>& bearings, double resolution) const;
    void setIndicators(const std::optional<SnapResult>& first, const std::optional<SnapResult>& second);
    void removeIndicators();

    FeatureLayer& scratchLayer_;
    const VertexList& vertices_;
    bool isPolygon_;
    SnapType snapTo_ = SnapType::All;
    std::vector<Coordinate> coordinates_;
    std::vector<double> bearings_;
    std::optional<Coordinate> lastCoordinate_;
    std::vector<std::uint32_t> indicatorIds_;
};
