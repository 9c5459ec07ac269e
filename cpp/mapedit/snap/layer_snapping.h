#pragma once

#include "mapedit/interaction/interaction.h"
#include "mapedit/snap/snap_types.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

class FeatureLayer;

// Snaps the event position to the vertices, then the edges, of the features on a set of
// layers. The snapped position replaces positionOrPixel; the replaced position is kept in
// unsnappedPositionOrPixel. A marker feature on the scratch layer shows the current snap.
class LayerSnapping : public Interaction {
public:
    using FeatureFilter = std::function<bool(const FeatureLayer*, std::uint32_t)>;

    LayerSnapping(
        std::vector<FeatureLayer*> layers,
        FeatureLayer& scratchLayer,
        FeatureFilter filter,
        EventType eventType = EventType::ClickMove | EventType::DblClick);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    const std::vector<FeatureLayer*>& layers() const { return layers_; }
    void setLayers(std::vector<FeatureLayer*> layers) { layers_ = std::move(layers); }
    SnapType snapTo() const noexcept { return snapTo_; }
    // Only Vertex and Edge are relevant here.
    void setSnapTo(SnapType snapTo) noexcept { snapTo_ = snapTo; }

    std::uint32_t markerId() const noexcept { return markerId_; }

    // Vertex or edge result for `candidate`, without touching any event or marker.
    std::optional<SnapResult> findSnap(const Coordinate& candidate, double resolution, bool is3D) const;

private:
    void removeMarker();
    void setMarker(const SnapResult& result, bool is3D);

    std::vector<FeatureLayer*> layers_;
    FeatureLayer& scratchLayer_;
    FeatureFilter filter_;
    SnapType snapTo_ = SnapType::All;
    std::uint32_t markerId_ = 0;
};
