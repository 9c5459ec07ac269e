#pragma once

#include "mapedit/core/types.h"
#include "mapedit/transform/transformation_types.h"
#include <cstdint>
#include <functional>
#include <vector>

class FeatureLayer;
class MapView;

// Pivot and axis glyphs of a feature transformation. Glyphs are features on the scratch
// layer; their axes are kept in a side table and looked up with axisOf(). Glyph geometry is
// defined in handler units around the pivot and scaled to a constant screen size on every
// post-render tick of the view.
class TransformationHandler {
public:
    TransformationHandler(MapView& map, FeatureLayer& scratchLayer, TransformationMode mode);
    ~TransformationHandler();

    TransformationHandler(const TransformationHandler&) = delete;
    TransformationHandler& operator=(const TransformationHandler&) = delete;

    TransformationMode mode() const noexcept { return mode_; }
    MapView& map() { return map_; }

    // Derives the pivot from the extent of the features. Hides the glyphs when none of the
    // ids resolves to a geometry.
    void setFeatures(const FeatureLayer& layer, const std::vector<std::uint32_t>& ids);
    void setCenter(const Coordinate& center);
    const Coordinate& center() const noexcept { return center_; }
    void translate(double dx, double dy, double dz);

    bool showing() const noexcept { return showing_; }
    // Z glyphs are not pickable while a ground-clamped feature is transformed.
    bool greyOutZ() const noexcept { return greyOutZ_; }
    double scale() const noexcept { return scale_; }
    void updateScale();

    AxisAndPlanes showAxis() const noexcept { return showAxis_; }
    // Shows guide lines along the axis and a shadow of its glyphs at the current pivot.
    void setShowAxis(AxisAndPlanes axis);

    AxisAndPlanes axisOf(const FeatureLayer* layer, std::uint32_t featureId) const;
    const std::vector<std::uint32_t>& glyphIds() const { return glyphIds_; }
    const std::vector<std::uint32_t>& guideIds() const { return guideIds_; }

    // Removes every feature the handler placed. Safe to call more than once.
    void destroy();

private:
    struct Glyph {
        AxisAndPlanes axis;
        Geometry shape;
        bool pickable;
    };

    void buildGlyphShapes();
    void createGlyphs();
    void removeGlyphs();
    void placeGlyphs();
    void createGuides();
    void removeGuides();
    Geometry placedGeometry(const Geometry& shape) const;
    std::uint32_t addScratchFeature(Geometry geometry, bool pickable, const char* label);

    MapView& map_;
    FeatureLayer& scratch_;
    TransformationMode mode_;
    std::vector<Glyph> glyphs_;
    std::vector<std::uint32_t> glyphIds_;
    std::vector<std::uint32_t> guideIds_;
    Coordinate center_{};
    double scale_ = 1.0;
    bool showing_ = false;
    bool greyOutZ_ = false;
    bool destroyed_ = false;
    AxisAndPlanes showAxis_ = AxisAndPlanes::None;
    std::function<void()> removePostRenderListener_;
};
