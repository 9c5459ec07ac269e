#include "mapedit/transform/transformation_handler.h"
#include "mapedit/core/editor_constants.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_view.h"

#include <algorithm>
#include <cmath>

namespace {
    bool hasXComponent(AxisAndPlanes axis) {
        return axis == AxisAndPlanes::X || axis == AxisAndPlanes::XY || axis == AxisAndPlanes::XZ;
    }

    bool hasYComponent(AxisAndPlanes axis) {
        return axis == AxisAndPlanes::Y || axis == AxisAndPlanes::XY || axis == AxisAndPlanes::YZ;
    }

    bool hasZComponent(AxisAndPlanes axis) {
        return axis == AxisAndPlanes::Z || axis == AxisAndPlanes::XZ || axis == AxisAndPlanes::YZ;
    }
}

TransformationHandler::TransformationHandler(MapView& map, FeatureLayer& scratchLayer, TransformationMode mode)
    : map_(map),
      scratch_(scratchLayer),
      mode_(mode) {
    removePostRenderListener_ = map_.postRender.connect([this]() { updateScale(); });
    buildGlyphShapes();
    createGlyphs();
}

TransformationHandler::~TransformationHandler() {
    destroy();
}

// ============================================================================
// Glyphs
// ============================================================================

void TransformationHandler::buildGlyphShapes() {
    using namespace editor_constants;
    glyphs_.clear();
    const bool is3D = map_.is3D();
    const GeometryLayout layout = is3D ? GeometryLayout::XYZ : GeometryLayout::XY;

    auto addAxis = [&](AxisAndPlanes axis, const Coordinate& direction, bool pickable) {
        Geometry line;
        line.kind = GeometryKind::LineString;
        line.layout = layout;
        line.coordinates = {{0.0, 0.0, 0.0}, direction};
        glyphs_.push_back({axis, std::move(line), pickable});

        Geometry tip;
        tip.kind = GeometryKind::Point;
        tip.layout = layout;
        tip.coordinates = {direction};
        glyphs_.push_back({axis, std::move(tip), pickable});
    };

    auto addPlane = [&](AxisAndPlanes axis, bool pickable) {
        const double a = HANDLER_PLANE_OFFSET;
        const double b = HANDLER_PLANE_OFFSET + HANDLER_PLANE_SIZE;
        Geometry square;
        square.kind = GeometryKind::Polygon;
        square.layout = layout;
        if (axis == AxisAndPlanes::XY) {
            square.coordinates = {{a, a, 0.0}, {b, a, 0.0}, {b, b, 0.0}, {a, b, 0.0}};
        } else if (axis == AxisAndPlanes::XZ) {
            square.coordinates = {{a, 0.0, a}, {b, 0.0, a}, {b, 0.0, b}, {a, 0.0, b}};
        } else {
            square.coordinates = {{0.0, a, a}, {0.0, b, a}, {0.0, b, b}, {0.0, a, b}};
        }
        glyphs_.push_back({axis, std::move(square), pickable});
    };

    switch (mode_) {
        case TransformationMode::Translate:
            addAxis(AxisAndPlanes::X, {1.0, 0.0, 0.0}, true);
            addAxis(AxisAndPlanes::Y, {0.0, 1.0, 0.0}, true);
            addPlane(AxisAndPlanes::XY, true);
            if (is3D) {
                addAxis(AxisAndPlanes::Z, {0.0, 0.0, 1.0}, !greyOutZ_);
                addPlane(AxisAndPlanes::XZ, !greyOutZ_);
                addPlane(AxisAndPlanes::YZ, !greyOutZ_);
            }
            break;
        case TransformationMode::Scale:
            addAxis(AxisAndPlanes::X, {1.0, 0.0, 0.0}, true);
            addAxis(AxisAndPlanes::Y, {0.0, 1.0, 0.0}, true);
            addPlane(AxisAndPlanes::XY, true);
            break;
        case TransformationMode::Rotate: {
            Geometry ring;
            ring.kind = GeometryKind::Circle;
            ring.layout = layout;
            ring.coordinates = {{0.0, 0.0, 0.0}};
            ring.radius = ROTATION_RING_RADIUS;
            glyphs_.push_back({AxisAndPlanes::Z, std::move(ring), true});
            break;
        }
        case TransformationMode::Extrude:
            addAxis(AxisAndPlanes::Z, {0.0, 0.0, 1.0}, true);
            break;
    }
}

std::uint32_t TransformationHandler::addScratchFeature(Geometry geometry, bool pickable, const char* label) {
    Feature feature;
    feature.geometry = std::move(geometry);
    feature.altitudeMode = AltitudeMode::Absolute;
    if (!pickable) feature.allowPicking = false;
    feature.label = label;
    return scratch_.addFeature(std::move(feature));
}

void TransformationHandler::createGlyphs() {
    glyphIds_.clear();
    glyphIds_.reserve(glyphs_.size());
    for (const Glyph& glyph : glyphs_) {
        const std::uint32_t id = addScratchFeature(placedGeometry(glyph.shape), glyph.pickable, axisName(glyph.axis));
        if (!showing_) scratch_.hide(id);
        glyphIds_.push_back(id);
    }
}

void TransformationHandler::removeGlyphs() {
    for (const std::uint32_t id : glyphIds_) {
        scratch_.removeFeature(id);
    }
    glyphIds_.clear();
}

Geometry TransformationHandler::placedGeometry(const Geometry& shape) const {
    Geometry placed = shape;
    for (Coordinate& c : placed.coordinates) {
        c.x = center_.x + c.x * scale_;
        c.y = center_.y + c.y * scale_;
        c.z = placed.layout == GeometryLayout::XYZ ? center_.z + c.z * scale_ : 0.0;
    }
    placed.radius = shape.radius * scale_;
    return placed;
}

void TransformationHandler::placeGlyphs() {
    for (std::size_t i = 0; i < glyphIds_.size() && i < glyphs_.size(); ++i) {
        scratch_.setGeometry(glyphIds_[i], placedGeometry(glyphs_[i].shape));
    }
}

// ============================================================================
// Axis guides
// ============================================================================

void TransformationHandler::createGuides() {
    using namespace editor_constants;
    const bool is3D = map_.is3D();
    const GeometryLayout layout = is3D ? GeometryLayout::XYZ : GeometryLayout::XY;
    const double length = AXIS_GUIDE_LENGTH * scale_;

    auto addGuide = [&](const Coordinate& direction) {
        Geometry line;
        line.kind = GeometryKind::LineString;
        line.layout = layout;
        line.coordinates = {
            {center_.x - direction.x * length, center_.y - direction.y * length, center_.z - direction.z * length},
            {center_.x + direction.x * length, center_.y + direction.y * length, center_.z + direction.z * length},
        };
        guideIds_.push_back(addScratchFeature(std::move(line), false, "guide"));
    };

    if (hasXComponent(showAxis_)) addGuide({1.0, 0.0, 0.0});
    if (hasYComponent(showAxis_)) addGuide({0.0, 1.0, 0.0});
    if (is3D && hasZComponent(showAxis_)) addGuide({0.0, 0.0, 1.0});

    for (const Glyph& glyph : glyphs_) {
        if (glyph.axis != showAxis_) continue;
        guideIds_.push_back(addScratchFeature(placedGeometry(glyph.shape), false, "shadow"));
    }
}

void TransformationHandler::removeGuides() {
    for (const std::uint32_t id : guideIds_) {
        scratch_.removeFeature(id);
    }
    guideIds_.clear();
}

void TransformationHandler::setShowAxis(AxisAndPlanes axis) {
    if (destroyed_ || axis == showAxis_) return;
    removeGuides();
    showAxis_ = axis;
    if (showAxis_ != AxisAndPlanes::None) createGuides();
}

// ============================================================================
// Pivot
// ============================================================================

void TransformationHandler::setFeatures(const FeatureLayer& layer, const std::vector<std::uint32_t>& ids) {
    if (destroyed_) return;

    Extent extent = createEmptyExtent();
    bool someClamped = false;
    bool someWithoutHeight = false;
    for (const std::uint32_t id : ids) {
        const Feature* feature = layer.getFeature(id);
        if (!feature) continue;
        const Geometry& geometry = feature->geometry;
        extendExtent(extent, geometry);
        if (feature->altitudeMode == AltitudeMode::ClampToGround) someClamped = true;
        if (geometry.layout == GeometryLayout::XY
            || (!geometry.coordinates.empty() && geometry.coordinates.front().z == 0.0)) {
            someWithoutHeight = true;
        }
    }

    if (isEmptyExtent(extent)) {
        showing_ = false;
        setShowAxis(AxisAndPlanes::None);
        for (const std::uint32_t id : glyphIds_) scratch_.hide(id);
        return;
    }

    const bool is3D = map_.is3D();
    Coordinate center = extentCenter(extent, is3D);
    if (is3D && (someClamped || someWithoutHeight)) {
        if (const auto height = map_.sampleTerrainHeight(center)) center.z = *height;
    }

    const bool greyOutZ = is3D && someClamped;
    if (greyOutZ != greyOutZ_) {
        greyOutZ_ = greyOutZ;
        removeGlyphs();
        buildGlyphShapes();
        createGlyphs();
    }

    showing_ = true;
    for (const std::uint32_t id : glyphIds_) scratch_.show(id);
    setCenter(center);
}

void TransformationHandler::setCenter(const Coordinate& center) {
    if (destroyed_) return;
    center_ = center;
    if (showing_) {
        updateScale();
    }
    placeGlyphs();
}

void TransformationHandler::translate(double dx, double dy, double dz) {
    if (destroyed_) return;
    center_.x += dx;
    center_.y += dy;
    center_.z += dz;
    placeGlyphs();
}

void TransformationHandler::updateScale() {
    if (destroyed_ || !showing_) return;
    const double resolution = map_.resolutionAt(center_);
    if (!(resolution > 0.0) || !std::isfinite(resolution)) return;
    const double scale = resolution * editor_constants::HANDLER_SIZE_PX;
    if (scale == scale_) return;
    scale_ = scale;
    placeGlyphs();
}

AxisAndPlanes TransformationHandler::axisOf(const FeatureLayer* layer, std::uint32_t featureId) const {
    if (layer != &scratch_ || featureId == 0) return AxisAndPlanes::None;
    const auto it = std::find(glyphIds_.begin(), glyphIds_.end(), featureId);
    if (it == glyphIds_.end()) return AxisAndPlanes::None;
    const std::size_t index = static_cast<std::size_t>(it - glyphIds_.begin());
    if (!glyphs_[index].pickable) return AxisAndPlanes::None;
    return glyphs_[index].axis;
}

void TransformationHandler::destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    if (removePostRenderListener_) {
        removePostRenderListener_();
        removePostRenderListener_ = nullptr;
    }
    removeGuides();
    removeGlyphs();
    showAxis_ = AxisAndPlanes::None;
    showing_ = false;
}
