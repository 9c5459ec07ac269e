#include "mapedit/edit/edit_interaction_sets.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/edit/box_corners.h"
#include "mapedit/edit/insert_vertex_interaction.h"
#include "mapedit/edit/remove_vertex_interaction.h"
#include "mapedit/edit/segment_length_interaction.h"
#include "mapedit/edit/translate_vertex_interaction.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/session/suspend_guard.h"
#include "mapedit/snap/layer_snapping.h"
#include "mapedit/snap/translation_snapping.h"

#include <functional>

EditInteractionSet::EditInteractionSet(FeatureLayer& layer, std::uint32_t featureId, FeatureLayer& scratchLayer)
    : layer_(layer),
      featureId_(featureId),
      vertices_(scratchLayer),
      chain_(std::make_shared<InteractionChain>()) {}

EditInteractionSet::~EditInteractionSet() {
    destroy();
}

void EditInteractionSet::setLayerSnapping(std::shared_ptr<LayerSnapping> layerSnapping) {
    if (layerSnapping_) {
        chain_->removeInteraction(layerSnapping_.get());
        layerSnapping_->destroy();
    }
    layerSnapping_ = std::move(layerSnapping);
    if (layerSnapping_) chain_->addInteraction(layerSnapping_, 0);
}

void EditInteractionSet::setSnapTo(SnapType snapTo) {
    if (translationSnapping_) translationSnapping_->setSnapTo(snapTo);
    if (layerSnapping_) layerSnapping_->setSnapTo(snapTo);
}

void EditInteractionSet::destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    disposers_.dispose();
    chain_->destroy();
    vertices_.clear();
    translationSnapping_.reset();
    layerSnapping_.reset();
}

// ============================================================================
// Per-kind construction
// ============================================================================

struct EditInteractionSetBuilder {
    // Writes the handle coordinates back into the edited geometry.
    static void resetGeometry(EditInteractionSet& set) {
        SuspendGuard guard(set.suspend_);
        Geometry* geometry = set.layer_.geometry(set.featureId_);
        if (!geometry) return;
        VertexCoordinates vc = set.vertices_.coordinatesAndLayout();
        geometry->coordinates = std::move(vc.coordinates);
        geometry->layout = vc.layout;
        set.layer_.markGeometryChanged(set.featureId_);
    }

    // Resynchronizes the handles when the geometry is changed by anyone but the set.
    static void listenToGeometry(EditInteractionSet& set, std::function<void(EditInteractionSet&, const Geometry&)> resync) {
        EditInteractionSet* raw = &set;
        const auto listenerId = set.layer_.geometryChanged.addListener(
            [raw, resync](std::uint32_t id) {
                if (id != raw->featureId_ || raw->suspend_) return;
                const Geometry* geometry = raw->layer_.geometry(id);
                if (geometry) resync(*raw, *geometry);
            });
        FeatureLayer* layer = &set.layer_;
        set.disposers_.push([layer, listenerId]() { layer->geometryChanged.removeListener(listenerId); });
    }

    static void addSegmentLength(EditInteractionSet& set, FeatureLayer& scratchLayer, const EditGeometrySessionOptions& options) {
        if (options.hideSegmentLength) return;
        set.chain_->addInteraction(
            std::make_shared<SegmentLengthInteraction>(scratchLayer, set.layer_, set.featureId_, set.vertices_));
    }

    static std::unique_ptr<EditInteractionSet> point(
        FeatureLayer& layer,
        std::uint32_t featureId,
        FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions&,
        SnapType) {
        const Geometry* geometry = layer.geometry(featureId);
        if (!geometry || geometry->coordinates.empty()) return nullptr;

        auto set = std::make_unique<EditInteractionSet>(layer, featureId, scratchLayer);
        set->vertices_.append(geometry->coordinates.front(), geometry->layout);
        layer.hide(featureId);
        FeatureLayer* layerPtr = &layer;
        set->disposers_.push([layerPtr, featureId]() { layerPtr->show(featureId); });

        auto translateVertex = std::make_shared<TranslateVertexInteraction>(set->vertices_);
        EditInteractionSet* raw = set.get();
        translateVertex->vertexChanged.addListener([raw](std::size_t) { resetGeometry(*raw); });
        set->chain_->addInteraction(translateVertex);

        listenToGeometry(*set, [](EditInteractionSet& s, const Geometry& g) {
            if (g.coordinates.empty()) return;
            s.vertices_.reset({g.coordinates.front()}, g.layout);
        });
        return set;
    }

    static std::unique_ptr<EditInteractionSet> path(
        FeatureLayer& layer,
        std::uint32_t featureId,
        FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions& options,
        SnapType snapTo,
        bool isPolygon) {
        const Geometry* geometry = layer.geometry(featureId);
        if (!geometry || !geometry->holes.empty()) return nullptr;

        auto set = std::make_unique<EditInteractionSet>(layer, featureId, scratchLayer);
        EditInteractionSet* raw = set.get();
        for (const Coordinate& c : geometry->coordinates) {
            set->vertices_.append(c, geometry->layout);
        }

        set->translationSnapping_ = std::make_shared<TranslationSnapping>(scratchLayer, set->vertices_, isPolygon);
        set->translationSnapping_->setSnapTo(snapTo);
        set->chain_->addInteraction(set->translationSnapping_);

        auto translateVertex = std::make_shared<TranslateVertexInteraction>(set->vertices_);
        translateVertex->vertexChanged.addListener([raw](std::size_t) { resetGeometry(*raw); });
        set->chain_->addInteraction(translateVertex);

        addSegmentLength(*set, scratchLayer, options);

        if (!options.denyInsertion) {
            set->allowsInsertion_ = true;
            auto insertVertex = std::make_shared<InsertVertexInteraction>(layer, featureId, isPolygon);
            insertVertex->vertexInserted.addListener([raw](std::size_t index, const Coordinate& coordinate) {
                const Geometry* g = raw->layer_.geometry(raw->featureId_);
                if (!g) return;
                raw->vertices_.insertAt(index, coordinate, g->layout);
                resetGeometry(*raw);
            });
            set->chain_->addInteraction(insertVertex);
        }

        if (!options.denyRemoval) {
            auto removeVertex = std::make_shared<RemoveVertexInteraction>(set->vertices_);
            removeVertex->vertexRemoved.addListener([raw](std::uint32_t vertexId) {
                if (raw->vertices_.remove(vertexId)) resetGeometry(*raw);
            });
            set->chain_->addInteraction(removeVertex);
        }

        listenToGeometry(*set, [](EditInteractionSet& s, const Geometry& g) {
            s.vertices_.reset(g.coordinates, g.layout);
        });
        return set;
    }

    static std::unique_ptr<EditInteractionSet> lineString(
        FeatureLayer& layer, std::uint32_t featureId, FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions& options, SnapType snapTo) {
        return path(layer, featureId, scratchLayer, options, snapTo, false);
    }

    static std::unique_ptr<EditInteractionSet> polygon(
        FeatureLayer& layer, std::uint32_t featureId, FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions& options, SnapType snapTo) {
        return path(layer, featureId, scratchLayer, options, snapTo, true);
    }

    static std::unique_ptr<EditInteractionSet> box(
        FeatureLayer& layer,
        std::uint32_t featureId,
        FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions& options,
        SnapType) {
        const Geometry* geometry = layer.geometry(featureId);
        if (!geometry || geometry->coordinates.size() != 4) return nullptr;

        auto set = std::make_unique<EditInteractionSet>(layer, featureId, scratchLayer);
        EditInteractionSet* raw = set.get();
        for (const Coordinate& c : geometry->coordinates) {
            set->vertices_.append(c, geometry->layout);
        }

        auto translateVertex = std::make_shared<TranslateVertexInteraction>(set->vertices_);
        translateVertex->vertexChanged.addListener([raw](std::size_t index) {
            VertexList& vertices = raw->vertices_;
            std::vector<Coordinate> corners = vertices.coordinatesAndLayout().coordinates;
            if (corners.size() != 4) return;
            const Coordinate dragged = corners[index];
            const Coordinate moved = moveBoxCorner(corners, index, dragged);
            if (moved != dragged) vertices.setCoordinateAt(index, moved);
            vertices.setCoordinateAt((index + 1) % 4, corners[(index + 1) % 4]);
            vertices.setCoordinateAt((index + 3) % 4, corners[(index + 3) % 4]);
            resetGeometry(*raw);
        });
        set->chain_->addInteraction(translateVertex);

        addSegmentLength(*set, scratchLayer, options);

        listenToGeometry(*set, [](EditInteractionSet& s, const Geometry& g) {
            s.vertices_.reset(g.coordinates, g.layout);
        });
        return set;
    }

    static std::unique_ptr<EditInteractionSet> circle(
        FeatureLayer& layer,
        std::uint32_t featureId,
        FeatureLayer& scratchLayer,
        const EditGeometrySessionOptions& options,
        SnapType) {
        const Geometry* geometry = layer.geometry(featureId);
        if (!geometry || geometry->coordinates.empty()) return nullptr;

        auto set = std::make_unique<EditInteractionSet>(layer, featureId, scratchLayer);
        EditInteractionSet* raw = set.get();
        for (const Coordinate& c : flatCoordinates(*geometry)) {
            set->vertices_.append(c, geometry->layout);
        }

        auto translateVertex = std::make_shared<TranslateVertexInteraction>(set->vertices_);
        translateVertex->vertexChanged.addListener([raw](std::size_t index) {
            SuspendGuard guard(raw->suspend_);
            Geometry* g = raw->layer_.geometry(raw->featureId_);
            if (!g || g->coordinates.empty()) return;
            VertexList& vertices = raw->vertices_;
            if (index == 1) {
                g->radius = distance2D(g->coordinates.front(), vertices.coordinateAt(1));
            } else {
                Coordinate center = vertices.coordinateAt(0);
                g->layout = vertices.layoutAt(0);
                if (g->layout == GeometryLayout::XY) center.z = 0.0;
                g->coordinates = {center};
                vertices.setCoordinateAt(1, {center.x + g->radius, center.y, center.z});
            }
            raw->layer_.markGeometryChanged(raw->featureId_);
        });
        set->chain_->addInteraction(translateVertex);

        addSegmentLength(*set, scratchLayer, options);

        listenToGeometry(*set, [](EditInteractionSet& s, const Geometry& g) {
            s.vertices_.reset(flatCoordinates(g), g.layout);
        });
        return set;
    }
};

const std::array<EditInteractionSetFactory, geometryKindCount>& editInteractionSetFactories() {
    static const std::array<EditInteractionSetFactory, geometryKindCount> factories = {
        &EditInteractionSetBuilder::point,      // Point
        &EditInteractionSetBuilder::lineString, // LineString
        &EditInteractionSetBuilder::polygon,    // Polygon
        &EditInteractionSetBuilder::box,        // Box
        &EditInteractionSetBuilder::circle,     // Circle
    };
    return factories;
}

std::unique_ptr<EditInteractionSet> createEditInteractionSet(
    FeatureLayer& layer,
    std::uint32_t featureId,
    FeatureLayer& scratchLayer,
    const EditGeometrySessionOptions& options,
    SnapType snapTo) {
    const Geometry* geometry = layer.geometry(featureId);
    if (!geometry) return nullptr;
    const auto index = static_cast<std::size_t>(geometry->kind);
    if (index >= geometryKindCount) return nullptr;
    const EditInteractionSetFactory factory = editInteractionSetFactories()[index];
    if (!factory) return nullptr;
    return factory(layer, featureId, scratchLayer, options, snapTo);
}
