#include "mapedit/edit/segment_length_interaction.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/edit/vertex_list.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_view.h"

#include <cstdio>
#include <utility>

namespace {
    using Segment = std::pair<Coordinate, Coordinate>;

    std::vector<Segment> segmentsForIndex(const Geometry& geometry, std::size_t index) {
        if (geometry.kind == GeometryKind::Circle) {
            const std::vector<Coordinate> flats = flatCoordinates(geometry);
            if (flats.size() < 2) return {};
            return {{flats[0], flats[1]}};
        }

        const std::vector<Coordinate>& c = geometry.coordinates;
        const std::size_t n = c.size();
        if (n < 2 || index >= n) return {};

        const bool isRing = geometry.kind == GeometryKind::Polygon || geometry.kind == GeometryKind::Box;
        const std::size_t previous = index == 0 ? 1 : index - 1;
        std::vector<Segment> segments{{c[index], c[previous]}};

        if (isRing) {
            std::size_t next;
            if (index == 0) {
                next = n - 1;
            } else if (index + 1 == n) {
                next = 0;
            } else {
                next = index + 1;
            }
            if (next != previous) segments.push_back({c[index], c[next]});
        } else if (index > 0 && index + 1 < n) {
            segments.push_back({c[index], c[index + 1]});
        }
        return segments;
    }
}

std::string formatSegmentLength(double length) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f m", length);
    return buffer;
}

SegmentLengthInteraction::SegmentLengthInteraction(
    FeatureLayer& scratchLayer,
    FeatureLayer& layer,
    std::uint32_t featureId,
    const VertexList& vertices)
    : Interaction(EventType::DragEvents, ModificationKey::None | ModificationKey::Ctrl),
      scratchLayer_(scratchLayer),
      layer_(layer),
      featureId_(featureId),
      vertices_(vertices) {}

void SegmentLengthInteraction::pipe(InteractionEvent& event) {
    removeLabels();
    if (event.type == EventType::DragEnd) return;
    if (!hasPickedFeature(event) || !vertices_.contains(event.featureLayer, event.featureId)) return;

    const Geometry* geometry = layer_.geometry(featureId_);
    if (!geometry) return;
    const int index = vertices_.indexOf(event.featureId);
    if (index < 0) return;

    const bool is3D = event.map && event.map->is3D() && geometry->layout == GeometryLayout::XYZ;
    const std::vector<Segment> segments = segmentsForIndex(*geometry, static_cast<std::size_t>(index));
    for (const Segment& segment : segments) {
        addLabel(segment.first, segment.second, is3D);
    }

    if (geometry->kind == GeometryKind::Circle && !segments.empty()) {
        Feature radius;
        radius.geometry.kind = GeometryKind::LineString;
        radius.geometry.layout = geometry->layout;
        radius.geometry.coordinates = {segments[0].first, segments[0].second};
        radius.allowPicking = false;
        const std::uint32_t id = scratchLayer_.addFeature(std::move(radius));
        if (id != 0) labelIds_.push_back(id);
    }
}

void SegmentLengthInteraction::addLabel(const Coordinate& a, const Coordinate& b, bool is3D) {
    Feature label;
    label.geometry.kind = GeometryKind::Point;
    label.geometry.layout = is3D ? GeometryLayout::XYZ : GeometryLayout::XY;
    label.geometry.coordinates = {midPoint(a, b)};
    label.allowPicking = false;
    label.label = formatSegmentLength(is3D ? distance3D(a, b) : distance2D(a, b));
    const std::uint32_t id = scratchLayer_.addFeature(std::move(label));
    if (id != 0) labelIds_.push_back(id);
}

void SegmentLengthInteraction::removeLabels() {
    for (const std::uint32_t id : labelIds_) {
        scratchLayer_.removeFeature(id);
    }
    labelIds_.clear();
}

void SegmentLengthInteraction::destroy() {
    removeLabels();
}
