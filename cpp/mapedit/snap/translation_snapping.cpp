#include "mapedit/snap/translation_snapping.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/edit/vertex_list.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_view.h"
#include "mapedit/snap/snapping.h"

TranslationSnapping::TranslationSnapping(FeatureLayer& scratchLayer, const VertexList& vertices, bool isPolygon)
    : Interaction(EventType::DragEvents, ModificationKey::None | ModificationKey::Ctrl),
      scratchLayer_(scratchLayer),
      vertices_(vertices),
      isPolygon_(isPolygon) {}

void TranslationSnapping::refreshCoordinates() {
    coordinates_ = vertices_.coordinatesAndLayout().coordinates;
    bearings_ = getBearings(coordinates_, isPolygon_);
}

std::optional<SnapResult> TranslationSnapping::previousSegmentResult(
    const Coordinate& coordinate,
    int index,
    const std::vector<double>& bearings,
    double resolution) const {
    const int n = static_cast<int>(coordinates_.size());
    if (index > 1) {
        return getSnapResultForSegment(coordinate, coordinates_[index - 1], coordinates_[index - 2],
                                       bearings, index - 1, resolution, snapTo_);
    }
    if (!isPolygon_ || n < 3) return std::nullopt;
    if (index == 1) {
        return getSnapResultForSegment(coordinate, coordinates_[0], coordinates_.back(),
                                       bearings, 0, resolution, snapTo_);
    }
    return getSnapResultForSegment(coordinate, coordinates_.back(), coordinates_[n - 2],
                                   bearings, n - 1, resolution, snapTo_);
}

std::optional<SnapResult> TranslationSnapping::nextSegmentResult(
    const Coordinate& candidate,
    int index,
    const std::vector<double>& bearings,
    double resolution) const {
    const int n = static_cast<int>(coordinates_.size());
    if (n <= 2) return std::nullopt;
    if (index < n - 2) {
        return getSnapResultForSegment(candidate, coordinates_[index + 1], coordinates_[index + 2],
                                       bearings, index + 1, resolution, snapTo_);
    }
    if (!isPolygon_) return std::nullopt;
    if (index == n - 1) {
        return getSnapResultForSegment(candidate, coordinates_[0], coordinates_[1],
                                       bearings, 0, resolution, snapTo_);
    }
    return getSnapResultForSegment(candidate, coordinates_.back(), coordinates_[0],
                                   bearings, n - 1, resolution, snapTo_);
}

void TranslationSnapping::pipe(InteractionEvent& event) {
    removeIndicators();

    if (event.type == EventType::DragEnd && lastCoordinate_) {
        event.positionOrPixel = *lastCoordinate_;
        lastCoordinate_.reset();
        return;
    }
    if (event.key == ModificationKey::Ctrl || !event.map) return;
    if (!hasPickedFeature(event) || !vertices_.contains(event.featureLayer, event.featureId)) return;

    if (event.type == EventType::DragStart || coordinates_.size() != vertices_.size()) {
        refreshCoordinates();
    }
    const int index = vertices_.indexOf(event.featureId);
    if (index < 0 || static_cast<std::size_t>(index) >= coordinates_.size()) return;

    std::vector<double> bearings = bearings_;
    for (std::size_t i = 0; i < bearings.size(); i++) {
        const int bearingIndex = static_cast<int>(i);
        if (bearingIndex == index || bearingIndex == index - 1) {
            bearings[i] = -1.0;
        } else if (isPolygon_ && index == 0 && i == bearings.size() - 1) {
            bearings[i] = -1.0;
        }
    }

    // A layer snap ran before us; project from the pointer, not from its result.
    const Coordinate coordinate = event.alreadySnapped ? event.unsnappedPositionOrPixel : event.positionOrPixel;
    const double resolution = event.map->resolutionAt(coordinate);

    const std::optional<SnapResult> first = previousSegmentResult(coordinate, index, bearings, resolution);
    const Coordinate candidate = first ? first->snapped : coordinate;
    const std::optional<SnapResult> second = nextSegmentResult(candidate, index, bearings, resolution);

    const std::optional<Coordinate> snapped =
        getSnappedCoordinateForResults(first, second, coordinates_, coordinate, resolution);
    if (!snapped) {
        lastCoordinate_ = event.alreadySnapped ? std::optional<Coordinate>(event.positionOrPixel) : std::nullopt;
        return;
    }
    if (event.alreadySnapped
        && distance2D(event.positionOrPixel, coordinate) < distance2D(*snapped, coordinate)) {
        lastCoordinate_ = event.positionOrPixel;
        return;
    }

    Coordinate result = *snapped;
    if (vertices_.layoutAt(static_cast<std::size_t>(index)) == GeometryLayout::XY) result.z = 0.0;
    event.positionOrPixel = result;
    event.alreadySnapped = true;
    event.unsnappedPositionOrPixel = coordinate;
    setIndicators(first, second);
    lastCoordinate_ = result;
}

void TranslationSnapping::setIndicators(const std::optional<SnapResult>& first, const std::optional<SnapResult>& second) {
    const int n = static_cast<int>(coordinates_.size());
    for (const std::optional<SnapResult>* result : {&first, &second}) {
        if (!*result) continue;
        const SnapResult& r = **result;
        Feature indicator;
        indicator.geometry.kind = GeometryKind::Point;
        indicator.geometry.layout = GeometryLayout::XYZ;
        indicator.allowPicking = false;
        if (r.type == SnapType::Orthogonal && r.orthogonalIndex >= 0 && r.orthogonalIndex < n) {
            indicator.geometry.coordinates = {coordinates_[r.orthogonalIndex]};
            indicator.label = "orthogonal";
        } else if (r.type == SnapType::Parallel && r.parallelIndex >= 0 && r.parallelIndex < n) {
            const int other = r.parallelIndex != n - 1 ? r.parallelIndex + 1 : 0;
            indicator.geometry.coordinates = {midPoint(coordinates_[r.parallelIndex], coordinates_[other])};
            indicator.label = "parallel";
        } else {
            continue;
        }
        const std::uint32_t id = scratchLayer_.addFeature(std::move(indicator));
        if (id != 0) indicatorIds_.push_back(id);
    }
}

void TranslationSnapping::removeIndicators() {
    for (const std::uint32_t id : indicatorIds_) {
        scratchLayer_.removeFeature(id);
    }
    indicatorIds_.clear();
}

void TranslationSnapping::destroy() {
    removeIndicators();
    lastCoordinate_.reset();
}
