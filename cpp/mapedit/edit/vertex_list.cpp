#include "mapedit/edit/vertex_list.h"
#include "mapedit/feature/feature_layer.h"

#include <algorithm>

VertexList::VertexList(FeatureLayer& scratchLayer)
    : layer_(scratchLayer) {}

VertexList::~VertexList() {
    clear();
}

std::uint32_t VertexList::createVertexFeature(const Coordinate& coordinate, GeometryLayout layout) {
    Feature vertex;
    vertex.geometry.kind = GeometryKind::Point;
    vertex.geometry.layout = layout;
    vertex.geometry.coordinates = {coordinate};
    if (layout == GeometryLayout::XY) vertex.geometry.coordinates.front().z = 0.0;
    return layer_.addFeature(std::move(vertex));
}

std::uint32_t VertexList::append(const Coordinate& coordinate, GeometryLayout layout) {
    return insertAt(ids_.size(), coordinate, layout);
}

std::uint32_t VertexList::insertAt(std::size_t index, const Coordinate& coordinate, GeometryLayout layout) {
    const std::uint32_t id = createVertexFeature(coordinate, layout);
    if (id == 0) return 0;
    index = std::min(index, ids_.size());
    ids_.insert(ids_.begin() + static_cast<std::ptrdiff_t>(index), id);
    states_[id] = {index, VertexFlags::DoNotTransform | VertexFlags::CreateSync};
    reindex();
    return id;
}

bool VertexList::remove(std::uint32_t id) {
    const auto it = std::find(ids_.begin(), ids_.end(), id);
    if (it == ids_.end()) return false;
    ids_.erase(it);
    states_.erase(id);
    layer_.removeFeature(id);
    reindex();
    return true;
}

void VertexList::clear() {
    for (const std::uint32_t id : ids_) {
        layer_.removeFeature(id);
    }
    ids_.clear();
    states_.clear();
}

void VertexList::reset(const std::vector<Coordinate>& coordinates, GeometryLayout layout) {
    if (coordinates.size() != ids_.size()) {
        clear();
        for (const Coordinate& c : coordinates) append(c, layout);
        return;
    }
    for (std::size_t i = 0; i < coordinates.size(); i++) {
        Geometry* geometry = layer_.geometry(ids_[i]);
        if (!geometry) continue;
        geometry->layout = layout;
        geometry->coordinates = {coordinates[i]};
        layer_.markGeometryChanged(ids_[i]);
    }
}

int VertexList::indexOf(std::uint32_t id) const {
    const auto it = states_.find(id);
    return it == states_.end() ? -1 : static_cast<int>(it->second.index);
}

bool VertexList::contains(const FeatureLayer* layer, std::uint32_t id) const {
    return layer == &layer_ && states_.find(id) != states_.end();
}

const VertexState* VertexList::state(std::uint32_t id) const {
    const auto it = states_.find(id);
    return it == states_.end() ? nullptr : &it->second;
}

Coordinate VertexList::coordinateAt(std::size_t index) const {
    const Geometry* geometry = layer_.geometry(ids_.at(index));
    if (!geometry || geometry->coordinates.empty()) return {};
    return geometry->coordinates.front();
}

GeometryLayout VertexList::layoutAt(std::size_t index) const {
    const Geometry* geometry = layer_.geometry(ids_.at(index));
    return geometry ? geometry->layout : GeometryLayout::XY;
}

void VertexList::setCoordinateAt(std::size_t index, const Coordinate& coordinate) {
    const std::uint32_t id = ids_.at(index);
    Geometry* geometry = layer_.geometry(id);
    if (!geometry) return;
    Coordinate c = coordinate;
    if (geometry->layout == GeometryLayout::XY) c.z = 0.0;
    geometry->coordinates = {c};
    layer_.markGeometryChanged(id);
}

VertexCoordinates VertexList::coordinatesAndLayout() const {
    VertexCoordinates result{{}, GeometryLayout::XYZ};
    result.coordinates.reserve(ids_.size());
    for (std::size_t i = 0; i < ids_.size(); i++) {
        if (layoutAt(i) == GeometryLayout::XY) result.layout = GeometryLayout::XY;
        result.coordinates.push_back(coordinateAt(i));
    }
    if (result.layout == GeometryLayout::XY) {
        for (Coordinate& c : result.coordinates) c.z = 0.0;
    }
    return result;
}

void VertexList::reindex() {
    for (std::size_t i = 0; i < ids_.size(); i++) {
        states_[ids_[i]].index = i;
    }
}
