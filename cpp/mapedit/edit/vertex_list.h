#pragma once

#include "mapedit/core/types.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

class FeatureLayer;

enum class VertexFlags : std::uint8_t {
    None           = 0,
    DoNotTransform = 1 << 0, // ignored by whole-feature transformations
    CreateSync     = 1 << 1, // kept in sync with its geometry by the editor
};

inline VertexFlags operator|(VertexFlags a, VertexFlags b) {
    return static_cast<VertexFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline bool hasFlag(VertexFlags flags, VertexFlags flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

struct VertexState {
    std::size_t index;
    VertexFlags flags;
};

struct VertexCoordinates {
    std::vector<Coordinate> coordinates;
    GeometryLayout layout;
};

// Handles of one edited geometry, in coordinate order. Each handle is a point feature on
// the scratch layer; its index and flags live here rather than on the feature.
class VertexList {
public:
    explicit VertexList(FeatureLayer& scratchLayer);
    ~VertexList();

    VertexList(const VertexList&) = delete;
    VertexList& operator=(const VertexList&) = delete;

    std::uint32_t append(const Coordinate& coordinate, GeometryLayout layout);
    std::uint32_t insertAt(std::size_t index, const Coordinate& coordinate, GeometryLayout layout);
    bool remove(std::uint32_t id);
    // Removes all handle features from the scratch layer.
    void clear();

    // Rebuilds the handles when the count differs, moves them otherwise.
    void reset(const std::vector<Coordinate>& coordinates, GeometryLayout layout);

    std::size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }
    const std::vector<std::uint32_t>& ids() const { return ids_; }
    std::uint32_t idAt(std::size_t index) const { return ids_.at(index); }
    // -1 when the id is not a handle of this list.
    int indexOf(std::uint32_t id) const;
    bool contains(const FeatureLayer* layer, std::uint32_t id) const;
    const VertexState* state(std::uint32_t id) const;

    Coordinate coordinateAt(std::size_t index) const;
    GeometryLayout layoutAt(std::size_t index) const;
    void setCoordinateAt(std::size_t index, const Coordinate& coordinate);

    // Coordinates of all handles; XY if any handle is 2D.
    VertexCoordinates coordinatesAndLayout() const;

    FeatureLayer& layer() { return layer_; }

private:
    std::uint32_t createVertexFeature(const Coordinate& coordinate, GeometryLayout layout);
    void reindex();

    FeatureLayer& layer_;
    std::vector<std::uint32_t> ids_;
    std::unordered_map<std::uint32_t, VertexState> states_;
};
