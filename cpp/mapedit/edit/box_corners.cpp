#include "mapedit/edit/box_corners.h"
#include "mapedit/core/editor_constants.h"

namespace {
    // Offsets `moving` off the axes of `fixed`; true if it had to.
    bool preventCollapse(const Coordinate& fixed, Coordinate& moving) {
        bool offset = false;
        if (moving.x == fixed.x) {
            moving.x += editor_constants::BOX_DEGENERACY_EPSILON;
            offset = true;
        }
        if (moving.y == fixed.y) {
            moving.y += editor_constants::BOX_DEGENERACY_EPSILON;
            offset = true;
        }
        return offset;
    }
}

std::vector<Coordinate> boxCornersFromOrigin(const Coordinate& origin, const Coordinate& corner) {
    Coordinate c{corner.x, corner.y, origin.z};
    preventCollapse(origin, c);

    const bool eastOfOrigin = c.x > origin.x;
    const bool northOfOrigin = c.y > origin.y;
    const Coordinate alongX{c.x, origin.y, origin.z};
    const Coordinate alongY{origin.x, c.y, origin.z};
    if (eastOfOrigin == northOfOrigin) {
        return {origin, alongX, c, alongY};
    }
    return {origin, alongY, c, alongX};
}

Coordinate moveBoxCorner(std::vector<Coordinate>& corners, std::size_t index, const Coordinate& target) {
    if (corners.size() != 4 || index >= 4) return target;
    const Coordinate origin = corners[(index + 2) % 4];
    Coordinate moved = target;
    preventCollapse(origin, moved);
    corners[index] = moved;

    for (const std::size_t other : {(index + 1) % 4, (index + 3) % 4}) {
        Coordinate& c = corners[other];
        if (c.x == origin.x) {
            c.y = moved.y;
        } else {
            c.x = moved.x;
        }
    }
    return moved;
}
