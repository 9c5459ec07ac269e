#pragma once

#include "mapedit/core/types.h"
#include <vector>

// Corners of the axis aligned box spanned by origin and corner, counter-clockwise and
// starting at origin. A corner sharing an axis value with the origin is moved off it by
// BOX_DEGENERACY_EPSILON. All corners take the origin's z.
std::vector<Coordinate> boxCornersFromOrigin(const Coordinate& origin, const Coordinate& corner);

// Moves corner `index` of a four corner box to `target`; the opposite corner stays fixed
// and the adjacent corners follow along their axes. Returns the possibly offset target.
Coordinate moveBoxCorner(std::vector<Coordinate>& corners, std::size_t index, const Coordinate& target);
