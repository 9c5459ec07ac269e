#pragma once

#include "mapedit/core/types.h"

// Structural validity of a geometry, consulted when a creation commits and when an
// edit ends.
bool isCoordinateFinite(const Coordinate& c);
bool isGeometryValid(const Geometry& geometry);
