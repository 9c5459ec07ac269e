#pragma once

#include "mapedit/core/types.h"

class MapView;

// Sets every coordinate's z to the terrain height below it and makes the geometry XYZ.
// Coordinates without a terrain sample keep their z. Only 3D views have terrain; returns
// false and leaves the geometry untouched otherwise.
bool drapeGeometryOnTerrain(Geometry& geometry, const MapView& map);

// Places the whole geometry at the lowest terrain height below any of its coordinates.
bool placeGeometryOnTerrain(Geometry& geometry, const MapView& map);

// Gives a feature an absolute height on 3D views: ground-clamped geometries are placed on
// the terrain, relative heights get the terrain height below each coordinate added. The
// feature's altitude mode becomes Absolute. Returns false on views without terrain.
bool ensureFeatureAbsolute(Feature& feature, const MapView& map);
