#include "tests/editor_test_common.h"
#include "mapedit/edit/editor_helpers.h"

using namespace editor_test;

namespace {
    Geometry raisedLine(double z) {
        Geometry line = makeGeometry(GeometryKind::LineString, {{0.0, 0.0, z}, {4.0, 0.0, z}});
        line.layout = GeometryLayout::XYZ;
        return line;
    }
}

TEST(EditorHelpersTest, DrapeNeedsA3DView) {
    FakeMapView planar;
    Geometry line = makeGeometry(GeometryKind::LineString, {{0.0, 0.0, 0.0}, {4.0, 0.0, 0.0}});
    EXPECT_FALSE(drapeGeometryOnTerrain(line, planar));
    EXPECT_EQ(line.layout, GeometryLayout::XY);

    FakeMapView globe(MapKind::Globe3D);
    globe.setTerrainHeight(7.0);
    EXPECT_TRUE(drapeGeometryOnTerrain(line, globe));
    EXPECT_EQ(line.layout, GeometryLayout::XYZ);
    EXPECT_DOUBLE_EQ(line.coordinates[0].z, 7.0);
    EXPECT_DOUBLE_EQ(line.coordinates[1].z, 7.0);
}

TEST(EditorHelpersTest, DrapeKeepsHeightsWithoutTerrain) {
    FakeMapView globe(MapKind::Globe3D);
    Geometry line = raisedLine(3.0);
    EXPECT_TRUE(drapeGeometryOnTerrain(line, globe));
    EXPECT_DOUBLE_EQ(line.coordinates[1].z, 3.0);
    EXPECT_FALSE(placeGeometryOnTerrain(line, globe));
}

TEST(EditorHelpersTest, ClampedFeaturesArePlacedOnTerrain) {
    FakeMapView globe(MapKind::Globe3D);
    globe.setTerrainHeight(7.0);
    Feature feature;
    feature.geometry = makeGeometry(GeometryKind::Point, {{1.0, 1.0, 0.0}});

    EXPECT_TRUE(ensureFeatureAbsolute(feature, globe));
    EXPECT_EQ(feature.altitudeMode, AltitudeMode::Absolute);
    EXPECT_EQ(feature.geometry.layout, GeometryLayout::XYZ);
    EXPECT_DOUBLE_EQ(feature.geometry.coordinates[0].z, 7.0);
}

TEST(EditorHelpersTest, RelativeHeightsAddTheTerrain) {
    FakeMapView globe(MapKind::Globe3D);
    globe.setTerrainHeight(7.0);
    Feature raised;
    raised.geometry = raisedLine(2.0);
    raised.altitudeMode = AltitudeMode::RelativeToGround;
    EXPECT_TRUE(ensureFeatureAbsolute(raised, globe));
    EXPECT_DOUBLE_EQ(raised.geometry.coordinates[0].z, 9.0);

    Feature flat;
    flat.geometry = makeGeometry(GeometryKind::LineString, {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}});
    flat.altitudeMode = AltitudeMode::RelativeToGround;
    EXPECT_TRUE(ensureFeatureAbsolute(flat, globe));
    EXPECT_DOUBLE_EQ(flat.geometry.coordinates[1].z, 7.0);
}

TEST(EditorHelpersTest, AbsoluteFeaturesAreLeftAlone) {
    FakeMapView planar;
    Feature absolute;
    absolute.geometry = raisedLine(4.0);
    absolute.altitudeMode = AltitudeMode::Absolute;
    EXPECT_TRUE(ensureFeatureAbsolute(absolute, planar));
    EXPECT_DOUBLE_EQ(absolute.geometry.coordinates[0].z, 4.0);

    Feature clamped;
    clamped.geometry = makeGeometry(GeometryKind::Point, {{0.0, 0.0, 0.0}});
    EXPECT_FALSE(ensureFeatureAbsolute(clamped, planar));
    EXPECT_EQ(clamped.altitudeMode, AltitudeMode::ClampToGround);
}
