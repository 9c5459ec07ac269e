#include "tests/editor_test_common.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/transform/rotate_interaction.h"
#include "mapedit/transform/transformation_handler.h"
#include <memory>

using namespace editor_test;

namespace {
    std::uint32_t glyphFor(const TransformationHandler& handler, const FeatureLayer& scratch, const char* label,
                           GeometryKind kind) {
        for (const std::uint32_t id : handler.glyphIds()) {
            const Feature* feature = scratch.getFeature(id);
            if (feature && feature->label == label && feature->geometry.kind == kind) return id;
        }
        return 0;
    }
}

class TransformationHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        squareId = features.addFeature(makeGeometry(
            GeometryKind::Polygon, {{0.0, 0.0, 0.0}, {2.0, 0.0, 0.0}, {2.0, 2.0, 0.0}, {0.0, 2.0, 0.0}}));
    }

    FakeMapView map{MapKind::Planar};
    FakeMapView globe{MapKind::Globe3D};
    FeatureLayer features{"features"};
    FeatureLayer scratch{"scratch"};
    std::uint32_t squareId = 0;
};

TEST_F(TransformationHandlerTest, GlyphsAreHiddenUntilFeaturesAreSet) {
    TransformationHandler handler(map, scratch, TransformationMode::Translate);
    ASSERT_EQ(handler.glyphIds().size(), 5u);
    EXPECT_FALSE(handler.showing());
    for (const std::uint32_t id : handler.glyphIds()) {
        EXPECT_TRUE(scratch.isHidden(id));
        EXPECT_EQ(scratch.getFeature(id)->altitudeMode, AltitudeMode::Absolute);
    }

    handler.setFeatures(features, {squareId});
    EXPECT_TRUE(handler.showing());
    for (const std::uint32_t id : handler.glyphIds()) {
        EXPECT_FALSE(scratch.isHidden(id));
    }
}

TEST_F(TransformationHandlerTest, GlyphsArePlacedAtPivotAndScaledToScreen) {
    TransformationHandler handler(map, scratch, TransformationMode::Translate);
    handler.setFeatures(features, {squareId});

    expectCoordinateNear(handler.center(), {1.0, 1.0, 0.0});
    EXPECT_DOUBLE_EQ(handler.scale(), 3.0);

    const std::uint32_t xAxis = glyphFor(handler, scratch, "X", GeometryKind::LineString);
    ASSERT_NE(xAxis, 0u);
    const Geometry* line = scratch.geometry(xAxis);
    expectCoordinateNear(line->coordinates[0], {1.0, 1.0, 0.0});
    expectCoordinateNear(line->coordinates[1], {4.0, 1.0, 0.0});
    EXPECT_EQ(handler.axisOf(&scratch, xAxis), AxisAndPlanes::X);

    const std::uint32_t plane = glyphFor(handler, scratch, "XY", GeometryKind::Polygon);
    ASSERT_NE(plane, 0u);
    expectCoordinateNear(scratch.geometry(plane)->coordinates[0], {1.6, 1.6, 0.0});
    expectCoordinateNear(scratch.geometry(plane)->coordinates[2], {2.2, 2.2, 0.0});

    map.setResolution(0.1);
    map.postRender.raise();
    EXPECT_DOUBLE_EQ(handler.scale(), 6.0);
    expectCoordinateNear(scratch.geometry(xAxis)->coordinates[1], {7.0, 1.0, 0.0});
}

TEST_F(TransformationHandlerTest, EmptyFeatureSetHidesTheHandler) {
    TransformationHandler handler(map, scratch, TransformationMode::Scale);
    handler.setFeatures(features, {squareId});
    handler.setShowAxis(AxisAndPlanes::X);

    handler.setFeatures(features, {});
    EXPECT_FALSE(handler.showing());
    EXPECT_EQ(handler.showAxis(), AxisAndPlanes::None);
    EXPECT_TRUE(handler.guideIds().empty());
    for (const std::uint32_t id : handler.glyphIds()) {
        EXPECT_TRUE(scratch.isHidden(id));
    }
}

TEST_F(TransformationHandlerTest, ShowAxisAddsGuideAndShadows) {
    TransformationHandler handler(map, scratch, TransformationMode::Translate);
    handler.setFeatures(features, {squareId});

    handler.setShowAxis(AxisAndPlanes::X);
    ASSERT_EQ(handler.guideIds().size(), 3u);
    const Geometry* guide = scratch.geometry(handler.guideIds()[0]);
    EXPECT_EQ(scratch.getFeature(handler.guideIds()[0])->label, "guide");
    EXPECT_DOUBLE_EQ(guide->coordinates[0].y, 1.0);
    EXPECT_LT(guide->coordinates[0].x, -1000.0);
    EXPECT_EQ(handler.axisOf(&scratch, handler.guideIds()[1]), AxisAndPlanes::None);

    handler.setShowAxis(AxisAndPlanes::XY);
    EXPECT_EQ(handler.guideIds().size(), 3u);

    handler.setShowAxis(AxisAndPlanes::None);
    EXPECT_TRUE(handler.guideIds().empty());
    EXPECT_EQ(scratch.featureCount(), handler.glyphIds().size());
}

TEST_F(TransformationHandlerTest, ThreeDimensionalTranslateHasZGlyphs) {
    globe.setTerrainHeight(10.0);
    Geometry raised = makeGeometry(GeometryKind::Point, {{1.0, 1.0, 5.0}});
    raised.layout = GeometryLayout::XYZ;
    Feature absolute;
    absolute.geometry = raised;
    absolute.altitudeMode = AltitudeMode::Absolute;
    const std::uint32_t id = features.addFeature(absolute);

    TransformationHandler handler(globe, scratch, TransformationMode::Translate);
    EXPECT_EQ(handler.glyphIds().size(), 9u);
    handler.setFeatures(features, {id});
    EXPECT_FALSE(handler.greyOutZ());
    expectCoordinateNear(handler.center(), {1.0, 1.0, 5.0});

    const std::uint32_t zAxis = glyphFor(handler, scratch, "Z", GeometryKind::LineString);
    ASSERT_NE(zAxis, 0u);
    EXPECT_EQ(handler.axisOf(&scratch, zAxis), AxisAndPlanes::Z);
    expectCoordinateNear(scratch.geometry(zAxis)->coordinates[1], {1.0, 1.0, 8.0});
}

TEST_F(TransformationHandlerTest, ClampedFeaturesGreyOutZ) {
    globe.setTerrainHeight(10.0);
    TransformationHandler handler(globe, scratch, TransformationMode::Translate);
    handler.setFeatures(features, {squareId});

    EXPECT_TRUE(handler.greyOutZ());
    expectCoordinateNear(handler.center(), {1.0, 1.0, 10.0});
    const std::uint32_t zAxis = glyphFor(handler, scratch, "Z", GeometryKind::LineString);
    ASSERT_NE(zAxis, 0u);
    EXPECT_EQ(handler.axisOf(&scratch, zAxis), AxisAndPlanes::None);
    EXPECT_FALSE(scratch.getFeature(zAxis)->allowPicking.value_or(true));
    EXPECT_NE(handler.axisOf(&scratch, glyphFor(handler, scratch, "X", GeometryKind::LineString)),
              AxisAndPlanes::None);
}

TEST_F(TransformationHandlerTest, RotateOffersTheZRing) {
    TransformationHandler handler(map, scratch, TransformationMode::Rotate);
    handler.setFeatures(features, {squareId});
    ASSERT_EQ(handler.glyphIds().size(), 1u);
    const Geometry* ring = scratch.geometry(handler.glyphIds()[0]);
    EXPECT_EQ(ring->kind, GeometryKind::Circle);
    EXPECT_DOUBLE_EQ(ring->radius, 1.5);
    EXPECT_EQ(handler.axisOf(&scratch, handler.glyphIds()[0]), AxisAndPlanes::Z);
}

TEST_F(TransformationHandlerTest, DestroyRemovesAllFeatures) {
    auto handler = std::make_unique<TransformationHandler>(map, scratch, TransformationMode::Translate);
    handler->setFeatures(features, {squareId});
    handler->setShowAxis(AxisAndPlanes::Y);
    EXPECT_GT(scratch.featureCount(), 0u);

    handler->destroy();
    handler->destroy();
    EXPECT_EQ(scratch.featureCount(), 0u);
    EXPECT_EQ(map.postRender.listenerCount(), 0u);
    handler.reset();
    EXPECT_EQ(scratch.featureCount(), 0u);
}

TEST_F(TransformationHandlerTest, IgnoresFeaturesOfOtherLayers) {
    TransformationHandler handler(map, scratch, TransformationMode::Translate);
    handler.setFeatures(features, {squareId});
    EXPECT_EQ(handler.axisOf(&features, handler.glyphIds()[0]), AxisAndPlanes::None);
    EXPECT_EQ(handler.axisOf(&scratch, 0), AxisAndPlanes::None);
}

TEST(RotateInteractionTest, SignedAngleIsCounterClockwisePositive) {
    EXPECT_NEAR(signedAngleBetween(1.0, 0.0, 0.0, 1.0), kPiOverTwo, kEpsilon);
    EXPECT_NEAR(signedAngleBetween(0.0, 1.0, 1.0, 0.0), -kPiOverTwo, kEpsilon);
    EXPECT_NEAR(signedAngleBetween(1.0, 0.0, 2.0, 0.0), 0.0, kEpsilon);
    EXPECT_DOUBLE_EQ(signedAngleBetween(0.0, 0.0, 1.0, 0.0), 0.0);
}
