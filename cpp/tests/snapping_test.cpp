#include "tests/editor_test_common.h"
#include "mapedit/core/geometry_math.h"
#include "mapedit/snap/layer_snapping.h"
#include "mapedit/snap/snapping.h"

using namespace editor_test;

namespace {
    const std::vector<Coordinate> kSquare = {
        {0.0, 0.0, 0.0},
        {10.0, 0.0, 0.0},
        {10.0, 10.0, 0.0},
        {0.0, 10.0, 0.0},
    };
}

TEST(SnappingTest, BearingsIncludeClosingSegmentOfPolygons) {
    const std::vector<double> polygon = getBearings(kSquare, true);
    ASSERT_EQ(polygon.size(), 4u);
    EXPECT_NEAR(polygon[0], kPiOverTwo, kEpsilon);
    EXPECT_NEAR(polygon[1], 0.0, kEpsilon);
    EXPECT_NEAR(polygon[2], 1.5 * kPi, kEpsilon);
    EXPECT_NEAR(polygon[3], kPi, kEpsilon);

    EXPECT_EQ(getBearings(kSquare, false).size(), 3u);
    EXPECT_TRUE(getBearings({}, true).empty());
}

TEST(SnappingTest, SnapsOrthogonalToPreviousSegment) {
    const auto result = snapToSegment(
        {10.0, 0.5, 0.0}, {10.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, getBearings({{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}}, false), 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, SnapType::Orthogonal);
    EXPECT_EQ(result->orthogonalIndex, 1);
    expectCoordinateNear(result->snapped, {10.0, 0.5, 0.0});
}

TEST(SnappingTest, SnapsParallelToUnmaskedBearing) {
    const std::vector<double> bearings = {-1.0, kPi};
    const auto result = snapToSegment({10.1, 0.0, 0.0}, {10.0, 10.0, 0.0}, {0.0, 0.0, 0.0}, bearings, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, SnapType::Parallel);
    EXPECT_EQ(result->parallelIndex, 1);
    expectCoordinateNear(result->snapped, {10.0, 0.0, 0.0});

    EXPECT_FALSE(snapToSegment({10.1, 0.0, 0.0}, {10.0, 10.0, 0.0}, {0.0, 0.0, 0.0}, {-1.0, -1.0}, 0).has_value());
}

TEST(SnappingTest, OrthogonalMatchWithoutOrthogonalFlagDoesNotSnap) {
    const auto result = snapToSegment(
        {10.0, 0.5, 0.0}, {10.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, {kPiOverTwo}, 1, SnapType::Parallel);
    EXPECT_FALSE(result.has_value());
}

TEST(SnappingTest, SegmentResultRespectsTolerance) {
    const std::vector<double> bearings = getBearings(kSquare, true);
    EXPECT_FALSE(getSnapResultForSegment(
        {10.2, 9.9, 0.0}, {10.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, bearings, 1, 0.01).has_value());

    const auto result = getSnapResultForSegment(
        {10.2, 9.9, 0.0}, {10.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, bearings, 1, kResolution);
    ASSERT_TRUE(result.has_value());
    expectCoordinateNear(result->snapped, {10.0, 9.9, 0.0});
}

TEST(SnappingTest, IntersectsResultsOfBothSegments) {
    SnapResult first;
    first.type = SnapType::Orthogonal;
    first.snapped = {10.0, 9.8, 0.0};
    first.orthogonalIndex = 1;
    SnapResult second;
    second.type = SnapType::Orthogonal;
    second.snapped = {10.0, 10.0, 0.0};
    second.orthogonalIndex = 3;

    const Coordinate pointer{10.1, 9.9, 0.0};
    const auto both = getSnappedCoordinateForResults(first, second, kSquare, pointer, kResolution);
    ASSERT_TRUE(both.has_value());
    expectCoordinateNear(*both, {10.0, 10.0, 0.0});

    const auto onlyFirst = getSnappedCoordinateForResults(first, std::nullopt, kSquare, pointer, kResolution);
    ASSERT_TRUE(onlyFirst.has_value());
    expectCoordinateNear(*onlyFirst, {10.0, 9.8, 0.0});

    EXPECT_FALSE(getSnappedCoordinateForResults(std::nullopt, std::nullopt, kSquare, pointer, kResolution)
                     .has_value());
}

TEST(SnappingTest, DistantIntersectionFallsBackToCloserResult) {
    // x = 10 and a nearly vertical line through (10.2, 10) meet around y = 2010.
    const std::vector<Coordinate> coordinates{{10.0, 0.0, 0.0}, {10.201, 0.0, 0.0}};
    SnapResult first;
    first.type = SnapType::Parallel;
    first.snapped = {10.0, 9.9, 0.0};
    first.orthogonalIndex = 0;
    SnapResult second;
    second.type = SnapType::Parallel;
    second.snapped = {10.2, 10.0, 0.0};
    second.orthogonalIndex = 1;

    const auto nearFirst = getSnappedCoordinateForResults(
        first, second, coordinates, {10.05, 9.9, 0.0}, kResolution);
    ASSERT_TRUE(nearFirst.has_value());
    expectCoordinateNear(*nearFirst, {10.0, 9.9, 0.0});

    const auto nearSecond = getSnappedCoordinateForResults(
        first, second, coordinates, {10.2, 10.05, 0.0}, kResolution);
    ASSERT_TRUE(nearSecond.has_value());
    expectCoordinateNear(*nearSecond, {10.2, 10.0, 0.0});
}

TEST(SnappingTest, IntersectionIsUsedOnlyWithinTolerance) {
    SnapResult first;
    first.type = SnapType::Orthogonal;
    first.snapped = {10.0, 9.0, 0.0};
    first.orthogonalIndex = 1;
    SnapResult second;
    second.type = SnapType::Orthogonal;
    second.snapped = {9.0, 10.0, 0.0};
    second.orthogonalIndex = 3;

    // The lines meet at (10, 10), 0.92 away from the pointer at a 0.6 tolerance.
    const auto coarse = getSnappedCoordinateForResults(first, second, kSquare, {9.35, 9.35, 0.0}, kResolution);
    ASSERT_TRUE(coarse.has_value());
    EXPECT_GT(distance2D(*coarse, {10.0, 10.0, 0.0}), 0.5);

    const auto fine = getSnappedCoordinateForResults(first, second, kSquare, {9.35, 9.35, 0.0}, 0.1);
    ASSERT_TRUE(fine.has_value());
    expectCoordinateNear(*fine, {10.0, 10.0, 0.0});
}

class LayerSnappingTest : public ::testing::Test {
protected:
    void SetUp() override {
        lineId = layer.addFeature(makeGeometry(GeometryKind::LineString, {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}}));
    }

    FeatureLayer layer{"features"};
    FeatureLayer scratch{"scratch"};
    std::uint32_t lineId = 0;
};

TEST_F(LayerSnappingTest, PrefersVerticesOverEdges) {
    LayerSnapping snapping({&layer}, scratch, nullptr);

    const auto vertex = snapping.findSnap({0.3, 0.2, 0.0}, kResolution, false);
    ASSERT_TRUE(vertex.has_value());
    EXPECT_EQ(vertex->type, SnapType::Vertex);
    expectCoordinateNear(vertex->snapped, {0.0, 0.0, 0.0});

    const auto edge = snapping.findSnap({5.0, 0.4, 0.0}, kResolution, false);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->type, SnapType::Edge);
    expectCoordinateNear(edge->snapped, {5.0, 0.0, 0.0});

    EXPECT_FALSE(snapping.findSnap({5.0, 2.0, 0.0}, kResolution, false).has_value());
}

TEST_F(LayerSnappingTest, FilterAndSnapTypesLimitCandidates) {
    const std::uint32_t excluded = lineId;
    LayerSnapping filtered({&layer}, scratch, [excluded](const FeatureLayer*, std::uint32_t id) {
        return id != excluded;
    });
    EXPECT_FALSE(filtered.findSnap({0.3, 0.2, 0.0}, kResolution, false).has_value());

    LayerSnapping edgesOnly({&layer}, scratch, nullptr);
    edgesOnly.setSnapTo(SnapType::Edge);
    const auto edge = edgesOnly.findSnap({0.3, 0.2, 0.0}, kResolution, false);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->type, SnapType::Edge);
    expectCoordinateNear(edge->snapped, {0.3, 0.0, 0.0});
}

TEST_F(LayerSnappingTest, ReplacesEventPositionAndShowsMarker) {
    FakeMapView map;
    LayerSnapping snapping({&layer}, scratch, nullptr);

    InteractionEvent event = makeEvent(EventType::Move, &map, {5.0, 0.4, 0.0});
    snapping.pipe(event);

    EXPECT_TRUE(event.alreadySnapped);
    expectCoordinateNear(event.positionOrPixel, {5.0, 0.0, 0.0});
    expectCoordinateNear(event.unsnappedPositionOrPixel, {5.0, 0.4, 0.0});
    ASSERT_NE(snapping.markerId(), 0u);
    EXPECT_EQ(scratch.getFeature(snapping.markerId())->label, "edge");

    InteractionEvent away = makeEvent(EventType::Move, &map, {5.0, 3.0, 0.0});
    snapping.pipe(away);
    EXPECT_FALSE(away.alreadySnapped);
    EXPECT_EQ(snapping.markerId(), 0u);
    EXPECT_EQ(scratch.featureCount(), 0u);
}
