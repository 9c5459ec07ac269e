#include "tests/editor_test_common.h"
#include "mapedit/create/create_feature_session.h"
#include "mapedit/edit/box_corners.h"

using namespace editor_test;

namespace {
    struct FinishedLog {
        std::vector<std::uint32_t> ids;
    };

    void recordFinished(CreateFeatureSession& session, FinishedLog& log) {
        session.creationFinished.addListener([&log](std::uint32_t id) { log.ids.push_back(id); });
    }
}

class CreateFeatureSessionTest : public EditorTest {};

TEST_F(CreateFeatureSessionTest, ClickCreatesPointAndStartsOver) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Point);
    FinishedLog log;
    recordFinished(*session, log);
    const CreateInteraction* first = session->currentInteraction();

    click({1.0, 2.0, 0.0});

    ASSERT_EQ(layer.featureCount(), 1u);
    ASSERT_EQ(log.ids.size(), 1u);
    const Geometry* geometry = layer.geometry(log.ids[0]);
    ASSERT_NE(geometry, nullptr);
    EXPECT_EQ(geometry->kind, GeometryKind::Point);
    EXPECT_EQ(geometry->layout, GeometryLayout::XY);
    expectCoordinateNear(geometry->coordinates[0], {1.0, 2.0, 0.0});

    ASSERT_NE(session->currentInteraction(), nullptr);
    EXPECT_NE(session->currentInteraction(), first);
    EXPECT_FALSE(session->currentInteraction()->isStarted());

    click({3.0, 4.0, 0.0});
    EXPECT_EQ(layer.featureCount(), 2u);
}

TEST_F(CreateFeatureSessionTest, LineFollowsPointerAndFinishesOnDoubleClick) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);
    FinishedLog log;
    recordFinished(*session, log);
    std::uint32_t createdId = 0;
    session->featureCreated.addListener([&createdId](std::uint32_t id) { createdId = id; });

    click({0.0, 0.0, 0.0});
    ASSERT_NE(createdId, 0u);
    EXPECT_EQ(session->currentFeature(), createdId);

    move({1.0, 1.0, 0.0});
    EXPECT_EQ(layer.geometry(createdId)->coordinates.size(), 2u);
    click({1.0, 1.0, 0.0});
    move({2.0, 0.0, 0.0});
    click({2.0, 0.0, 0.0});
    dblClick({2.0, 0.0, 0.0});

    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_EQ(log.ids[0], createdId);
    const Geometry* geometry = layer.geometry(createdId);
    ASSERT_NE(geometry, nullptr);
    ASSERT_EQ(geometry->coordinates.size(), 3u);
    expectCoordinateNear(geometry->coordinates[1], {1.0, 1.0, 0.0});
    expectCoordinateNear(geometry->coordinates[2], {2.0, 0.0, 0.0});
    EXPECT_EQ(session->currentFeature(), 0u);
}

TEST_F(CreateFeatureSessionTest, SingleVertexLineIsDiscarded) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);
    FinishedLog log;
    recordFinished(*session, log);

    click({0.0, 0.0, 0.0});
    move({1.0, 1.0, 0.0});
    EXPECT_EQ(layer.featureCount(), 1u);
    session->finish();

    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_EQ(log.ids[0], 0u);
    EXPECT_EQ(layer.featureCount(), 0u);
    EXPECT_FALSE(session->isStopped());
}

TEST_F(CreateFeatureSessionTest, PolygonNeedsThreeVertices) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Polygon);
    FinishedLog log;
    recordFinished(*session, log);

    click({0.0, 0.0, 0.0});
    click({1.0, 0.0, 0.0});
    dblClick({1.0, 0.0, 0.0});
    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_EQ(log.ids[0], 0u);
    EXPECT_EQ(layer.featureCount(), 0u);

    click({0.0, 0.0, 0.0});
    click({1.0, 0.0, 0.0});
    click({1.0, 1.0, 0.0});
    dblClick({1.0, 1.0, 0.0});
    ASSERT_EQ(log.ids.size(), 2u);
    ASSERT_NE(log.ids[1], 0u);
    EXPECT_EQ(layer.geometry(log.ids[1])->coordinates.size(), 3u);
}

TEST_F(CreateFeatureSessionTest, BoxIsSpannedByTwoClicks) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Box);
    FinishedLog log;
    recordFinished(*session, log);

    click({0.0, 0.0, 0.0});
    move({1.0, 3.0, 0.0});
    click({2.0, 1.0, 0.0});

    ASSERT_EQ(log.ids.size(), 1u);
    const Geometry* geometry = layer.geometry(log.ids[0]);
    ASSERT_NE(geometry, nullptr);
    ASSERT_EQ(geometry->coordinates.size(), 4u);
    expectCoordinateNear(geometry->coordinates[0], {0.0, 0.0, 0.0});
    expectCoordinateNear(geometry->coordinates[1], {2.0, 0.0, 0.0});
    expectCoordinateNear(geometry->coordinates[2], {2.0, 1.0, 0.0});
    expectCoordinateNear(geometry->coordinates[3], {0.0, 1.0, 0.0});
}

TEST(BoxCornersTest, CornersAreCounterClockwiseFromOrigin) {
    const std::vector<Coordinate> corners = boxCornersFromOrigin({2.0, 1.0, 0.0}, {0.0, 0.0, 0.0});
    ASSERT_EQ(corners.size(), 4u);
    expectCoordinateNear(corners[1], {0.0, 1.0, 0.0});
    expectCoordinateNear(corners[2], {0.0, 0.0, 0.0});
    expectCoordinateNear(corners[3], {2.0, 0.0, 0.0});

    const std::vector<Coordinate> flat = boxCornersFromOrigin({0.0, 0.0, 0.0}, {2.0, 0.0, 0.0});
    EXPECT_NE(flat[2].y, 0.0);
    EXPECT_NEAR(flat[2].y, 0.0, 1e-6);
}

TEST_F(CreateFeatureSessionTest, CircleRadiusIsDistanceToSecondClick) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Circle);
    FinishedLog log;
    recordFinished(*session, log);

    click({0.0, 0.0, 0.0});
    move({1.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(layer.geometry(session->currentFeature())->radius, 1.0);
    click({3.0, 4.0, 0.0});

    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_DOUBLE_EQ(layer.geometry(log.ids[0])->radius, 5.0);
}

TEST_F(CreateFeatureSessionTest, ThreeDimensionalViewCreatesXYZ) {
    FakeMapView globe(MapKind::Globe3D);
    context.setActiveMap(&globe);
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Point);
    FinishedLog log;
    recordFinished(*session, log);

    click({1.0, 2.0, 5.0});
    ASSERT_EQ(log.ids.size(), 1u);
    const Geometry* geometry = layer.geometry(log.ids[0]);
    EXPECT_EQ(geometry->layout, GeometryLayout::XYZ);
    EXPECT_DOUBLE_EQ(geometry->coordinates[0].z, 5.0);

    session->stop();
    context.setActiveMap(&map);
}

TEST_F(CreateFeatureSessionTest, FlatViewDropsHeight) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::Point);
    FinishedLog log;
    recordFinished(*session, log);
    click({1.0, 2.0, 5.0});
    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_DOUBLE_EQ(layer.geometry(log.ids[0])->coordinates[0].z, 0.0);
}

TEST_F(CreateFeatureSessionTest, ObliqueImagesDoNotSwitchWhileDrawing) {
    FakeMapView oblique(MapKind::Oblique);
    context.setActiveMap(&oblique);
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);

    click({0.0, 0.0, 0.0});
    EXPECT_FALSE(oblique.switchEnabled());
    click({1.0, 0.0, 0.0});
    dblClick({1.0, 0.0, 0.0});
    EXPECT_TRUE(oblique.switchEnabled());

    FinishedLog log;
    recordFinished(*session, log);
    click({5.0, 5.0, 0.0});
    click({6.0, 5.0, 0.0});
    oblique.imageChanged.raise();
    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_NE(log.ids[0], 0u);
    EXPECT_TRUE(oblique.switchEnabled());
    EXPECT_FALSE(session->currentInteraction()->isStarted());

    session->stop();
    context.setActiveMap(&map);
}

TEST_F(CreateFeatureSessionTest, MapActivationFinishesCurrentGeometry) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);
    FinishedLog log;
    recordFinished(*session, log);
    click({0.0, 0.0, 0.0});
    click({1.0, 0.0, 0.0});

    FakeMapView other;
    context.setActiveMap(&other);
    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_NE(log.ids[0], 0u);
    EXPECT_EQ(layer.featureCount(), 1u);

    session->stop();
    context.setActiveMap(&map);
}

TEST_F(CreateFeatureSessionTest, MapActivationBeforeFirstClickStartsOverQuietly) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);
    FinishedLog log;
    recordFinished(*session, log);

    FakeMapView other;
    context.setActiveMap(&other);
    EXPECT_TRUE(log.ids.empty());
    EXPECT_EQ(layer.featureCount(), 0u);
    ASSERT_NE(session->currentInteraction(), nullptr);
    EXPECT_FALSE(session->currentInteraction()->isStarted());

    context.setActiveMap(&map);
    EXPECT_TRUE(log.ids.empty());
    click({0.0, 0.0, 0.0});
    EXPECT_EQ(layer.featureCount(), 1u);

    session->stop();
}

TEST_F(CreateFeatureSessionTest, StopFinishesAndIsIdempotent) {
    auto session = startCreateFeatureSession(context, layer, GeometryKind::LineString);
    int stoppedCount = 0;
    session->stopped.addListener([&stoppedCount]() { stoppedCount++; });
    FinishedLog log;
    recordFinished(*session, log);

    click({0.0, 0.0, 0.0});
    session->stop();
    session->stop();

    EXPECT_TRUE(session->isStopped());
    EXPECT_EQ(stoppedCount, 1);
    ASSERT_EQ(log.ids.size(), 1u);
    EXPECT_EQ(log.ids[0], 0u);
    EXPECT_EQ(layer.featureCount(), 0u);
    EXPECT_EQ(session->currentInteraction(), nullptr);
    EXPECT_FALSE(context.dispatcher().hasExclusive());

    click({2.0, 2.0, 0.0});
    EXPECT_EQ(layer.featureCount(), 0u);
}

TEST_F(CreateFeatureSessionTest, AnotherSessionDisplacesTheFirst) {
    auto first = startCreateFeatureSession(context, layer, GeometryKind::Point);
    auto second = startCreateFeatureSession(context, layer, GeometryKind::Circle);

    EXPECT_TRUE(first->isStopped());
    EXPECT_FALSE(second->isStopped());

    click({0.0, 0.0, 0.0});
    click({1.0, 0.0, 0.0});
    ASSERT_EQ(layer.featureCount(), 1u);
    EXPECT_EQ(layer.geometry(layer.featureIds()[0])->kind, GeometryKind::Circle);
}
