#include "tests/board_test_common.h"
#include "board/geometry/geometry.h"

using namespace board_test;

TEST_F(BoardEngineTest, StraightConnectorBetweenPorts) {
    const std::uint32_t rect = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t circle = engine.addElement(makeEllipse(300.0f, 300.0f, 50.0f, 50.0f));
    const std::uint32_t edge =
        engine.addEdge(attached(rect, PortKind::E), attached(circle, PortKind::W), EdgeRouting::Straight);
    ASSERT_NE(edge, 0u);
    EXPECT_TRUE(engine.getEdge(edge)->stale);

    EXPECT_EQ(engine.reflowEdges(), 1u);
    const Edge* e = engine.getEdge(edge);
    EXPECT_FALSE(e->stale);
    expectPoints(e->points, {{100.0f, 50.0f}, {250.0f, 300.0f}});
    // Attached endpoints cache their resolved position.
    EXPECT_FLOAT_EQ(e->target.x, 250.0f);
    EXPECT_FLOAT_EQ(e->target.y, 300.0f);
}

TEST_F(BoardEngineTest, OrthogonalRouteHasOneBendForPerpendicularPorts) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 200.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::N), EdgeRouting::Orthogonal);
    engine.reflowEdges();

    const std::vector<Point2>& points = engine.getEdge(edge)->points;
    expectPoints(points, {{100.0f, 50.0f}, {350.0f, 50.0f}, {350.0f, 200.0f}});
    EXPECT_EQ(countBends(points), 1u);
}

TEST_F(BoardEngineTest, OrthogonalRouteBetweenFacingPortsIsStraight) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::W), EdgeRouting::Orthogonal);
    engine.reflowEdges();
    expectPoints(engine.getEdge(edge)->points, {{100.0f, 50.0f}, {300.0f, 50.0f}});
}

TEST_F(BoardEngineTest, OrthogonalSegmentsAreAxisAligned) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(400.0f, 300.0f, 80.0f, 60.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::S), attached(b, PortKind::W), EdgeRouting::Orthogonal);
    engine.reflowEdges();

    const std::vector<Point2>& points = engine.getEdge(edge)->points;
    ASSERT_GE(points.size(), 2u);
    expectPoint(points.front(), 50.0f, 100.0f);
    expectPoint(points.back(), 400.0f, 330.0f);
    for (std::size_t i = 1; i < points.size(); ++i) {
        const bool horizontal = std::fabs(points[i].y - points[i - 1].y) < kEps;
        const bool vertical = std::fabs(points[i].x - points[i - 1].x) < kEps;
        EXPECT_TRUE(horizontal || vertical) << "segment " << i;
    }
}

TEST_F(BoardEngineTest, CurvedRouteIsFlattenedAndBows) {
    const std::uint32_t edge = engine.addEdge(freePoint(0.0f, 0.0f), freePoint(200.0f, 0.0f), EdgeRouting::Curved);
    engine.reflowEdges();
    const std::vector<Point2>& points = engine.getEdge(edge)->points;
    ASSERT_EQ(points.size(), engine.config().router.curveSegments + 1);
    expectPoint(points.front(), 0.0f, 0.0f);
    expectPoint(points.back(), 200.0f, 0.0f);
    const Point2& mid = points[points.size() / 2];
    EXPECT_NEAR(mid.x, 100.0f, kEps);
    EXPECT_LT(mid.y, -1.0f);
}

TEST_F(BoardEngineTest, ObstacleAwareRouteAvoidsElementsInBetween) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t wall = engine.addElement(makeRect(200.0f, -50.0f, 100.0f, 200.0f));
    const std::uint32_t b = engine.addElement(makeRect(400.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::W), EdgeRouting::ObstacleAware);
    engine.reflowEdges();

    const std::vector<Point2>& points = engine.getEdge(edge)->points;
    ASSERT_GE(points.size(), 4u);
    expectPoint(points.front(), 100.0f, 50.0f);
    expectPoint(points.back(), 400.0f, 50.0f);

    AABB wallBox{};
    ASSERT_TRUE(engine.worldBounds(wall, wallBox));
    for (std::size_t i = 1; i < points.size(); ++i) {
        EXPECT_FALSE(board::segmentIntersectsAabb(points[i - 1], points[i], wallBox)) << "segment " << i;
    }
    EXPECT_GE(countBends(points), 2u);
    EXPECT_EQ(engine.diagnostics().routeFallbacks, 0u);
}

TEST_F(BoardEngineTest, ObstacleAwareRouteWithoutObstaclesMatchesOrthogonal) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 200.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::N), EdgeRouting::ObstacleAware);
    engine.reflowEdges();
    expectPoints(engine.getEdge(edge)->points, {{100.0f, 50.0f}, {350.0f, 50.0f}, {350.0f, 200.0f}});
}

TEST_F(BoardEngineTest, ReflowRoutesOnlyDirtyEdges) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t moving = engine.addEdge(attached(a, PortKind::E), freePoint(300.0f, 50.0f), EdgeRouting::Straight);
    const std::uint32_t still = engine.addEdge(freePoint(0.0f, 500.0f), freePoint(100.0f, 500.0f), EdgeRouting::Straight);
    (void)still;
    EXPECT_EQ(engine.reflowEdges(), 2u);
    EXPECT_EQ(BoardEngineTestAccessor::dirtyEdgeCount(engine), 0u);
    EXPECT_EQ(engine.reflowEdges(), 0u);

    ElementPatch patch;
    patch.y = 100.0f;
    engine.updateElement(a, patch);
    EXPECT_EQ(BoardEngineTestAccessor::dirtyEdgeCount(engine), 1u);
    EXPECT_EQ(engine.reflowEdges(), 1u);
    expectPoints(engine.getEdge(moving)->points, {{100.0f, 150.0f}, {300.0f, 50.0f}});
}

TEST_F(BoardEngineTest, EdgesOfSectionChildrenFollowTheSection) {
    const std::uint32_t section = engine.addElement(makeSection(0.0f, 0.0f, 400.0f, 300.0f));
    Element el = makeRect(10.0f, 10.0f, 50.0f, 50.0f);
    el.parentId = section;
    const std::uint32_t child = engine.addElement(el);
    const std::uint32_t edge = engine.addEdge(attached(child, PortKind::E), freePoint(600.0f, 35.0f), EdgeRouting::Straight);
    engine.reflowEdges();
    expectPoint(engine.getEdge(edge)->points.front(), 60.0f, 35.0f);

    ElementPatch patch;
    patch.x = 100.0f;
    engine.updateElement(section, patch);
    EXPECT_EQ(engine.reflowEdges(), 1u);
    expectPoint(engine.getEdge(edge)->points.front(), 160.0f, 35.0f);
}

TEST_F(BoardEngineTest, DanglingEdgeKeepsStaleRoute) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), freePoint(300.0f, 50.0f), EdgeRouting::Straight);
    engine.reflowEdges();

    // Erase the element behind the store's back so the edge still points at it.
    BoardEngineTestAccessor::store(engine).restore(a, nullptr);
    EXPECT_EQ(engine.reflowEdges(), 0u);
    const Edge* e = engine.getEdge(edge);
    EXPECT_TRUE(e->stale);
    expectPoints(e->points, {{100.0f, 50.0f}, {300.0f, 50.0f}});
    EXPECT_EQ(engine.diagnostics().danglingEdgesSkipped, 1u);
}

TEST_F(BoardEngineTest, NearestPortPrefersClosest) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));

    const std::optional<PortHit> hit = engine.nearestPort(Point2{104.0f, 47.0f}, 10.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->elementId, a);
    EXPECT_EQ(hit->port, PortKind::E);
    EXPECT_NEAR(hit->distance, 5.0f, kEps);

    EXPECT_FALSE(engine.nearestPort(Point2{200.0f, 200.0f}, 10.0f).has_value());
}

TEST(EdgeRouterTest, SimplifyDropsShortAndCollinearSegments) {
    const BoardConfig config;
    BoardDiagnostics diagnostics;
    EdgeStore edges;
    ElementStore store(edges, config, diagnostics);
    EdgeRouter router(store, config.router, diagnostics);

    const std::vector<Point2> out = router.simplify(
        {{0.0f, 0.0f}, {5.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 0.5f}, {10.0f, 10.0f}});
    board_test::expectPoints(out, {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}});

    // A reversal is a real bend.
    const std::vector<Point2> back = router.simplify({{0.0f, 0.0f}, {10.0f, 0.0f}, {5.0f, 0.0f}});
    EXPECT_EQ(back.size(), 3u);
}

TEST(EdgeRouterTest, CountBends) {
    EXPECT_EQ(countBends({{0.0f, 0.0f}, {10.0f, 0.0f}}), 0u);
    EXPECT_EQ(countBends({{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {20.0f, 10.0f}}), 2u);
    EXPECT_EQ(countBends({{0.0f, 0.0f}, {5.0f, 0.0f}, {10.0f, 0.0f}}), 0u);
}
