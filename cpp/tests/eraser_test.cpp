#include "tests/board_test_common.h"

using namespace board_test;

TEST_F(BoardEngineTest, EraserDeletesStrokeWithPointInRadius) {
    const std::uint32_t stroke = engine.addElement(makeStroke({{10.0f, 10.0f}, {20.0f, 20.0f}, {40.0f, 40.0f}}));

    EXPECT_EQ(engine.eraseAlongPath({{1000.0f, 1000.0f}, {1010.0f, 1000.0f}}, 15.0f), 0u);
    EXPECT_NE(engine.getElement(stroke), nullptr);

    EXPECT_EQ(engine.eraseAlongPath({{20.0f, 20.0f}}, 15.0f), 1u);
    EXPECT_EQ(engine.getElement(stroke), nullptr);
}

TEST_F(BoardEngineTest, EraserIgnoresSegmentsBetweenDistantPoints) {
    const std::uint32_t stroke = engine.addElement(makeStroke({{0.0f, 0.0f}, {100.0f, 0.0f}}));
    // The footprint covers the middle of the segment but neither sample point.
    EXPECT_EQ(engine.eraseAlongPath({{50.0f, 0.0f}}, 15.0f), 0u);
    EXPECT_NE(engine.getElement(stroke), nullptr);
    EXPECT_EQ(engine.eraseAlongPath({{50.0f, 0.0f}}, 50.0f), 1u);
}

TEST_F(BoardEngineTest, EraserSweepsBetweenPathSamples) {
    const std::uint32_t stroke = engine.addElement(makeStroke({{100.0f, 5.0f}, {101.0f, 5.0f}}));
    // Neither path sample is near the stroke; the interpolated ones are.
    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}, {200.0f, 0.0f}}, 15.0f), 1u);
    EXPECT_EQ(engine.getElement(stroke), nullptr);
}

TEST_F(BoardEngineTest, EraserReachesPointsBetweenPathVertices) {
    // (7.5, 13) is 13 units from the path but more than 15 from both of its vertices.
    const std::uint32_t stroke = engine.addElement(makeStroke({{7.5f, 13.0f}, {7.5f, 60.0f}}));
    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}, {30.0f, 0.0f}}, 15.0f), 1u);
    EXPECT_EQ(engine.getElement(stroke), nullptr);
}

TEST_F(BoardEngineTest, EraserHandlesTinyRadiusOnLongPath) {
    const std::uint32_t above = engine.addElement(makeStroke({{5000.0f, 50.0f}, {5010.0f, 50.0f}}));
    const std::uint32_t on = engine.addElement(makeStroke({{5000.0f, 0.0f}, {5001.0f, 0.0f}}));

    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}, {10000.0f, 0.0f}}, 1e-7f), 1u);
    EXPECT_EQ(engine.getElement(on), nullptr);
    EXPECT_NE(engine.getElement(above), nullptr);

    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}, {10000.0f, 0.0f}}, INFINITY), 0u);
    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}, {10000.0f, 0.0f}}, NAN), 0u);
    EXPECT_NE(engine.getElement(above), nullptr);
}

TEST_F(BoardEngineTest, DefaultEraserSparesShapesAndLockedStrokes) {
    const std::uint32_t rect = engine.addElement(makeRect(0.0f, 0.0f, 40.0f, 40.0f));
    Element locked = makeStroke({{20.0f, 20.0f}, {25.0f, 25.0f}});
    locked.flags = static_cast<std::uint32_t>(ElementFlags::Locked);
    const std::uint32_t lockedId = engine.addElement(locked);

    EXPECT_EQ(engine.eraseAlongPath({{20.0f, 20.0f}}, 15.0f), 0u);
    EXPECT_NE(engine.getElement(rect), nullptr);
    EXPECT_NE(engine.getElement(lockedId), nullptr);

    engine.setErasablePredicate([](const Element& el) { return el.kind == ElementKind::Rectangle; });
    EXPECT_EQ(engine.eraseAlongPath({{20.0f, 20.0f}}, 15.0f), 1u);
    EXPECT_EQ(engine.getElement(rect), nullptr);

    engine.resetErasablePredicate();
    EXPECT_EQ(engine.eraseAlongPath({{20.0f, 20.0f}}, 15.0f), 0u);
}

TEST_F(BoardEngineTest, EraseInBoundsRemovesIntersectingStrokes) {
    const std::uint32_t inside = engine.addElement(makeStroke({{10.0f, 10.0f}, {20.0f, 20.0f}}));
    const std::uint32_t crossing = engine.addElement(makeStroke({{90.0f, 50.0f}, {150.0f, 50.0f}}));
    const std::uint32_t outside = engine.addElement(makeStroke({{300.0f, 300.0f}, {310.0f, 310.0f}}));

    EXPECT_EQ(engine.eraseInBounds(AABB{0.0f, 0.0f, 100.0f, 100.0f}), 2u);
    EXPECT_EQ(engine.getElement(inside), nullptr);
    EXPECT_EQ(engine.getElement(crossing), nullptr);
    EXPECT_NE(engine.getElement(outside), nullptr);

    // Whole erase is one undo step.
    ASSERT_TRUE(engine.undo());
    EXPECT_NE(engine.getElement(inside), nullptr);
    EXPECT_NE(engine.getElement(crossing), nullptr);
}

TEST_F(BoardEngineTest, EraserDraftIsOneGesture) {
    const std::uint32_t a = engine.addElement(makeStroke({{10.0f, 10.0f}, {12.0f, 12.0f}}));
    const std::uint32_t b = engine.addElement(makeStroke({{200.0f, 10.0f}, {202.0f, 12.0f}}));
    const auto before = engine.getHistoryMeta();

    engine.setSelection({a, b});
    ASSERT_TRUE(engine.startDraft(ToolKind::Eraser, Point2{0.0f, 10.0f}));
    EXPECT_EQ(engine.getElement(a), nullptr);
    engine.updateDraft(Point2{100.0f, 10.0f});
    engine.updateDraft(Point2{205.0f, 10.0f});
    EXPECT_EQ(engine.getElement(b), nullptr);
    EXPECT_FALSE(engine.canUndo());

    const DraftCommit result = engine.commitDraft();
    EXPECT_EQ(result.kind, DraftResultKind::None);
    EXPECT_EQ(engine.getHistoryMeta().depth, before.depth + 1);
    EXPECT_TRUE(engine.getSelection().empty());

    ASSERT_TRUE(engine.undo());
    EXPECT_NE(engine.getElement(a), nullptr);
    EXPECT_NE(engine.getElement(b), nullptr);
}

TEST_F(BoardEngineTest, EraserRadiusIsConfigurable) {
    engine.setEraserRadius(-3.0f);
    EXPECT_FLOAT_EQ(engine.config().eraser.radius, 15.0f);
    engine.setEraserRadius(2.0f);
    EXPECT_FLOAT_EQ(engine.config().eraser.radius, 2.0f);

    const std::uint32_t a = engine.addElement(makeStroke({{10.0f, 10.0f}, {12.0f, 12.0f}}));
    ASSERT_TRUE(engine.startDraft(ToolKind::Eraser, Point2{16.0f, 10.0f}));
    EXPECT_NE(engine.getElement(a), nullptr);
    engine.cancelDraft();
}

namespace {
// Eleven points from x = 0 to x = 100, ten units apart.
Element makeRuler() {
    std::vector<Point2> pts;
    for (int i = 0; i <= 10; ++i) pts.push_back(Point2{static_cast<float>(i) * 10.0f, 0.0f});
    return makeStroke(pts);
}
} // namespace

TEST_F(BoardEngineTest, SegmentEraseSplitsStrokeInTwo) {
    const std::uint32_t stroke = engine.addElement(makeRuler());
    const auto before = engine.getHistoryMeta();

    // Removes x = 40, 50, 60.
    EXPECT_EQ(engine.eraseSegmentsAlongPath({{50.0f, 0.0f}}, 12.0f), 1u);
    ASSERT_EQ(engine.getElementCount(), 2u);
    EXPECT_EQ(engine.getHistoryMeta().depth, before.depth + 1);

    const Element* head = engine.getElement(stroke);
    ASSERT_NE(head, nullptr);
    EXPECT_FLOAT_EQ(head->x, 0.0f);
    ASSERT_EQ(head->points.size(), 4u);
    expectPoint(head->points.back(), 30.0f, 0.0f);

    const std::uint32_t tailId = engine.getDrawOrder().back();
    ASSERT_NE(tailId, stroke);
    const Element* tail = engine.getElement(tailId);
    ASSERT_NE(tail, nullptr);
    EXPECT_EQ(tail->kind, ElementKind::Stroke);
    EXPECT_FLOAT_EQ(tail->x, 70.0f);
    ASSERT_EQ(tail->points.size(), 4u);
    expectPoint(tail->points.front(), 0.0f, 0.0f);
    expectPoint(tail->points.back(), 30.0f, 0.0f);

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getElementCount(), 1u);
    EXPECT_EQ(engine.getElement(stroke)->points.size(), 11u);
    EXPECT_EQ(engine.getElement(tailId), nullptr);
}

TEST_F(BoardEngineTest, SegmentEraseTrimsOneEnd) {
    const std::uint32_t stroke = engine.addElement(makeRuler());
    EXPECT_EQ(engine.eraseSegmentsAlongPath({{100.0f, 0.0f}}, 12.0f), 1u);
    EXPECT_EQ(engine.getElementCount(), 1u);
    const Element* el = engine.getElement(stroke);
    ASSERT_NE(el, nullptr);
    ASSERT_EQ(el->points.size(), 9u);
    expectPoint(el->points.back(), 80.0f, 0.0f);
}

TEST_F(BoardEngineTest, SegmentEraseRemovesFullyCoveredStroke) {
    const std::uint32_t stroke = engine.addElement(makeRuler());
    const std::uint32_t spared = engine.addElement(makeStroke({{0.0f, 500.0f}, {10.0f, 500.0f}}));
    engine.setSelection({stroke});

    EXPECT_EQ(engine.eraseSegmentsAlongPath({{0.0f, 0.0f}, {100.0f, 0.0f}}, 5.0f), 1u);
    EXPECT_EQ(engine.getElement(stroke), nullptr);
    EXPECT_NE(engine.getElement(spared), nullptr);
    EXPECT_TRUE(engine.getSelection().empty());

    // A single survivor between two erased points is dropped with them.
    const std::uint32_t three = engine.addElement(makeStroke({{0.0f, 0.0f}, {10.0f, 0.0f}, {20.0f, 0.0f}}));
    // The path detours around (10, 0) and only reaches the two ends.
    EXPECT_EQ(engine.eraseSegmentsAlongPath({{0.0f, 0.0f}, {0.0f, 30.0f}, {20.0f, 30.0f}, {20.0f, 0.0f}}, 1.0f), 1u);
    EXPECT_EQ(engine.getElement(three), nullptr);
    EXPECT_EQ(engine.eraseSegmentsAlongPath({{1000.0f, 1000.0f}}, 15.0f), 0u);
}

TEST(EraserEngineTest, SolidKindsUseTheirOrientedBox) {
    const BoardConfig config;
    BoardDiagnostics diagnostics;
    EdgeStore edges;
    ElementStore store(edges, config, diagnostics);
    EraserEngine eraser(store);

    Element rect = board_test::makeRect(0.0f, 0.0f, 100.0f, 20.0f);
    rect.id = 1;
    ASSERT_TRUE(store.add(rect));
    const Element* el = store.get(1);
    EXPECT_TRUE(eraser.touches(*el, Point2{50.0f, 30.0f}, 10.0f));
    EXPECT_FALSE(eraser.touches(*el, Point2{50.0f, 31.0f}, 10.0f));
    EXPECT_FALSE(eraser.isErasable(*el));
}
