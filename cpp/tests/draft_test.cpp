#include "tests/board_test_common.h"

using namespace board_test;

TEST(DraftTest, RectangleDragCreatesOneUndoStep) {
    BoardEngine engine(noSnapConfig());
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{0.0f, 0.0f}));
    engine.updateDraft(Point2{60.0f, 30.0f});
    engine.updateDraft(Point2{100.0f, 50.0f});
    EXPECT_TRUE(engine.isDraftActive());

    const DraftCommit result = engine.commitDraft();
    ASSERT_EQ(result.kind, DraftResultKind::Element);
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->kind, ElementKind::Rectangle);
    EXPECT_FLOAT_EQ(el->x, 0.0f);
    EXPECT_FLOAT_EQ(el->y, 0.0f);
    EXPECT_FLOAT_EQ(el->w, 100.0f);
    EXPECT_FLOAT_EQ(el->h, 50.0f);
    EXPECT_FALSE(engine.isDraftActive());
    EXPECT_EQ(engine.getSelection(), std::vector<std::uint32_t>{result.id});

    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);
    EXPECT_EQ(BoardEngineTestAccessor::history(engine).undoLabel(), "Draw rectangle");
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getElementCount(), 0u);
    EXPECT_TRUE(engine.getSelection().empty());
}

TEST(DraftTest, DragInAnyDirectionNormalizesTheBox) {
    BoardEngine engine(noSnapConfig());
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{100.0f, 80.0f}));
    engine.updateDraft(Point2{40.0f, 20.0f});
    const DraftCommit result = engine.commitDraft();
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_FLOAT_EQ(el->x, 40.0f);
    EXPECT_FLOAT_EQ(el->y, 20.0f);
    EXPECT_FLOAT_EQ(el->w, 60.0f);
    EXPECT_FLOAT_EQ(el->h, 60.0f);
}

TEST(DraftTest, EllipseDragStoresCenterAndRadii) {
    BoardEngine engine(noSnapConfig());
    ASSERT_TRUE(engine.startDraft(ToolKind::Ellipse, Point2{0.0f, 0.0f}));
    engine.updateDraft(Point2{100.0f, 60.0f});
    const DraftCommit result = engine.commitDraft();
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->kind, ElementKind::Ellipse);
    EXPECT_FLOAT_EQ(el->x, 50.0f);
    EXPECT_FLOAT_EQ(el->y, 30.0f);
    EXPECT_FLOAT_EQ(el->rx, 50.0f);
    EXPECT_FLOAT_EQ(el->ry, 30.0f);
}

TEST_F(BoardEngineTest, ShapeClickWithoutDragIsDiscarded) {
    const std::uint32_t idBefore = engine.nextId();
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{500.0f, 500.0f}));
    engine.updateDraft(Point2{500.5f, 500.0f});
    const DraftCommit result = engine.commitDraft();
    EXPECT_EQ(result.kind, DraftResultKind::None);
    EXPECT_EQ(result.id, 0u);
    EXPECT_EQ(engine.getElementCount(), 0u);
    EXPECT_EQ(engine.nextId(), idBefore);
    EXPECT_FALSE(engine.canUndo());
}

TEST_F(BoardEngineTest, StickyNoteClickUsesDefaultSize) {
    ASSERT_TRUE(engine.startDraft(ToolKind::StickyNote, Point2{500.0f, 500.0f}));
    const DraftCommit result = engine.commitDraft();
    ASSERT_EQ(result.kind, DraftResultKind::Element);
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->kind, ElementKind::StickyNote);
    EXPECT_FLOAT_EQ(el->w, 200.0f);
    EXPECT_FLOAT_EQ(el->h, 150.0f);
    EXPECT_FLOAT_EQ(el->x, 400.0f);
    EXPECT_FLOAT_EQ(el->y, 425.0f);
}

TEST_F(BoardEngineTest, TableClickGetsEmptyCells) {
    ASSERT_TRUE(engine.startDraft(ToolKind::Table, Point2{0.0f, 0.0f}));
    const DraftCommit result = engine.commitDraft();
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->rows, 3u);
    EXPECT_EQ(el->cols, 3u);
    EXPECT_EQ(el->cells.size(), 9u);
    EXPECT_FLOAT_EQ(el->w, 300.0f);
    EXPECT_FLOAT_EQ(el->h, 120.0f);
}

TEST(DraftTest, DraftPointsSnapToGrid) {
    BoardEngine engine(gridOnlyConfig());
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{3.0f, 2.0f}));
    engine.updateDraft(Point2{98.0f, 57.0f});
    EXPECT_TRUE(engine.getLastSnap().snapped);
    EXPECT_EQ(engine.getLastSnap().kind, SnapTargetKind::Grid);

    const DraftCommit result = engine.commitDraft();
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_FLOAT_EQ(el->x, 0.0f);
    EXPECT_FLOAT_EQ(el->y, 0.0f);
    EXPECT_FLOAT_EQ(el->w, 100.0f);
    EXPECT_FLOAT_EQ(el->h, 60.0f);
}

TEST(DraftTest, CancelRemovesThePhantom) {
    BoardEngine engine(noSnapConfig());
    const std::uint32_t idBefore = engine.nextId();
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{0.0f, 0.0f}));
    engine.updateDraft(Point2{100.0f, 50.0f});
    const std::uint32_t phantom = BoardEngineTestAccessor::draftPhantomId(engine);
    ASSERT_NE(phantom, 0u);
    EXPECT_NE(engine.getElement(phantom), nullptr);
    EXPECT_EQ(engine.getGestureState(), GestureState::Active);

    engine.cancelDraft();
    EXPECT_EQ(engine.getElement(phantom), nullptr);
    EXPECT_EQ(engine.nextId(), idBefore);
    EXPECT_FALSE(engine.isDraftActive());
    EXPECT_FALSE(engine.canUndo());
    EXPECT_EQ(engine.getGestureState(), GestureState::Idle);
}

TEST_F(BoardEngineTest, OnlyOneGestureAtATime) {
    const std::uint32_t id = engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{100.0f, 100.0f}));
    EXPECT_FALSE(engine.startDraft(ToolKind::Ellipse, Point2{0.0f, 0.0f}));
    EXPECT_FALSE(engine.beginTransform({id}, TransformMode::Move, Point2{0.0f, 0.0f}));
    EXPECT_EQ(engine.eraseAlongPath({{0.0f, 0.0f}}, 5.0f), 0u);
    engine.cancelDraft();

    EXPECT_FALSE(engine.startDraft(ToolKind::Edit, Point2{0.0f, 0.0f}));
    EXPECT_FALSE(engine.startDraft(ToolKind::Rectangle, Point2{NAN, 0.0f}));
    EXPECT_FALSE(engine.isDraftActive());
}

TEST_F(BoardEngineTest, PenStrokeStoresPointsRelativeToStart) {
    ASSERT_TRUE(engine.startDraft(ToolKind::Pen, Point2{10.0f, 10.0f}));
    engine.updateDraft(Point2{20.0f, 15.0f});
    engine.updateDraft(Point2{20.1f, 15.1f}); // below the sampling step
    engine.updateDraft(Point2{30.0f, 10.0f});

    const DraftCommit result = engine.commitDraft();
    ASSERT_EQ(result.kind, DraftResultKind::Element);
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->kind, ElementKind::Stroke);
    EXPECT_FLOAT_EQ(el->x, 10.0f);
    EXPECT_FLOAT_EQ(el->y, 10.0f);
    expectPoints(el->points, {{0.0f, 0.0f}, {10.0f, 5.0f}, {20.0f, 0.0f}});
    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);
}

TEST_F(BoardEngineTest, PenClickIsDiscarded) {
    const std::uint32_t idBefore = engine.nextId();
    ASSERT_TRUE(engine.startDraft(ToolKind::Pen, Point2{10.0f, 10.0f}));
    EXPECT_EQ(engine.getElementCount(), 1u);
    const DraftCommit result = engine.commitDraft();
    EXPECT_EQ(result.kind, DraftResultKind::None);
    EXPECT_EQ(engine.getElementCount(), 0u);
    EXPECT_EQ(engine.nextId(), idBefore);
    EXPECT_FALSE(engine.canUndo());
}

TEST_F(BoardEngineTest, ConnectorDraftAttachesToNearbyPorts) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));

    ASSERT_TRUE(engine.startDraft(ToolKind::Connector, Point2{101.0f, 50.0f}));
    engine.updateDraft(Point2{200.0f, 80.0f});
    const std::uint32_t phantom = BoardEngineTestAccessor::draftPhantomId(engine);
    ASSERT_NE(engine.getEdge(phantom), nullptr);
    EXPECT_EQ(engine.getEdge(phantom)->target.elementId, 0u);

    engine.updateDraft(Point2{299.0f, 50.0f});
    const DraftCommit result = engine.commitDraft();
    ASSERT_EQ(result.kind, DraftResultKind::Edge);
    const Edge* edge = engine.getEdge(result.id);
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->source.elementId, a);
    EXPECT_EQ(edge->source.port, PortKind::E);
    EXPECT_EQ(edge->target.elementId, b);
    EXPECT_EQ(edge->target.port, PortKind::W);
    EXPECT_EQ(edge->routing, EdgeRouting::Straight);
    // Connectors do not change the selection.
    EXPECT_TRUE(engine.getSelection().empty());

    engine.reflowEdges();
    expectPoints(engine.getEdge(result.id)->points, {{100.0f, 50.0f}, {300.0f, 50.0f}});
}

TEST_F(BoardEngineTest, ConnectorUsesConfiguredRouting) {
    engine.setConnectorRouting(EdgeRouting::Orthogonal);
    ASSERT_TRUE(engine.startDraft(ToolKind::Connector, Point2{500.0f, 500.0f}));
    engine.updateDraft(Point2{600.0f, 650.0f});
    const DraftCommit result = engine.commitDraft();
    ASSERT_EQ(result.kind, DraftResultKind::Edge);
    EXPECT_EQ(engine.getEdge(result.id)->routing, EdgeRouting::Orthogonal);
    EXPECT_EQ(engine.getEdge(result.id)->source.elementId, 0u);
}

TEST_F(BoardEngineTest, ConnectorClickBetweenFreePointsIsDiscarded) {
    const std::uint32_t idBefore = engine.nextId();
    ASSERT_TRUE(engine.startDraft(ToolKind::Connector, Point2{500.0f, 500.0f}));
    engine.updateDraft(Point2{500.5f, 500.0f});
    EXPECT_EQ(engine.commitDraft().kind, DraftResultKind::None);
    EXPECT_EQ(engine.getEdgeCount(), 0u);
    EXPECT_EQ(engine.nextId(), idBefore);
}

TEST(DraftTest, DraftInsideSectionJoinsIt) {
    BoardEngine engine(noSnapConfig());
    const std::uint32_t section = engine.addElement(makeSection(100.0f, 100.0f, 400.0f, 300.0f));

    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{150.0f, 150.0f}));
    engine.updateDraft(Point2{250.0f, 200.0f});
    const DraftCommit result = engine.commitDraft();
    const Element* el = engine.getElement(result.id);
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->parentId, section);
    EXPECT_FLOAT_EQ(el->x, 50.0f);
    EXPECT_FLOAT_EQ(el->y, 50.0f);

    AABB world{};
    ASSERT_TRUE(engine.worldBounds(result.id, world));
    EXPECT_NEAR(world.minX, 150.0f, kEps);
    EXPECT_NEAR(world.minY, 150.0f, kEps);

    // Creation and attachment undo together.
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getElement(result.id), nullptr);
    EXPECT_EQ(engine.getElementCount(), 1u);
}

TEST(DraftTest, DraftOutsideSectionsStaysTopLevel) {
    BoardEngine engine(noSnapConfig());
    engine.addElement(makeSection(100.0f, 100.0f, 400.0f, 300.0f));
    ASSERT_TRUE(engine.startDraft(ToolKind::Rectangle, Point2{600.0f, 150.0f}));
    engine.updateDraft(Point2{700.0f, 200.0f});
    const DraftCommit result = engine.commitDraft();
    EXPECT_EQ(engine.getElement(result.id)->parentId, 0u);
}
