#include "tests/board_test_common.h"

using namespace board_test;

TEST_F(BoardEngineTest, ElementsAndEdgesShareOneIdSpace) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), freePoint(50.0f, 5.0f), EdgeRouting::Straight);
    const std::uint32_t b = engine.addElement(makeRect(20.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(edge, 2u);
    EXPECT_EQ(b, 3u);

    const std::uint32_t reserved = engine.allocateId();
    EXPECT_EQ(reserved, 4u);
    EXPECT_EQ(engine.nextId(), 5u);

    // An explicit id already used by an edge is refused.
    Element clash = makeRect(0.0f, 0.0f, 5.0f, 5.0f);
    clash.id = edge;
    EXPECT_EQ(engine.addElement(clash), 0u);
    EXPECT_EQ(engine.getLastError(), BoardError::InvalidOperation);
}

TEST_F(BoardEngineTest, ErrorsAreReportedAndCleared) {
    EXPECT_FALSE(engine.updateElement(42, ElementPatch{}));
    EXPECT_EQ(engine.getLastError(), BoardError::UnknownElement);
    EXPECT_FALSE(engine.removeElement(42));
    EXPECT_FALSE(engine.bringToFront(42));
    EXPECT_FALSE(engine.removeEdge(42));
    EXPECT_FALSE(engine.setEdgeRouting(42, EdgeRouting::Curved));
    EXPECT_EQ(engine.getLastError(), BoardError::UnknownElement);

    EXPECT_EQ(engine.addEdge(attached(42, PortKind::N), freePoint(0.0f, 0.0f), EdgeRouting::Straight), 0u);
    EXPECT_EQ(engine.getLastError(), BoardError::UnknownElement);
    EXPECT_EQ(engine.addEdge(freePoint(NAN, 0.0f), freePoint(0.0f, 0.0f), EdgeRouting::Straight), 0u);

    const std::uint32_t id = engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_NE(id, 0u);
    EXPECT_EQ(engine.getLastError(), BoardError::Ok);
    EXPECT_TRUE(engine.canUndo());
}

TEST_F(BoardEngineTest, EdgeRoutingAndReconnectAreUndoable) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), freePoint(300.0f, 50.0f), EdgeRouting::Straight);

    ASSERT_TRUE(engine.setEdgeRouting(edge, EdgeRouting::Orthogonal));
    ASSERT_TRUE(engine.reconnectEdge(edge, EdgeEnd::Target, attached(b, PortKind::W)));
    EXPECT_EQ(engine.getEdgesConnectedTo(b), std::vector<std::uint32_t>{edge});
    EXPECT_TRUE(engine.getEdge(edge)->stale);

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getEdge(edge)->target.elementId, 0u);
    EXPECT_TRUE(engine.getEdgesConnectedTo(b).empty());
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getEdge(edge)->routing, EdgeRouting::Straight);

    EXPECT_FALSE(engine.reconnectEdge(edge, EdgeEnd::Source, attached(999, PortKind::N)));
    EXPECT_EQ(engine.getEdge(edge)->source.elementId, a);

    ASSERT_TRUE(engine.removeEdge(edge));
    EXPECT_EQ(engine.getEdge(edge), nullptr);
    EXPECT_TRUE(engine.getEdgesConnectedTo(a).empty());
}

TEST_F(BoardEngineTest, SelectionIgnoresUnknownIdsAndFollowsRemoval) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    const std::uint32_t b = engine.addElement(makeRect(20.0f, 0.0f, 10.0f, 10.0f));
    engine.setSelection({b, 77, a});
    EXPECT_EQ(engine.getSelection(), (std::vector<std::uint32_t>{a, b}));
    EXPECT_TRUE(engine.isSelected(a));
    EXPECT_FALSE(engine.isSelected(77));

    engine.removeElement(a);
    EXPECT_EQ(engine.getSelection(), std::vector<std::uint32_t>{b});

    // Undoing the add of b drops it from the selection too.
    ASSERT_TRUE(engine.undo());
    ASSERT_TRUE(engine.undo());
    EXPECT_TRUE(engine.getSelection().empty());

    engine.setSelection({a});
    engine.clearSelection();
    EXPECT_TRUE(engine.getSelection().empty());
}

TEST_F(BoardEngineTest, ClearResetsEverything) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    engine.addEdge(attached(a, PortKind::E), freePoint(50.0f, 5.0f), EdgeRouting::Straight);
    engine.setSelection({a});
    ASSERT_TRUE(engine.startDraft(ToolKind::Pen, Point2{0.0f, 0.0f}));

    engine.clear();
    EXPECT_EQ(engine.getElementCount(), 0u);
    EXPECT_EQ(engine.getEdgeCount(), 0u);
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_FALSE(engine.canUndo());
    EXPECT_FALSE(engine.isDraftActive());
    EXPECT_EQ(engine.getGestureState(), GestureState::Idle);
    EXPECT_EQ(engine.nextId(), 1u);
    EXPECT_EQ(engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f)), 1u);

    BoardEngine fresh;
    fresh.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_EQ(engine.getDocumentDigest(), fresh.getDocumentDigest());
}

TEST_F(BoardEngineTest, DigestDependsOnlyOnDocumentState) {
    BoardEngine other;
    other.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    engine.addElement(makeRect(0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_EQ(engine.getDocumentDigest(), other.getDocumentDigest());

    // Selection and view state are not part of the document.
    engine.setSelection({1});
    engine.setViewScale(3.0f);
    EXPECT_EQ(engine.getDocumentDigest(), other.getDocumentDigest());

    ElementPatch patch;
    patch.strokeRGBA = 0x112233FFu;
    engine.updateElement(1, patch);
    EXPECT_NE(engine.getDocumentDigest(), other.getDocumentDigest());
}

TEST_F(BoardEngineTest, SetConfigReachesEveryService) {
    BoardConfig config;
    config.snap.enabled = false;
    config.router.curveSegments = 4;
    config.history.capacity = 1;
    config.cull.bufferPx = 0.0f;
    engine.setConfig(config);
    EXPECT_FALSE(engine.config().snap.enabled);

    EXPECT_FALSE(engine.snap(Point2{19.0f, 1.0f}, {}).snapped);

    const std::uint32_t edge = engine.addEdge(freePoint(0.0f, 0.0f), freePoint(100.0f, 0.0f), EdgeRouting::Curved);
    engine.reflowEdges();
    EXPECT_EQ(engine.getEdge(edge)->points.size(), 5u);

    engine.addElement(makeRect(150.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);

    EXPECT_TRUE(engine.visibleElements(viewport(0.0f, 0.0f, 100.0f, 100.0f)).empty());
}

TEST_F(BoardEngineTest, ViewScaleRejectsNonPositiveValues) {
    engine.setViewScale(2.0f);
    EXPECT_FLOAT_EQ(engine.viewScale(), 2.0f);
    engine.setViewScale(0.0f);
    engine.setViewScale(-1.0f);
    engine.setViewScale(NAN);
    EXPECT_FLOAT_EQ(engine.viewScale(), 2.0f);
}

TEST_F(BoardEngineTest, ResetDiagnosticsZeroesCounters) {
    Element el = makeRect(0.0f, 0.0f, -5.0f, 10.0f);
    engine.addElement(el);
    EXPECT_GT(engine.diagnostics().geometryClamped, 0u);
    engine.resetDiagnostics();
    EXPECT_EQ(engine.diagnostics().geometryClamped, 0u);
}

TEST_F(BoardEngineTest, EndpointDragIsOneUndoStep) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t c = engine.addElement(makeRect(300.0f, 300.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::W), EdgeRouting::Straight);
    const auto before = engine.getHistoryMeta();

    ASSERT_TRUE(engine.beginEndpointDrag(edge, EdgeEnd::Target));
    EXPECT_TRUE(engine.isEndpointDragActive());
    ASSERT_TRUE(engine.updateEndpointDrag(Point2{250.0f, 200.0f}));
    EXPECT_EQ(engine.getEdge(edge)->target.elementId, 0u);
    EXPECT_FLOAT_EQ(engine.getEdge(edge)->target.x, 250.0f);
    EXPECT_FLOAT_EQ(engine.getEdge(edge)->target.y, 200.0f);

    ASSERT_TRUE(engine.updateEndpointDrag(Point2{299.0f, 350.0f}));
    EXPECT_EQ(engine.getHistoryMeta().depth, before.depth);
    ASSERT_TRUE(engine.commitEndpointDrag());
    EXPECT_FALSE(engine.isEndpointDragActive());
    EXPECT_EQ(engine.getHistoryMeta().depth, before.depth + 1);

    const Edge* moved = engine.getEdge(edge);
    EXPECT_EQ(moved->target.elementId, c);
    EXPECT_EQ(moved->target.port, PortKind::W);
    EXPECT_TRUE(engine.getEdgesConnectedTo(b).empty());
    EXPECT_EQ(engine.getEdgesConnectedTo(c), std::vector<std::uint32_t>{edge});

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getEdge(edge)->target.elementId, b);
    EXPECT_EQ(engine.getEdge(edge)->target.port, PortKind::W);
}

TEST_F(BoardEngineTest, CancelledEndpointDragRestoresAttachment) {
    const std::uint32_t a = engine.addElement(makeRect(0.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t b = engine.addElement(makeRect(300.0f, 0.0f, 100.0f, 100.0f));
    const std::uint32_t edge = engine.addEdge(attached(a, PortKind::E), attached(b, PortKind::W), EdgeRouting::Straight);
    const auto before = engine.getHistoryMeta();

    EXPECT_FALSE(engine.beginEndpointDrag(999, EdgeEnd::Source));
    EXPECT_EQ(engine.getLastError(), BoardError::UnknownElement);

    ASSERT_TRUE(engine.beginEndpointDrag(edge, EdgeEnd::Source));
    EXPECT_FALSE(engine.beginEndpointDrag(edge, EdgeEnd::Target));
    EXPECT_FALSE(engine.startDraft(ToolKind::Pen, Point2{0.0f, 0.0f}));
    EXPECT_FALSE(engine.updateEndpointDrag(Point2{NAN, 0.0f}));

    // An end never captures the element the other end sits on.
    ASSERT_TRUE(engine.updateEndpointDrag(Point2{299.0f, 50.0f}));
    EXPECT_EQ(engine.getEdge(edge)->source.elementId, 0u);
    EXPECT_TRUE(engine.getEdgesConnectedTo(a).empty());

    engine.cancelEndpointDrag();
    EXPECT_FALSE(engine.isEndpointDragActive());
    EXPECT_EQ(engine.getEdge(edge)->source.elementId, a);
    EXPECT_EQ(engine.getEdge(edge)->source.port, PortKind::E);
    EXPECT_EQ(engine.getEdgesConnectedTo(a), std::vector<std::uint32_t>{edge});
    EXPECT_EQ(engine.getHistoryMeta().depth, before.depth);
    EXPECT_EQ(engine.getGestureState(), GestureState::Idle);
}
