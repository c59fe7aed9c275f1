#pragma once

#include "board/core/types.h"
#include "board/interaction/eraser_engine.h"
#include "board/interaction/interaction_types.h"
#include "board/interaction/snap_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

// Forward declarations
class BoardEngine;
class ElementStore;
class EdgeStore;
class HistoryManager;
class SnapEngine;
class EdgeRouter;

// Pointer-driven gestures: interactive transforms and drafts. Every gesture runs inside
// one history gesture, so interim updates go through the skip-history path and only the
// final commit produces an entry.
class InteractionSession {
public:
    InteractionSession(
        BoardEngine& engine,
        ElementStore& store,
        EdgeStore& edges,
        HistoryManager& history,
        SnapEngine& snap,
        EdgeRouter& router,
        EraserEngine& eraser);

    // ==============================================================================
    // State Query
    // ==============================================================================
    bool isTransformActive() const noexcept { return transform_.active; }
    bool isDraftActive() const noexcept { return draft_.active; }
    bool isEndpointDragActive() const noexcept { return endpointDrag_.active; }
    ToolKind draftTool() const noexcept { return draft_.tool; }

    // Result of the last snapped update (guides for the host overlay).
    const SnapResult& lastSnap() const { return lastSnap_; }

    // Routing mode given to connectors created by the Connector tool.
    void setConnectorRouting(EdgeRouting routing) { connectorRouting_ = routing; }
    EdgeRouting connectorRouting() const noexcept { return connectorRouting_; }

    // ==============================================================================
    // Transform API
    // ==============================================================================
    // Locked and unknown ids are skipped. Fails when nothing is left to transform or
    // another gesture is running.
    bool beginTransform(const std::vector<std::uint32_t>& ids, TransformMode mode, const Point2& start);
    // Move mode: translates the set by (pointer - start), snapping the dragged bounds.
    bool updateTransform(float x, float y);
    // ScaleRotate mode: transient visual state reported by the host.
    bool setTransientTransform(std::uint32_t id, float sx, float sy, float rot);
    bool commitTransform();
    void cancelTransform();

    // ==============================================================================
    // Draft API (Phantom Element System)
    // ==============================================================================
    bool startDraft(ToolKind tool, const Point2& point);
    void updateDraft(const Point2& point);
    DraftCommit commitDraft();
    void cancelDraft();

    // ==============================================================================
    // Connector endpoint drag
    // ==============================================================================
    // Drags one end of an existing connector. Updates capture the nearest port within
    // the port capture tolerance, or leave the end free at the pointer.
    bool beginEndpointDrag(std::uint32_t edgeId, EdgeEnd end);
    bool updateEndpointDrag(const Point2& point);
    // Fails (and cancels) when both ends would sit on the same port.
    bool commitEndpointDrag();
    void cancelEndpointDrag();

    // One-shot erase along a recorded path, as its own history entry.
    std::size_t eraseAlongPath(const std::vector<Point2>& path, float radius);
    std::size_t eraseInBounds(const AABB& rect);
    // Removes only the stroke points the sweep reaches. Each stroke is split into its
    // surviving runs of two or more points; the first run keeps the stroke's id and every
    // other run becomes a new stroke. Returns the number of strokes changed or removed.
    std::size_t eraseSegmentsAlongPath(const std::vector<Point2>& path, float radius);

    // Abandons whatever gesture is running.
    void reset();

private:
    friend class BoardEngineTestAccessor;

    struct TransformState {
        bool active = false;
        TransformMode mode = TransformMode::Move;
        std::vector<std::uint32_t> ids;
        // Base positions, parallel to ids.
        std::vector<Point2> basePositions;
        std::vector<std::uint32_t> snapExclude;
        AABB baseBounds{0.0f, 0.0f, 0.0f, 0.0f};
        Point2 start{0.0f, 0.0f};
        std::uint32_t nextIdBefore = 1;
    };

    struct DraftState {
        bool active = false;
        ToolKind tool = ToolKind::Edit;
        Point2 start{0.0f, 0.0f};
        Point2 current{0.0f, 0.0f};
        std::uint32_t phantomId = 0;
        std::uint32_t nextIdBefore = 1;
        std::vector<Point2> path;
        EdgeEndpoint source;
        EdgeEndpoint target;
    };

    struct EndpointDragState {
        bool active = false;
        std::uint32_t edgeId = 0;
        EdgeEnd end = EdgeEnd::Source;
        std::uint32_t nextIdBefore = 1;
    };

    bool gestureRunning() const;
    float viewScale() const;
    Point2 snapDraftPoint(const Point2& point);

    // Phantom element helpers
    Element draftElement(bool clickSized) const;
    void upsertPhantomElement(bool clickSized);
    void updatePenStroke(const Point2& point);
    EdgeEndpoint endpointAt(const Point2& point, std::uint32_t excludeId) const;
    void eraseStep(const Point2& from, const Point2& to);
    std::size_t removeErased(const std::vector<std::uint32_t>& hits);
    bool splitStroke(const EraserEngine::PointHits& hit);
    void attachToEnclosingSection(std::uint32_t id);
    bool draftIsClick() const;

    BoardEngine& engine_;
    ElementStore& store_;
    EdgeStore& edges_;
    HistoryManager& history_;
    SnapEngine& snap_;
    EdgeRouter& router_;
    EraserEngine& eraser_;

    TransformState transform_;
    DraftState draft_;
    EndpointDragState endpointDrag_;
    SnapResult lastSnap_;
    EdgeRouting connectorRouting_ = EdgeRouting::Straight;
    std::vector<std::uint32_t> hits_;
    std::vector<std::uint32_t> scratch_;
    std::vector<EraserEngine::PointHits> pointHits_;
};
