#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "board/core/board_config.h"
#include "board/core/types.h"
#include "board/core/util.h"

#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"
#include "board/history/history_manager.h"
#include "board/interaction/eraser_engine.h"
#include "board/interaction/interaction_session.h"
#include "board/interaction/snap_engine.h"
#include "board/persistence/snapshot.h"
#include "board/render/viewport_culler.h"
#include "board/routing/edge_router.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

// Output of one batched frame: dirty edges were reflowed, then the viewport culled.
struct FrameResult {
    CullResult cull;
    std::size_t edgesRouted{0};
    // True when nothing changed since the previous frame and the cull was reused.
    bool reused{false};
    std::uint32_t generation{0};
};

class BoardEngine {
    friend class InteractionSession;
    friend class BoardEngineTestAccessor;
public:
    static constexpr std::uint32_t kSnapshotVersion = board::snapshotVersionBsnp;

    BoardEngine();
    explicit BoardEngine(const BoardConfig& config);

    BoardEngine(const BoardEngine&) = delete;
    BoardEngine& operator=(const BoardEngine&) = delete;

    // ==============================================================================
    // Lifecycle / configuration
    // ==============================================================================
    const BoardConfig& config() const noexcept { return config_; }
    void setConfig(const BoardConfig& config);

    // Drops every element, edge, history entry and the selection. The config is kept.
    void clear() noexcept;

    BoardError getLastError() const noexcept { return lastError_; }
    const BoardDiagnostics& diagnostics() const noexcept { return diagnostics_; }
    void resetDiagnostics() noexcept { diagnostics_ = BoardDiagnostics{}; }

    // Elements and edges share one id space; 0 is never a valid id.
    std::uint32_t allocateId();
    std::uint32_t nextId() const noexcept { return nextId_; }

    // ==============================================================================
    // Elements
    // ==============================================================================
    // Outside a gesture each call is its own undo step. Returns the element id (a new one
    // is allocated when element.id is 0) or 0 on failure.
    std::uint32_t addElement(const Element& element);
    bool updateElement(std::uint32_t id, const ElementPatch& patch);
    bool removeElement(std::uint32_t id);
    const Element* getElement(std::uint32_t id) const { return store_.get(id); }
    std::size_t getElementCount() const noexcept { return store_.size(); }
    // Back to front.
    std::vector<std::uint32_t> getDrawOrder() const { return store_.idsInZOrder(); }

    bool bringToFront(std::uint32_t id);
    bool sendToBack(std::uint32_t id);
    bool attachToSection(std::uint32_t id, std::uint32_t sectionId);
    bool detachFromSection(std::uint32_t id);
    bool worldBounds(std::uint32_t id, AABB& out) const { return store_.worldBounds(id, out); }

    // ==============================================================================
    // Edges
    // ==============================================================================
    std::uint32_t addEdge(const EdgeEndpoint& source, const EdgeEndpoint& target, EdgeRouting routing);
    bool removeEdge(std::uint32_t id);
    bool setEdgeRouting(std::uint32_t id, EdgeRouting routing);
    bool reconnectEdge(std::uint32_t id, EdgeEnd end, const EdgeEndpoint& endpoint);
    // Interactive counterpart of reconnectEdge: one undo step per drag.
    bool beginEndpointDrag(std::uint32_t id, EdgeEnd end);
    bool updateEndpointDrag(const Point2& point) { return session_.updateEndpointDrag(point); }
    bool commitEndpointDrag() { return session_.commitEndpointDrag(); }
    void cancelEndpointDrag();
    bool isEndpointDragActive() const noexcept { return session_.isEndpointDragActive(); }
    const Edge* getEdge(std::uint32_t id) const { return edges_.get(id); }
    std::size_t getEdgeCount() const noexcept { return edges_.size(); }
    std::vector<std::uint32_t> getEdgesConnectedTo(std::uint32_t elementId) const { return edges_.connectedTo(elementId); }
    // Routes the dirty edges now instead of waiting for the next frame.
    std::size_t reflowEdges();

    // ==============================================================================
    // Queries
    // ==============================================================================
    std::vector<std::uint32_t> visibleElements(const Viewport& viewport);
    SnapResult snap(const Point2& point, const std::vector<std::uint32_t>& excludeIds);
    std::optional<PortHit> nearestPort(const Point2& point, float maxDistance);

    // Zoom used to convert pixel tolerances; updated by frame().
    float viewScale() const noexcept { return viewScale_; }
    void setViewScale(float scale);

    // ==============================================================================
    // Drafts
    // ==============================================================================
    bool startDraft(ToolKind tool, const Point2& point) { return session_.startDraft(tool, point); }
    void updateDraft(const Point2& point) { session_.updateDraft(point); }
    DraftCommit commitDraft();
    void cancelDraft() { session_.cancelDraft(); }
    bool isDraftActive() const noexcept { return session_.isDraftActive(); }
    void setConnectorRouting(EdgeRouting routing) { session_.setConnectorRouting(routing); }

    // ==============================================================================
    // Interactive transforms
    // ==============================================================================
    bool beginTransform(const std::vector<std::uint32_t>& ids, TransformMode mode, const Point2& start) {
        return session_.beginTransform(ids, mode, start);
    }
    bool updateTransform(float x, float y) { return session_.updateTransform(x, y); }
    bool setTransientTransform(std::uint32_t id, float sx, float sy, float rot) {
        return session_.setTransientTransform(id, sx, sy, rot);
    }
    bool commitTransform();
    void cancelTransform();
    bool isTransformActive() const noexcept { return session_.isTransformActive(); }
    const SnapResult& getLastSnap() const { return session_.lastSnap(); }

    // ==============================================================================
    // Eraser
    // ==============================================================================
    std::size_t eraseAlongPath(const std::vector<Point2>& path, float radius);
    std::size_t eraseInBounds(const AABB& rect);
    std::size_t eraseSegmentsAlongPath(const std::vector<Point2>& path, float radius);
    void setEraserRadius(float radius);
    void setErasablePredicate(ErasablePredicate predicate) { eraser_.setPredicate(std::move(predicate)); }
    void resetErasablePredicate() { eraser_.resetPredicate(); }

    // ==============================================================================
    // History
    // ==============================================================================
    struct HistoryMeta {
        std::uint32_t depth;
        std::uint32_t cursor;
        std::uint32_t generation;
    };

    HistoryMeta getHistoryMeta() const noexcept;
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    bool undo();
    bool redo();
    GestureState getGestureState() const noexcept { return history_.state(); }

    // ==============================================================================
    // Frame batching
    // ==============================================================================
    const FrameResult& frame(const Viewport& viewport);

    // ==============================================================================
    // Persistence
    // ==============================================================================
    std::vector<std::uint8_t> saveSnapshot() const;
    BoardError loadSnapshot(const std::uint8_t* bytes, std::size_t byteCount);
    BoardError loadSnapshot(const std::vector<std::uint8_t>& bytes) { return loadSnapshot(bytes.data(), bytes.size()); }

    // FNV-1a over the canonical element/edge state (timestamps and cached routes excluded).
    std::uint64_t getDocumentDigest() const noexcept;

    // ==============================================================================
    // Selection
    // ==============================================================================
    // Unknown ids are ignored.
    void setSelection(const std::vector<std::uint32_t>& ids);
    std::vector<std::uint32_t> getSelection() const;
    void clearSelection();
    bool isSelected(std::uint32_t id) const { return selection_.find(id) != selection_.end(); }

private:
    // Declaration order is construction order: the stores reference config_ and
    // diagnostics_, the services reference the stores.
    BoardConfig config_;
    BoardDiagnostics diagnostics_{};
    BoardError lastError_{BoardError::Ok};

    EdgeStore edges_;
    ElementStore store_;
    HistoryManager history_;
    SnapEngine snap_;
    EdgeRouter router_;
    EraserEngine eraser_;
    ViewportCuller culler_;
    InteractionSession session_;

    std::uint32_t nextId_{1};
    std::unordered_set<std::uint32_t> selection_;
    std::uint32_t selectionRevision_{0};
    float viewScale_{1.0f};

    FrameResult lastFrame_;
    bool frameValid_{false};
    Viewport frameViewport_{};
    std::uint32_t frameElementRevision_{0};
    std::uint32_t frameEdgeRevision_{0};
    std::uint32_t frameSelectionRevision_{0};

    void clearError() { lastError_ = BoardError::Ok; }
    void setError(BoardError err) { lastError_ = err; }

    // Opens an Edit gesture unless one is already running. Returns true when this call
    // owns the gesture and must close it with endEdit.
    bool beginEdit();
    void endEdit(bool owned, const char* label);

    bool validEndpoint(const EdgeEndpoint& endpoint) const;
    void trackNextId(std::uint32_t id);
    void restoreNextId(std::uint32_t id) { nextId_ = id; }
    void pruneSelection();
    void invalidateFrame() { frameValid_ = false; }
};
