#include "board/interaction/interaction_session.h"
#include "board/board_engine.h"
#include "board/core/logging.h"
#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"
#include "board/geometry/geometry.h"
#include "board/history/history_manager.h"
#include "board/interaction/eraser_engine.h"
#include "board/interaction/snap_engine.h"
#include "board/interaction/transform_normalizer.h"
#include "board/routing/edge_router.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

InteractionSession::InteractionSession(
    BoardEngine& engine,
    ElementStore& store,
    EdgeStore& edges,
    HistoryManager& history,
    SnapEngine& snap,
    EdgeRouter& router,
    EraserEngine& eraser)
    : engine_(engine), store_(store), edges_(edges), history_(history), snap_(snap), router_(router), eraser_(eraser)
{
    hits_.reserve(32);
    scratch_.reserve(64);
}

bool InteractionSession::gestureRunning() const {
    return transform_.active || draft_.active || endpointDrag_.active || history_.isGestureActive();
}

float InteractionSession::viewScale() const {
    const float scale = engine_.viewScale();
    return (scale > 1e-6f && std::isfinite(scale)) ? scale : 1.0f;
}

// ==============================================================================
// Transform Implementation
// ==============================================================================

bool InteractionSession::beginTransform(const std::vector<std::uint32_t>& ids, TransformMode mode, const Point2& start) {
    if (gestureRunning()) return false;
    if (!board::isFiniteNumber(start.x) || !board::isFiniteNumber(start.y)) return false;

    std::unordered_set<std::uint32_t> chosen;
    for (std::uint32_t id : ids) {
        const Element* el = store_.get(id);
        if (!el || hasFlag(el->flags, ElementFlags::Locked)) continue;
        chosen.insert(id);
    }

    TransformState next;
    next.mode = mode;
    next.start = start;
    for (std::uint32_t id : chosen) {
        const Element* el = store_.get(id);
        // A child moves with its section already.
        if (el->parentId != 0 && chosen.count(el->parentId) != 0) continue;
        next.ids.push_back(id);
    }
    if (next.ids.empty()) return false;
    std::sort(next.ids.begin(), next.ids.end());

    bool first = true;
    for (std::uint32_t id : next.ids) {
        const Element* el = store_.get(id);
        next.basePositions.push_back(Point2{el->x, el->y});
        const AABB b = store_.worldBounds(*el);
        next.baseBounds = first ? b : board::aabbUnion(next.baseBounds, b);
        first = false;
        next.snapExclude.push_back(id);
        if (el->kind == ElementKind::Section) {
            for (std::uint32_t child : store_.childrenOf(id)) next.snapExclude.push_back(child);
        }
    }

    next.nextIdBefore = engine_.nextId();
    if (!history_.beginGesture(ToolKind::Transform, engine_.nextId())) return false;

    snap_.resetHysteresis();
    lastSnap_ = SnapResult{};
    transform_ = std::move(next);
    transform_.active = true;
    return true;
}

bool InteractionSession::updateTransform(float x, float y) {
    if (!transform_.active || transform_.mode != TransformMode::Move) return false;
    if (!board::isFiniteNumber(x) || !board::isFiniteNumber(y)) return false;

    float dx = x - transform_.start.x;
    float dy = y - transform_.start.y;
    const AABB dragged{
        transform_.baseBounds.minX + dx, transform_.baseBounds.minY + dy,
        transform_.baseBounds.maxX + dx, transform_.baseBounds.maxY + dy};

    lastSnap_ = SnapResult{};
    if (snap_.options().enabled) {
        lastSnap_ = snap_.snap(Point2{x, y}, transform_.snapExclude, viewScale(), &dragged);
        if (lastSnap_.snapped) {
            dx += lastSnap_.dx;
            dy += lastSnap_.dy;
        }
    }

    for (std::size_t i = 0; i < transform_.ids.size(); ++i) {
        ElementPatch patch;
        patch.x = transform_.basePositions[i].x + dx;
        patch.y = transform_.basePositions[i].y + dy;
        store_.update(transform_.ids[i], patch);
    }
    return true;
}

bool InteractionSession::setTransientTransform(std::uint32_t id, float sx, float sy, float rot) {
    if (!transform_.active || transform_.mode != TransformMode::ScaleRotate) return false;
    if (!std::binary_search(transform_.ids.begin(), transform_.ids.end(), id)) return false;
    if (!board::isFiniteNumber(sx) || !board::isFiniteNumber(sy) || !board::isFiniteNumber(rot)) return false;

    ElementPatch patch;
    patch.sx = sx;
    patch.sy = sy;
    patch.rot = rot;
    return store_.update(id, patch);
}

bool InteractionSession::commitTransform() {
    if (!transform_.active) return false;

    const float minSize = engine_.config().minElementSize;
    for (std::uint32_t id : transform_.ids) {
        const Element* el = store_.get(id);
        if (!el || !board::hasTransientScale(*el)) continue;
        store_.update(id, board::normalizedPatch(*el, minSize));
    }

    const bool recorded = history_.commitGesture("Transform", engine_.nextId());
    transform_ = TransformState{};
    lastSnap_ = SnapResult{};
    return recorded;
}

void InteractionSession::cancelTransform() {
    if (!transform_.active) return;
    history_.cancelGesture();
    engine_.restoreNextId(transform_.nextIdBefore);
    transform_ = TransformState{};
    lastSnap_ = SnapResult{};
}

// ==============================================================================
// Erase
// ==============================================================================

std::size_t InteractionSession::removeErased(const std::vector<std::uint32_t>& hits) {
    std::size_t removed = 0;
    for (std::uint32_t id : hits) {
        if (store_.remove(id)) removed++;
    }
    if (removed > 0) engine_.pruneSelection();
    return removed;
}

std::size_t InteractionSession::eraseAlongPath(const std::vector<Point2>& path, float radius) {
    if (gestureRunning()) return 0;
    if (!history_.beginGesture(ToolKind::Eraser, engine_.nextId())) return 0;
    hits_.clear();
    eraser_.hitsAlongPath(path, radius, hits_);
    const std::size_t removed = removeErased(hits_);
    history_.commitGesture("Erase", engine_.nextId());
    return removed;
}

std::size_t InteractionSession::eraseInBounds(const AABB& rect) {
    if (gestureRunning()) return 0;
    if (!history_.beginGesture(ToolKind::Eraser, engine_.nextId())) return 0;
    hits_.clear();
    eraser_.hitsInBounds(rect, hits_);
    const std::size_t removed = removeErased(hits_);
    history_.commitGesture("Erase", engine_.nextId());
    return removed;
}

std::size_t InteractionSession::eraseSegmentsAlongPath(const std::vector<Point2>& path, float radius) {
    if (gestureRunning()) return 0;
    if (!history_.beginGesture(ToolKind::Eraser, engine_.nextId())) return 0;
    eraser_.pointHitsAlongPath(path, radius, pointHits_);
    std::size_t changed = 0;
    for (const EraserEngine::PointHits& hit : pointHits_) {
        if (splitStroke(hit)) changed++;
    }
    if (changed > 0) engine_.pruneSelection();
    history_.commitGesture("Erase segments", engine_.nextId());
    pointHits_.clear();
    return changed;
}

bool InteractionSession::splitStroke(const EraserEngine::PointHits& hit) {
    const Element* el = store_.get(hit.id);
    if (!el) return false;
    const std::vector<Point2> world = store_.worldStrokePoints(*el);
    if (world.size() != hit.erased.size()) return false;

    // Surviving runs as [first, last) index ranges.
    std::vector<std::pair<std::size_t, std::size_t>> runs;
    std::size_t first = 0;
    for (std::size_t i = 0; i <= world.size(); ++i) {
        if (i < world.size() && !hit.erased[i]) continue;
        if (i - first >= 2) runs.emplace_back(first, i);
        first = i + 1;
    }
    if (runs.empty()) return store_.remove(hit.id);

    // Pieces are written in world space relative to their first point, so scale and
    // rotation are baked into the points.
    const Element source = *el;
    const Point2 parent = store_.parentOrigin(source);
    auto pieceOf = [&](const std::pair<std::size_t, std::size_t>& run, Element& out) {
        const Point2 origin = world[run.first];
        out.x = origin.x - parent.x;
        out.y = origin.y - parent.y;
        out.rot = 0.0f;
        out.sx = 1.0f;
        out.sy = 1.0f;
        out.points.clear();
        for (std::size_t i = run.first; i < run.second; ++i) {
            out.points.push_back(Point2{world[i].x - origin.x, world[i].y - origin.y});
        }
    };

    Element head = source;
    pieceOf(runs.front(), head);
    ElementPatch patch;
    patch.x = head.x;
    patch.y = head.y;
    patch.rot = head.rot;
    patch.sx = head.sx;
    patch.sy = head.sy;
    patch.points = head.points;
    if (!store_.update(hit.id, patch)) return false;

    for (std::size_t r = 1; r < runs.size(); ++r) {
        Element piece = source;
        piece.id = engine_.allocateId();
        piece.createdAt = 0.0;
        pieceOf(runs[r], piece);
        if (!store_.add(piece)) BOARD_LOG_WARN("erase: stroke piece %u rejected", piece.id);
    }
    return true;
}

// ==============================================================================
// Connector Endpoint Drag
// ==============================================================================

bool InteractionSession::beginEndpointDrag(std::uint32_t edgeId, EdgeEnd end) {
    if (gestureRunning()) return false;
    if (!edges_.has(edgeId)) return false;

    EndpointDragState next;
    next.edgeId = edgeId;
    next.end = end;
    next.nextIdBefore = engine_.nextId();
    if (!history_.beginGesture(ToolKind::Connector, engine_.nextId())) return false;
    endpointDrag_ = next;
    endpointDrag_.active = true;
    return true;
}

bool InteractionSession::updateEndpointDrag(const Point2& point) {
    if (!endpointDrag_.active) return false;
    if (!board::isFiniteNumber(point.x) || !board::isFiniteNumber(point.y)) return false;
    const Edge* edge = edges_.get(endpointDrag_.edgeId);
    if (!edge) return false;

    const EdgeEndpoint& other = endpointDrag_.end == EdgeEnd::Source ? edge->target : edge->source;
    const EdgeEndpoint ep = endpointAt(point, other.elementId);
    return edges_.setEndpoint(endpointDrag_.edgeId, endpointDrag_.end, ep);
}

bool InteractionSession::commitEndpointDrag() {
    if (!endpointDrag_.active) return false;
    const Edge* edge = edges_.get(endpointDrag_.edgeId);
    if (!edge || sameAttachment(edge->source, edge->target)) {
        cancelEndpointDrag();
        return false;
    }
    const bool recorded = history_.commitGesture("Reconnect", engine_.nextId());
    endpointDrag_ = EndpointDragState{};
    return recorded;
}

void InteractionSession::cancelEndpointDrag() {
    if (!endpointDrag_.active) return;
    history_.cancelGesture();
    engine_.restoreNextId(endpointDrag_.nextIdBefore);
    endpointDrag_ = EndpointDragState{};
}

void InteractionSession::reset() {
    if (history_.isGestureActive()) history_.cancelGesture();
    transform_ = TransformState{};
    draft_ = DraftState{};
    endpointDrag_ = EndpointDragState{};
    lastSnap_ = SnapResult{};
    hits_.clear();
}
