#include "board/interaction/eraser_engine.h"
#include "board/entity/element_store.h"
#include "board/geometry/element_shape.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <utility>

bool isDefaultErasable(const Element& el) {
    if (hasFlag(el.flags, ElementFlags::Locked) || hasFlag(el.flags, ElementFlags::Hidden)) return false;
    return board::isPointSequenceKind(el.kind);
}

EraserEngine::EraserEngine(ElementStore& store)
    : store_(store), predicate_(isDefaultErasable) {}

void EraserEngine::setPredicate(ErasablePredicate predicate) {
    if (predicate) predicate_ = std::move(predicate);
    else resetPredicate();
}

void EraserEngine::resetPredicate() {
    predicate_ = isDefaultErasable;
}

namespace {

// Number of footprint positions in a path: its segments, or one stamp for a lone point.
std::size_t sweepCount(const std::vector<Point2>& path) {
    return path.size() == 1 ? 1 : path.size() - 1;
}

void sweepAt(const std::vector<Point2>& path, std::size_t i, Point2& a, Point2& b) {
    if (path.size() == 1) {
        a = path.front();
        b = path.front();
        return;
    }
    a = path[i];
    b = path[i + 1];
}

bool finitePoint(const Point2& p) {
    return board::isFiniteNumber(p.x) && board::isFiniteNumber(p.y);
}

float pointToBoxSq(const Point2& p, const AABB& box) {
    const float qx = std::clamp(p.x, box.minX, box.maxX);
    const float qy = std::clamp(p.y, box.minY, box.maxY);
    return board::distSq(p, Point2{qx, qy});
}

} // namespace

bool EraserEngine::touches(const Element& el, const Point2& center, float radius) const {
    return touchesSegment(el, center, center, radius);
}

bool EraserEngine::touchesSegment(const Element& el, const Point2& a, const Point2& b, float radius) const {
    const float r2 = radius * radius;
    if (board::isPointSequenceKind(el.kind)) {
        for (const Point2& p : store_.worldStrokePoints(el)) {
            if (board::distToSegmentSq(p, a, b) <= r2) return true;
        }
        return false;
    }
    // Solid kinds: swept circle against the oriented box, in the box's frame.
    const board::ElementFrame f = store_.worldFrame(el);
    const Point2 c{f.cx, f.cy};
    const Point2 la = board::rotateAround(a, c, -f.rot);
    const Point2 lb = board::rotateAround(b, c, -f.rot);
    const AABB box{f.cx - f.hw, f.cy - f.hh, f.cx + f.hw, f.cy + f.hh};
    if (board::segmentIntersectsAabb(la, lb, box)) return true;
    if (pointToBoxSq(la, box) <= r2 || pointToBoxSq(lb, box) <= r2) return true;
    const Point2 corners[4] = {
        {box.minX, box.minY}, {box.maxX, box.minY}, {box.maxX, box.maxY}, {box.minX, box.maxY}};
    for (const Point2& corner : corners) {
        if (board::distToSegmentSq(corner, la, lb) <= r2) return true;
    }
    return false;
}

void EraserEngine::collectCandidates(const std::vector<Point2>& path, float radius) {
    candidates_.clear();
    const std::size_t count = sweepCount(path);
    for (std::size_t i = 0; i < count; ++i) {
        Point2 a{};
        Point2 b{};
        sweepAt(path, i, a, b);
        if (!finitePoint(a) || !finitePoint(b)) continue;
        store_.index().query(board::aabbExpand(board::makeAabb(a.x, a.y, b.x, b.y), radius), candidates_);
    }
    std::sort(candidates_.begin(), candidates_.end());
    candidates_.erase(std::unique(candidates_.begin(), candidates_.end()), candidates_.end());
}

void EraserEngine::hitsAlongPath(const std::vector<Point2>& path, float radius, std::vector<std::uint32_t>& out) {
    if (path.empty() || !(radius > 0.0f) || !std::isfinite(radius)) return;
    collectCandidates(path, radius);
    const std::size_t count = sweepCount(path);
    for (std::uint32_t id : candidates_) {
        if (std::find(out.begin(), out.end(), id) != out.end()) continue;
        const Element* el = store_.get(id);
        if (!el || !predicate_(*el)) continue;
        for (std::size_t i = 0; i < count; ++i) {
            Point2 a{};
            Point2 b{};
            sweepAt(path, i, a, b);
            if (!finitePoint(a) || !finitePoint(b)) continue;
            if (touchesSegment(*el, a, b, radius)) {
                out.push_back(id);
                break;
            }
        }
    }
}

void EraserEngine::pointHitsAlongPath(const std::vector<Point2>& path, float radius, std::vector<PointHits>& out) {
    out.clear();
    if (path.empty() || !(radius > 0.0f) || !std::isfinite(radius)) return;
    collectCandidates(path, radius);
    const std::size_t count = sweepCount(path);
    const float r2 = radius * radius;
    for (std::uint32_t id : candidates_) {
        const Element* el = store_.get(id);
        if (!el || !board::isPointSequenceKind(el->kind) || !predicate_(*el)) continue;

        const std::vector<Point2> pts = store_.worldStrokePoints(*el);
        PointHits hits{id, std::vector<bool>(pts.size(), false)};
        bool any = false;
        for (std::size_t p = 0; p < pts.size(); ++p) {
            for (std::size_t i = 0; i < count; ++i) {
                Point2 a{};
                Point2 b{};
                sweepAt(path, i, a, b);
                if (!finitePoint(a) || !finitePoint(b)) continue;
                if (board::distToSegmentSq(pts[p], a, b) <= r2) {
                    hits.erased[p] = true;
                    any = true;
                    break;
                }
            }
        }
        if (any) out.push_back(std::move(hits));
    }
}

void EraserEngine::hitsInBounds(const AABB& rect, std::vector<std::uint32_t>& out) {
    candidates_.clear();
    store_.index().query(rect, candidates_);
    std::sort(candidates_.begin(), candidates_.end());
    for (std::uint32_t id : candidates_) {
        if (std::find(out.begin(), out.end(), id) != out.end()) continue;
        const Element* el = store_.get(id);
        if (!el || !predicate_(*el)) continue;
        if (board::aabbIntersects(store_.worldBounds(*el), rect)) out.push_back(id);
    }
}
