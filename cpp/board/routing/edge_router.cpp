#include "board/routing/edge_router.h"
#include "board/core/logging.h"
#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"
#include "board/geometry/element_shape.h"
#include "board/geometry/geometry.h"
#include "board/geometry/ports.h"
#include "board/routing/obstacle_router.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr float kCollinearEps = 1e-4f;

float cross(const Point2& a, const Point2& b, const Point2& c) {
    return (b.x - a.x) * (c.y - b.y) - (b.y - a.y) * (c.x - b.x);
}

float dot(const Point2& a, const Point2& b, const Point2& c) {
    return (b.x - a.x) * (c.x - b.x) + (b.y - a.y) * (c.y - b.y);
}

bool isCollinearTurn(const Point2& a, const Point2& b, const Point2& c) {
    const float l1 = std::sqrt(board::distSq(a, b));
    const float l2 = std::sqrt(board::distSq(b, c));
    return std::fabs(cross(a, b, c)) <= kCollinearEps * std::max(1.0f, l1 * l2);
}

Point2 offsetBy(const Point2& p, const Point2& dir, float d) {
    return Point2{p.x + dir.x * d, p.y + dir.y * d};
}

bool segmentsClear(const std::vector<Point2>& path, const std::vector<AABB>& obstacles) {
    for (std::size_t i = 1; i < path.size(); ++i) {
        for (const AABB& o : obstacles) {
            if (board::segmentIntersectsAabb(path[i - 1], path[i], o)) return false;
        }
    }
    return true;
}

} // namespace

std::uint32_t countBends(const std::vector<Point2>& points) {
    std::uint32_t bends = 0;
    for (std::size_t i = 1; i + 1 < points.size(); ++i) {
        if (!isCollinearTurn(points[i - 1], points[i], points[i + 1])
            || dot(points[i - 1], points[i], points[i + 1]) < 0.0f) {
            ++bends;
        }
    }
    return bends;
}

EdgeRouter::EdgeRouter(ElementStore& store, const RouterOptions& options, BoardDiagnostics& diagnostics)
    : store_(store), options_(options), diagnostics_(diagnostics) {}

bool EdgeRouter::resolveEnds(const Edge& edge, RouteEnd& source, RouteEnd& target) const {
    auto roughPosition = [&](const EdgeEndpoint& e, Point2& out) {
        if (e.elementId == 0) {
            out = Point2{e.x, e.y};
            return true;
        }
        const Element* el = store_.get(e.elementId);
        if (!el) return false;
        const board::ElementFrame f = store_.worldFrame(*el);
        out = Point2{f.cx, f.cy};
        return true;
    };

    Point2 roughSource{0.0f, 0.0f};
    Point2 roughTarget{0.0f, 0.0f};
    if (!roughPosition(edge.source, roughSource) || !roughPosition(edge.target, roughTarget)) return false;

    auto resolve = [&](const EdgeEndpoint& e, const Point2& toward, RouteEnd& out) {
        out.elementId = e.elementId;
        if (e.elementId == 0) {
            out.position = Point2{e.x, e.y};
            out.normal = Point2{0.0f, 0.0f};
            return;
        }
        const Element* el = store_.get(e.elementId);
        const board::ResolvedPort port = board::resolveAttachment(el->kind, store_.worldFrame(*el), e.port, toward);
        out.position = port.position;
        out.normal = port.normal;
    };
    resolve(edge.source, roughTarget, source);
    resolve(edge.target, roughSource, target);
    return true;
}

std::vector<Point2> EdgeRouter::simplify(const std::vector<Point2>& points) const {
    const float minSeg = std::max(0.0f, options_.minSegmentLength);
    const float minSegSq = minSeg * minSeg;
    std::vector<Point2> merged;
    merged.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        const Point2& p = points[i];
        const bool last = i + 1 == points.size();
        if (!merged.empty() && board::distSq(merged.back(), p) < minSegSq) {
            // The exact endpoint always survives.
            if (last && merged.size() > 1) merged.back() = p;
            else if (last) merged.push_back(p);
            continue;
        }
        merged.push_back(p);
    }
    if (merged.size() <= 2) return merged;

    std::vector<Point2> out;
    out.reserve(merged.size());
    out.push_back(merged.front());
    for (std::size_t i = 1; i + 1 < merged.size(); ++i) {
        const Point2& prev = out.back();
        const Point2& cur = merged[i];
        const Point2& next = merged[i + 1];
        if (isCollinearTurn(prev, cur, next) && dot(prev, cur, next) > 0.0f) continue;
        out.push_back(cur);
    }
    out.push_back(merged.back());
    return out;
}

std::vector<Point2> EdgeRouter::routeStraight(const RouteEnd& a, const RouteEnd& b) const {
    return {a.position, b.position};
}

std::vector<Point2> EdgeRouter::routeOrthogonal(const RouteEnd& a, const RouteEnd& b) const {
    const Point2 a1 = offsetBy(a.position, a.normal, options_.clearance);
    const Point2 b1 = offsetBy(b.position, b.normal, options_.clearance);

    const std::vector<Point2> hv = simplify({a.position, a1, Point2{b1.x, a1.y}, b1, b.position});
    const std::vector<Point2> vh = simplify({a.position, a1, Point2{a1.x, b1.y}, b1, b.position});

    const float lenHV = board::polylineLength(hv);
    const float lenVH = board::polylineLength(vh);
    if (std::fabs(lenHV - lenVH) > 1e-3f) return lenHV < lenVH ? hv : vh;
    return countBends(vh) < countBends(hv) ? vh : hv;
}

std::vector<Point2> EdgeRouter::routeCurved(const RouteEnd& a, const RouteEnd& b) const {
    const Point2& p0 = a.position;
    const Point2& p2 = b.position;
    const float dx = p2.x - p0.x;
    const float dy = p2.y - p0.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len < 1e-4f) return {p0, p2};

    // Control point sits off the chord midpoint, pushed across the dominant travel axis.
    const Point2 mid{(p0.x + p2.x) * 0.5f, (p0.y + p2.y) * 0.5f};
    const float bow = options_.curvature * len;
    Point2 control = mid;
    if (std::fabs(dx) >= std::fabs(dy)) control.y += dx >= 0.0f ? -bow : bow;
    else control.x += dy >= 0.0f ? bow : -bow;

    const std::uint32_t segments = std::max<std::uint32_t>(2, options_.curveSegments);
    std::vector<Point2> out;
    out.reserve(segments + 1);
    for (std::uint32_t i = 0; i <= segments; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(segments);
        const float u = 1.0f - t;
        out.push_back(Point2{
            u * u * p0.x + 2.0f * u * t * control.x + t * t * p2.x,
            u * u * p0.y + 2.0f * u * t * control.y + t * t * p2.y,
        });
    }
    out.front() = p0;
    out.back() = p2;
    return out;
}

void EdgeRouter::collectObstacles(const RouteEnd& a, const RouteEnd& b, std::vector<AABB>& out) {
    out.clear();
    const float span = std::max(std::fabs(a.position.x - b.position.x), std::fabs(a.position.y - b.position.y));
    const AABB region = board::aabbExpand(
        board::makeAabb(a.position.x, a.position.y, b.position.x, b.position.y),
        std::max(100.0f, span * 0.5f));

    auto parentOf = [&](std::uint32_t id) -> std::uint32_t {
        const Element* el = id ? store_.get(id) : nullptr;
        return el ? el->parentId : 0;
    };
    const std::uint32_t skip[4] = {a.elementId, b.elementId, parentOf(a.elementId), parentOf(b.elementId)};

    scratch_.clear();
    store_.index().query(region, scratch_);
    std::sort(scratch_.begin(), scratch_.end());
    for (std::uint32_t id : scratch_) {
        if (id == 0 || std::find(std::begin(skip), std::end(skip), id) != std::end(skip)) continue;
        const Element* el = store_.get(id);
        if (!el || hasFlag(el->flags, ElementFlags::Hidden)) continue;
        // Sections are containers, connectors may cross them.
        if (el->kind == ElementKind::Section) continue;
        out.push_back(board::aabbExpand(store_.worldBounds(*el), options_.obstaclePadding));
    }
}

std::vector<Point2> EdgeRouter::routeObstacleAware(const RouteEnd& a, const RouteEnd& b) {
    std::vector<Point2> plain = routeOrthogonal(a, b);

    std::vector<AABB> obstacles;
    collectObstacles(a, b, obstacles);
    if (obstacles.empty() || segmentsClear(plain, obstacles)) return plain;

    const Point2 a1 = offsetBy(a.position, a.normal, options_.clearance);
    const Point2 b1 = offsetBy(b.position, b.normal, options_.clearance);
    const ObstacleRouter search(options_.obstacleGridStep, options_.searchNodeBudget);
    const ObstacleSearchResult found = search.search(a1, b1, obstacles);
    if (!found.found) {
        diagnostics_.routeFallbacks++;
        BOARD_LOG_WARN("obstacle routing gave up after %u nodes; using plain orthogonal route", found.expanded);
        return plain;
    }

    std::vector<Point2> path;
    path.reserve(found.points.size() + 4);
    path.push_back(a.position);
    path.insert(path.end(), found.points.begin(), found.points.end());
    // The lattice goal can sit up to half a step away from the real approach point.
    const Point2 g = found.points.back();
    path.push_back(Point2{b1.x, g.y});
    path.push_back(b1);
    path.push_back(b.position);
    return simplify(path);
}

bool EdgeRouter::route(const Edge& edge, std::vector<Point2>& out, RouteEnd* sourceOut, RouteEnd* targetOut) {
    RouteEnd source;
    RouteEnd target;
    if (!resolveEnds(edge, source, target)) return false;

    switch (edge.routing) {
        case EdgeRouting::Straight: out = routeStraight(source, target); break;
        case EdgeRouting::Orthogonal: out = routeOrthogonal(source, target); break;
        case EdgeRouting::Curved: out = routeCurved(source, target); break;
        case EdgeRouting::ObstacleAware: out = routeObstacleAware(source, target); break;
    }
    if (sourceOut) *sourceOut = source;
    if (targetOut) *targetOut = target;
    return true;
}

std::size_t EdgeRouter::reflowDirty(EdgeStore& edges) {
    std::size_t routed = 0;
    for (std::uint32_t id : edges.takeDirty()) {
        const Edge* edge = edges.get(id);
        if (!edge) continue;
        std::vector<Point2> points;
        RouteEnd source;
        RouteEnd target;
        if (!route(*edge, points, &source, &target)) {
            edges.markStale(id);
            diagnostics_.danglingEdgesSkipped++;
            BOARD_LOG_WARN("edge %u references a missing element; keeping stale route", id);
            continue;
        }
        edges.setRoute(id, std::move(points), source.position, target.position);
        ++routed;
    }
    return routed;
}

std::optional<PortHit> EdgeRouter::nearestPort(const Point2& point, float maxDistance, std::uint32_t excludeId) {
    if (!(maxDistance >= 0.0f)) return std::nullopt;
    const AABB region{point.x - maxDistance, point.y - maxDistance, point.x + maxDistance, point.y + maxDistance};
    scratch_.clear();
    store_.index().query(region, scratch_);

    std::optional<PortHit> best;
    std::int32_t bestZ = std::numeric_limits<std::int32_t>::min();
    for (std::uint32_t id : scratch_) {
        if (id == excludeId) continue;
        const Element* el = store_.get(id);
        if (!el || hasFlag(el->flags, ElementFlags::Hidden)) continue;
        if (board::portSetFor(el->kind) == board::PortSet::None) continue;
        const board::ElementFrame frame = store_.worldFrame(*el);
        for (PortKind port : board::kCardinalPorts) {
            const board::ResolvedPort r = board::resolveAttachment(el->kind, frame, port, point);
            const float d = std::sqrt(board::distSq(r.position, point));
            if (d > maxDistance) continue;
            const bool better = !best
                || d < best->distance - 1e-5f
                || (std::fabs(d - best->distance) <= 1e-5f && el->z > bestZ);
            if (!better) continue;
            best = PortHit{id, port, r.position, d};
            bestZ = el->z;
        }
    }
    return best;
}
