#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"

#include <cstdint>
#include <optional>
#include <vector>

class ElementStore;
class EdgeStore;

// Resolved connector end in world space.
struct RouteEnd {
    Point2 position{0.0f, 0.0f};
    Point2 normal{0.0f, 0.0f};  // outward direction, (0, 0) for free ends without a hint
    std::uint32_t elementId{0};
};

struct PortHit {
    std::uint32_t elementId{0};
    PortKind port{PortKind::Center};
    Point2 position{0.0f, 0.0f};
    float distance{0.0f};
};

// Computes connector geometry from the current element geometry. Ports are resolved
// on demand; nothing about them is cached between calls.
class EdgeRouter {
public:
    EdgeRouter(ElementStore& store, const RouterOptions& options, BoardDiagnostics& diagnostics);

    void setOptions(const RouterOptions& options) { options_ = options; }
    const RouterOptions& options() const { return options_; }

    // False when an attached element does not exist (dangling edge).
    bool resolveEnds(const Edge& edge, RouteEnd& source, RouteEnd& target) const;

    // Full route for `edge` in its routing mode. False for dangling edges.
    bool route(const Edge& edge, std::vector<Point2>& out, RouteEnd* sourceOut = nullptr, RouteEnd* targetOut = nullptr);

    std::vector<Point2> routeStraight(const RouteEnd& a, const RouteEnd& b) const;
    std::vector<Point2> routeOrthogonal(const RouteEnd& a, const RouteEnd& b) const;
    std::vector<Point2> routeCurved(const RouteEnd& a, const RouteEnd& b) const;
    std::vector<Point2> routeObstacleAware(const RouteEnd& a, const RouteEnd& b);

    // Recomputes exactly the edges in the dirty set and clears it. Dangling edges keep
    // their last points and are flagged stale. Returns the number of edges routed.
    std::size_t reflowDirty(EdgeStore& edges);

    // Nearest cardinal port within `maxDistance` of `point`, skipping `excludeId`.
    std::optional<PortHit> nearestPort(const Point2& point, float maxDistance, std::uint32_t excludeId = 0);

    // Drops sub-minimum segments and collinear interior points. Reversals are kept.
    std::vector<Point2> simplify(const std::vector<Point2>& points) const;

private:
    void collectObstacles(const RouteEnd& a, const RouteEnd& b, std::vector<AABB>& out);

    ElementStore& store_;
    RouterOptions options_;
    BoardDiagnostics& diagnostics_;
    std::vector<std::uint32_t> scratch_;
};

// Number of direction changes along a polyline.
std::uint32_t countBends(const std::vector<Point2>& points);
