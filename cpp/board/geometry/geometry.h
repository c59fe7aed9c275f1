#pragma once

#include "board/core/types.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace board {

// Oriented box of an element in world space: center, half extents, rotation (radians).
struct ElementFrame {
    float cx{0.0f};
    float cy{0.0f};
    float hw{0.0f};
    float hh{0.0f};
    float rot{0.0f};
};

inline bool isFiniteNumber(float v) { return std::isfinite(v); }

inline AABB makeAabb(float x0, float y0, float x1, float y1) {
    return AABB{std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

inline bool aabbIntersects(const AABB& a, const AABB& b) {
    return a.minX <= b.maxX && a.maxX >= b.minX && a.minY <= b.maxY && a.maxY >= b.minY;
}

inline bool aabbContains(const AABB& outer, const AABB& inner) {
    return inner.minX >= outer.minX && inner.maxX <= outer.maxX
        && inner.minY >= outer.minY && inner.maxY <= outer.maxY;
}

inline bool aabbContainsPoint(const AABB& box, float x, float y) {
    return x >= box.minX && x <= box.maxX && y >= box.minY && y <= box.maxY;
}

inline AABB aabbUnion(const AABB& a, const AABB& b) {
    return AABB{std::min(a.minX, b.minX), std::min(a.minY, b.minY),
                std::max(a.maxX, b.maxX), std::max(a.maxY, b.maxY)};
}

inline AABB aabbExpand(const AABB& a, float margin) {
    return AABB{a.minX - margin, a.minY - margin, a.maxX + margin, a.maxY + margin};
}

inline float distSq(const Point2& a, const Point2& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return dx * dx + dy * dy;
}

float distToSegmentSq(const Point2& p, const Point2& a, const Point2& b);

// Even-odd rule. Points exactly on an edge may fall either way.
bool pointInPolygon(const Point2& p, const std::vector<Point2>& polygon);

// Inclusive: a point at exactly `radius` is inside.
inline bool pointInRadius(const Point2& p, const Point2& center, float radius) {
    return distSq(p, center) <= radius * radius;
}

Point2 rotateAround(const Point2& p, const Point2& center, float angle);

// World AABB of a rotated rectangle (center + half extents).
AABB rotatedRectAabb(const ElementFrame& frame);

// World AABB of a rotated ellipse (center + radii).
AABB rotatedEllipseAabb(const ElementFrame& frame);

// AABB of a point list offset by (ox, oy). Returns a degenerate box at the origin when empty.
AABB pointsAabb(const std::vector<Point2>& points, float ox, float oy);

// True when the segment a-b touches the box (inclusive).
bool segmentIntersectsAabb(const Point2& a, const Point2& b, const AABB& box);

float polylineLength(const std::vector<Point2>& points);

// Point on the boundary of the (unrotated, frame-local) box along the ray from the
// center toward `toward`. Ellipses use the analytic ellipse boundary.
Point2 boxBoundaryToward(const ElementFrame& frame, const Point2& toward, bool elliptical);

} // namespace board
