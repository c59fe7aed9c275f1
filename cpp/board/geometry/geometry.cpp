#include "board/geometry/geometry.h"

#include <limits>

namespace board {

float distToSegmentSq(const Point2& p, const Point2& a, const Point2& b) {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float lenSq = dx * dx + dy * dy;
    if (lenSq <= 1e-12f) return distSq(p, a);
    float t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
    t = std::clamp(t, 0.0f, 1.0f);
    const Point2 proj{a.x + t * dx, a.y + t * dy};
    return distSq(p, proj);
}

bool pointInPolygon(const Point2& p, const std::vector<Point2>& polygon) {
    const std::size_t n = polygon.size();
    if (n < 3) return false;
    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& a = polygon[i];
        const Point2& b = polygon[j];
        const bool crosses = (a.y > p.y) != (b.y > p.y);
        if (!crosses) continue;
        const float xAt = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
        if (p.x < xAt) inside = !inside;
    }
    return inside;
}

Point2 rotateAround(const Point2& p, const Point2& center, float angle) {
    if (angle == 0.0f) return p;
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    const float dx = p.x - center.x;
    const float dy = p.y - center.y;
    return Point2{center.x + dx * c - dy * s, center.y + dx * s + dy * c};
}

AABB rotatedRectAabb(const ElementFrame& frame) {
    if (frame.rot == 0.0f) {
        return AABB{frame.cx - frame.hw, frame.cy - frame.hh, frame.cx + frame.hw, frame.cy + frame.hh};
    }
    const float c = std::fabs(std::cos(frame.rot));
    const float s = std::fabs(std::sin(frame.rot));
    const float ex = frame.hw * c + frame.hh * s;
    const float ey = frame.hw * s + frame.hh * c;
    return AABB{frame.cx - ex, frame.cy - ey, frame.cx + ex, frame.cy + ey};
}

AABB rotatedEllipseAabb(const ElementFrame& frame) {
    if (frame.rot == 0.0f) {
        return AABB{frame.cx - frame.hw, frame.cy - frame.hh, frame.cx + frame.hw, frame.cy + frame.hh};
    }
    const float c = std::cos(frame.rot);
    const float s = std::sin(frame.rot);
    const float ex = std::sqrt(frame.hw * frame.hw * c * c + frame.hh * frame.hh * s * s);
    const float ey = std::sqrt(frame.hw * frame.hw * s * s + frame.hh * frame.hh * c * c);
    return AABB{frame.cx - ex, frame.cy - ey, frame.cx + ex, frame.cy + ey};
}

AABB pointsAabb(const std::vector<Point2>& points, float ox, float oy) {
    if (points.empty()) return AABB{ox, oy, ox, oy};
    AABB box{points[0].x + ox, points[0].y + oy, points[0].x + ox, points[0].y + oy};
    for (const Point2& p : points) {
        box.minX = std::min(box.minX, p.x + ox);
        box.minY = std::min(box.minY, p.y + oy);
        box.maxX = std::max(box.maxX, p.x + ox);
        box.maxY = std::max(box.maxY, p.y + oy);
    }
    return box;
}

bool segmentIntersectsAabb(const Point2& a, const Point2& b, const AABB& box) {
    // Liang-Barsky clip.
    float t0 = 0.0f;
    float t1 = 1.0f;
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float p[4] = {-dx, dx, -dy, dy};
    const float q[4] = {a.x - box.minX, box.maxX - a.x, a.y - box.minY, box.maxY - a.y};
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0f) {
            if (q[i] < 0.0f) return false;
            continue;
        }
        const float r = q[i] / p[i];
        if (p[i] < 0.0f) {
            if (r > t1) return false;
            if (r > t0) t0 = r;
        } else {
            if (r < t0) return false;
            if (r < t1) t1 = r;
        }
    }
    return true;
}

float polylineLength(const std::vector<Point2>& points) {
    float total = 0.0f;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += std::sqrt(distSq(points[i - 1], points[i]));
    }
    return total;
}

Point2 boxBoundaryToward(const ElementFrame& frame, const Point2& toward, bool elliptical) {
    const Point2 center{frame.cx, frame.cy};
    const Point2 local = rotateAround(toward, center, -frame.rot);
    const float dx = local.x - center.x;
    const float dy = local.y - center.y;
    if (std::fabs(dx) < 1e-6f && std::fabs(dy) < 1e-6f) return center;
    if (frame.hw <= 0.0f || frame.hh <= 0.0f) return center;

    float t = 0.0f;
    if (elliptical) {
        const float nx = dx / frame.hw;
        const float ny = dy / frame.hh;
        t = 1.0f / std::sqrt(nx * nx + ny * ny);
    } else {
        const float tx = std::fabs(dx) > 1e-6f ? frame.hw / std::fabs(dx) : std::numeric_limits<float>::infinity();
        const float ty = std::fabs(dy) > 1e-6f ? frame.hh / std::fabs(dy) : std::numeric_limits<float>::infinity();
        t = std::min(tx, ty);
    }
    const Point2 hit{center.x + dx * t, center.y + dy * t};
    return rotateAround(hit, center, frame.rot);
}

} // namespace board
