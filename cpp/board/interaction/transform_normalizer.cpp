#include "board/interaction/transform_normalizer.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>

namespace board {

namespace {

float scaledSize(float size, float scale, float minSize) {
    const float s = std::isfinite(scale) ? std::fabs(scale) : 1.0f;
    const float v = size * s;
    return std::isfinite(v) ? std::max(minSize, v) : minSize;
}

} // namespace

Element normalizeTransform(const Element& el, float minSize) {
    Element out = el;
    const float sx = std::isfinite(el.sx) ? el.sx : 1.0f;
    const float sy = std::isfinite(el.sy) ? el.sy : 1.0f;

    switch (el.kind) {
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section: {
            const float cx = el.x + el.w * 0.5f;
            const float cy = el.y + el.h * 0.5f;
            out.w = scaledSize(el.w, sx, minSize);
            out.h = scaledSize(el.h, sy, minSize);
            out.x = cx - out.w * 0.5f;
            out.y = cy - out.h * 0.5f;
            if (el.kind == ElementKind::Text) out.fontSize = scaledSize(el.fontSize, sy, minSize);
            break;
        }
        case ElementKind::Ellipse:
            out.rx = scaledSize(el.rx, sx, minSize);
            out.ry = scaledSize(el.ry, sy, minSize);
            break;
        case ElementKind::Stroke: {
            const AABB local = pointsAabb(el.points, 0.0f, 0.0f);
            const float cx = (local.minX + local.maxX) * 0.5f;
            const float cy = (local.minY + local.maxY) * 0.5f;
            for (Point2& p : out.points) {
                p.x = cx + (p.x - cx) * sx;
                p.y = cy + (p.y - cy) * sy;
            }
            break;
        }
    }

    out.sx = 1.0f;
    out.sy = 1.0f;
    return out;
}

ElementPatch normalizedPatch(const Element& el, float minSize) {
    const Element n = normalizeTransform(el, minSize);
    ElementPatch patch;
    patch.x = n.x;
    patch.y = n.y;
    patch.w = n.w;
    patch.h = n.h;
    patch.rx = n.rx;
    patch.ry = n.ry;
    patch.rot = n.rot;
    patch.sx = 1.0f;
    patch.sy = 1.0f;
    patch.fontSize = n.fontSize;
    if (el.kind == ElementKind::Stroke) patch.points = n.points;
    return patch;
}

} // namespace board
