#include "board/geometry/element_shape.h"

namespace board {

bool isBoxKind(ElementKind kind) {
    switch (kind) {
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
            return true;
        case ElementKind::Ellipse:
        case ElementKind::Stroke:
            return false;
    }
    return false;
}

bool isEllipticalKind(ElementKind kind) {
    switch (kind) {
        case ElementKind::Ellipse:
            return true;
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
        case ElementKind::Stroke:
            return false;
    }
    return false;
}

bool isPointSequenceKind(ElementKind kind) {
    switch (kind) {
        case ElementKind::Stroke:
            return true;
        case ElementKind::Rectangle:
        case ElementKind::Ellipse:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
            return false;
    }
    return false;
}

const char* elementKindName(ElementKind kind) {
    switch (kind) {
        case ElementKind::Rectangle: return "rectangle";
        case ElementKind::Ellipse: return "ellipse";
        case ElementKind::Text: return "text";
        case ElementKind::StickyNote: return "sticky-note";
        case ElementKind::Table: return "table";
        case ElementKind::Image: return "image";
        case ElementKind::Section: return "section";
        case ElementKind::Stroke: return "stroke";
    }
    return "unknown";
}

ElementFrame elementFrame(const Element& el, const Point2& origin) {
    const float sx = std::fabs(el.sx);
    const float sy = std::fabs(el.sy);
    ElementFrame f;
    f.rot = el.rot;
    switch (el.kind) {
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
            f.cx = origin.x + el.x + el.w * 0.5f;
            f.cy = origin.y + el.y + el.h * 0.5f;
            f.hw = el.w * 0.5f * sx;
            f.hh = el.h * 0.5f * sy;
            break;
        case ElementKind::Ellipse:
            f.cx = origin.x + el.x;
            f.cy = origin.y + el.y;
            f.hw = el.rx * sx;
            f.hh = el.ry * sy;
            break;
        case ElementKind::Stroke: {
            const AABB local = pointsAabb(el.points, 0.0f, 0.0f);
            f.cx = origin.x + el.x + (local.minX + local.maxX) * 0.5f;
            f.cy = origin.y + el.y + (local.minY + local.maxY) * 0.5f;
            f.hw = (local.maxX - local.minX) * 0.5f * sx;
            f.hh = (local.maxY - local.minY) * 0.5f * sy;
            break;
        }
    }
    return f;
}

std::vector<Point2> strokeWorldPoints(const Element& el, const Point2& origin) {
    std::vector<Point2> out;
    if (!isPointSequenceKind(el.kind)) return out;
    const ElementFrame f = elementFrame(el, origin);
    const Point2 center{f.cx, f.cy};
    out.reserve(el.points.size());
    for (const Point2& p : el.points) {
        const float wx = origin.x + el.x + p.x;
        const float wy = origin.y + el.y + p.y;
        const Point2 scaled{center.x + (wx - center.x) * el.sx, center.y + (wy - center.y) * el.sy};
        out.push_back(rotateAround(scaled, center, el.rot));
    }
    return out;
}

AABB elementWorldAabb(const Element& el, const Point2& origin) {
    switch (el.kind) {
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
            return rotatedRectAabb(elementFrame(el, origin));
        case ElementKind::Ellipse:
            return rotatedEllipseAabb(elementFrame(el, origin));
        case ElementKind::Stroke: {
            const std::vector<Point2> pts = strokeWorldPoints(el, origin);
            return aabbExpand(pointsAabb(pts, 0.0f, 0.0f), std::max(0.0f, el.strokeWidth * 0.5f));
        }
    }
    return AABB{0.0f, 0.0f, 0.0f, 0.0f};
}

Point2 elementWorldOrigin(const Element& el, const Point2& origin) {
    if (isEllipticalKind(el.kind)) {
        return Point2{origin.x + el.x - el.rx, origin.y + el.y - el.ry};
    }
    return Point2{origin.x + el.x, origin.y + el.y};
}

} // namespace board
