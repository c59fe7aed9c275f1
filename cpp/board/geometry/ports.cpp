#include "board/geometry/ports.h"
#include "board/geometry/element_shape.h"

namespace board {

PortSet portSetFor(ElementKind kind) {
    switch (kind) {
        case ElementKind::Ellipse:
            return PortSet::Perimeter;
        case ElementKind::Rectangle:
        case ElementKind::StickyNote:
        case ElementKind::Image:
        case ElementKind::Section:
            return PortSet::EdgeMidpoints;
        case ElementKind::Text:
        case ElementKind::Table:
        case ElementKind::Stroke:
            return PortSet::None;
    }
    return PortSet::None;
}

Point2 portUnitOffset(PortKind port) {
    switch (port) {
        case PortKind::N: return Point2{0.0f, -1.0f};
        case PortKind::S: return Point2{0.0f, 1.0f};
        case PortKind::E: return Point2{1.0f, 0.0f};
        case PortKind::W: return Point2{-1.0f, 0.0f};
        case PortKind::Center: return Point2{0.0f, 0.0f};
    }
    return Point2{0.0f, 0.0f};
}

Point2 portNormal(PortKind port, float rot) {
    const Point2 n = portUnitOffset(port);
    if (rot == 0.0f) return n;
    return rotateAround(n, Point2{0.0f, 0.0f}, rot);
}

Point2 dominantAxis(const Point2& from, const Point2& to) {
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    if (std::fabs(dx) < 1e-6f && std::fabs(dy) < 1e-6f) return Point2{0.0f, 0.0f};
    if (std::fabs(dx) >= std::fabs(dy)) return Point2{dx > 0.0f ? 1.0f : -1.0f, 0.0f};
    return Point2{0.0f, dy > 0.0f ? 1.0f : -1.0f};
}

ResolvedPort resolveAttachment(ElementKind kind, const ElementFrame& frame, PortKind port, const Point2& toward) {
    ResolvedPort out;
    const Point2 center{frame.cx, frame.cy};

    if (port == PortKind::Center) {
        out.position = center;
        out.normal = dominantAxis(center, toward);
        out.onPort = true;
        return out;
    }

    switch (portSetFor(kind)) {
        case PortSet::Perimeter:
        case PortSet::EdgeMidpoints: {
            // A cardinal point of the inscribed ellipse coincides with the side midpoint
            // of its box, so both sets share the same offset math.
            const Point2 u = portUnitOffset(port);
            const Point2 local{center.x + u.x * frame.hw, center.y + u.y * frame.hh};
            out.position = rotateAround(local, center, frame.rot);
            out.normal = portNormal(port, frame.rot);
            out.onPort = true;
            return out;
        }
        case PortSet::None:
            out.position = boxBoundaryToward(frame, toward, isEllipticalKind(kind));
            out.normal = dominantAxis(center, out.position);
            out.onPort = false;
            return out;
    }
    return out;
}

const char* portKindName(PortKind port) {
    switch (port) {
        case PortKind::N: return "N";
        case PortKind::S: return "S";
        case PortKind::E: return "E";
        case PortKind::W: return "W";
        case PortKind::Center: return "CENTER";
    }
    return "?";
}

} // namespace board
