#pragma once

#include "board/core/types.h"
#include "board/geometry/geometry.h"

#include <vector>

namespace board {

// Kind-level shape facts. Each is an exhaustive switch over ElementKind.
bool isBoxKind(ElementKind kind);
bool isEllipticalKind(ElementKind kind);
bool isPointSequenceKind(ElementKind kind);
const char* elementKindName(ElementKind kind);

// Oriented world frame of an element. `origin` is the world position of the parent
// section's top-left corner, or (0, 0) for top-level elements. Transient scale is applied.
ElementFrame elementFrame(const Element& el, const Point2& origin);

// Exact world AABB (rotation, transient scale and stroke width included).
AABB elementWorldAabb(const Element& el, const Point2& origin);

// World positions of a stroke's points. Empty for other kinds.
std::vector<Point2> strokeWorldPoints(const Element& el, const Point2& origin);

// Top-left corner of a box kind in world space, ignoring rotation.
Point2 elementWorldOrigin(const Element& el, const Point2& origin);

} // namespace board
