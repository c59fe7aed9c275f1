#pragma once

#include "board/core/types.h"
#include "board/geometry/geometry.h"

#include <array>

namespace board {

enum class PortSet : std::uint8_t {
    None = 0,           // free-form kinds: connectors attach to the nearest boundary point
    Perimeter = 1,      // circular kinds: cardinal points on the perimeter
    EdgeMidpoints = 2,  // rectangular/container kinds: midpoints of the four sides
};

constexpr std::array<PortKind, 4> kCardinalPorts = {PortKind::N, PortKind::E, PortKind::S, PortKind::W};

PortSet portSetFor(ElementKind kind);

// Normalized offset from the center in units of half extent (N = (0, -1), y down).
Point2 portUnitOffset(PortKind port);

// Outward unit normal of a port after rotation. Center has no normal (0, 0).
Point2 portNormal(PortKind port, float rot);

struct ResolvedPort {
    Point2 position{0.0f, 0.0f};
    Point2 normal{0.0f, 0.0f};  // unit, or (0, 0) when undetermined
    bool onPort{false};         // false when the kind has no such port
};

// World position and outward direction of an attachment. Ports are always derived from
// the current frame. `toward` is the other end of the connector and is used to pick the
// boundary point (and direction) for kinds without ports and for Center attachments.
ResolvedPort resolveAttachment(ElementKind kind, const ElementFrame& frame, PortKind port, const Point2& toward);

// Unit vector along the dominant axis of (to - from). Zero when the points coincide.
Point2 dominantAxis(const Point2& from, const Point2& to);

const char* portKindName(PortKind port);

} // namespace board
