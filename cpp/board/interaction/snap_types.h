#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <vector>

enum class SnapTargetKind : std::uint16_t {
    None = 0,
    Grid = 1,
    Corner = 2,
    Midpoint = 3,
    Center = 4,
    Guide = 5,
};

struct SnapGuide {
    float x0;
    float y0;
    float x1;
    float y1;
};

struct SnapResult {
    bool snapped{false};
    Point2 point{0.0f, 0.0f};   // snapped position of the query point
    float dx{0.0f};             // offset applied to the query point (and drag bounds)
    float dy{0.0f};
    SnapTargetKind kind{SnapTargetKind::None};
    std::uint32_t elementId{0}; // element owning the anchor, 0 for grid and guides
    std::vector<SnapGuide> guides;
};
