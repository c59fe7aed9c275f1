#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <vector>

struct ObstacleSearchResult {
    bool found = false;
    std::uint32_t expanded = 0;
    std::vector<Point2> points;  // turning points only, start and goal included
};

// Grid-constrained A* over a lattice anchored at the start point. State is
// (cell, incoming direction) so that bends can be penalized; the heuristic is the
// Manhattan distance in cells. The goal is the lattice point nearest to `goal`;
// the caller joins it to the exact goal.
class ObstacleRouter {
public:
    ObstacleRouter(float step, std::uint32_t nodeBudget);

    ObstacleSearchResult search(const Point2& start, const Point2& goal, const std::vector<AABB>& obstacles) const;

private:
    float step_;
    std::uint32_t nodeBudget_;
};
