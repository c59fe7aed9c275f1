#include "board/routing/obstacle_router.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <queue>
#include <unordered_map>

namespace {

constexpr int kDirNone = -1;
constexpr int kSearchPadCells = 4;
constexpr int kBendPenalty = 4;

struct Cell {
    int x;
    int y;
};

struct StateKey {
    int x;
    int y;
    int dir;
    bool operator==(const StateKey& other) const {
        return x == other.x && y == other.y && dir == other.dir;
    }
};

struct StateKeyHash {
    std::size_t operator()(const StateKey& k) const {
        std::size_t h = static_cast<std::size_t>(static_cast<std::uint32_t>(k.x)) * 73856093u;
        h ^= static_cast<std::size_t>(static_cast<std::uint32_t>(k.y)) * 19349663u;
        h ^= static_cast<std::size_t>(k.dir + 1) * 83492791u;
        return h;
    }
};

struct Node {
    int x;
    int y;
    int dir;
    int g;
    int f;
};

struct NodeOrder {
    bool operator()(const Node& a, const Node& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.g < b.g;
    }
};

struct CellBounds {
    int minX, minY, maxX, maxY;
};

Cell dirDelta(int dir) {
    switch (dir) {
        case 0: return Cell{1, 0};
        case 1: return Cell{0, 1};
        case 2: return Cell{-1, 0};
        case 3: return Cell{0, -1};
        default: return Cell{0, 0};
    }
}

// Continue straight first so ties resolve toward fewer bends.
std::array<int, 4> orderedDirs(int current) {
    if (current == kDirNone) return {0, 1, 2, 3};
    return {current, (current + 1) % 4, (current + 3) % 4, (current + 2) % 4};
}

int stepCost(int fromDir, int toDir) {
    if (fromDir == kDirNone || fromDir == toDir) return 1;
    return 1 + kBendPenalty;
}

int manhattanDistance(int x, int y, const Cell& goal) {
    return std::abs(x - goal.x) + std::abs(y - goal.y);
}

} // namespace

ObstacleRouter::ObstacleRouter(float step, std::uint32_t nodeBudget)
    : step_(step > 0.0f ? step : 1.0f), nodeBudget_(nodeBudget) {}

ObstacleSearchResult ObstacleRouter::search(const Point2& start, const Point2& goal, const std::vector<AABB>& obstacles) const {
    ObstacleSearchResult result;

    auto toWorld = [&](int cx, int cy) {
        return Point2{start.x + static_cast<float>(cx) * step_, start.y + static_cast<float>(cy) * step_};
    };
    auto toCell = [&](float v, float origin) {
        return static_cast<int>(std::lround((v - origin) / step_));
    };

    const Cell goalCell{toCell(goal.x, start.x), toCell(goal.y, start.y)};
    if (goalCell.x == 0 && goalCell.y == 0) {
        result.found = true;
        result.points = {start};
        return result;
    }

    CellBounds bounds{std::min(0, goalCell.x), std::min(0, goalCell.y), std::max(0, goalCell.x), std::max(0, goalCell.y)};
    for (const AABB& o : obstacles) {
        bounds.minX = std::min(bounds.minX, toCell(o.minX, start.x) - 1);
        bounds.minY = std::min(bounds.minY, toCell(o.minY, start.y) - 1);
        bounds.maxX = std::max(bounds.maxX, toCell(o.maxX, start.x) + 1);
        bounds.maxY = std::max(bounds.maxY, toCell(o.maxY, start.y) + 1);
    }
    bounds.minX -= kSearchPadCells;
    bounds.minY -= kSearchPadCells;
    bounds.maxX += kSearchPadCells;
    bounds.maxY += kSearchPadCells;

    auto isBlocked = [&](int cx, int cy) {
        if (cx == goalCell.x && cy == goalCell.y) return false;
        const Point2 p = toWorld(cx, cy);
        for (const AABB& o : obstacles) {
            if (board::aabbContainsPoint(o, p.x, p.y)) return true;
        }
        return false;
    };
    // Moving between two free lattice points can still clip a thin obstacle.
    auto crosses = [&](int ax, int ay, int bx, int by) {
        const Point2 a = toWorld(ax, ay);
        const Point2 b = toWorld(bx, by);
        for (const AABB& o : obstacles) {
            if (board::segmentIntersectsAabb(a, b, o)
                && !board::aabbContainsPoint(o, a.x, a.y)
                && !(bx == goalCell.x && by == goalCell.y)) {
                return true;
            }
        }
        return false;
    };

    std::priority_queue<Node, std::vector<Node>, NodeOrder> open;
    std::unordered_map<StateKey, int, StateKeyHash> gScore;
    std::unordered_map<StateKey, StateKey, StateKeyHash> cameFrom;

    const StateKey startKey{0, 0, kDirNone};
    gScore[startKey] = 0;
    open.push(Node{0, 0, kDirNone, 0, manhattanDistance(0, 0, goalCell)});

    bool reached = false;
    StateKey goalKey{};
    while (!open.empty() && result.expanded < nodeBudget_) {
        const Node cur = open.top();
        open.pop();
        const StateKey curKey{cur.x, cur.y, cur.dir};
        const auto gsIt = gScore.find(curKey);
        if (gsIt == gScore.end() || gsIt->second != cur.g) continue;

        if (cur.x == goalCell.x && cur.y == goalCell.y) {
            reached = true;
            goalKey = curKey;
            break;
        }

        ++result.expanded;
        for (int dir : orderedDirs(cur.dir)) {
            // No immediate reversal.
            if (cur.dir != kDirNone && dir == (cur.dir + 2) % 4) continue;
            const Cell d = dirDelta(dir);
            const int nx = cur.x + d.x;
            const int ny = cur.y + d.y;
            if (nx < bounds.minX || nx > bounds.maxX || ny < bounds.minY || ny > bounds.maxY) continue;
            if (isBlocked(nx, ny) || crosses(cur.x, cur.y, nx, ny)) continue;

            const int ng = cur.g + stepCost(cur.dir, dir);
            const StateKey nextKey{nx, ny, dir};
            const auto it = gScore.find(nextKey);
            if (it != gScore.end() && ng >= it->second) continue;
            gScore[nextKey] = ng;
            cameFrom[nextKey] = curKey;
            open.push(Node{nx, ny, dir, ng, ng + manhattanDistance(nx, ny, goalCell)});
        }
    }

    if (!reached) return result;

    std::vector<Cell> cells;
    StateKey cur = goalKey;
    while (true) {
        cells.push_back(Cell{cur.x, cur.y});
        if (cur == startKey) break;
        auto it = cameFrom.find(cur);
        if (it == cameFrom.end()) return result;
        cur = it->second;
    }
    std::reverse(cells.begin(), cells.end());

    // Keep turning points only.
    result.points.push_back(toWorld(cells.front().x, cells.front().y));
    for (std::size_t i = 1; i + 1 < cells.size(); ++i) {
        const Cell& a = cells[i - 1];
        const Cell& b = cells[i];
        const Cell& c = cells[i + 1];
        const bool straight = (a.x == b.x && b.x == c.x) || (a.y == b.y && b.y == c.y);
        if (!straight) result.points.push_back(toWorld(b.x, b.y));
    }
    result.points.push_back(toWorld(cells.back().x, cells.back().y));
    result.found = true;
    return result;
}
