#ifndef BOARD_ENGINE_QUADTREE_H
#define BOARD_ENGINE_QUADTREE_H

#include "board/core/types.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

// Region quadtree over element bounds. An entry lives in the deepest node whose
// bounds contain it entirely; entries that straddle a split line stay in the parent
// and entries outside the root bounds stay in the root. Nodes live in a flat pool
// and children are addressed by index.
class QuadTree {
public:
    QuadTree(std::uint32_t maxElementsPerNode, std::uint32_t maxDepth);

    // Drops every entry and starts over with a single root node.
    void reset(const AABB& rootBounds);
    void clear();

    void insert(std::uint32_t id, const AABB& bounds);
    bool remove(std::uint32_t id);
    bool contains(std::uint32_t id) const { return locator_.find(id) != locator_.end(); }

    // Appends every id whose stored bounds intersect `rect`. May return ids whose exact
    // geometry does not intersect; callers refine.
    void query(const AABB& rect, std::vector<std::uint32_t>& out) const;

    std::size_t size() const noexcept { return locator_.size(); }
    std::size_t nodeCount() const noexcept { return nodes_.size(); }
    std::uint32_t maxDepthReached() const noexcept { return maxDepthReached_; }
    const AABB& rootBounds() const { return nodes_[0].bounds; }

    void setLimits(std::uint32_t maxElementsPerNode, std::uint32_t maxDepth);

private:
    struct Entry {
        std::uint32_t id;
        AABB bounds;
    };

    struct Node {
        AABB bounds;
        std::int32_t firstChild = -1;  // index of the NW child; NE, SW, SE follow
        std::uint32_t depth = 0;
        std::vector<Entry> entries;
    };

    std::int32_t childSlotFor(const Node& node, const AABB& bounds) const;
    void subdivide(std::uint32_t nodeIndex);
    void insertAt(std::uint32_t nodeIndex, const Entry& entry);

    std::uint32_t maxElementsPerNode_;
    std::uint32_t maxDepth_;
    std::uint32_t maxDepthReached_ = 0;
    std::vector<Node> nodes_;
    std::unordered_map<std::uint32_t, std::uint32_t> locator_;  // id -> node index
};

#endif // BOARD_ENGINE_QUADTREE_H
