#include "board/spatial/quadtree.h"
#include "board/geometry/geometry.h"

using board::aabbContains;
using board::aabbIntersects;

QuadTree::QuadTree(std::uint32_t maxElementsPerNode, std::uint32_t maxDepth)
    : maxElementsPerNode_(maxElementsPerNode > 0 ? maxElementsPerNode : 1),
      maxDepth_(maxDepth) {
    reset(AABB{0.0f, 0.0f, 0.0f, 0.0f});
}

void QuadTree::setLimits(std::uint32_t maxElementsPerNode, std::uint32_t maxDepth) {
    maxElementsPerNode_ = maxElementsPerNode > 0 ? maxElementsPerNode : 1;
    maxDepth_ = maxDepth;
}

void QuadTree::reset(const AABB& rootBounds) {
    nodes_.clear();
    locator_.clear();
    maxDepthReached_ = 0;
    Node root;
    root.bounds = rootBounds;
    nodes_.push_back(std::move(root));
}

void QuadTree::clear() {
    reset(nodes_.empty() ? AABB{0.0f, 0.0f, 0.0f, 0.0f} : nodes_[0].bounds);
}

std::int32_t QuadTree::childSlotFor(const Node& node, const AABB& bounds) const {
    const float midX = (node.bounds.minX + node.bounds.maxX) * 0.5f;
    const float midY = (node.bounds.minY + node.bounds.maxY) * 0.5f;
    const bool west = bounds.maxX < midX;
    const bool east = bounds.minX >= midX;
    const bool north = bounds.maxY < midY;
    const bool south = bounds.minY >= midY;
    if (!aabbContains(node.bounds, bounds)) return -1;
    if (north && west) return 0;
    if (north && east) return 1;
    if (south && west) return 2;
    if (south && east) return 3;
    return -1;
}

void QuadTree::subdivide(std::uint32_t nodeIndex) {
    const AABB b = nodes_[nodeIndex].bounds;
    const std::uint32_t depth = nodes_[nodeIndex].depth + 1;
    const float midX = (b.minX + b.maxX) * 0.5f;
    const float midY = (b.minY + b.maxY) * 0.5f;
    const AABB quads[4] = {
        {b.minX, b.minY, midX, midY},
        {midX, b.minY, b.maxX, midY},
        {b.minX, midY, midX, b.maxY},
        {midX, midY, b.maxX, b.maxY},
    };

    const std::int32_t first = static_cast<std::int32_t>(nodes_.size());
    for (const AABB& q : quads) {
        Node child;
        child.bounds = q;
        child.depth = depth;
        nodes_.push_back(std::move(child));
    }
    nodes_[nodeIndex].firstChild = first;
    if (depth > maxDepthReached_) maxDepthReached_ = depth;

    // Push down whatever now fits wholly inside a child.
    std::vector<Entry> keep;
    std::vector<Entry> pending;
    pending.swap(nodes_[nodeIndex].entries);
    for (const Entry& e : pending) {
        const std::int32_t slot = childSlotFor(nodes_[nodeIndex], e.bounds);
        if (slot < 0) {
            keep.push_back(e);
            continue;
        }
        insertAt(static_cast<std::uint32_t>(first + slot), e);
    }
    nodes_[nodeIndex].entries = std::move(keep);
    for (const Entry& e : nodes_[nodeIndex].entries) locator_[e.id] = nodeIndex;
}

void QuadTree::insertAt(std::uint32_t nodeIndex, const Entry& entry) {
    std::uint32_t current = nodeIndex;
    while (nodes_[current].firstChild >= 0) {
        const std::int32_t slot = childSlotFor(nodes_[current], entry.bounds);
        if (slot < 0) break;
        current = static_cast<std::uint32_t>(nodes_[current].firstChild + slot);
    }

    nodes_[current].entries.push_back(entry);
    locator_[entry.id] = current;

    Node& node = nodes_[current];
    if (node.firstChild < 0
        && node.entries.size() > maxElementsPerNode_
        && node.depth < maxDepth_) {
        subdivide(current);
    }
}

void QuadTree::insert(std::uint32_t id, const AABB& bounds) {
    if (contains(id)) remove(id);
    insertAt(0, Entry{id, bounds});
}

bool QuadTree::remove(std::uint32_t id) {
    auto it = locator_.find(id);
    if (it == locator_.end()) return false;
    std::vector<Entry>& entries = nodes_[it->second].entries;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].id != id) continue;
        entries[i] = entries.back();
        entries.pop_back();
        break;
    }
    locator_.erase(it);
    return true;
}

void QuadTree::query(const AABB& rect, std::vector<std::uint32_t>& out) const {
    if (nodes_.empty()) return;
    std::vector<std::uint32_t> stack;
    stack.push_back(0);
    while (!stack.empty()) {
        const std::uint32_t index = stack.back();
        stack.pop_back();
        const Node& node = nodes_[index];
        // The root also holds entries outside its bounds, so it is always visited.
        if (index != 0 && !aabbIntersects(node.bounds, rect)) continue;
        for (const Entry& e : node.entries) {
            if (aabbIntersects(e.bounds, rect)) out.push_back(e.id);
        }
        if (node.firstChild >= 0) {
            for (std::int32_t i = 0; i < 4; ++i) {
                stack.push_back(static_cast<std::uint32_t>(node.firstChild + i));
            }
        }
    }
}
