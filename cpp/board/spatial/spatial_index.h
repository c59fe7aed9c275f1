#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"
#include "board/spatial/quadtree.h"

#include <cstdint>
#include <utility>
#include <vector>

// Authoritative provider of element bounds the index is derived from.
class BoundsSource {
public:
    virtual ~BoundsSource() = default;
    virtual void collectBounds(std::vector<std::pair<std::uint32_t, AABB>>& out) const = 0;
    virtual bool containsElement(std::uint32_t id) const = 0;
    virtual std::size_t elementCount() const = 0;
};

// Quadtree over world bounds with lazy reconciliation: mutations only mark the index
// dirty and the next query rebuilds it from the source in one pass.
class SpatialIndex {
public:
    SpatialIndex(const BoundsSource& source, const IndexOptions& options, BoardDiagnostics& diagnostics);

    void setOptions(const IndexOptions& options);

    // Direct maintenance. Both keep the index clean; the store path uses markDirty instead.
    void insert(std::uint32_t id, const AABB& bounds);
    void remove(std::uint32_t id);

    // Records that an element moved from `before` to `after`.
    void markDirty(const AABB& before, const AABB& after);
    void markDirty(const AABB& bounds);
    void markAllDirty();
    bool isDirty() const noexcept { return dirty_; }

    // Full O(n) rebuild from the source.
    void rebuild();

    // Candidate ids whose bounds intersect `rect` (superset). Rebuilds first when dirty
    // and recovers from a detected index/store mismatch by rebuilding.
    void query(const AABB& rect, std::vector<std::uint32_t>& out);

    void clear();

    std::size_t size() const noexcept { return tree_.size(); }
    const QuadTree& tree() const { return tree_; }
    const AABB& dirtyRegion() const { return dirtyRegion_; }

private:
    friend class BoardEngineTestAccessor;

    bool verifyResults(const std::vector<std::uint32_t>& results, std::size_t from) const;

    const BoundsSource& source_;
    IndexOptions options_;
    BoardDiagnostics& diagnostics_;
    QuadTree tree_;
    bool dirty_ = true;
    bool hasDirtyRegion_ = false;
    AABB dirtyRegion_{0.0f, 0.0f, 0.0f, 0.0f};
    std::vector<std::pair<std::uint32_t, AABB>> scratch_;
};
