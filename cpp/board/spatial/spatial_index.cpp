#include "board/spatial/spatial_index.h"
#include "board/core/logging.h"
#include "board/geometry/geometry.h"

SpatialIndex::SpatialIndex(const BoundsSource& source, const IndexOptions& options, BoardDiagnostics& diagnostics)
    : source_(source),
      options_(options),
      diagnostics_(diagnostics),
      tree_(options.maxElementsPerNode, options.maxDepth) {}

void SpatialIndex::setOptions(const IndexOptions& options) {
    options_ = options;
    tree_.setLimits(options.maxElementsPerNode, options.maxDepth);
    markAllDirty();
}

void SpatialIndex::insert(std::uint32_t id, const AABB& bounds) {
    tree_.insert(id, bounds);
}

void SpatialIndex::remove(std::uint32_t id) {
    tree_.remove(id);
}

void SpatialIndex::markDirty(const AABB& before, const AABB& after) {
    markDirty(board::aabbUnion(before, after));
}

void SpatialIndex::markDirty(const AABB& bounds) {
    dirtyRegion_ = hasDirtyRegion_ ? board::aabbUnion(dirtyRegion_, bounds) : bounds;
    hasDirtyRegion_ = true;
    dirty_ = true;
}

void SpatialIndex::markAllDirty() {
    dirty_ = true;
}

void SpatialIndex::clear() {
    tree_.clear();
    dirty_ = true;
    hasDirtyRegion_ = false;
}

void SpatialIndex::rebuild() {
    scratch_.clear();
    source_.collectBounds(scratch_);

    const float extent = options_.defaultWorldExtent;
    AABB root{-extent, -extent, extent, extent};
    for (const auto& [id, bounds] : scratch_) {
        (void)id;
        root = board::aabbUnion(root, bounds);
    }
    // Square root cell keeps quadrants isotropic.
    const float w = root.maxX - root.minX;
    const float h = root.maxY - root.minY;
    if (w > h) root.maxY = root.minY + w;
    else root.maxX = root.minX + h;

    tree_.reset(root);
    for (const auto& [id, bounds] : scratch_) tree_.insert(id, bounds);

    dirty_ = false;
    hasDirtyRegion_ = false;
    diagnostics_.indexRebuilds++;
    BOARD_LOG_DEBUG("spatial index rebuilt: %zu entries, %zu nodes", tree_.size(), tree_.nodeCount());
}

bool SpatialIndex::verifyResults(const std::vector<std::uint32_t>& results, std::size_t from) const {
    for (std::size_t i = from; i < results.size(); ++i) {
        if (!source_.containsElement(results[i])) return false;
    }
    return true;
}

void SpatialIndex::query(const AABB& rect, std::vector<std::uint32_t>& out) {
    if (dirty_) rebuild();

    if (tree_.size() != source_.elementCount()) {
        BOARD_LOG_WARN("spatial index desync: %zu indexed, %zu stored; rebuilding", tree_.size(), source_.elementCount());
        diagnostics_.indexDesyncRecoveries++;
        rebuild();
    }

    const std::size_t start = out.size();
    tree_.query(rect, out);
    if (verifyResults(out, start)) return;

    BOARD_LOG_WARN("spatial index returned ids missing from the store; rebuilding");
    diagnostics_.indexDesyncRecoveries++;
    out.resize(start);
    rebuild();
    tree_.query(rect, out);
}
