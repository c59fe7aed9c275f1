#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"

#include <cstdint>
#include <unordered_set>
#include <vector>

class ElementStore;
class EdgeStore;

struct CullResult {
    std::vector<std::uint32_t> elementIds;  // back to front
    std::vector<std::uint32_t> edgeIds;     // ascending id
    LodLevel lod = LodLevel::Full;
    AABB queryRect{0.0f, 0.0f, 0.0f, 0.0f};
};

// Selects what the host has to draw for a viewport.
class ViewportCuller {
public:
    explicit ViewportCuller(const CullOptions& options) : options_(options) {}

    void setOptions(const CullOptions& options) { options_ = options; }

    LodLevel lodForScale(float scale) const;

    // Visible rectangle grown by the screen-space buffer, in world units.
    AABB expandedRect(const Viewport& viewport) const;

    void cull(
        ElementStore& store,
        const EdgeStore& edges,
        const Viewport& viewport,
        const std::unordered_set<std::uint32_t>& selection,
        CullResult& out);

private:
    CullOptions options_;
    std::vector<std::uint32_t> candidates_;
};
