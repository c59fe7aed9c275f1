#include "board/render/viewport_culler.h"
#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>

LodLevel ViewportCuller::lodForScale(float scale) const {
    if (!std::isfinite(scale)) return LodLevel::Hidden;
    if (scale >= options_.fullScale) return LodLevel::Full;
    if (scale >= options_.simplifiedScale) return LodLevel::Simplified;
    if (scale >= options_.placeholderScale) return LodLevel::Placeholder;
    return LodLevel::Hidden;
}

AABB ViewportCuller::expandedRect(const Viewport& viewport) const {
    const float scale = viewport.scale > 1e-6f ? viewport.scale : 1e-6f;
    const float buffer = options_.bufferPx / scale;
    return AABB{
        viewport.x - buffer,
        viewport.y - buffer,
        viewport.x + std::max(0.0f, viewport.width) + buffer,
        viewport.y + std::max(0.0f, viewport.height) + buffer,
    };
}

void ViewportCuller::cull(
    ElementStore& store,
    const EdgeStore& edges,
    const Viewport& viewport,
    const std::unordered_set<std::uint32_t>& selection,
    CullResult& out) {
    out.elementIds.clear();
    out.edgeIds.clear();
    out.lod = lodForScale(viewport.scale);
    out.queryRect = expandedRect(viewport);

    std::unordered_set<std::uint32_t> visible;
    if (out.lod != LodLevel::Hidden) {
        candidates_.clear();
        store.index().query(out.queryRect, candidates_);
        for (std::uint32_t id : candidates_) {
            const Element* el = store.get(id);
            if (!el) continue;
            if (hasFlag(el->flags, ElementFlags::Hidden)) continue;
            if (!board::aabbIntersects(store.worldBounds(*el), out.queryRect)) continue;
            visible.insert(id);
        }
    }
    for (std::uint32_t id : selection) {
        if (store.has(id)) visible.insert(id);
    }

    std::vector<std::pair<std::int32_t, std::uint32_t>> order;
    order.reserve(visible.size());
    for (std::uint32_t id : visible) order.emplace_back(store.get(id)->z, id);
    std::sort(order.begin(), order.end());
    out.elementIds.reserve(order.size());
    for (const auto& entry : order) out.elementIds.push_back(entry.second);

    if (out.lod == LodLevel::Hidden) return;
    for (std::uint32_t edgeId : edges.ids()) {
        const Edge* edge = edges.get(edgeId);
        if (!edge) continue;
        bool show = (edge->source.elementId != 0 && visible.count(edge->source.elementId) != 0)
                 || (edge->target.elementId != 0 && visible.count(edge->target.elementId) != 0);
        if (!show && !edge->points.empty()) {
            show = board::aabbIntersects(board::pointsAabb(edge->points, 0.0f, 0.0f), out.queryRect);
        }
        if (show) out.edgeIds.push_back(edgeId);
    }
}
