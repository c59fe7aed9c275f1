// BoardEngine queries and frame batching.

#include "board/board_engine.h"
#include "board/geometry/geometry.h"

#include <cmath>

namespace {

bool sameViewport(const Viewport& a, const Viewport& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height && a.scale == b.scale;
}

} // namespace

void BoardEngine::setViewScale(float scale) {
    if (!(scale > 1e-6f) || !std::isfinite(scale)) return;
    viewScale_ = scale;
}

std::vector<std::uint32_t> BoardEngine::visibleElements(const Viewport& viewport) {
    CullResult result;
    culler_.cull(store_, edges_, viewport, selection_, result);
    return result.elementIds;
}

SnapResult BoardEngine::snap(const Point2& point, const std::vector<std::uint32_t>& excludeIds) {
    return snap_.snap(point, excludeIds, viewScale_);
}

std::optional<PortHit> BoardEngine::nearestPort(const Point2& point, float maxDistance) {
    return router_.nearestPort(point, maxDistance);
}

const FrameResult& BoardEngine::frame(const Viewport& viewport) {
    setViewScale(viewport.scale);

    const std::size_t routed = edges_.dirtyCount() > 0 ? router_.reflowDirty(edges_) : 0;

    const bool unchanged = frameValid_
        && routed == 0
        && sameViewport(viewport, frameViewport_)
        && store_.revision() == frameElementRevision_
        && edges_.revision() == frameEdgeRevision_
        && selectionRevision_ == frameSelectionRevision_;
    if (unchanged) {
        lastFrame_.reused = true;
        lastFrame_.edgesRouted = 0;
        return lastFrame_;
    }

    culler_.cull(store_, edges_, viewport, selection_, lastFrame_.cull);
    lastFrame_.edgesRouted = routed;
    lastFrame_.reused = false;
    lastFrame_.generation++;

    frameValid_ = true;
    frameViewport_ = viewport;
    frameElementRevision_ = store_.revision();
    frameEdgeRevision_ = edges_.revision();
    frameSelectionRevision_ = selectionRevision_;
    return lastFrame_;
}
