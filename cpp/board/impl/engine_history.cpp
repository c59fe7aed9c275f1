// BoardEngine history and gesture commits.

#include "board/board_engine.h"

#include <cmath>

BoardEngine::HistoryMeta BoardEngine::getHistoryMeta() const noexcept {
    return HistoryMeta{
        static_cast<std::uint32_t>(history_.getHistorySize()),
        static_cast<std::uint32_t>(history_.getCursor()),
        history_.getGeneration(),
    };
}

bool BoardEngine::undo() {
    std::uint32_t next = nextId_;
    if (!history_.undo(next)) return false;
    nextId_ = next;
    pruneSelection();
    invalidateFrame();
    return true;
}

bool BoardEngine::redo() {
    std::uint32_t next = nextId_;
    if (!history_.redo(next)) return false;
    nextId_ = next;
    pruneSelection();
    invalidateFrame();
    return true;
}

DraftCommit BoardEngine::commitDraft() {
    const DraftCommit result = session_.commitDraft();
    pruneSelection();
    return result;
}

bool BoardEngine::commitTransform() {
    return session_.commitTransform();
}

void BoardEngine::cancelTransform() {
    session_.cancelTransform();
    invalidateFrame();
}

std::size_t BoardEngine::eraseAlongPath(const std::vector<Point2>& path, float radius) {
    return session_.eraseAlongPath(path, radius);
}

std::size_t BoardEngine::eraseInBounds(const AABB& rect) {
    return session_.eraseInBounds(rect);
}

std::size_t BoardEngine::eraseSegmentsAlongPath(const std::vector<Point2>& path, float radius) {
    return session_.eraseSegmentsAlongPath(path, radius);
}

bool BoardEngine::beginEndpointDrag(std::uint32_t id, EdgeEnd end) {
    clearError();
    if (!edges_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    return session_.beginEndpointDrag(id, end);
}

void BoardEngine::cancelEndpointDrag() {
    session_.cancelEndpointDrag();
    invalidateFrame();
}

void BoardEngine::setEraserRadius(float radius) {
    if (!(radius > 0.0f) || !std::isfinite(radius)) return;
    config_.eraser.radius = radius;
}
