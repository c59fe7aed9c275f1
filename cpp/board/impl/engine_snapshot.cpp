// BoardEngine snapshot and serialization methods

#include "board/board_engine.h"
#include "board/core/logging.h"
#include "board/persistence/snapshot.h"

#include <algorithm>
#include <unordered_set>

namespace {

// Elements and edges share one id space: every record needs its own nonzero id.
bool hasUniqueIds(const board::SnapshotData& sd) {
    std::unordered_set<std::uint32_t> seen;
    seen.reserve(sd.elements.size() + sd.edges.size());
    for (const Element& el : sd.elements) {
        if (el.id == 0 || !seen.insert(el.id).second) return false;
    }
    for (const Edge& e : sd.edges) {
        if (e.id == 0 || !seen.insert(e.id).second) return false;
    }
    return true;
}

} // namespace

std::vector<std::uint8_t> BoardEngine::saveSnapshot() const {
    board::SnapshotData sd;
    sd.elements.reserve(store_.size());
    for (const auto& kv : store_.elements()) sd.elements.push_back(kv.second);
    sd.edges.reserve(edges_.size());
    for (std::uint32_t id : edges_.ids()) {
        const Edge* e = edges_.get(id);
        if (e) sd.edges.push_back(*e);
    }
    sd.nextId = nextId_;
    return board::buildSnapshotBytes(sd);
}

BoardError BoardEngine::loadSnapshot(const std::uint8_t* bytes, std::size_t byteCount) {
    clearError();
    board::SnapshotData sd;
    const BoardError err = board::parseSnapshot(bytes, byteCount, sd);
    if (err != BoardError::Ok) {
        BOARD_LOG_WARN("snapshot: rejected (error %u)", static_cast<unsigned>(err));
        setError(err);
        return err;
    }
    if (!hasUniqueIds(sd)) {
        BOARD_LOG_WARN("snapshot: rejected (zero or duplicate id)");
        setError(BoardError::InvalidPayloadSize);
        return BoardError::InvalidPayloadSize;
    }

    session_.reset();
    history_.clear();
    store_.clear();
    edges_.clear();
    selection_.clear();
    selectionRevision_++;

    std::uint32_t maxId = 0;
    for (const Element& el : sd.elements) {
        if (!store_.load(el)) BOARD_LOG_WARN("snapshot: element %u skipped", el.id);
        maxId = std::max(maxId, el.id);
    }
    for (const Edge& e : sd.edges) {
        edges_.restore(e.id, &e);
        maxId = std::max(maxId, e.id);
    }
    nextId_ = std::max(sd.nextId, maxId + 1);

    store_.index().rebuild();
    edges_.markAllDirty();
    invalidateFrame();
    return BoardError::Ok;
}
