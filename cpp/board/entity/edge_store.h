#pragma once

#include "board/core/types.h"
#include "board/entity/mutation_observer.h"

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Connectors keyed by id, plus the dirty-edge set consumed by the router's reflow.
// Element references are plain ids; the store never holds element data.
class EdgeStore {
public:
    EdgeStore() = default;

    void setObserver(MutationObserver* observer) { observer_ = observer; }

    bool add(const Edge& edge);
    bool remove(std::uint32_t id);
    const Edge* get(std::uint32_t id) const;
    bool has(std::uint32_t id) const { return edges_.find(id) != edges_.end(); }

    bool setRouting(std::uint32_t id, EdgeRouting routing);
    bool setEndpoint(std::uint32_t id, EdgeEnd end, const EdgeEndpoint& endpoint);

    // Writes a freshly computed route. Derived state: not reported to the observer.
    void setRoute(std::uint32_t id, std::vector<Point2> points, const Point2& sourcePos, const Point2& targetPos);
    // Leaves the cached points in place and flags them as out of date.
    void markStale(std::uint32_t id);

    // Verbatim write or erase used by history replay and snapshot loading.
    void restore(std::uint32_t id, const Edge* state);

    void clear();

    std::vector<std::uint32_t> connectedTo(std::uint32_t elementId) const;

    // Dirty-edge set.
    void markDirty(std::uint32_t id);
    void markElementDirty(std::uint32_t elementId);
    void markAllDirty();
    std::vector<std::uint32_t> takeDirty();
    bool isDirty(std::uint32_t id) const { return dirty_.find(id) != dirty_.end(); }
    std::size_t dirtyCount() const noexcept { return dirty_.size(); }

    std::size_t size() const noexcept { return edges_.size(); }
    std::vector<std::uint32_t> ids() const;
    std::uint32_t revision() const noexcept { return revision_; }

private:
    void link(const Edge& edge);
    void unlink(const Edge& edge);
    void notify(std::uint32_t id);

    std::unordered_map<std::uint32_t, Edge> edges_;
    std::unordered_map<std::uint32_t, std::unordered_set<std::uint32_t>> byElement_;
    std::unordered_set<std::uint32_t> dirty_;
    MutationObserver* observer_ = nullptr;
    std::uint32_t revision_ = 0;
};
