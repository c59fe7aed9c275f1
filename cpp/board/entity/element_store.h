#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"
#include "board/entity/edge_store.h"
#include "board/entity/mutation_observer.h"
#include "board/geometry/geometry.h"
#include "board/spatial/spatial_index.h"

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Single source of truth for element data. Every mutation path marks the owned spatial
// index dirty for the old and new bounds and queues the connected edges for reflow.
class ElementStore : public BoundsSource {
public:
    ElementStore(EdgeStore& edges, const BoardConfig& config, BoardDiagnostics& diagnostics);

    ElementStore(const ElementStore&) = delete;
    ElementStore& operator=(const ElementStore&) = delete;

    void setObserver(MutationObserver* observer) { observer_ = observer; }

    // Inserts a new element in front of every other one. Invalid sizes are clamped.
    // Fails when the id is 0 or already taken, or the parent is not a section.
    bool add(const Element& element);
    bool update(std::uint32_t id, const ElementPatch& patch);
    // Removes the element. Section children are detached in place; connectors are
    // detached to free endpoints or removed according to RouterOptions.
    bool remove(std::uint32_t id);

    const Element* get(std::uint32_t id) const;
    bool has(std::uint32_t id) const { return elements_.find(id) != elements_.end(); }

    // Verbatim write or erase used by history replay.
    void restore(std::uint32_t id, const Element* state);
    // Inserts a snapshot record with its stored z. Invalid geometry is clamped as in add().
    // Fails when the id is 0 or already taken.
    bool load(const Element& element);

    void clear();

    bool bringToFront(std::uint32_t id);
    bool sendToBack(std::uint32_t id);

    bool attachToSection(std::uint32_t id, std::uint32_t sectionId);
    bool detachFromSection(std::uint32_t id);

    // World position of the parent section's top-left corner, (0, 0) when top-level.
    Point2 parentOrigin(const Element& el) const;
    board::ElementFrame worldFrame(const Element& el) const;
    AABB worldBounds(const Element& el) const;
    bool worldBounds(std::uint32_t id, AABB& out) const;
    std::vector<Point2> worldStrokePoints(const Element& el) const;

    std::vector<std::uint32_t> idsInZOrder() const;
    std::vector<std::uint32_t> childrenOf(std::uint32_t sectionId) const;
    const std::unordered_map<std::uint32_t, Element>& elements() const { return elements_; }
    std::size_t size() const noexcept { return elements_.size(); }
    std::uint32_t revision() const noexcept { return revision_; }

    SpatialIndex& index() { return index_; }
    const SpatialIndex& index() const { return index_; }

    // BoundsSource
    void collectBounds(std::vector<std::pair<std::uint32_t, AABB>>& out) const override;
    bool containsElement(std::uint32_t id) const override { return has(id); }
    std::size_t elementCount() const override { return elements_.size(); }

private:
    friend class BoardEngineTestAccessor;

    void notify(std::uint32_t id);
    // Clamps non-finite or undersized geometry. Returns true when anything changed.
    bool sanitize(Element& el) const;
    void markChanged(const Element& el, const AABB& before);
    void markChildrenChanged(std::uint32_t sectionId);
    void linkParent(const Element& el);
    void unlinkParent(const Element& el);
    void trackZ(std::int32_t z);
    void releaseEdges(const Element& el);

    EdgeStore& edges_;
    const BoardConfig& config_;
    BoardDiagnostics& diagnostics_;
    SpatialIndex index_;
    MutationObserver* observer_ = nullptr;

    std::unordered_map<std::uint32_t, Element> elements_;
    std::unordered_map<std::uint32_t, std::unordered_set<std::uint32_t>> children_;
    std::int32_t topZ_ = 0;
    std::int32_t bottomZ_ = 0;
    std::uint32_t revision_ = 0;
};
