#include "board/entity/element_store.h"
#include "board/core/logging.h"
#include "board/core/util.h"
#include "board/geometry/element_shape.h"
#include "board/geometry/ports.h"

#include <algorithm>
#include <cmath>

namespace {

bool clampSize(float& v, float minSize) {
    if (std::isfinite(v) && v >= minSize) return false;
    v = minSize;
    return true;
}

bool clampFinite(float& v, float fallback) {
    if (std::isfinite(v)) return false;
    v = fallback;
    return true;
}

} // namespace

ElementStore::ElementStore(EdgeStore& edges, const BoardConfig& config, BoardDiagnostics& diagnostics)
    : edges_(edges),
      config_(config),
      diagnostics_(diagnostics),
      index_(*this, config.index, diagnostics) {}

void ElementStore::notify(std::uint32_t id) {
    if (observer_) observer_->beforeElementChange(*this, id);
}

bool ElementStore::sanitize(Element& el) const {
    const float minSize = config_.minElementSize;
    bool clamped = false;
    clamped |= clampFinite(el.x, 0.0f);
    clamped |= clampFinite(el.y, 0.0f);
    clamped |= clampFinite(el.rot, 0.0f);
    clamped |= clampFinite(el.sx, 1.0f);
    clamped |= clampFinite(el.sy, 1.0f);
    if (el.strokeWidth < 0.0f || !std::isfinite(el.strokeWidth)) {
        el.strokeWidth = 0.0f;
        clamped = true;
    }

    switch (el.kind) {
        case ElementKind::Rectangle:
        case ElementKind::Text:
        case ElementKind::StickyNote:
        case ElementKind::Table:
        case ElementKind::Image:
        case ElementKind::Section:
            clamped |= clampSize(el.w, minSize);
            clamped |= clampSize(el.h, minSize);
            break;
        case ElementKind::Ellipse:
            clamped |= clampSize(el.rx, minSize);
            clamped |= clampSize(el.ry, minSize);
            break;
        case ElementKind::Stroke: {
            const std::size_t before = el.points.size();
            el.points.erase(
                std::remove_if(el.points.begin(), el.points.end(), [](const Point2& p) {
                    return !std::isfinite(p.x) || !std::isfinite(p.y);
                }),
                el.points.end());
            clamped |= el.points.size() != before;
            break;
        }
    }

    if (!std::isfinite(el.fontSize) || el.fontSize < minSize) {
        el.fontSize = minSize;
        clamped = true;
    }
    return clamped;
}

void ElementStore::linkParent(const Element& el) {
    if (el.parentId != 0) children_[el.parentId].insert(el.id);
}

void ElementStore::unlinkParent(const Element& el) {
    if (el.parentId == 0) return;
    auto it = children_.find(el.parentId);
    if (it == children_.end()) return;
    it->second.erase(el.id);
    if (it->second.empty()) children_.erase(it);
}

void ElementStore::trackZ(std::int32_t z) {
    topZ_ = std::max(topZ_, z);
    bottomZ_ = std::min(bottomZ_, z);
}

void ElementStore::markChanged(const Element& el, const AABB& before) {
    index_.markDirty(before, worldBounds(el));
    edges_.markElementDirty(el.id);
    if (el.kind == ElementKind::Section) markChildrenChanged(el.id);
    revision_++;
}

void ElementStore::markChildrenChanged(std::uint32_t sectionId) {
    auto it = children_.find(sectionId);
    if (it == children_.end()) return;
    for (std::uint32_t childId : it->second) {
        edges_.markElementDirty(childId);
    }
    index_.markAllDirty();
}

bool ElementStore::add(const Element& element) {
    if (element.id == 0 || has(element.id)) return false;
    if (element.parentId != 0) {
        const Element* parent = get(element.parentId);
        if (!parent || parent->kind != ElementKind::Section || element.kind == ElementKind::Section) {
            BOARD_LOG_WARN("add %u: parent %u is not a section", element.id, element.parentId);
            return false;
        }
    }

    Element el = element;
    if (sanitize(el)) {
        diagnostics_.geometryClamped++;
        BOARD_LOG_WARN("add %u: invalid %s geometry clamped", el.id, board::elementKindName(el.kind));
    }
    el.z = elements_.empty() ? 0 : topZ_ + 1;
    const double now = boardNowMs();
    if (el.createdAt == 0.0) el.createdAt = now;
    el.updatedAt = el.createdAt;

    notify(el.id);
    trackZ(el.z);
    linkParent(el);
    auto [it, inserted] = elements_.emplace(el.id, std::move(el));
    (void)inserted;
    const AABB bounds = worldBounds(it->second);
    markChanged(it->second, bounds);
    return true;
}

bool ElementStore::update(std::uint32_t id, const ElementPatch& patch) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return false;

    const AABB before = worldBounds(it->second);
    Element next = it->second;
    if (patch.x) next.x = *patch.x;
    if (patch.y) next.y = *patch.y;
    if (patch.w) next.w = *patch.w;
    if (patch.h) next.h = *patch.h;
    if (patch.rx) next.rx = *patch.rx;
    if (patch.ry) next.ry = *patch.ry;
    if (patch.rot) next.rot = *patch.rot;
    if (patch.sx) next.sx = *patch.sx;
    if (patch.sy) next.sy = *patch.sy;
    if (patch.flags) next.flags = *patch.flags;
    if (patch.fillRGBA) next.fillRGBA = *patch.fillRGBA;
    if (patch.strokeRGBA) next.strokeRGBA = *patch.strokeRGBA;
    if (patch.strokeWidth) next.strokeWidth = *patch.strokeWidth;
    if (patch.points) next.points = *patch.points;
    if (patch.text) next.text = *patch.text;
    if (patch.source) next.source = *patch.source;
    if (patch.fontSize) next.fontSize = *patch.fontSize;
    if (patch.rows) next.rows = *patch.rows;
    if (patch.cols) next.cols = *patch.cols;
    if (patch.cells) next.cells = *patch.cells;

    if (sanitize(next)) {
        diagnostics_.geometryClamped++;
        BOARD_LOG_WARN("update %u: invalid %s geometry clamped", id, board::elementKindName(next.kind));
    }
    next.updatedAt = boardNowMs();

    notify(id);
    it->second = std::move(next);
    markChanged(it->second, before);
    return true;
}

void ElementStore::releaseEdges(const Element& el) {
    for (std::uint32_t edgeId : edges_.connectedTo(el.id)) {
        if (config_.router.removeOrphanedEdges) {
            edges_.remove(edgeId);
            continue;
        }
        const Edge* edge = edges_.get(edgeId);
        if (!edge) continue;
        const Edge snapshot = *edge;
        const board::ElementFrame frame = worldFrame(el);
        const EdgeEnd ends[2] = {EdgeEnd::Source, EdgeEnd::Target};
        for (EdgeEnd end : ends) {
            const EdgeEndpoint& self = end == EdgeEnd::Source ? snapshot.source : snapshot.target;
            const EdgeEndpoint& other = end == EdgeEnd::Source ? snapshot.target : snapshot.source;
            if (self.elementId != el.id) continue;
            const board::ResolvedPort port =
                board::resolveAttachment(el.kind, frame, self.port, Point2{other.x, other.y});
            EdgeEndpoint freed;
            freed.elementId = 0;
            freed.port = PortKind::Center;
            freed.x = port.position.x;
            freed.y = port.position.y;
            edges_.setEndpoint(edgeId, end, freed);
        }
    }
}

bool ElementStore::remove(std::uint32_t id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return false;

    if (it->second.kind == ElementKind::Section) {
        // Children keep their world position.
        const Point2 origin = board::elementWorldOrigin(it->second, parentOrigin(it->second));
        for (std::uint32_t childId : childrenOf(id)) {
            auto child = elements_.find(childId);
            if (child == elements_.end()) continue;
            notify(childId);
            child->second.x += origin.x;
            child->second.y += origin.y;
            child->second.parentId = 0;
        }
        children_.erase(id);
    }

    releaseEdges(it->second);

    notify(id);
    const AABB before = worldBounds(it->second);
    unlinkParent(it->second);
    elements_.erase(it);
    index_.markDirty(before);
    edges_.markElementDirty(id);
    revision_++;
    return true;
}

const Element* ElementStore::get(std::uint32_t id) const {
    auto it = elements_.find(id);
    return it == elements_.end() ? nullptr : &it->second;
}

void ElementStore::restore(std::uint32_t id, const Element* state) {
    auto it = elements_.find(id);
    if (it != elements_.end()) {
        index_.markDirty(worldBounds(it->second));
        unlinkParent(it->second);
        elements_.erase(it);
    }
    if (state) {
        Element copy = *state;
        copy.id = id;
        trackZ(copy.z);
        linkParent(copy);
        auto [pos, inserted] = elements_.emplace(id, std::move(copy));
        (void)inserted;
        index_.markDirty(worldBounds(pos->second));
        if (pos->second.kind == ElementKind::Section) markChildrenChanged(id);
    }
    edges_.markElementDirty(id);
    revision_++;
}

bool ElementStore::load(const Element& element) {
    if (element.id == 0 || has(element.id)) return false;
    Element el = element;
    if (sanitize(el)) {
        diagnostics_.geometryClamped++;
        BOARD_LOG_WARN("load %u: invalid %s geometry clamped", el.id, board::elementKindName(el.kind));
    }
    trackZ(el.z);
    linkParent(el);
    auto [it, inserted] = elements_.emplace(el.id, std::move(el));
    (void)inserted;
    index_.markDirty(worldBounds(it->second));
    edges_.markElementDirty(it->first);
    revision_++;
    return true;
}

void ElementStore::clear() {
    elements_.clear();
    children_.clear();
    topZ_ = 0;
    bottomZ_ = 0;
    index_.clear();
    revision_++;
}

bool ElementStore::bringToFront(std::uint32_t id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return false;
    if (it->second.z == topZ_ && elements_.size() > 1) {
        bool shared = false;
        for (const auto& [otherId, other] : elements_) {
            if (otherId != id && other.z == topZ_) { shared = true; break; }
        }
        if (!shared) return true;
    }
    notify(id);
    it->second.z = topZ_ + 1;
    trackZ(it->second.z);
    revision_++;
    return true;
}

bool ElementStore::sendToBack(std::uint32_t id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return false;
    notify(id);
    it->second.z = bottomZ_ - 1;
    trackZ(it->second.z);
    revision_++;
    return true;
}

bool ElementStore::attachToSection(std::uint32_t id, std::uint32_t sectionId) {
    auto it = elements_.find(id);
    const Element* section = get(sectionId);
    if (it == elements_.end() || !section) return false;
    if (section->kind != ElementKind::Section || it->second.kind == ElementKind::Section) return false;
    if (it->second.parentId == sectionId) return true;
    if (it->second.parentId != 0 && !detachFromSection(id)) return false;

    const Point2 origin = board::elementWorldOrigin(*section, parentOrigin(*section));
    notify(id);
    it->second.x -= origin.x;
    it->second.y -= origin.y;
    it->second.parentId = sectionId;
    linkParent(it->second);
    edges_.markElementDirty(id);
    revision_++;
    return true;
}

bool ElementStore::detachFromSection(std::uint32_t id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return false;
    if (it->second.parentId == 0) return true;
    const Point2 origin = parentOrigin(it->second);
    notify(id);
    unlinkParent(it->second);
    it->second.x += origin.x;
    it->second.y += origin.y;
    it->second.parentId = 0;
    edges_.markElementDirty(id);
    revision_++;
    return true;
}

Point2 ElementStore::parentOrigin(const Element& el) const {
    if (el.parentId == 0) return Point2{0.0f, 0.0f};
    const Element* parent = get(el.parentId);
    if (!parent) return Point2{0.0f, 0.0f};
    // Sections are always top-level, so one level of translation is enough.
    return board::elementWorldOrigin(*parent, Point2{0.0f, 0.0f});
}

board::ElementFrame ElementStore::worldFrame(const Element& el) const {
    return board::elementFrame(el, parentOrigin(el));
}

AABB ElementStore::worldBounds(const Element& el) const {
    return board::elementWorldAabb(el, parentOrigin(el));
}

bool ElementStore::worldBounds(std::uint32_t id, AABB& out) const {
    const Element* el = get(id);
    if (!el) return false;
    out = worldBounds(*el);
    return true;
}

std::vector<Point2> ElementStore::worldStrokePoints(const Element& el) const {
    return board::strokeWorldPoints(el, parentOrigin(el));
}

std::vector<std::uint32_t> ElementStore::idsInZOrder() const {
    std::vector<std::pair<std::int32_t, std::uint32_t>> order;
    order.reserve(elements_.size());
    for (const auto& [id, el] : elements_) order.emplace_back(el.z, id);
    std::sort(order.begin(), order.end());
    std::vector<std::uint32_t> out;
    out.reserve(order.size());
    for (const auto& entry : order) out.push_back(entry.second);
    return out;
}

std::vector<std::uint32_t> ElementStore::childrenOf(std::uint32_t sectionId) const {
    std::vector<std::uint32_t> out;
    auto it = children_.find(sectionId);
    if (it == children_.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    std::sort(out.begin(), out.end());
    return out;
}

void ElementStore::collectBounds(std::vector<std::pair<std::uint32_t, AABB>>& out) const {
    out.reserve(out.size() + elements_.size());
    for (const auto& [id, el] : elements_) out.emplace_back(id, worldBounds(el));
}
