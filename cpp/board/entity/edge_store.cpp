#include "board/entity/edge_store.h"

#include <algorithm>

void EdgeStore::notify(std::uint32_t id) {
    if (observer_) observer_->beforeEdgeChange(*this, id);
}

void EdgeStore::link(const Edge& edge) {
    if (edge.source.elementId != 0) byElement_[edge.source.elementId].insert(edge.id);
    if (edge.target.elementId != 0) byElement_[edge.target.elementId].insert(edge.id);
}

void EdgeStore::unlink(const Edge& edge) {
    for (std::uint32_t elementId : {edge.source.elementId, edge.target.elementId}) {
        if (elementId == 0) continue;
        auto it = byElement_.find(elementId);
        if (it == byElement_.end()) continue;
        it->second.erase(edge.id);
        if (it->second.empty()) byElement_.erase(it);
    }
}

bool EdgeStore::add(const Edge& edge) {
    if (edge.id == 0 || has(edge.id)) return false;
    notify(edge.id);
    Edge stored = edge;
    stored.stale = true;
    link(stored);
    edges_.emplace(stored.id, std::move(stored));
    dirty_.insert(edge.id);
    revision_++;
    return true;
}

bool EdgeStore::remove(std::uint32_t id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;
    notify(id);
    unlink(it->second);
    edges_.erase(it);
    dirty_.erase(id);
    revision_++;
    return true;
}

const Edge* EdgeStore::get(std::uint32_t id) const {
    auto it = edges_.find(id);
    return it == edges_.end() ? nullptr : &it->second;
}

bool EdgeStore::setRouting(std::uint32_t id, EdgeRouting routing) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;
    if (it->second.routing == routing) return true;
    notify(id);
    it->second.routing = routing;
    dirty_.insert(id);
    revision_++;
    return true;
}

bool EdgeStore::setEndpoint(std::uint32_t id, EdgeEnd end, const EdgeEndpoint& endpoint) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;
    notify(id);
    unlink(it->second);
    switch (end) {
        case EdgeEnd::Source: it->second.source = endpoint; break;
        case EdgeEnd::Target: it->second.target = endpoint; break;
    }
    link(it->second);
    dirty_.insert(id);
    revision_++;
    return true;
}

void EdgeStore::setRoute(std::uint32_t id, std::vector<Point2> points, const Point2& sourcePos, const Point2& targetPos) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return;
    Edge& e = it->second;
    e.points = std::move(points);
    e.source.x = sourcePos.x;
    e.source.y = sourcePos.y;
    e.target.x = targetPos.x;
    e.target.y = targetPos.y;
    e.stale = false;
}

void EdgeStore::markStale(std::uint32_t id) {
    auto it = edges_.find(id);
    if (it != edges_.end()) it->second.stale = true;
}

void EdgeStore::restore(std::uint32_t id, const Edge* state) {
    auto it = edges_.find(id);
    if (it != edges_.end()) {
        unlink(it->second);
        edges_.erase(it);
    }
    if (state) {
        Edge copy = *state;
        copy.id = id;
        link(copy);
        edges_[id] = std::move(copy);
        dirty_.insert(id);
    } else {
        dirty_.erase(id);
    }
    revision_++;
}

void EdgeStore::clear() {
    edges_.clear();
    byElement_.clear();
    dirty_.clear();
    revision_++;
}

std::vector<std::uint32_t> EdgeStore::connectedTo(std::uint32_t elementId) const {
    std::vector<std::uint32_t> out;
    auto it = byElement_.find(elementId);
    if (it == byElement_.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    std::sort(out.begin(), out.end());
    return out;
}

void EdgeStore::markDirty(std::uint32_t id) {
    if (has(id)) dirty_.insert(id);
}

void EdgeStore::markElementDirty(std::uint32_t elementId) {
    auto it = byElement_.find(elementId);
    if (it == byElement_.end()) return;
    dirty_.insert(it->second.begin(), it->second.end());
}

void EdgeStore::markAllDirty() {
    for (const auto& [id, edge] : edges_) {
        (void)edge;
        dirty_.insert(id);
    }
}

std::vector<std::uint32_t> EdgeStore::takeDirty() {
    std::vector<std::uint32_t> out(dirty_.begin(), dirty_.end());
    dirty_.clear();
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::uint32_t> EdgeStore::ids() const {
    std::vector<std::uint32_t> out;
    out.reserve(edges_.size());
    for (const auto& [id, edge] : edges_) {
        (void)edge;
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}
