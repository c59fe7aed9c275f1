// BoardEngine construction, configuration and direct element/edge mutations.

#include "board/board_engine.h"
#include "board/core/logging.h"
#include "board/geometry/geometry.h"

#include <algorithm>

BoardEngine::BoardEngine() : BoardEngine(BoardConfig{}) {}

BoardEngine::BoardEngine(const BoardConfig& config)
    : config_(config),
      edges_(),
      store_(edges_, config_, diagnostics_),
      history_(store_, edges_, config_.history, diagnostics_),
      snap_(store_, config_.snap),
      router_(store_, config_.router, diagnostics_),
      eraser_(store_),
      culler_(config_.cull),
      session_(*this, store_, edges_, history_, snap_, router_, eraser_)
{
    store_.setObserver(&history_);
    edges_.setObserver(&history_);
}

void BoardEngine::setConfig(const BoardConfig& config) {
    config_ = config;
    store_.index().setOptions(config_.index);
    store_.index().markAllDirty();
    history_.setOptions(config_.history);
    snap_.setOptions(config_.snap);
    router_.setOptions(config_.router);
    culler_.setOptions(config_.cull);
    edges_.markAllDirty();
    invalidateFrame();
}

void BoardEngine::clear() noexcept {
    session_.reset();
    history_.clear();
    store_.clear();
    edges_.clear();
    selection_.clear();
    selectionRevision_++;
    nextId_ = 1;
    diagnostics_ = BoardDiagnostics{};
    lastFrame_ = FrameResult{};
    invalidateFrame();
    clearError();
}

std::uint32_t BoardEngine::allocateId() {
    return nextId_++;
}

void BoardEngine::trackNextId(std::uint32_t id) {
    if (id >= nextId_) nextId_ = id + 1;
}

bool BoardEngine::beginEdit() {
    if (history_.isGestureActive()) return false;
    return history_.beginGesture(ToolKind::Edit, nextId_);
}

void BoardEngine::endEdit(bool owned, const char* label) {
    if (!owned) return;
    history_.commitGesture(label, nextId_);
}

// ==============================================================================
// Elements
// ==============================================================================

std::uint32_t BoardEngine::addElement(const Element& element) {
    clearError();
    Element el = element;
    if (el.id != 0 && (store_.has(el.id) || edges_.has(el.id))) {
        setError(BoardError::InvalidOperation);
        return 0;
    }

    const bool owned = beginEdit();
    if (el.id == 0) el.id = allocateId();
    const bool ok = store_.add(el);
    if (ok) trackNextId(el.id);
    endEdit(owned, "Add element");

    if (!ok) {
        setError(el.parentId != 0 ? BoardError::UnknownElement : BoardError::InvalidOperation);
        return 0;
    }
    return el.id;
}

bool BoardEngine::updateElement(std::uint32_t id, const ElementPatch& patch) {
    clearError();
    if (!store_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.update(id, patch);
    endEdit(owned, "Edit element");
    return ok;
}

bool BoardEngine::removeElement(std::uint32_t id) {
    clearError();
    if (!store_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.remove(id);
    endEdit(owned, "Delete element");
    pruneSelection();
    return ok;
}

bool BoardEngine::bringToFront(std::uint32_t id) {
    clearError();
    if (!store_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.bringToFront(id);
    endEdit(owned, "Bring to front");
    return ok;
}

bool BoardEngine::sendToBack(std::uint32_t id) {
    clearError();
    if (!store_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.sendToBack(id);
    endEdit(owned, "Send to back");
    return ok;
}

bool BoardEngine::attachToSection(std::uint32_t id, std::uint32_t sectionId) {
    clearError();
    if (!store_.has(id) || !store_.has(sectionId)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.attachToSection(id, sectionId);
    endEdit(owned, "Add to section");
    if (!ok) setError(BoardError::InvalidOperation);
    return ok;
}

bool BoardEngine::detachFromSection(std::uint32_t id) {
    clearError();
    if (!store_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = store_.detachFromSection(id);
    endEdit(owned, "Remove from section");
    return ok;
}

// ==============================================================================
// Edges
// ==============================================================================

bool BoardEngine::validEndpoint(const EdgeEndpoint& endpoint) const {
    if (endpoint.elementId != 0) return store_.has(endpoint.elementId);
    return board::isFiniteNumber(endpoint.x) && board::isFiniteNumber(endpoint.y);
}

std::uint32_t BoardEngine::addEdge(const EdgeEndpoint& source, const EdgeEndpoint& target, EdgeRouting routing) {
    clearError();
    if (!validEndpoint(source) || !validEndpoint(target)) {
        setError(BoardError::UnknownElement);
        return 0;
    }

    const bool owned = beginEdit();
    Edge edge;
    edge.id = allocateId();
    edge.source = source;
    edge.target = target;
    edge.routing = routing;
    const bool ok = edges_.add(edge);
    endEdit(owned, "Connect");
    if (!ok) {
        setError(BoardError::InvalidOperation);
        return 0;
    }
    return edge.id;
}

bool BoardEngine::removeEdge(std::uint32_t id) {
    clearError();
    if (!edges_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = edges_.remove(id);
    endEdit(owned, "Delete connector");
    return ok;
}

bool BoardEngine::setEdgeRouting(std::uint32_t id, EdgeRouting routing) {
    clearError();
    if (!edges_.has(id)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = edges_.setRouting(id, routing);
    endEdit(owned, "Change routing");
    return ok;
}

bool BoardEngine::reconnectEdge(std::uint32_t id, EdgeEnd end, const EdgeEndpoint& endpoint) {
    clearError();
    if (!edges_.has(id) || !validEndpoint(endpoint)) {
        setError(BoardError::UnknownElement);
        return false;
    }
    const bool owned = beginEdit();
    const bool ok = edges_.setEndpoint(id, end, endpoint);
    endEdit(owned, "Reconnect");
    return ok;
}

std::size_t BoardEngine::reflowEdges() {
    return router_.reflowDirty(edges_);
}

// ==============================================================================
// Selection
// ==============================================================================

void BoardEngine::setSelection(const std::vector<std::uint32_t>& ids) {
    selection_.clear();
    for (std::uint32_t id : ids) {
        if (store_.has(id)) selection_.insert(id);
    }
    selectionRevision_++;
}

std::vector<std::uint32_t> BoardEngine::getSelection() const {
    std::vector<std::uint32_t> out(selection_.begin(), selection_.end());
    std::sort(out.begin(), out.end());
    return out;
}

void BoardEngine::clearSelection() {
    if (selection_.empty()) return;
    selection_.clear();
    selectionRevision_++;
}

void BoardEngine::pruneSelection() {
    bool changed = false;
    for (auto it = selection_.begin(); it != selection_.end();) {
        if (!store_.has(*it)) {
            it = selection_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    if (changed) selectionRevision_++;
}
