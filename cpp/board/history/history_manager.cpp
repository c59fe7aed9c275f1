#include "board/history/history_manager.h"
#include "board/core/logging.h"
#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"

#include <algorithm>

namespace {

const std::string kEmptyLabel;

bool sameElementState(const Element& a, const Element& b) {
    // Timestamps are bookkeeping and do not make two states different.
    return a.kind == b.kind
        && a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h
        && a.rx == b.rx && a.ry == b.ry && a.rot == b.rot
        && a.sx == b.sx && a.sy == b.sy
        && a.z == b.z && a.parentId == b.parentId && a.flags == b.flags
        && a.fillRGBA == b.fillRGBA && a.strokeRGBA == b.strokeRGBA && a.strokeWidth == b.strokeWidth
        && a.text == b.text && a.source == b.source && a.fontSize == b.fontSize
        && a.rows == b.rows && a.cols == b.cols && a.cells == b.cells
        && a.points.size() == b.points.size()
        && std::equal(a.points.begin(), a.points.end(), b.points.begin(), [](const Point2& p, const Point2& q) {
               return p.x == q.x && p.y == q.y;
           });
}

bool sameEndpoint(const EdgeEndpoint& a, const EdgeEndpoint& b) {
    if (a.elementId != b.elementId) return false;
    if (a.elementId != 0) return a.port == b.port;
    return a.x == b.x && a.y == b.y;
}

bool sameEdgeState(const Edge& a, const Edge& b) {
    return a.routing == b.routing && sameEndpoint(a.source, b.source) && sameEndpoint(a.target, b.target);
}

} // namespace

HistoryManager::HistoryManager(ElementStore& store, EdgeStore& edges, const HistoryOptions& options, BoardDiagnostics& diagnostics)
    : store_(store), edges_(edges), options_(options), diagnostics_(diagnostics) {}

void HistoryManager::setOptions(const HistoryOptions& options) {
    options_ = options;
    const std::size_t capacity = std::max<std::size_t>(1, options_.capacity);
    while (history_.size() > capacity) {
        history_.erase(history_.begin());
        if (cursor_ > 0) cursor_--;
        diagnostics_.historyEntriesDropped++;
    }
}

bool HistoryManager::transition(GestureState next) {
    bool allowed = false;
    switch (state_) {
        case GestureState::Idle:
            allowed = next == GestureState::Active;
            break;
        case GestureState::Active:
            allowed = next == GestureState::Committed || next == GestureState::Cancelled;
            break;
        case GestureState::Committed:
        case GestureState::Cancelled:
            allowed = next == GestureState::Idle;
            break;
    }
    if (!allowed) {
        BOARD_LOG_WARN("history: invalid gesture transition %u -> %u",
            static_cast<unsigned>(state_), static_cast<unsigned>(next));
        return false;
    }
    state_ = next;
    return true;
}

void HistoryManager::resetTransaction() {
    transaction_.tool = ToolKind::Edit;
    transaction_.entry = HistoryEntry{};
    transaction_.elementIndex.clear();
    transaction_.edgeIndex.clear();
}

bool HistoryManager::beginGesture(ToolKind tool, std::uint32_t nextId) {
    if (!transition(GestureState::Active)) return false;
    resetTransaction();
    transaction_.tool = tool;
    transaction_.entry.tool = tool;
    transaction_.entry.nextIdBefore = nextId;
    transaction_.entry.nextIdAfter = nextId;
    return true;
}

void HistoryManager::beforeElementChange(const ElementStore& store, std::uint32_t id) {
    if (state_ != GestureState::Active) return;
    auto& entry = transaction_.entry;
    auto [it, inserted] = transaction_.elementIndex.emplace(id, entry.elements.size());
    (void)it;
    if (!inserted) return;

    HistoryEntry::ElementChange change{};
    change.id = id;
    const Element* current = store.get(id);
    change.existedBefore = current != nullptr;
    if (current) change.before = *current;
    entry.elements.push_back(std::move(change));
}

void HistoryManager::beforeEdgeChange(const EdgeStore& store, std::uint32_t id) {
    if (state_ != GestureState::Active) return;
    auto& entry = transaction_.entry;
    auto [it, inserted] = transaction_.edgeIndex.emplace(id, entry.edges.size());
    (void)it;
    if (!inserted) return;

    HistoryEntry::EdgeChange change{};
    change.id = id;
    const Edge* current = store.get(id);
    change.existedBefore = current != nullptr;
    if (current) change.before = *current;
    entry.edges.push_back(std::move(change));
}

void HistoryManager::finalizeEntry(HistoryEntry& entry, std::uint32_t nextId) {
    entry.nextIdAfter = nextId;
    for (auto& change : entry.elements) {
        const Element* current = store_.get(change.id);
        change.existedAfter = current != nullptr;
        if (current) change.after = *current;
    }
    for (auto& change : entry.edges) {
        const Edge* current = edges_.get(change.id);
        change.existedAfter = current != nullptr;
        if (current) change.after = *current;
    }

    // Drop records that ended where they started (including drafts created and removed
    // within the same gesture).
    entry.elements.erase(
        std::remove_if(entry.elements.begin(), entry.elements.end(), [](const HistoryEntry::ElementChange& c) {
            if (c.existedBefore != c.existedAfter) return false;
            if (!c.existedBefore) return true;
            return sameElementState(c.before, c.after);
        }),
        entry.elements.end());
    entry.edges.erase(
        std::remove_if(entry.edges.begin(), entry.edges.end(), [](const HistoryEntry::EdgeChange& c) {
            if (c.existedBefore != c.existedAfter) return false;
            if (!c.existedBefore) return true;
            return sameEdgeState(c.before, c.after);
        }),
        entry.edges.end());
}

void HistoryManager::pushEntry(HistoryEntry&& entry) {
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(entry));
    const std::size_t capacity = std::max<std::size_t>(1, options_.capacity);
    while (history_.size() > capacity) {
        history_.erase(history_.begin());
        diagnostics_.historyEntriesDropped++;
        BOARD_LOG_DEBUG("history: capacity %zu reached, oldest entry dropped", capacity);
    }
    cursor_ = history_.size();
    generation_++;
}

bool HistoryManager::commitGesture(const std::string& label, std::uint32_t nextId) {
    if (!transition(GestureState::Committed)) return false;
    HistoryEntry entry = std::move(transaction_.entry);
    entry.label = label;
    resetTransaction();
    finalizeEntry(entry, nextId);

    const bool empty = entry.elements.empty() && entry.edges.empty();
    if (!empty) pushEntry(std::move(entry));
    transition(GestureState::Idle);
    return !empty;
}

bool HistoryManager::cancelGesture() {
    if (!transition(GestureState::Cancelled)) return false;
    HistoryEntry entry = std::move(transaction_.entry);
    resetTransaction();
    // Only the "before" half was captured; replaying it backward restores everything.
    applyEntry(entry, false);
    transition(GestureState::Idle);
    return true;
}

bool HistoryManager::canUndo() const noexcept {
    return state_ == GestureState::Idle && cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return state_ == GestureState::Idle && cursor_ < history_.size();
}

bool HistoryManager::undo(std::uint32_t& nextIdOut) {
    if (!canUndo()) return false;
    cursor_--;
    const HistoryEntry& entry = history_[cursor_];
    applyEntry(entry, false);
    nextIdOut = entry.nextIdBefore;
    generation_++;
    return true;
}

bool HistoryManager::redo(std::uint32_t& nextIdOut) {
    if (!canRedo()) return false;
    const HistoryEntry& entry = history_[cursor_];
    applyEntry(entry, true);
    nextIdOut = entry.nextIdAfter;
    cursor_++;
    generation_++;
    return true;
}

void HistoryManager::applyEntry(const HistoryEntry& entry, bool useAfter) {
    lastTouchedElements_.clear();
    for (const auto& change : entry.elements) {
        const bool exists = useAfter ? change.existedAfter : change.existedBefore;
        const Element& state = useAfter ? change.after : change.before;
        store_.restore(change.id, exists ? &state : nullptr);
        lastTouchedElements_.push_back(change.id);
    }
    for (const auto& change : entry.edges) {
        const bool exists = useAfter ? change.existedAfter : change.existedBefore;
        const Edge& state = useAfter ? change.after : change.before;
        edges_.restore(change.id, exists ? &state : nullptr);
    }
    store_.index().markAllDirty();
}

void HistoryManager::clear() {
    if (state_ == GestureState::Active) {
        transition(GestureState::Cancelled);
        transition(GestureState::Idle);
    }
    state_ = GestureState::Idle;
    resetTransaction();
    history_.clear();
    cursor_ = 0;
    generation_++;
}

const std::string& HistoryManager::undoLabel() const {
    return cursor_ > 0 ? history_[cursor_ - 1].label : kEmptyLabel;
}

const std::string& HistoryManager::redoLabel() const {
    return cursor_ < history_.size() ? history_[cursor_].label : kEmptyLabel;
}
