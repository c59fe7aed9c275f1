#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"
#include "board/entity/mutation_observer.h"
#include "board/history/history_types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class ElementStore;
class EdgeStore;

// Undo/redo stack driven by an explicit gesture state machine:
//   Idle -> Active(tool) -> Committed | Cancelled -> Idle
// While Active, every store mutation reports the touched record so its prior state is
// captured once. Only a commit produces an entry; a cancel restores the captured state.
class HistoryManager : public MutationObserver {
public:
    HistoryManager(ElementStore& store, EdgeStore& edges, const HistoryOptions& options, BoardDiagnostics& diagnostics);

    void setOptions(const HistoryOptions& options);

    GestureState state() const noexcept { return state_; }
    bool isGestureActive() const noexcept { return state_ == GestureState::Active; }
    ToolKind activeTool() const noexcept { return transaction_.tool; }

    bool beginGesture(ToolKind tool, std::uint32_t nextId);
    // Returns true when an entry was recorded. A gesture that changed nothing leaves
    // the stack untouched.
    bool commitGesture(const std::string& label, std::uint32_t nextId);
    // Puts every touched record back to its pre-gesture state.
    bool cancelGesture();

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Replays the entry backward/forward. `nextIdOut` receives the id counter to restore.
    bool undo(std::uint32_t& nextIdOut);
    bool redo(std::uint32_t& nextIdOut);

    void clear();

    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }
    const std::string& undoLabel() const;
    const std::string& redoLabel() const;

    // Ids touched by the most recent replay, for edge reflow.
    const std::vector<std::uint32_t>& lastTouchedElements() const { return lastTouchedElements_; }

    // MutationObserver
    void beforeElementChange(const ElementStore& store, std::uint32_t id) override;
    void beforeEdgeChange(const EdgeStore& store, std::uint32_t id) override;

private:
    friend class BoardEngineTestAccessor;

    bool transition(GestureState next);
    void finalizeEntry(HistoryEntry& entry, std::uint32_t nextId);
    void pushEntry(HistoryEntry&& entry);
    void applyEntry(const HistoryEntry& entry, bool useAfter);
    void resetTransaction();

    ElementStore& store_;
    EdgeStore& edges_;
    HistoryOptions options_;
    BoardDiagnostics& diagnostics_;

    GestureState state_ = GestureState::Idle;
    GestureTransaction transaction_;
    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    std::uint32_t generation_ = 0;
    std::vector<std::uint32_t> lastTouchedElements_;
};
