#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// One undoable step: the before/after state of every record a committed gesture touched.
struct HistoryEntry {
    std::string label;
    ToolKind tool = ToolKind::Edit;

    struct ElementChange {
        std::uint32_t id;
        bool existedBefore;
        bool existedAfter;
        Element before;
        Element after;
    };
    std::vector<ElementChange> elements;

    struct EdgeChange {
        std::uint32_t id;
        bool existedBefore;
        bool existedAfter;
        Edge before;
        Edge after;
    };
    std::vector<EdgeChange> edges;

    std::uint32_t nextIdBefore = 1;
    std::uint32_t nextIdAfter = 1;
};

// Open gesture: the entry under construction plus lookup tables for first-touch capture.
struct GestureTransaction {
    ToolKind tool = ToolKind::Edit;
    HistoryEntry entry;
    std::unordered_map<std::uint32_t, std::size_t> elementIndex;
    std::unordered_map<std::uint32_t, std::size_t> edgeIndex;
};
