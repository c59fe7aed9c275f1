#pragma once

#include "board/core/board_constants.h"

#include <cstddef>
#include <cstdint>

struct SnapOptions {
    bool enabled{true};
    bool gridEnabled{true};
    bool anchorsEnabled{true};
    bool guidesEnabled{true};
    float gridSize{board_constants::SNAP_GRID_SIZE};
    float tolerancePx{board_constants::SNAP_TOLERANCE_PX};
    float hysteresisPx{board_constants::SNAP_HYSTERESIS_PX};
    float gridStrength{board_constants::SNAP_GRID_STRENGTH};
    float anchorStrength{board_constants::SNAP_ANCHOR_STRENGTH};
    float guideStrength{board_constants::SNAP_GUIDE_STRENGTH};
    float magneticStrength{board_constants::SNAP_MAGNETIC_STRENGTH};
};

struct CullOptions {
    float bufferPx{board_constants::CULL_BUFFER_PX};
    float fullScale{board_constants::LOD_FULL_SCALE};
    float simplifiedScale{board_constants::LOD_SIMPLIFIED_SCALE};
    float placeholderScale{board_constants::LOD_PLACEHOLDER_SCALE};
};

struct RouterOptions {
    float clearance{board_constants::ROUTE_CLEARANCE};
    float minSegmentLength{board_constants::ROUTE_MIN_SEGMENT};
    float curvature{board_constants::ROUTE_CURVATURE};
    std::uint32_t curveSegments{board_constants::ROUTE_CURVE_SEGMENTS};
    float obstacleGridStep{board_constants::ROUTE_GRID_STEP};
    float obstaclePadding{board_constants::ROUTE_OBSTACLE_PADDING};
    std::uint32_t searchNodeBudget{board_constants::ROUTE_SEARCH_NODE_BUDGET};
    float portCapturePx{board_constants::PORT_CAPTURE_PX};
    // When false, removing an element detaches its connectors to free endpoints.
    bool removeOrphanedEdges{false};
};

struct HistoryOptions {
    std::size_t capacity{board_constants::HISTORY_CAPACITY};
};

struct IndexOptions {
    std::uint32_t maxElementsPerNode{board_constants::INDEX_MAX_ELEMENTS_PER_NODE};
    std::uint32_t maxDepth{board_constants::INDEX_MAX_DEPTH};
    float defaultWorldExtent{board_constants::INDEX_DEFAULT_WORLD_EXTENT};
};

struct EraserOptions {
    float radius{board_constants::ERASER_RADIUS};
};

struct BoardConfig {
    SnapOptions snap;
    CullOptions cull;
    RouterOptions router;
    HistoryOptions history;
    IndexOptions index;
    EraserOptions eraser;
    float minElementSize{board_constants::MIN_ELEMENT_SIZE};
};
