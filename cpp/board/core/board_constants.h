#pragma once

/**
 * @file board_constants.h
 * @brief Default tunables for the scene engine.
 *
 * Screen-space values are in pixels and are converted to world units by dividing
 * by the current view scale. World-space values are in document units.
 */

namespace board_constants {

// =============================================================================
// Geometry
// =============================================================================

/// Smallest width/height/radius an element may have (world units)
constexpr float MIN_ELEMENT_SIZE = 1.0f;

// =============================================================================
// Snapping (screen pixels unless noted)
// =============================================================================

/// Grid cell size (world units)
constexpr float SNAP_GRID_SIZE = 20.0f;

/// Capture distance for every snap candidate
constexpr float SNAP_TOLERANCE_PX = 10.0f;

/// Radius that keeps the cursor stuck to the current snap target
constexpr float SNAP_HYSTERESIS_PX = 5.0f;

/// Candidate weights, distance is divided by the weight when ranking
constexpr float SNAP_GRID_STRENGTH = 1.0f;
constexpr float SNAP_ANCHOR_STRENGTH = 1.5f;
constexpr float SNAP_GUIDE_STRENGTH = 1.25f;
constexpr float SNAP_MAGNETIC_STRENGTH = 3.0f;

/// Two element edges closer than this share an alignment guide (world units)
constexpr float SNAP_GUIDE_EPSILON = 0.5f;

// =============================================================================
// Viewport culling
// =============================================================================

/// Margin added around the viewport to avoid pop-in
constexpr float CULL_BUFFER_PX = 100.0f;

/// Level-of-detail thresholds on view scale
constexpr float LOD_FULL_SCALE = 1.5f;
constexpr float LOD_SIMPLIFIED_SCALE = 0.5f;
constexpr float LOD_PLACEHOLDER_SCALE = 0.1f;

// =============================================================================
// Connector routing (world units)
// =============================================================================

/// Distance an orthogonal route leaves a port along its outward normal
constexpr float ROUTE_CLEARANCE = 8.0f;

/// Segments shorter than this are collapsed
constexpr float ROUTE_MIN_SEGMENT = 1.0f;

/// Control point offset of curved routes, relative to the chord length
constexpr float ROUTE_CURVATURE = 0.25f;

/// Number of segments a curved route is flattened into
constexpr unsigned ROUTE_CURVE_SEGMENTS = 16;

/// Lattice step of the obstacle-aware search
constexpr float ROUTE_GRID_STEP = 10.0f;

/// Obstacles are inflated by this much before searching
constexpr float ROUTE_OBSTACLE_PADDING = 8.0f;

/// Expanded-node budget before the search falls back to the plain route
constexpr unsigned ROUTE_SEARCH_NODE_BUDGET = 20000;

/// Capture distance when attaching connector endpoints to ports (screen pixels)
constexpr float PORT_CAPTURE_PX = 16.0f;

// =============================================================================
// Eraser / history / index
// =============================================================================

/// Default eraser radius (world units)
constexpr float ERASER_RADIUS = 15.0f;

/// Undo entries kept before the oldest is dropped
constexpr unsigned HISTORY_CAPACITY = 50;

/// Quadtree node split threshold and depth limit
constexpr unsigned INDEX_MAX_ELEMENTS_PER_NODE = 10;
constexpr unsigned INDEX_MAX_DEPTH = 8;

/// Half extent of the root square when the document is empty (world units)
constexpr float INDEX_DEFAULT_WORLD_EXTENT = 5000.0f;

// =============================================================================
// Drafts
// =============================================================================

/// Drags shorter than this count as a click (world units)
constexpr float DRAFT_CLICK_DISTANCE = 2.0f;

/// Pen samples closer than this to the previous one are dropped (world units)
constexpr float DRAFT_PEN_MIN_STEP = 0.5f;

/// Sizes used when a box tool is clicked instead of dragged
constexpr float DRAFT_TEXT_WIDTH = 200.0f;
constexpr float DRAFT_TEXT_HEIGHT = 50.0f;
constexpr float DRAFT_STICKY_SIZE_W = 200.0f;
constexpr float DRAFT_STICKY_SIZE_H = 150.0f;
constexpr float DRAFT_IMAGE_WIDTH = 200.0f;
constexpr float DRAFT_IMAGE_HEIGHT = 150.0f;
constexpr float DRAFT_SECTION_WIDTH = 400.0f;
constexpr float DRAFT_SECTION_HEIGHT = 300.0f;
constexpr float DRAFT_TABLE_WIDTH = 300.0f;
constexpr float DRAFT_TABLE_HEIGHT = 120.0f;
constexpr unsigned DRAFT_TABLE_ROWS = 3;
constexpr unsigned DRAFT_TABLE_COLS = 3;

} // namespace board_constants
