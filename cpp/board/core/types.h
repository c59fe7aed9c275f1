#ifndef BOARD_ENGINE_TYPES_H
#define BOARD_ENGINE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Core value types shared by every module of the scene engine.

struct Point2 { float x; float y; };

struct AABB {
    float minX, minY, maxX, maxY;
};

// Closed set of element kinds. Every switch over ElementKind is written without
// a default label so that adding a kind fails the build (-Werror=switch).
enum class ElementKind : std::uint8_t {
    Rectangle = 0,
    Ellipse = 1,
    Text = 2,
    StickyNote = 3,
    Table = 4,
    Image = 5,
    Section = 6,
    Stroke = 7,
};

static constexpr std::uint32_t kElementKindCount = 8;

enum class ElementFlags : std::uint32_t {
    Locked = 1 << 0,
    Hidden = 1 << 1,
    Magnetic = 1 << 2,
};

inline bool hasFlag(std::uint32_t flags, ElementFlags flag) {
    return (flags & static_cast<std::uint32_t>(flag)) != 0;
}

enum class PortKind : std::uint8_t {
    N = 0,
    S = 1,
    E = 2,
    W = 3,
    Center = 4,
};

enum class EdgeRouting : std::uint8_t {
    Straight = 0,
    Orthogonal = 1,
    Curved = 2,
    ObstacleAware = 3,
};

enum class BoardError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownElement = 5,
    InvalidOperation = 6,
};

// Element record. Position semantics depend on kind:
//   box kinds (Rectangle, Text, StickyNote, Table, Image, Section): x/y is the top-left corner
//   Ellipse: x/y is the center, rx/ry the radii
//   Stroke: x/y is the origin the point list is relative to
// While parentId != 0 the position is relative to the parent section's top-left corner.
struct Element {
    std::uint32_t id{0};
    ElementKind kind{ElementKind::Rectangle};
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};
    float rx{0.0f};
    float ry{0.0f};
    float rot{0.0f};  // radians, about the element center
    float sx{1.0f};   // transient visual scale, identity once normalized
    float sy{1.0f};
    std::int32_t z{0};  // draw order, higher is in front
    std::uint32_t parentId{0};
    std::uint32_t flags{0};
    double createdAt{0.0};
    double updatedAt{0.0};

    std::uint32_t fillRGBA{0xFFFFFFFFu};
    std::uint32_t strokeRGBA{0x000000FFu};
    float strokeWidth{1.0f};

    std::vector<Point2> points;      // Stroke
    std::string text;                // Text, StickyNote, Section title
    std::string source;              // Image
    float fontSize{16.0f};           // Text, StickyNote
    std::uint32_t rows{0};           // Table
    std::uint32_t cols{0};           // Table
    std::vector<std::string> cells;  // Table, row-major
};

// Partial update. Unset fields are left untouched.
struct ElementPatch {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> w;
    std::optional<float> h;
    std::optional<float> rx;
    std::optional<float> ry;
    std::optional<float> rot;
    std::optional<float> sx;
    std::optional<float> sy;
    std::optional<std::uint32_t> flags;
    std::optional<std::uint32_t> fillRGBA;
    std::optional<std::uint32_t> strokeRGBA;
    std::optional<float> strokeWidth;
    std::optional<std::vector<Point2>> points;
    std::optional<std::string> text;
    std::optional<std::string> source;
    std::optional<float> fontSize;
    std::optional<std::uint32_t> rows;
    std::optional<std::uint32_t> cols;
    std::optional<std::vector<std::string>> cells;
};

// Connector endpoint. elementId == 0 marks a free endpoint located at (x, y).
// For attached endpoints (x, y) holds the last resolved world position.
struct EdgeEndpoint {
    std::uint32_t elementId{0};
    PortKind port{PortKind::Center};
    float x{0.0f};
    float y{0.0f};
};

// Both ends on the same port of the same element.
inline bool sameAttachment(const EdgeEndpoint& a, const EdgeEndpoint& b) {
    return a.elementId != 0 && a.elementId == b.elementId && a.port == b.port;
}

enum class EdgeEnd : std::uint8_t {
    Source = 0,
    Target = 1,
};

struct Edge {
    std::uint32_t id{0};
    EdgeEndpoint source;
    EdgeEndpoint target;
    EdgeRouting routing{EdgeRouting::Straight};
    std::vector<Point2> points;  // flattened route, valid while !stale
    bool stale{true};
};

struct Viewport {
    float x{0.0f};       // world-space top-left of the visible area
    float y{0.0f};
    float width{0.0f};   // world-space extent
    float height{0.0f};
    float scale{1.0f};   // zoom (screen px per world unit)
};

enum class LodLevel : std::uint8_t {
    Full = 0,
    Simplified = 1,
    Placeholder = 2,
    Hidden = 3,
};

enum class ToolKind : std::uint8_t {
    Edit = 0,        // direct API mutation
    Transform = 1,
    Rectangle = 2,
    Ellipse = 3,
    Text = 4,
    StickyNote = 5,
    Table = 6,
    Image = 7,
    Section = 8,
    Pen = 9,
    Connector = 10,
    Eraser = 11,
};

enum class GestureState : std::uint8_t {
    Idle = 0,
    Active = 1,
    Committed = 2,
    Cancelled = 3,
};

// Counters for the recoverable failures the engine absorbs instead of reporting.
struct BoardDiagnostics {
    std::uint32_t geometryClamped{0};
    std::uint32_t danglingEdgesSkipped{0};
    std::uint32_t indexRebuilds{0};
    std::uint32_t indexDesyncRecoveries{0};
    std::uint32_t routeFallbacks{0};
    std::uint32_t historyEntriesDropped{0};
};

#endif // BOARD_ENGINE_TYPES_H
