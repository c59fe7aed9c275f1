#pragma once

#include <cstdint>

enum class TransformMode : std::uint8_t {
    Move = 0,
    ScaleRotate = 1,
};

enum class DraftResultKind : std::uint8_t {
    None = 0,
    Element = 1,
    Edge = 2,
};

// What a committed draft produced.
struct DraftCommit {
    DraftResultKind kind{DraftResultKind::None};
    std::uint32_t id{0};
};
