#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace board::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_ELEM = fourCC('E', 'L', 'E', 'M');
constexpr std::uint32_t TAG_EDGE = fourCC('E', 'D', 'G', 'E');
constexpr std::uint32_t TAG_NIDX = fourCC('N', 'I', 'D', 'X');

// Fixed-size prefix of each record; variable-length tails follow.
// Element: id, kind, parentId, flags, z, x, y, w, h, rx, ry, rot, sx, sy,
//          fill, stroke, strokeWidth, fontSize, rows, cols (4 bytes each), createdAt, updatedAt (f64)
constexpr std::size_t elementSnapshotBytes = 20 * 4 + 2 * 8;
// Edge: id, routing, then source and target as (elementId, port, x, y)
constexpr std::size_t edgeSnapshotBytes = 2 * 4 + 2 * 4 * 4;
constexpr std::size_t pointSnapshotBytes = 2 * 4;

inline const std::array<std::uint32_t, 256>& crc32Table() {
    static const std::array<std::uint32_t, 256> table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            t[i] = c;
        }
        return t;
    }();
    return table;
}

// CRC-32 (IEEE, reflected), as used by zlib and PNG.
inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    const std::array<std::uint32_t, 256>& table = crc32Table();
    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

} // namespace board::snapshot::detail
