#ifndef BOARD_ENGINE_SNAPSHOT_H
#define BOARD_ENGINE_SNAPSHOT_H

#include "board/core/types.h"
#include <cstdint>
#include <vector>

namespace board {

// Binary document layout (little endian):
//   header: magic 'BSNP', version, sectionCount, reserved
//   table:  sectionCount x (tag, offset, size, crc32)
//   payload sections: ELEM, EDGE, NIDX
constexpr std::uint32_t snapshotMagicBsnp = 0x504E5342; // "BSNP"
constexpr std::uint32_t snapshotVersionBsnp = 1;
constexpr std::size_t snapshotHeaderBytesBsnp = 16;
constexpr std::size_t snapshotSectionEntryBytes = 16;

struct SnapshotData {
    std::vector<Element> elements;
    std::vector<Edge> edges;
    std::uint32_t nextId = 1;
    std::uint32_t version = snapshotVersionBsnp;
};

// Elements and edges are written in ascending id order; cached route points are kept
// so a loaded document can render before its first reflow.
std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data);

BoardError parseSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out);

} // namespace board

#endif // BOARD_ENGINE_SNAPSHOT_H
