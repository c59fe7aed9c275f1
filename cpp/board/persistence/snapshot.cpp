#include "board/persistence/snapshot.h"
#include "board/core/util.h"
#include "board/persistence/snapshot_internal.h"

#include <string>
#include <unordered_map>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::size_t size{0};
};

bool readString(const SectionView& sec, std::size_t& o, std::string& out) {
    using board::snapshot::detail::requireBytes;
    if (!requireBytes(o, 4, sec.size)) return false;
    const std::uint32_t len = readU32(sec.data, o); o += 4;
    if (!requireBytes(o, len, sec.size)) return false;
    out.assign(reinterpret_cast<const char*>(sec.data + o), len);
    o += len;
    return true;
}

bool readPoints(const SectionView& sec, std::size_t& o, std::vector<Point2>& out) {
    using namespace board::snapshot::detail;
    if (!requireBytes(o, 4, sec.size)) return false;
    const std::uint32_t count = readU32(sec.data, o); o += 4;
    std::size_t bytes = 0;
    if (!tryMul(count, pointSnapshotBytes, bytes)) return false;
    if (!requireBytes(o, bytes, sec.size)) return false;
    out.clear();
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        Point2 p{};
        p.x = readF32(sec.data, o); o += 4;
        p.y = readF32(sec.data, o); o += 4;
        out.push_back(p);
    }
    return true;
}

bool readEndpoint(const SectionView& sec, std::size_t& o, EdgeEndpoint& out) {
    out.elementId = readU32(sec.data, o); o += 4;
    const std::uint32_t port = readU32(sec.data, o); o += 4;
    out.x = readF32(sec.data, o); o += 4;
    out.y = readF32(sec.data, o); o += 4;
    if (port > static_cast<std::uint32_t>(PortKind::Center)) return false;
    out.port = static_cast<PortKind>(port);
    return true;
}

} // namespace

namespace board {
using namespace snapshot::detail;

BoardError parseSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytesBsnp) {
        return BoardError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicBsnp) return BoardError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionBsnp) return BoardError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t headerBytes = snapshotHeaderBytesBsnp;
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return BoardError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(headerBytes, tableBytes, headerPlusTable)) {
        return BoardError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return BoardError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return BoardError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return BoardError::InvalidPayloadSize;
        if (end > byteCount) return BoardError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        const std::uint32_t actualCrc = crc32(payload, size);
        if (actualCrc != expectedCrc) return BoardError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* elem = findSection(TAG_ELEM);
    const SectionView* edge = findSection(TAG_EDGE);
    const SectionView* nidx = findSection(TAG_NIDX);
    if (!elem || !edge || !nidx) {
        return BoardError::InvalidPayloadSize;
    }

    // ELEM
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, elem->size)) return BoardError::BufferTruncated;
        const std::uint32_t count = readU32(elem->data, o); o += 4;

        out.elements.clear();
        for (std::uint32_t i = 0; i < count; ++i) {
            if (!requireBytes(o, elementSnapshotBytes, elem->size)) return BoardError::BufferTruncated;
            Element el{};
            el.id = readU32(elem->data, o); o += 4;
            const std::uint32_t kind = readU32(elem->data, o); o += 4;
            if (kind >= kElementKindCount) return BoardError::InvalidPayloadSize;
            el.kind = static_cast<ElementKind>(kind);
            el.parentId = readU32(elem->data, o); o += 4;
            el.flags = readU32(elem->data, o); o += 4;
            el.z = static_cast<std::int32_t>(readU32(elem->data, o)); o += 4;
            el.x = readF32(elem->data, o); o += 4;
            el.y = readF32(elem->data, o); o += 4;
            el.w = readF32(elem->data, o); o += 4;
            el.h = readF32(elem->data, o); o += 4;
            el.rx = readF32(elem->data, o); o += 4;
            el.ry = readF32(elem->data, o); o += 4;
            el.rot = readF32(elem->data, o); o += 4;
            el.sx = readF32(elem->data, o); o += 4;
            el.sy = readF32(elem->data, o); o += 4;
            el.fillRGBA = readU32(elem->data, o); o += 4;
            el.strokeRGBA = readU32(elem->data, o); o += 4;
            el.strokeWidth = readF32(elem->data, o); o += 4;
            el.fontSize = readF32(elem->data, o); o += 4;
            el.rows = readU32(elem->data, o); o += 4;
            el.cols = readU32(elem->data, o); o += 4;
            el.createdAt = readF64(elem->data, o); o += 8;
            el.updatedAt = readF64(elem->data, o); o += 8;

            if (!readPoints(*elem, o, el.points)) return BoardError::BufferTruncated;
            if (!readString(*elem, o, el.text)) return BoardError::BufferTruncated;
            if (!readString(*elem, o, el.source)) return BoardError::BufferTruncated;

            if (!requireBytes(o, 4, elem->size)) return BoardError::BufferTruncated;
            const std::uint32_t cellCount = readU32(elem->data, o); o += 4;
            // Each cell carries at least its length prefix.
            std::size_t minCellBytes = 0;
            if (!tryMul(cellCount, 4, minCellBytes) || !requireBytes(o, minCellBytes, elem->size)) {
                return BoardError::BufferTruncated;
            }
            el.cells.resize(cellCount);
            for (std::uint32_t c = 0; c < cellCount; ++c) {
                if (!readString(*elem, o, el.cells[c])) return BoardError::BufferTruncated;
            }
            out.elements.push_back(std::move(el));
        }
    }

    // EDGE
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, edge->size)) return BoardError::BufferTruncated;
        const std::uint32_t count = readU32(edge->data, o); o += 4;

        out.edges.clear();
        for (std::uint32_t i = 0; i < count; ++i) {
            if (!requireBytes(o, edgeSnapshotBytes, edge->size)) return BoardError::BufferTruncated;
            Edge e{};
            e.id = readU32(edge->data, o); o += 4;
            const std::uint32_t routing = readU32(edge->data, o); o += 4;
            if (routing > static_cast<std::uint32_t>(EdgeRouting::ObstacleAware)) return BoardError::InvalidPayloadSize;
            e.routing = static_cast<EdgeRouting>(routing);
            if (!readEndpoint(*edge, o, e.source)) return BoardError::InvalidPayloadSize;
            if (!readEndpoint(*edge, o, e.target)) return BoardError::InvalidPayloadSize;
            if (!readPoints(*edge, o, e.points)) return BoardError::BufferTruncated;
            e.stale = true;
            out.edges.push_back(std::move(e));
        }
    }

    // NIDX
    {
        if (!requireBytes(0, 4, nidx->size)) return BoardError::BufferTruncated;
        out.nextId = readU32(nidx->data, 0);
    }

    return BoardError::Ok;
}

} // namespace board
