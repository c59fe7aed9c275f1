#include "board/persistence/snapshot.h"
#include "board/core/util.h"
#include "board/persistence/snapshot_internal.h"

#include <algorithm>
#include <cstring>
#include <string>

namespace board {
using namespace snapshot::detail;

namespace {

struct ByteWriter {
    std::vector<std::uint8_t>& out;

    void u32(std::uint32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeU32LE(out.data(), o, v);
    }
    void f32(float v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeF32LE(out.data(), o, v);
    }
    void f64(double v) {
        const std::size_t o = out.size();
        out.resize(o + 8);
        writeF64LE(out.data(), o, v);
    }
    void str(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }
    void points(const std::vector<Point2>& pts) {
        u32(static_cast<std::uint32_t>(pts.size()));
        for (const Point2& p : pts) {
            f32(p.x);
            f32(p.y);
        }
    }
    void endpoint(const EdgeEndpoint& ep) {
        u32(ep.elementId);
        u32(static_cast<std::uint32_t>(ep.port));
        f32(ep.x);
        f32(ep.y);
    }
};

} // namespace

std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data) {
    const std::uint32_t version = snapshotVersionBsnp;

    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(3);

    // ELEM
    {
        std::vector<const Element*> sorted;
        sorted.reserve(data.elements.size());
        for (const Element& el : data.elements) sorted.push_back(&el);
        std::sort(sorted.begin(), sorted.end(), [](const Element* a, const Element* b) { return a->id < b->id; });

        SectionBytes sec{TAG_ELEM, {}};
        ByteWriter w{sec.bytes};
        w.u32(static_cast<std::uint32_t>(sorted.size()));
        for (const Element* el : sorted) {
            w.u32(el->id);
            w.u32(static_cast<std::uint32_t>(el->kind));
            w.u32(el->parentId);
            w.u32(el->flags);
            w.u32(static_cast<std::uint32_t>(el->z));
            w.f32(el->x);
            w.f32(el->y);
            w.f32(el->w);
            w.f32(el->h);
            w.f32(el->rx);
            w.f32(el->ry);
            w.f32(el->rot);
            w.f32(el->sx);
            w.f32(el->sy);
            w.u32(el->fillRGBA);
            w.u32(el->strokeRGBA);
            w.f32(el->strokeWidth);
            w.f32(el->fontSize);
            w.u32(el->rows);
            w.u32(el->cols);
            w.f64(el->createdAt);
            w.f64(el->updatedAt);
            w.points(el->points);
            w.str(el->text);
            w.str(el->source);
            w.u32(static_cast<std::uint32_t>(el->cells.size()));
            for (const std::string& cell : el->cells) w.str(cell);
        }
        sections.push_back(std::move(sec));
    }

    // EDGE
    {
        std::vector<const Edge*> sorted;
        sorted.reserve(data.edges.size());
        for (const Edge& e : data.edges) sorted.push_back(&e);
        std::sort(sorted.begin(), sorted.end(), [](const Edge* a, const Edge* b) { return a->id < b->id; });

        SectionBytes sec{TAG_EDGE, {}};
        ByteWriter w{sec.bytes};
        w.u32(static_cast<std::uint32_t>(sorted.size()));
        for (const Edge* e : sorted) {
            w.u32(e->id);
            w.u32(static_cast<std::uint32_t>(e->routing));
            w.endpoint(e->source);
            w.endpoint(e->target);
            w.points(e->points);
        }
        sections.push_back(std::move(sec));
    }

    // NIDX
    {
        SectionBytes sec{TAG_NIDX, {}};
        sec.bytes.resize(4);
        writeU32LE(sec.bytes.data(), 0, data.nextId);
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = snapshotHeaderBytesBsnp;
    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();
    const std::size_t totalBytes = headerBytes + tableBytes + payloadBytes;

    std::vector<std::uint8_t> out;
    out.resize(totalBytes);

    writeU32LE(out.data(), 0, snapshotMagicBsnp);
    writeU32LE(out.data(), 4, version);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = headerBytes;
    std::size_t dataOffset = headerBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        tableOffset += snapshotSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }

    return out;
}

} // namespace board
