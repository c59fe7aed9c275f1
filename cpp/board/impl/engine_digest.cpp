// engine_digest.cpp - Document digest computation for BoardEngine

#include "board/board_engine.h"
#include "board/core/hash_utils.h"

#include <algorithm>

using board::kDigestOffset;
using board::hashU32;
using board::hashF32;
using board::hashBytes;

namespace {

std::uint64_t hashString(std::uint64_t h, const std::string& s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    if (!s.empty()) {
        h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    }
    return h;
}

std::uint64_t hashPoints(std::uint64_t h, const std::vector<Point2>& points) {
    h = hashU32(h, static_cast<std::uint32_t>(points.size()));
    for (const Point2& p : points) {
        h = hashF32(h, p.x);
        h = hashF32(h, p.y);
    }
    return h;
}

std::uint64_t hashEndpoint(std::uint64_t h, const EdgeEndpoint& ep) {
    h = hashU32(h, ep.elementId);
    if (ep.elementId != 0) return hashU32(h, static_cast<std::uint32_t>(ep.port));
    h = hashF32(h, ep.x);
    return hashF32(h, ep.y);
}

} // namespace

std::uint64_t BoardEngine::getDocumentDigest() const noexcept {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x50534E42u); // "BSNP" marker
    h = hashU32(h, kSnapshotVersion);

    std::vector<std::uint32_t> ids;
    ids.reserve(store_.size());
    for (const auto& kv : store_.elements()) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    h = hashU32(h, static_cast<std::uint32_t>(ids.size()));
    for (const std::uint32_t id : ids) {
        const Element* el = store_.get(id);
        if (!el) continue;
        h = hashU32(h, id);
        h = hashU32(h, static_cast<std::uint32_t>(el->kind));
        h = hashU32(h, el->parentId);
        h = hashU32(h, el->flags);
        h = hashU32(h, static_cast<std::uint32_t>(el->z));
        h = hashF32(h, el->x);
        h = hashF32(h, el->y);
        h = hashF32(h, el->w);
        h = hashF32(h, el->h);
        h = hashF32(h, el->rx);
        h = hashF32(h, el->ry);
        h = hashF32(h, el->rot);
        h = hashF32(h, el->sx);
        h = hashF32(h, el->sy);
        h = hashU32(h, el->fillRGBA);
        h = hashU32(h, el->strokeRGBA);
        h = hashF32(h, el->strokeWidth);
        h = hashF32(h, el->fontSize);
        h = hashU32(h, el->rows);
        h = hashU32(h, el->cols);
        h = hashPoints(h, el->points);
        h = hashString(h, el->text);
        h = hashString(h, el->source);
        h = hashU32(h, static_cast<std::uint32_t>(el->cells.size()));
        for (const std::string& cell : el->cells) h = hashString(h, cell);
    }

    const std::vector<std::uint32_t> edgeIds = edges_.ids();
    h = hashU32(h, static_cast<std::uint32_t>(edgeIds.size()));
    for (const std::uint32_t id : edgeIds) {
        const Edge* e = edges_.get(id);
        if (!e) continue;
        h = hashU32(h, id);
        h = hashU32(h, static_cast<std::uint32_t>(e->routing));
        h = hashEndpoint(h, e->source);
        h = hashEndpoint(h, e->target);
    }

    return h;
}
