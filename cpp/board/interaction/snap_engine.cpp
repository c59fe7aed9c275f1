#include "board/interaction/snap_engine.h"
#include "board/entity/element_store.h"
#include "board/geometry/element_shape.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
    inline float toWorldTolerance(float tolerancePx, float viewScale) {
        const float px = tolerancePx > 0.0f ? tolerancePx : 0.0f;
        if (viewScale <= 1e-6f || !std::isfinite(viewScale)) return px;
        return px / viewScale;
    }

    inline float manhattan(const Point2& a, const Point2& b) {
        return std::fabs(a.x - b.x) + std::fabs(a.y - b.y);
    }

    inline bool isExcluded(std::uint32_t id, const std::vector<std::uint32_t>& excludeIds) {
        for (const std::uint32_t ex : excludeIds) {
            if (ex == id) return true;
        }
        return false;
    }

    struct AxisEntry {
        float value;
        std::uint32_t id;
        float spanMin;
        float spanMax;
    };

    void collectAnchors(const Element& el, const board::ElementFrame& f, std::vector<std::pair<Point2, SnapTargetKind>>& out) {
        const Point2 c{f.cx, f.cy};
        auto local = [&](float dx, float dy) { return board::rotateAround(Point2{f.cx + dx, f.cy + dy}, c, f.rot); };
        out.emplace_back(c, SnapTargetKind::Center);
        out.emplace_back(local(0.0f, -f.hh), SnapTargetKind::Midpoint);
        out.emplace_back(local(f.hw, 0.0f), SnapTargetKind::Midpoint);
        out.emplace_back(local(0.0f, f.hh), SnapTargetKind::Midpoint);
        out.emplace_back(local(-f.hw, 0.0f), SnapTargetKind::Midpoint);
        // An ellipse has no corners to offer.
        if (board::isEllipticalKind(el.kind)) return;
        out.emplace_back(local(-f.hw, -f.hh), SnapTargetKind::Corner);
        out.emplace_back(local(f.hw, -f.hh), SnapTargetKind::Corner);
        out.emplace_back(local(f.hw, f.hh), SnapTargetKind::Corner);
        out.emplace_back(local(-f.hw, f.hh), SnapTargetKind::Corner);
    }
} // namespace

SnapEngine::SnapEngine(ElementStore& store, const SnapOptions& options)
    : store_(store), options_(options) {}

void SnapEngine::setOptions(const SnapOptions& options) {
    options_ = options;
    resetHysteresis();
}

void SnapEngine::resetHysteresis() {
    hasLast_ = false;
    last_ = Candidate{};
    lastProbe_ = 0;
}

void SnapEngine::refreshGuides(const std::vector<std::uint32_t>& excludeIds) {
    std::vector<std::uint32_t> exclude = excludeIds;
    std::sort(exclude.begin(), exclude.end());
    if (guidesValid_ && guideRevision_ == store_.revision() && guideExclude_ == exclude) return;

    guideExclude_ = std::move(exclude);
    guideRevision_ = store_.revision();
    guidesValid_ = true;
    guidesX_.clear();
    guidesY_.clear();

    std::vector<AxisEntry> xs;
    std::vector<AxisEntry> ys;
    for (const auto& [id, el] : store_.elements()) {
        if (hasFlag(el.flags, ElementFlags::Hidden)) continue;
        if (std::binary_search(guideExclude_.begin(), guideExclude_.end(), id)) continue;
        const AABB b = store_.worldBounds(el);
        const float cx = (b.minX + b.maxX) * 0.5f;
        const float cy = (b.minY + b.maxY) * 0.5f;
        for (float v : {b.minX, cx, b.maxX}) xs.push_back(AxisEntry{v, id, b.minY, b.maxY});
        for (float v : {b.minY, cy, b.maxY}) ys.push_back(AxisEntry{v, id, b.minX, b.maxX});
    }

    auto build = [](std::vector<AxisEntry>& entries, std::vector<GuideLine>& out) {
        std::sort(entries.begin(), entries.end(), [](const AxisEntry& a, const AxisEntry& b) {
            return a.value < b.value;
        });
        std::size_t i = 0;
        while (i < entries.size()) {
            std::size_t j = i + 1;
            bool shared = false;
            GuideLine line{entries[i].value, entries[i].spanMin, entries[i].spanMax};
            while (j < entries.size() && entries[j].value - entries[i].value <= board_constants::SNAP_GUIDE_EPSILON) {
                if (entries[j].id != entries[i].id) shared = true;
                line.spanMin = std::min(line.spanMin, entries[j].spanMin);
                line.spanMax = std::max(line.spanMax, entries[j].spanMax);
                ++j;
            }
            if (shared) out.push_back(line);
            i = j;
        }
    };
    build(xs, guidesX_);
    build(ys, guidesY_);
}

const SnapEngine::GuideLine* SnapEngine::nearestGuide(const std::vector<GuideLine>& lines, float v, float tol) const {
    if (lines.empty()) return nullptr;
    auto it = std::lower_bound(lines.begin(), lines.end(), v, [](const GuideLine& g, float value) {
        return g.value < value;
    });
    const GuideLine* best = nullptr;
    float bestDist = std::numeric_limits<float>::infinity();
    if (it != lines.end()) {
        bestDist = std::fabs(it->value - v);
        best = &*it;
    }
    if (it != lines.begin()) {
        const GuideLine& prev = *(it - 1);
        const float d = std::fabs(prev.value - v);
        if (d < bestDist) {
            bestDist = d;
            best = &prev;
        }
    }
    return bestDist <= tol ? best : nullptr;
}

SnapResult SnapEngine::makeResult(const Point2& point, const Candidate& c) const {
    SnapResult r;
    r.snapped = true;
    r.dx = c.target.x - c.probe.x;
    r.dy = c.target.y - c.probe.y;
    r.point = Point2{point.x + r.dx, point.y + r.dy};
    r.kind = c.kind;
    r.elementId = c.elementId;
    r.guides = c.guides;
    return r;
}

SnapResult SnapEngine::snap(
    const Point2& point,
    const std::vector<std::uint32_t>& excludeIds,
    float viewScale,
    const AABB* dragBounds) {
    SnapResult none;
    none.point = point;
    if (!options_.enabled) return none;

    const float tol = toWorldTolerance(options_.tolerancePx, viewScale);
    const float hysteresis = toWorldTolerance(options_.hysteresisPx, viewScale);

    std::vector<Point2> probes;
    if (dragBounds) {
        const AABB& b = *dragBounds;
        const float mx = (b.minX + b.maxX) * 0.5f;
        const float my = (b.minY + b.maxY) * 0.5f;
        probes = {
            {b.minX, b.minY}, {b.maxX, b.minY}, {b.maxX, b.maxY}, {b.minX, b.maxY},
            {mx, b.minY}, {b.maxX, my}, {mx, b.maxY}, {b.minX, my},
            {mx, my},
        };
    } else {
        probes.push_back(point);
    }

    // Stay on the current target while the probe remains inside the hysteresis radius.
    if (hasLast_ && lastProbe_ < probes.size()) {
        const bool ownerAlive = last_.elementId == 0 || store_.has(last_.elementId);
        const Point2& probe = probes[lastProbe_];
        if (ownerAlive && manhattan(probe, last_.target) <= hysteresis) {
            Candidate sticky = last_;
            sticky.probe = probe;
            return makeResult(point, sticky);
        }
    }

    Candidate best;
    bool found = false;
    std::uint32_t bestProbe = 0;
    auto consider = [&](Candidate&& c, std::uint32_t probeIndex) {
        if (c.dist > tol) return;
        c.score = c.dist / std::max(c.strength, 1e-6f);
        const bool better = !found
            || c.score < best.score - 1e-6f
            || (std::fabs(c.score - best.score) <= 1e-6f && c.strength > best.strength);
        if (!better) return;
        best = std::move(c);
        bestProbe = probeIndex;
        found = true;
    };

    // (a) grid intersections
    if (isGridSnapEnabled(options_)) {
        const float g = options_.gridSize;
        for (std::uint32_t i = 0; i < probes.size(); ++i) {
            const Point2& p = probes[i];
            Candidate c;
            c.target = Point2{std::round(p.x / g) * g, std::round(p.y / g) * g};
            c.probe = p;
            c.dist = manhattan(p, c.target);
            c.strength = options_.gridStrength;
            c.kind = SnapTargetKind::Grid;
            c.guides.push_back(SnapGuide{c.target.x, c.target.y - g, c.target.x, c.target.y + g});
            c.guides.push_back(SnapGuide{c.target.x - g, c.target.y, c.target.x + g, c.target.y});
            consider(std::move(c), i);
        }
    }

    // (b) element anchors
    if (options_.anchorsEnabled) {
        AABB region = board::pointsAabb(probes, 0.0f, 0.0f);
        region = board::aabbExpand(region, tol);
        scratch_.clear();
        store_.index().query(region, scratch_);
        std::vector<std::pair<Point2, SnapTargetKind>> anchors;
        for (const std::uint32_t id : scratch_) {
            if (isExcluded(id, excludeIds)) continue;
            const Element* el = store_.get(id);
            if (!el || hasFlag(el->flags, ElementFlags::Hidden)) continue;
            const float strength = hasFlag(el->flags, ElementFlags::Magnetic)
                ? options_.magneticStrength
                : options_.anchorStrength;
            anchors.clear();
            collectAnchors(*el, store_.worldFrame(*el), anchors);
            for (std::uint32_t i = 0; i < probes.size(); ++i) {
                for (const auto& [anchor, kind] : anchors) {
                    Candidate c;
                    c.target = anchor;
                    c.probe = probes[i];
                    c.dist = manhattan(probes[i], anchor);
                    c.strength = strength;
                    c.kind = kind;
                    c.elementId = id;
                    consider(std::move(c), i);
                }
            }
        }
    }

    // (c) alignment guides shared by at least two elements
    if (options_.guidesEnabled) {
        refreshGuides(excludeIds);
        for (std::uint32_t i = 0; i < probes.size(); ++i) {
            const Point2& p = probes[i];
            const GuideLine* gx = nearestGuide(guidesX_, p.x, tol);
            const GuideLine* gy = nearestGuide(guidesY_, p.y, tol);
            auto lineX = [&](const GuideLine& g, float y) {
                return SnapGuide{g.value, std::min(g.spanMin, y), g.value, std::max(g.spanMax, y)};
            };
            auto lineY = [&](const GuideLine& g, float x) {
                return SnapGuide{std::min(g.spanMin, x), g.value, std::max(g.spanMax, x), g.value};
            };
            if (gx) {
                Candidate c;
                c.target = Point2{gx->value, p.y};
                c.probe = p;
                c.dist = std::fabs(p.x - gx->value);
                c.strength = options_.guideStrength;
                c.kind = SnapTargetKind::Guide;
                c.guides.push_back(lineX(*gx, p.y));
                consider(std::move(c), i);
            }
            if (gy) {
                Candidate c;
                c.target = Point2{p.x, gy->value};
                c.probe = p;
                c.dist = std::fabs(p.y - gy->value);
                c.strength = options_.guideStrength;
                c.kind = SnapTargetKind::Guide;
                c.guides.push_back(lineY(*gy, p.x));
                consider(std::move(c), i);
            }
            if (gx && gy) {
                Candidate c;
                c.target = Point2{gx->value, gy->value};
                c.probe = p;
                c.dist = manhattan(p, c.target);
                // Two agreeing guides beat either alone at equal distance.
                c.strength = options_.guideStrength * 2.0f;
                c.kind = SnapTargetKind::Guide;
                c.guides.push_back(lineX(*gx, gy->value));
                c.guides.push_back(lineY(*gy, gx->value));
                consider(std::move(c), i);
            }
        }
    }

    if (!found) {
        hasLast_ = false;
        return none;
    }

    hasLast_ = true;
    last_ = best;
    lastProbe_ = bestProbe;
    return makeResult(point, best);
}
