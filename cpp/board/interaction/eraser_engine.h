#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <functional>
#include <vector>

class ElementStore;

// Decides which elements an eraser may delete.
using ErasablePredicate = std::function<bool(const Element&)>;

// Unlocked, visible strokes.
bool isDefaultErasable(const Element& el);

// Finds erasable elements touched by a circular eraser footprint. Candidates come from
// the spatial index; point sequences are tested point by point with Euclidean
// distance, stopping at the first point inside the footprint. A path sweeps the
// footprint along each of its segments, so the tests are exact distances to the segment.
class EraserEngine {
public:
    explicit EraserEngine(ElementStore& store);

    void setPredicate(ErasablePredicate predicate);
    void resetPredicate();
    bool isErasable(const Element& el) const { return predicate_(el); }

    // Appends ids touched by the footprint swept along `path`, one index query per
    // segment. A single-point path is a stamp. Ids already in `out` are skipped.
    void hitsAlongPath(const std::vector<Point2>& path, float radius, std::vector<std::uint32_t>& out);

    // Erasable point-sequence elements the sweep reaches, with one flag per stored point
    // telling whether that point lies inside the swept footprint.
    struct PointHits {
        std::uint32_t id;
        std::vector<bool> erased;
    };
    void pointHitsAlongPath(const std::vector<Point2>& path, float radius, std::vector<PointHits>& out);

    // Erasable elements whose world bounds intersect `rect`.
    void hitsInBounds(const AABB& rect, std::vector<std::uint32_t>& out);

    bool touches(const Element& el, const Point2& center, float radius) const;
    // Footprint swept from `a` to `b`.
    bool touchesSegment(const Element& el, const Point2& a, const Point2& b, float radius) const;

private:
    // Sorted candidate ids whose bounds meet any segment of the sweep.
    void collectCandidates(const std::vector<Point2>& path, float radius);

    ElementStore& store_;
    ErasablePredicate predicate_;
    std::vector<std::uint32_t> candidates_;
};
