#pragma once

#include "board/core/board_config.h"
#include "board/core/types.h"
#include "board/interaction/snap_types.h"

#include <cstdint>
#include <vector>

class ElementStore;

inline bool isGridSnapEnabled(const SnapOptions& options) {
    return options.enabled && options.gridEnabled && options.gridSize > 0.0001f;
}

// Attracts a point (or a dragged box) to grid intersections, element anchors and
// alignment guides. Distances are Manhattan; among the candidates within the
// tolerance the one with the smallest distance / strength wins.
class SnapEngine {
public:
    SnapEngine(ElementStore& store, const SnapOptions& options);

    void setOptions(const SnapOptions& options);
    const SnapOptions& options() const { return options_; }

    // `viewScale` converts the pixel tolerances to world units. When `dragBounds` is set
    // its corners, midpoints and center are snapped instead of `point`, and the winning
    // offset is applied to `point`.
    SnapResult snap(
        const Point2& point,
        const std::vector<std::uint32_t>& excludeIds,
        float viewScale,
        const AABB* dragBounds = nullptr);

    // Forgets the sticky target; call at the start of every gesture.
    void resetHysteresis();

private:
    friend class BoardEngineTestAccessor;

    struct Candidate {
        Point2 target{0.0f, 0.0f};
        Point2 probe{0.0f, 0.0f};
        float dist{0.0f};
        float score{0.0f};
        float strength{1.0f};
        SnapTargetKind kind{SnapTargetKind::None};
        std::uint32_t elementId{0};
        std::vector<SnapGuide> guides;
    };

    struct GuideLine {
        float value;
        float spanMin;
        float spanMax;
    };

    void refreshGuides(const std::vector<std::uint32_t>& excludeIds);
    const GuideLine* nearestGuide(const std::vector<GuideLine>& lines, float v, float tol) const;
    SnapResult makeResult(const Point2& point, const Candidate& c) const;

    ElementStore& store_;
    SnapOptions options_;

    // Sticky target.
    bool hasLast_ = false;
    Candidate last_;
    std::uint32_t lastProbe_ = 0;

    // Alignment guides derived from the store, rebuilt when the store or the
    // exclusion set changes.
    std::uint32_t guideRevision_ = 0;
    bool guidesValid_ = false;
    std::vector<std::uint32_t> guideExclude_;
    std::vector<GuideLine> guidesX_;
    std::vector<GuideLine> guidesY_;
    std::vector<std::uint32_t> scratch_;
};
