#include "board/interaction/interaction_session.h"
#include "board/board_engine.h"
#include "board/core/board_constants.h"
#include "board/core/logging.h"
#include "board/entity/edge_store.h"
#include "board/entity/element_store.h"
#include "board/geometry/geometry.h"
#include "board/history/history_manager.h"
#include "board/interaction/eraser_engine.h"
#include "board/interaction/snap_engine.h"
#include "board/routing/edge_router.h"

#include <algorithm>
#include <cmath>
#include <limits>

// ==============================================================================
// Draft Implementation (Phantom Element System)
// ==============================================================================
// Drafts create real elements (or edges) inside an open history gesture. The host
// renders them through the normal pipeline; commit keeps them as one history entry and
// cancel replays the captured state away.

namespace {

using namespace board_constants;

bool isShapeTool(ToolKind tool) {
    switch (tool) {
        case ToolKind::Rectangle:
        case ToolKind::Ellipse:
        case ToolKind::Text:
        case ToolKind::StickyNote:
        case ToolKind::Table:
        case ToolKind::Image:
        case ToolKind::Section:
            return true;
        case ToolKind::Edit:
        case ToolKind::Transform:
        case ToolKind::Pen:
        case ToolKind::Connector:
        case ToolKind::Eraser:
            return false;
    }
    return false;
}

// Size given to a box tool that was clicked rather than dragged.
void clickSize(ToolKind tool, float& w, float& h) {
    switch (tool) {
        case ToolKind::Text: w = DRAFT_TEXT_WIDTH; h = DRAFT_TEXT_HEIGHT; return;
        case ToolKind::StickyNote: w = DRAFT_STICKY_SIZE_W; h = DRAFT_STICKY_SIZE_H; return;
        case ToolKind::Table: w = DRAFT_TABLE_WIDTH; h = DRAFT_TABLE_HEIGHT; return;
        case ToolKind::Image: w = DRAFT_IMAGE_WIDTH; h = DRAFT_IMAGE_HEIGHT; return;
        case ToolKind::Section: w = DRAFT_SECTION_WIDTH; h = DRAFT_SECTION_HEIGHT; return;
        case ToolKind::Rectangle:
        case ToolKind::Ellipse:
        case ToolKind::Edit:
        case ToolKind::Transform:
        case ToolKind::Pen:
        case ToolKind::Connector:
        case ToolKind::Eraser:
            w = 0.0f;
            h = 0.0f;
            return;
    }
}

const char* draftLabel(ToolKind tool) {
    switch (tool) {
        case ToolKind::Edit: return "Edit";
        case ToolKind::Transform: return "Transform";
        case ToolKind::Rectangle: return "Draw rectangle";
        case ToolKind::Ellipse: return "Draw ellipse";
        case ToolKind::Text: return "Add text";
        case ToolKind::StickyNote: return "Add sticky note";
        case ToolKind::Table: return "Add table";
        case ToolKind::Image: return "Add image";
        case ToolKind::Section: return "Add section";
        case ToolKind::Pen: return "Draw";
        case ToolKind::Connector: return "Connect";
        case ToolKind::Eraser: return "Erase";
    }
    return "";
}

} // namespace

bool InteractionSession::draftIsClick() const {
    return board::distSq(draft_.start, draft_.current) < DRAFT_CLICK_DISTANCE * DRAFT_CLICK_DISTANCE;
}

Point2 InteractionSession::snapDraftPoint(const Point2& point) {
    lastSnap_ = SnapResult{};
    if (!snap_.options().enabled) return point;
    std::vector<std::uint32_t> exclude;
    if (draft_.phantomId != 0) exclude.push_back(draft_.phantomId);
    lastSnap_ = snap_.snap(point, exclude, viewScale());
    return lastSnap_.snapped ? lastSnap_.point : point;
}

EdgeEndpoint InteractionSession::endpointAt(const Point2& point, std::uint32_t excludeId) const {
    EdgeEndpoint ep;
    ep.x = point.x;
    ep.y = point.y;
    const float tolerance = router_.options().portCapturePx / viewScale();
    const auto hit = router_.nearestPort(point, tolerance, excludeId);
    if (hit) {
        ep.elementId = hit->elementId;
        ep.port = hit->port;
        ep.x = hit->position.x;
        ep.y = hit->position.y;
    }
    return ep;
}

bool InteractionSession::startDraft(ToolKind tool, const Point2& point) {
    if (gestureRunning()) return false;
    if (!board::isFiniteNumber(point.x) || !board::isFiniteNumber(point.y)) return false;
    if (tool == ToolKind::Edit || tool == ToolKind::Transform) return false;

    DraftState next;
    next.tool = tool;
    next.start = point;
    next.current = point;
    next.nextIdBefore = engine_.nextId();
    if (!history_.beginGesture(tool, engine_.nextId())) return false;

    snap_.resetHysteresis();
    lastSnap_ = SnapResult{};
    draft_ = std::move(next);
    draft_.active = true;

    switch (tool) {
        case ToolKind::Rectangle:
        case ToolKind::Ellipse:
        case ToolKind::Text:
        case ToolKind::StickyNote:
        case ToolKind::Table:
        case ToolKind::Image:
        case ToolKind::Section:
            draft_.start = snapDraftPoint(point);
            draft_.current = draft_.start;
            break;
        case ToolKind::Pen: {
            draft_.phantomId = engine_.allocateId();
            draft_.path.push_back(point);
            Element el;
            el.id = draft_.phantomId;
            el.kind = ElementKind::Stroke;
            el.x = point.x;
            el.y = point.y;
            el.strokeWidth = 2.0f;
            el.points.push_back(Point2{0.0f, 0.0f});
            if (!store_.add(el)) BOARD_LOG_WARN("draft: stroke %u rejected", draft_.phantomId);
            break;
        }
        case ToolKind::Connector: {
            draft_.phantomId = engine_.allocateId();
            draft_.source = endpointAt(point, 0);
            draft_.target = EdgeEndpoint{0, PortKind::Center, point.x, point.y};
            Edge edge;
            edge.id = draft_.phantomId;
            edge.source = draft_.source;
            edge.target = draft_.target;
            edge.routing = connectorRouting_;
            if (!edges_.add(edge)) BOARD_LOG_WARN("draft: connector %u rejected", draft_.phantomId);
            break;
        }
        case ToolKind::Eraser:
            draft_.path.push_back(point);
            eraseStep(point, point);
            break;
        case ToolKind::Edit:
        case ToolKind::Transform:
            break;
    }
    return true;
}

void InteractionSession::updateDraft(const Point2& point) {
    if (!draft_.active) return;
    if (!board::isFiniteNumber(point.x) || !board::isFiniteNumber(point.y)) return;

    switch (draft_.tool) {
        case ToolKind::Rectangle:
        case ToolKind::Ellipse:
        case ToolKind::Text:
        case ToolKind::StickyNote:
        case ToolKind::Table:
        case ToolKind::Image:
        case ToolKind::Section:
            draft_.current = snapDraftPoint(point);
            if (draft_.phantomId != 0 || !draftIsClick()) upsertPhantomElement(false);
            break;
        case ToolKind::Pen:
            draft_.current = point;
            updatePenStroke(point);
            break;
        case ToolKind::Connector:
            draft_.current = point;
            draft_.target = endpointAt(point, draft_.source.elementId);
            edges_.setEndpoint(draft_.phantomId, EdgeEnd::Target, draft_.target);
            break;
        case ToolKind::Eraser: {
            const Point2 prev = draft_.path.back();
            draft_.path.push_back(point);
            draft_.current = point;
            eraseStep(prev, point);
            break;
        }
        case ToolKind::Edit:
        case ToolKind::Transform:
            break;
    }
}

DraftCommit InteractionSession::commitDraft() {
    if (!draft_.active) return DraftCommit{};

    DraftCommit result;
    switch (draft_.tool) {
        case ToolKind::Rectangle:
        case ToolKind::Ellipse:
        case ToolKind::Text:
        case ToolKind::StickyNote:
        case ToolKind::Table:
        case ToolKind::Image:
        case ToolKind::Section: {
            const bool click = draftIsClick();
            if (click && (draft_.tool == ToolKind::Rectangle || draft_.tool == ToolKind::Ellipse)) {
                cancelDraft();
                return DraftCommit{};
            }
            upsertPhantomElement(click);
            if (draft_.tool != ToolKind::Section) attachToEnclosingSection(draft_.phantomId);
            result = DraftCommit{DraftResultKind::Element, draft_.phantomId};
            break;
        }
        case ToolKind::Pen: {
            const Element* el = store_.get(draft_.phantomId);
            if (!el || el->points.size() < 2) {
                cancelDraft();
                return DraftCommit{};
            }
            attachToEnclosingSection(draft_.phantomId);
            result = DraftCommit{DraftResultKind::Element, draft_.phantomId};
            break;
        }
        case ToolKind::Connector: {
            const bool degenerate = sameAttachment(draft_.source, draft_.target)
                || (draft_.source.elementId == 0 && draft_.target.elementId == 0 && draftIsClick());
            if (degenerate || !edges_.has(draft_.phantomId)) {
                cancelDraft();
                return DraftCommit{};
            }
            result = DraftCommit{DraftResultKind::Edge, draft_.phantomId};
            break;
        }
        case ToolKind::Eraser:
            // Late samples: one more pass over the whole recorded path.
            hits_.clear();
            eraser_.hitsAlongPath(draft_.path, engine_.config().eraser.radius, hits_);
            removeErased(hits_);
            break;
        case ToolKind::Edit:
        case ToolKind::Transform:
            break;
    }

    history_.commitGesture(draftLabel(draft_.tool), engine_.nextId());
    if (result.kind == DraftResultKind::Element) {
        engine_.setSelection(std::vector<std::uint32_t>{result.id});
    }
    draft_ = DraftState{};
    lastSnap_ = SnapResult{};
    return result;
}

void InteractionSession::cancelDraft() {
    if (!draft_.active) return;
    history_.cancelGesture();
    engine_.restoreNextId(draft_.nextIdBefore);
    draft_ = DraftState{};
    lastSnap_ = SnapResult{};
    engine_.pruneSelection();
}

Element InteractionSession::draftElement(bool clickSized) const {
    const float minSize = engine_.config().minElementSize;
    float x0 = 0.0f;
    float y0 = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
    if (clickSized) {
        clickSize(draft_.tool, w, h);
        x0 = draft_.start.x - w * 0.5f;
        y0 = draft_.start.y - h * 0.5f;
    } else {
        x0 = std::min(draft_.start.x, draft_.current.x);
        y0 = std::min(draft_.start.y, draft_.current.y);
        w = std::fabs(draft_.current.x - draft_.start.x);
        h = std::fabs(draft_.current.y - draft_.start.y);
    }
    w = std::max(w, minSize);
    h = std::max(h, minSize);

    Element el;
    el.id = draft_.phantomId;
    el.x = x0;
    el.y = y0;
    el.w = w;
    el.h = h;
    switch (draft_.tool) {
        case ToolKind::Rectangle:
            el.kind = ElementKind::Rectangle;
            break;
        case ToolKind::Ellipse:
            el.kind = ElementKind::Ellipse;
            el.x = x0 + w * 0.5f;
            el.y = y0 + h * 0.5f;
            el.rx = w * 0.5f;
            el.ry = h * 0.5f;
            el.w = 0.0f;
            el.h = 0.0f;
            break;
        case ToolKind::Text:
            el.kind = ElementKind::Text;
            el.fillRGBA = 0x00000000u;
            break;
        case ToolKind::StickyNote:
            el.kind = ElementKind::StickyNote;
            el.fillRGBA = 0xFFFFE0FFu;
            break;
        case ToolKind::Table:
            el.kind = ElementKind::Table;
            el.rows = DRAFT_TABLE_ROWS;
            el.cols = DRAFT_TABLE_COLS;
            el.cells.resize(static_cast<std::size_t>(el.rows) * el.cols);
            break;
        case ToolKind::Image:
            el.kind = ElementKind::Image;
            break;
        case ToolKind::Section:
            el.kind = ElementKind::Section;
            el.fillRGBA = 0xF5F5F5FFu;
            break;
        case ToolKind::Edit:
        case ToolKind::Transform:
        case ToolKind::Pen:
        case ToolKind::Connector:
        case ToolKind::Eraser:
            break;
    }
    return el;
}

void InteractionSession::upsertPhantomElement(bool clickSized) {
    if (!isShapeTool(draft_.tool)) return;
    if (draft_.phantomId == 0) {
        draft_.phantomId = engine_.allocateId();
        Element el = draftElement(clickSized);
        if (!store_.add(el)) BOARD_LOG_WARN("draft: element %u rejected", draft_.phantomId);
        return;
    }
    const Element el = draftElement(clickSized);
    ElementPatch patch;
    patch.x = el.x;
    patch.y = el.y;
    patch.w = el.w;
    patch.h = el.h;
    patch.rx = el.rx;
    patch.ry = el.ry;
    store_.update(draft_.phantomId, patch);
}

void InteractionSession::updatePenStroke(const Point2& point) {
    const Element* el = store_.get(draft_.phantomId);
    if (!el || draft_.path.empty()) return;
    if (board::distSq(draft_.path.back(), point) < DRAFT_PEN_MIN_STEP * DRAFT_PEN_MIN_STEP) return;
    draft_.path.push_back(point);

    ElementPatch patch;
    patch.points = el->points;
    patch.points->push_back(Point2{point.x - draft_.start.x, point.y - draft_.start.y});
    store_.update(draft_.phantomId, patch);
}

void InteractionSession::eraseStep(const Point2& from, const Point2& to) {
    hits_.clear();
    const std::vector<Point2> segment{from, to};
    eraser_.hitsAlongPath(segment, engine_.config().eraser.radius, hits_);
    removeErased(hits_);
}

void InteractionSession::attachToEnclosingSection(std::uint32_t id) {
    const Element* el = store_.get(id);
    if (!el || el->kind == ElementKind::Section || el->parentId != 0) return;

    const AABB b = store_.worldBounds(*el);
    const Point2 center{(b.minX + b.maxX) * 0.5f, (b.minY + b.maxY) * 0.5f};
    scratch_.clear();
    store_.index().query(AABB{center.x, center.y, center.x, center.y}, scratch_);

    std::uint32_t best = 0;
    std::int32_t bestZ = std::numeric_limits<std::int32_t>::min();
    for (std::uint32_t candidate : scratch_) {
        if (candidate == id) continue;
        const Element* section = store_.get(candidate);
        if (!section || section->kind != ElementKind::Section) continue;
        if (hasFlag(section->flags, ElementFlags::Hidden)) continue;
        if (!board::aabbContainsPoint(store_.worldBounds(*section), center.x, center.y)) continue;
        if (best == 0 || section->z > bestZ) {
            best = candidate;
            bestZ = section->z;
        }
    }
    if (best != 0) store_.attachToSection(id, best);
}
