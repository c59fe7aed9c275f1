#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "board/board_engine.h"

#ifdef EMSCRIPTEN
struct PortHitResult {
    std::uint32_t elementId;
    std::uint32_t port;
    float x, y;
    bool valid;
};

struct BoundsResult {
    float minX, minY, maxX, maxY;
    bool valid;
};

EMSCRIPTEN_BINDINGS(board_engine_module) {
    emscripten::enum_<ElementKind>("ElementKind")
        .value("Rectangle", ElementKind::Rectangle)
        .value("Ellipse", ElementKind::Ellipse)
        .value("Text", ElementKind::Text)
        .value("StickyNote", ElementKind::StickyNote)
        .value("Table", ElementKind::Table)
        .value("Image", ElementKind::Image)
        .value("Section", ElementKind::Section)
        .value("Stroke", ElementKind::Stroke);

    emscripten::enum_<PortKind>("PortKind")
        .value("N", PortKind::N)
        .value("S", PortKind::S)
        .value("E", PortKind::E)
        .value("W", PortKind::W)
        .value("Center", PortKind::Center);

    emscripten::enum_<EdgeRouting>("EdgeRouting")
        .value("Straight", EdgeRouting::Straight)
        .value("Orthogonal", EdgeRouting::Orthogonal)
        .value("Curved", EdgeRouting::Curved)
        .value("ObstacleAware", EdgeRouting::ObstacleAware);

    emscripten::enum_<EdgeEnd>("EdgeEnd")
        .value("Source", EdgeEnd::Source)
        .value("Target", EdgeEnd::Target);

    emscripten::enum_<ToolKind>("ToolKind")
        .value("Edit", ToolKind::Edit)
        .value("Transform", ToolKind::Transform)
        .value("Rectangle", ToolKind::Rectangle)
        .value("Ellipse", ToolKind::Ellipse)
        .value("Text", ToolKind::Text)
        .value("StickyNote", ToolKind::StickyNote)
        .value("Table", ToolKind::Table)
        .value("Image", ToolKind::Image)
        .value("Section", ToolKind::Section)
        .value("Pen", ToolKind::Pen)
        .value("Connector", ToolKind::Connector)
        .value("Eraser", ToolKind::Eraser);

    emscripten::enum_<TransformMode>("TransformMode")
        .value("Move", TransformMode::Move)
        .value("ScaleRotate", TransformMode::ScaleRotate);

    emscripten::enum_<DraftResultKind>("DraftResultKind")
        .value("None", DraftResultKind::None)
        .value("Element", DraftResultKind::Element)
        .value("Edge", DraftResultKind::Edge);

    emscripten::enum_<BoardError>("BoardError")
        .value("Ok", BoardError::Ok)
        .value("InvalidMagic", BoardError::InvalidMagic)
        .value("UnsupportedVersion", BoardError::UnsupportedVersion)
        .value("BufferTruncated", BoardError::BufferTruncated)
        .value("InvalidPayloadSize", BoardError::InvalidPayloadSize)
        .value("UnknownElement", BoardError::UnknownElement)
        .value("InvalidOperation", BoardError::InvalidOperation);

    emscripten::enum_<LodLevel>("LodLevel")
        .value("Full", LodLevel::Full)
        .value("Simplified", LodLevel::Simplified)
        .value("Placeholder", LodLevel::Placeholder)
        .value("Hidden", LodLevel::Hidden);

    emscripten::register_vector<std::uint32_t>("VectorUInt32");
    emscripten::register_vector<std::uint8_t>("VectorUInt8");
    emscripten::register_vector<Point2>("VectorPoint2");
    emscripten::register_vector<std::string>("VectorString");
    emscripten::register_vector<SnapGuide>("VectorSnapGuide");

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<AABB>("AABB")
        .field("minX", &AABB::minX)
        .field("minY", &AABB::minY)
        .field("maxX", &AABB::maxX)
        .field("maxY", &AABB::maxY);

    emscripten::value_object<Viewport>("Viewport")
        .field("x", &Viewport::x)
        .field("y", &Viewport::y)
        .field("width", &Viewport::width)
        .field("height", &Viewport::height)
        .field("scale", &Viewport::scale);

    emscripten::value_object<Element>("Element")
        .field("id", &Element::id)
        .field("kind", &Element::kind)
        .field("x", &Element::x)
        .field("y", &Element::y)
        .field("w", &Element::w)
        .field("h", &Element::h)
        .field("rx", &Element::rx)
        .field("ry", &Element::ry)
        .field("rot", &Element::rot)
        .field("sx", &Element::sx)
        .field("sy", &Element::sy)
        .field("z", &Element::z)
        .field("parentId", &Element::parentId)
        .field("flags", &Element::flags)
        .field("createdAt", &Element::createdAt)
        .field("updatedAt", &Element::updatedAt)
        .field("fillRGBA", &Element::fillRGBA)
        .field("strokeRGBA", &Element::strokeRGBA)
        .field("strokeWidth", &Element::strokeWidth)
        .field("points", &Element::points)
        .field("text", &Element::text)
        .field("source", &Element::source)
        .field("fontSize", &Element::fontSize)
        .field("rows", &Element::rows)
        .field("cols", &Element::cols)
        .field("cells", &Element::cells);

    emscripten::value_object<EdgeEndpoint>("EdgeEndpoint")
        .field("elementId", &EdgeEndpoint::elementId)
        .field("port", &EdgeEndpoint::port)
        .field("x", &EdgeEndpoint::x)
        .field("y", &EdgeEndpoint::y);

    emscripten::value_object<SnapGuide>("SnapGuide")
        .field("x0", &SnapGuide::x0)
        .field("y0", &SnapGuide::y0)
        .field("x1", &SnapGuide::x1)
        .field("y1", &SnapGuide::y1);

    emscripten::value_object<SnapResult>("SnapResult")
        .field("snapped", &SnapResult::snapped)
        .field("point", &SnapResult::point)
        .field("dx", &SnapResult::dx)
        .field("dy", &SnapResult::dy)
        .field("elementId", &SnapResult::elementId)
        .field("guides", &SnapResult::guides);

    emscripten::value_object<DraftCommit>("DraftCommit")
        .field("kind", &DraftCommit::kind)
        .field("id", &DraftCommit::id);

    emscripten::value_object<BoardEngine::HistoryMeta>("HistoryMeta")
        .field("depth", &BoardEngine::HistoryMeta::depth)
        .field("cursor", &BoardEngine::HistoryMeta::cursor)
        .field("generation", &BoardEngine::HistoryMeta::generation);

    emscripten::value_object<BoardDiagnostics>("BoardDiagnostics")
        .field("geometryClamped", &BoardDiagnostics::geometryClamped)
        .field("danglingEdgesSkipped", &BoardDiagnostics::danglingEdgesSkipped)
        .field("indexRebuilds", &BoardDiagnostics::indexRebuilds)
        .field("indexDesyncRecoveries", &BoardDiagnostics::indexDesyncRecoveries)
        .field("routeFallbacks", &BoardDiagnostics::routeFallbacks)
        .field("historyEntriesDropped", &BoardDiagnostics::historyEntriesDropped);

    emscripten::value_object<PortHitResult>("PortHitResult")
        .field("elementId", &PortHitResult::elementId)
        .field("port", &PortHitResult::port)
        .field("x", &PortHitResult::x)
        .field("y", &PortHitResult::y)
        .field("valid", &PortHitResult::valid);

    emscripten::value_object<BoundsResult>("BoundsResult")
        .field("minX", &BoundsResult::minX)
        .field("minY", &BoundsResult::minY)
        .field("maxX", &BoundsResult::maxX)
        .field("maxY", &BoundsResult::maxY)
        .field("valid", &BoundsResult::valid);

    emscripten::class_<BoardEngine>("BoardEngine")
        .constructor<>()
        .function("clear", &BoardEngine::clear)
        .function("getLastError", &BoardEngine::getLastError)
        .function("getDiagnostics", emscripten::optional_override([](const BoardEngine& self) {
            return self.diagnostics();
        }))
        .function("allocateId", &BoardEngine::allocateId)
        // Elements
        .function("addElement", &BoardEngine::addElement)
        .function("removeElement", &BoardEngine::removeElement)
        .function("moveElement", emscripten::optional_override([](BoardEngine& self, std::uint32_t id, float x, float y) {
            ElementPatch patch;
            patch.x = x;
            patch.y = y;
            return self.updateElement(id, patch);
        }))
        .function("resizeElement", emscripten::optional_override([](BoardEngine& self, std::uint32_t id, float w, float h) {
            ElementPatch patch;
            patch.w = w;
            patch.h = h;
            return self.updateElement(id, patch);
        }))
        .function("setElementFlags", emscripten::optional_override([](BoardEngine& self, std::uint32_t id, std::uint32_t flags) {
            ElementPatch patch;
            patch.flags = flags;
            return self.updateElement(id, patch);
        }))
        .function("setElementText", emscripten::optional_override([](BoardEngine& self, std::uint32_t id, const std::string& text) {
            ElementPatch patch;
            patch.text = text;
            return self.updateElement(id, patch);
        }))
        .function("getElement", emscripten::optional_override([](const BoardEngine& self, std::uint32_t id) {
            const Element* el = self.getElement(id);
            return el ? *el : Element{};
        }))
        .function("getDrawOrder", &BoardEngine::getDrawOrder)
        .function("bringToFront", &BoardEngine::bringToFront)
        .function("sendToBack", &BoardEngine::sendToBack)
        .function("attachToSection", &BoardEngine::attachToSection)
        .function("detachFromSection", &BoardEngine::detachFromSection)
        .function("worldBounds", emscripten::optional_override([](const BoardEngine& self, std::uint32_t id) {
            AABB b{0.0f, 0.0f, 0.0f, 0.0f};
            const bool ok = self.worldBounds(id, b);
            return BoundsResult{b.minX, b.minY, b.maxX, b.maxY, ok};
        }))
        // Edges
        .function("addEdge", &BoardEngine::addEdge)
        .function("removeEdge", &BoardEngine::removeEdge)
        .function("setEdgeRouting", &BoardEngine::setEdgeRouting)
        .function("reconnectEdge", &BoardEngine::reconnectEdge)
        .function("beginEndpointDrag", &BoardEngine::beginEndpointDrag)
        .function("updateEndpointDrag", &BoardEngine::updateEndpointDrag)
        .function("commitEndpointDrag", &BoardEngine::commitEndpointDrag)
        .function("cancelEndpointDrag", &BoardEngine::cancelEndpointDrag)
        .function("getEdgesConnectedTo", &BoardEngine::getEdgesConnectedTo)
        .function("getEdgePoints", emscripten::optional_override([](const BoardEngine& self, std::uint32_t id) {
            const Edge* e = self.getEdge(id);
            return e ? e->points : std::vector<Point2>{};
        }))
        // Queries
        .function("visibleElements", &BoardEngine::visibleElements)
        .function("snap", &BoardEngine::snap)
        .function("nearestPort", emscripten::optional_override([](BoardEngine& self, const Point2& p, float maxDistance) {
            const auto hit = self.nearestPort(p, maxDistance);
            if (!hit) return PortHitResult{0, static_cast<std::uint32_t>(PortKind::Center), 0.0f, 0.0f, false};
            return PortHitResult{hit->elementId, static_cast<std::uint32_t>(hit->port), hit->position.x, hit->position.y, true};
        }))
        .function("setViewScale", &BoardEngine::setViewScale)
        .function("frame", emscripten::optional_override([](BoardEngine& self, const Viewport& viewport) {
            return self.frame(viewport).cull.elementIds;
        }))
        // Drafts
        .function("startDraft", &BoardEngine::startDraft)
        .function("updateDraft", &BoardEngine::updateDraft)
        .function("commitDraft", &BoardEngine::commitDraft)
        .function("cancelDraft", &BoardEngine::cancelDraft)
        .function("setConnectorRouting", &BoardEngine::setConnectorRouting)
        // Transforms
        .function("beginTransform", &BoardEngine::beginTransform)
        .function("updateTransform", &BoardEngine::updateTransform)
        .function("setTransientTransform", &BoardEngine::setTransientTransform)
        .function("commitTransform", &BoardEngine::commitTransform)
        .function("cancelTransform", &BoardEngine::cancelTransform)
        // Eraser
        .function("eraseAlongPath", emscripten::optional_override([](BoardEngine& self, const std::vector<Point2>& path, float radius) {
            return static_cast<std::uint32_t>(self.eraseAlongPath(path, radius));
        }))
        .function("eraseInBounds", emscripten::optional_override([](BoardEngine& self, const AABB& rect) {
            return static_cast<std::uint32_t>(self.eraseInBounds(rect));
        }))
        .function("eraseSegmentsAlongPath", emscripten::optional_override([](BoardEngine& self, const std::vector<Point2>& path, float radius) {
            return static_cast<std::uint32_t>(self.eraseSegmentsAlongPath(path, radius));
        }))
        .function("setEraserRadius", &BoardEngine::setEraserRadius)
        // History
        .function("getHistoryMeta", &BoardEngine::getHistoryMeta)
        .function("canUndo", &BoardEngine::canUndo)
        .function("canRedo", &BoardEngine::canRedo)
        .function("undo", &BoardEngine::undo)
        .function("redo", &BoardEngine::redo)
        // Persistence
        .function("saveSnapshot", &BoardEngine::saveSnapshot)
        .function("loadSnapshot", emscripten::optional_override([](BoardEngine& self, const std::vector<std::uint8_t>& bytes) {
            return self.loadSnapshot(bytes);
        }))
        .function("getDocumentDigestLo", emscripten::optional_override([](const BoardEngine& self) {
            return static_cast<std::uint32_t>(self.getDocumentDigest() & 0xFFFFFFFFull);
        }))
        .function("getDocumentDigestHi", emscripten::optional_override([](const BoardEngine& self) {
            return static_cast<std::uint32_t>(self.getDocumentDigest() >> 32);
        }))
        // Selection
        .function("setSelection", &BoardEngine::setSelection)
        .function("getSelection", &BoardEngine::getSelection)
        .function("clearSelection", &BoardEngine::clearSelection);
}
#endif
