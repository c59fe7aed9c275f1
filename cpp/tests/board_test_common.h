#pragma once

#include <gtest/gtest.h>
#include "board/board_engine.h"
#include "tests/test_accessors.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace board_test {
inline constexpr float kEps = 1e-3f;

inline Element makeRect(float x, float y, float w, float h) {
    Element el;
    el.kind = ElementKind::Rectangle;
    el.x = x;
    el.y = y;
    el.w = w;
    el.h = h;
    return el;
}

inline Element makeEllipse(float cx, float cy, float rx, float ry) {
    Element el;
    el.kind = ElementKind::Ellipse;
    el.x = cx;
    el.y = cy;
    el.rx = rx;
    el.ry = ry;
    return el;
}

inline Element makeSection(float x, float y, float w, float h) {
    Element el = makeRect(x, y, w, h);
    el.kind = ElementKind::Section;
    return el;
}

// Stroke whose points are given in world space; stored relative to the first one.
inline Element makeStroke(const std::vector<Point2>& worldPoints) {
    Element el;
    el.kind = ElementKind::Stroke;
    if (worldPoints.empty()) return el;
    el.x = worldPoints.front().x;
    el.y = worldPoints.front().y;
    for (const Point2& p : worldPoints) {
        el.points.push_back(Point2{p.x - el.x, p.y - el.y});
    }
    return el;
}

inline EdgeEndpoint attached(std::uint32_t elementId, PortKind port) {
    EdgeEndpoint ep;
    ep.elementId = elementId;
    ep.port = port;
    return ep;
}

inline EdgeEndpoint freePoint(float x, float y) {
    EdgeEndpoint ep;
    ep.x = x;
    ep.y = y;
    return ep;
}

inline Viewport viewport(float x, float y, float w, float h, float scale = 1.0f) {
    Viewport vp;
    vp.x = x;
    vp.y = y;
    vp.width = w;
    vp.height = h;
    vp.scale = scale;
    return vp;
}

inline BoardConfig gridOnlyConfig() {
    BoardConfig config;
    config.snap.anchorsEnabled = false;
    config.snap.guidesEnabled = false;
    return config;
}

inline BoardConfig noSnapConfig() {
    BoardConfig config;
    config.snap.enabled = false;
    return config;
}

inline void expectPoint(const Point2& p, float x, float y) {
    EXPECT_NEAR(p.x, x, kEps);
    EXPECT_NEAR(p.y, y, kEps);
}

inline void expectPoints(const std::vector<Point2>& actual, const std::vector<Point2>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        expectPoint(actual[i], expected[i].x, expected[i].y);
    }
}
} // namespace board_test

class BoardEngineTest : public ::testing::Test {
protected:
    BoardEngine engine;

    void SetUp() override {
        engine.clear();
    }
};
