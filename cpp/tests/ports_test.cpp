#include <gtest/gtest.h>
#include "board/geometry/element_shape.h"
#include "board/geometry/ports.h"
#include "tests/board_test_common.h"

using namespace board;
using board_test::expectPoint;

namespace {
constexpr float kHalfPi = 1.57079632679f;

ElementFrame rectFrame(float x, float y, float w, float h, float rot = 0.0f) {
    Element el = board_test::makeRect(x, y, w, h);
    el.rot = rot;
    return elementFrame(el, Point2{0.0f, 0.0f});
}
} // namespace

TEST(PortsTest, RectangleExposesSideMidpoints) {
    const ElementFrame f = rectFrame(0.0f, 0.0f, 100.0f, 100.0f);
    const Point2 far{1000.0f, 1000.0f};
    expectPoint(resolveAttachment(ElementKind::Rectangle, f, PortKind::N, far).position, 50.0f, 0.0f);
    expectPoint(resolveAttachment(ElementKind::Rectangle, f, PortKind::E, far).position, 100.0f, 50.0f);
    expectPoint(resolveAttachment(ElementKind::Rectangle, f, PortKind::S, far).position, 50.0f, 100.0f);
    expectPoint(resolveAttachment(ElementKind::Rectangle, f, PortKind::W, far).position, 0.0f, 50.0f);
}

TEST(PortsTest, PortsFollowRotation) {
    const ElementFrame f = rectFrame(0.0f, 0.0f, 100.0f, 100.0f, kHalfPi);
    const ResolvedPort east = resolveAttachment(ElementKind::Rectangle, f, PortKind::E, Point2{0.0f, 0.0f});
    expectPoint(east.position, 50.0f, 100.0f);
    expectPoint(east.normal, 0.0f, 1.0f);
    EXPECT_TRUE(east.onPort);
}

TEST(PortsTest, EllipseUsesPerimeterPoints) {
    EXPECT_EQ(portSetFor(ElementKind::Ellipse), PortSet::Perimeter);
    const Element el = board_test::makeEllipse(0.0f, 0.0f, 20.0f, 10.0f);
    const ElementFrame f = elementFrame(el, Point2{0.0f, 0.0f});
    expectPoint(resolveAttachment(ElementKind::Ellipse, f, PortKind::N, Point2{0.0f, 0.0f}).position, 0.0f, -10.0f);
    expectPoint(resolveAttachment(ElementKind::Ellipse, f, PortKind::W, Point2{0.0f, 0.0f}).position, -20.0f, 0.0f);
}

TEST(PortsTest, KindsWithoutPortsUseBoundaryTowardOtherEnd) {
    EXPECT_EQ(portSetFor(ElementKind::Text), PortSet::None);
    EXPECT_EQ(portSetFor(ElementKind::Stroke), PortSet::None);
    const ElementFrame f = rectFrame(0.0f, 0.0f, 100.0f, 40.0f);
    const ResolvedPort r = resolveAttachment(ElementKind::Text, f, PortKind::N, Point2{50.0f, 300.0f});
    EXPECT_FALSE(r.onPort);
    expectPoint(r.position, 50.0f, 40.0f);
    expectPoint(r.normal, 0.0f, 1.0f);
}

TEST(PortsTest, CenterAttachmentFacesOtherEnd) {
    const ElementFrame f = rectFrame(0.0f, 0.0f, 100.0f, 100.0f);
    const ResolvedPort r = resolveAttachment(ElementKind::Rectangle, f, PortKind::Center, Point2{-300.0f, 60.0f});
    expectPoint(r.position, 50.0f, 50.0f);
    expectPoint(r.normal, -1.0f, 0.0f);
}

TEST(PortsTest, DominantAxis) {
    expectPoint(dominantAxis(Point2{0.0f, 0.0f}, Point2{3.0f, -10.0f}), 0.0f, -1.0f);
    expectPoint(dominantAxis(Point2{0.0f, 0.0f}, Point2{5.0f, 5.0f}), 1.0f, 0.0f);
    expectPoint(dominantAxis(Point2{1.0f, 1.0f}, Point2{1.0f, 1.0f}), 0.0f, 0.0f);
}

TEST(PortsTest, PortNames) {
    EXPECT_STREQ(portKindName(PortKind::N), "N");
    EXPECT_STREQ(portKindName(PortKind::Center), "CENTER");
}
