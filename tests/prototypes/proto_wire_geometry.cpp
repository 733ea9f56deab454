#include "test_harness/TestHarness.h"
#include "test_harness/RecordingSurface.h"
#include "diagram/GeometryUtils.h"
#include "diagram/Wire.h"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace circuitsketch::core::diagram;
using circuitsketch::test::RecordingSurface;

namespace {

Wire straightWire(double lineWidth) {
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(10.0, 0.0);
    wire.setLineWidth(lineWidth);
    return wire;
}

} // namespace

TEST_CASE(ClosestPoint_ClampsToSegmentEnds) {
    const gp_Pnt2d a(0.0, 0.0);
    const gp_Pnt2d b(10.0, 0.0);

    EXPECT_PNT2D_NEAR(geometry::closestPointOnSegment(gp_Pnt2d(4.0, 3.0), a, b), gp_Pnt2d(4.0, 0.0), 1e-12);
    EXPECT_PNT2D_NEAR(geometry::closestPointOnSegment(gp_Pnt2d(-5.0, 2.0), a, b), a, 1e-12);
    EXPECT_PNT2D_NEAR(geometry::closestPointOnSegment(gp_Pnt2d(15.0, -2.0), a, b), b, 1e-12);

    // Zero-length segment falls back to the point itself
    EXPECT_NEAR(geometry::squaredDistanceToSegment(gp_Pnt2d(3.0, 4.0), a, a), 25.0, 1e-12);
}

// Picking needs no surface: isHit is pure geometry over the stored points
TEST_CASE(HitTest_ToleranceIsHalfWidthPlusMargin) {
    Wire wire = straightWire(4.0);
    EXPECT_NEAR(wire.hitTolerance(), 7.0, 1e-12);

    EXPECT_TRUE(wire.isHit(3.0, 3.0));
    EXPECT_FALSE(wire.isHit(3.0, 20.0));
    EXPECT_TRUE(wire.isHit(5.0, 0.0));
    EXPECT_TRUE(wire.isHit(3.0, 7.0));
    EXPECT_FALSE(wire.isHit(3.0, 7.01));
}

TEST_CASE(HitTest_UsesSegmentNotInfiniteLine) {
    Wire wire = straightWire(4.0);

    // On the supporting line but past the end point
    EXPECT_FALSE(wire.isHit(30.0, 0.0));
    EXPECT_TRUE(wire.isHit(16.0, 0.0));
    EXPECT_FALSE(wire.isHit(17.5, 0.0));
    // Diagonal distance from the end cap
    EXPECT_TRUE(wire.isHit(14.0, 5.0));
    EXPECT_FALSE(wire.isHit(15.0, 5.5));
}

TEST_CASE(HitTest_NeedsTwoPoints) {
    Wire empty;
    EXPECT_FALSE(empty.isHit(0.0, 0.0));

    Wire single;
    single.addPoint(1.0, 1.0);
    EXPECT_FALSE(single.isHit(1.0, 1.0));
}

TEST_CASE(HitTest_ZeroLengthSegment) {
    Wire wire;
    wire.addPoint(2.0, 2.0);
    wire.addPoint(2.0, 2.0);
    wire.setLineWidth(2.0);
    EXPECT_TRUE(wire.isHit(2.0, 8.0));
    EXPECT_FALSE(wire.isHit(2.0, 8.5));
}

TEST_CASE(HitSegment_ReportsFirstMatchingSegment) {
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(100.0, 0.0);
    wire.addPoint(100.0, 100.0);
    EXPECT_EQ(wire.hitSegment(50.0, 1.0), 0);
    EXPECT_EQ(wire.hitSegment(99.0, 50.0), 1);
    EXPECT_EQ(wire.hitSegment(50.0, 50.0), -1);
}

TEST_CASE(HitMargin_IsConfigurable) {
    Wire wire = straightWire(4.0);
    EXPECT_FALSE(wire.setHitMargin(-1.0).accepted);
    EXPECT_NEAR(wire.hitMargin(), 5.0, 1e-12);
    EXPECT_TRUE(wire.setHitMargin(0.0).accepted);
    EXPECT_FALSE(wire.isHit(3.0, 3.0));
    EXPECT_TRUE(wire.isHit(3.0, 2.0));
}

TEST_CASE(Path_InsertSetRemoveKeepOrder) {
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(20.0, 0.0);

    EXPECT_TRUE(wire.insertPoint(1, gp_Pnt2d(10.0, 5.0)).accepted);
    EXPECT_EQ(wire.path().size(), size_t(3));
    EXPECT_PNT2D_NEAR(wire.path()[1], gp_Pnt2d(10.0, 5.0), 1e-12);
    EXPECT_PNT2D_NEAR(wire.path()[2], gp_Pnt2d(20.0, 0.0), 1e-12);

    EXPECT_FALSE(wire.insertPoint(7, gp_Pnt2d(1.0, 1.0)).accepted);
    EXPECT_TRUE(wire.insertPoint(3, gp_Pnt2d(30.0, 0.0)).accepted);
    EXPECT_EQ(wire.path().size(), size_t(4));

    EXPECT_TRUE(wire.setPoint(0, gp_Pnt2d(-1.0, -1.0)).accepted);
    EXPECT_FALSE(wire.setPoint(4, gp_Pnt2d(0.0, 0.0)).accepted);
    EXPECT_FALSE(wire.setPoint(1, gp_Pnt2d(std::numeric_limits<double>::quiet_NaN(), 0.0)).accepted);
    EXPECT_PNT2D_NEAR(wire.path()[1], gp_Pnt2d(10.0, 5.0), 1e-12);

    EXPECT_TRUE(wire.removePoint(1));
    EXPECT_FALSE(wire.removePoint(10));
    EXPECT_EQ(wire.path().size(), size_t(3));
    EXPECT_PNT2D_NEAR(wire.path()[0], gp_Pnt2d(-1.0, -1.0), 1e-12);
    EXPECT_PNT2D_NEAR(wire.path()[1], gp_Pnt2d(20.0, 0.0), 1e-12);
    EXPECT_PNT2D_NEAR(wire.path()[2], gp_Pnt2d(30.0, 0.0), 1e-12);
}

TEST_CASE(Move_TranslatesFreeWire) {
    Wire wire;
    wire.addPoint(1.0, 2.0);
    wire.addPoint(3.0, 4.0);
    wire.move(10.0, -2.0);
    EXPECT_PNT2D_NEAR(wire.path()[0], gp_Pnt2d(11.0, 0.0), 1e-12);
    EXPECT_PNT2D_NEAR(wire.path()[1], gp_Pnt2d(13.0, 2.0), 1e-12);
}

TEST_CASE(Edit_RejectsInvalidValuesAndKeepsPrevious) {
    Wire wire;
    QJsonObject bad;
    bad["lineWidth"] = -3.0;
    bad["color"] = "not-a-color";
    bad["lineDash"] = "dashed";
    bad["path"] = 12;
    bad["isTemporary"] = "yes";
    bad["unknownKey"] = true;

    const EditResult result = wire.edit(bad);
    EXPECT_EQ(result.rejected.size(), size_t(5));
    EXPECT_TRUE(result.applied.empty());
    EXPECT_NEAR(wire.lineWidth(), 2.0, 1e-12);
    EXPECT_EQ(wire.color(), std::string("#000000"));
    EXPECT_TRUE(wire.lineDash().empty());
    EXPECT_TRUE(wire.path().empty());
    EXPECT_FALSE(wire.isTemporary());
}

TEST_CASE(Edit_AppliesWhitelistedKeys) {
    Wire wire;
    QJsonObject props;
    props["lineWidth"] = 6.0;
    props["color"] = "#ff0000";
    props["lineDash"] = QJsonArray{4.0, 2.0};
    props["isTemporary"] = true;
    props["path"] = QJsonArray{QJsonObject{{"x", 1.0}, {"y", 2.0}}, QJsonObject{{"x", 3.0}, {"y", 4.0}}};

    const EditResult result = wire.edit(props);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.applied.size(), size_t(5));
    EXPECT_NEAR(wire.lineWidth(), 6.0, 1e-12);
    EXPECT_EQ(wire.color(), std::string("#ff0000"));
    EXPECT_EQ(wire.lineDash().size(), size_t(2));
    EXPECT_TRUE(wire.isTemporary());
    EXPECT_EQ(wire.path().size(), size_t(2));
    EXPECT_PNT2D_NEAR(wire.path()[1], gp_Pnt2d(3.0, 4.0), 1e-12);
}

TEST_CASE(Edit_PathWithBadEntryIsRejectedWhole) {
    Wire wire;
    wire.addPoint(5.0, 5.0);
    QJsonObject props;
    props["path"] = QJsonArray{QJsonObject{{"x", 1.0}, {"y", 2.0}}, QJsonObject{{"x", "three"}, {"y", 4.0}}};
    EXPECT_FALSE(wire.edit(props).ok());
    EXPECT_EQ(wire.path().size(), size_t(1));
    EXPECT_PNT2D_NEAR(wire.path()[0], gp_Pnt2d(5.0, 5.0), 1e-12);
}

TEST_CASE(Draw_SkipsWiresWithFewerThanTwoPoints) {
    RecordingSurface surface;
    Wire wire;
    wire.addPoint(1.0, 1.0);
    wire.draw(surface);
    EXPECT_TRUE(surface.calls().empty());
}

TEST_CASE(Draw_StrokesOnePolylineInsideSaveRestore) {
    RecordingSurface surface;
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(10.0, 0.0);
    wire.addPoint(10.0, 10.0);
    wire.setLineDash({3.0, 1.0});
    wire.draw(surface);

    const auto& calls = surface.calls();
    EXPECT_EQ(calls.front(), std::string("save"));
    EXPECT_EQ(calls.back(), std::string("restore"));
    EXPECT_EQ(surface.depth(), 0);
    EXPECT_TRUE(surface.contains("strokeCap round"));
    EXPECT_TRUE(surface.contains("strokeJoin round"));
    EXPECT_TRUE(surface.contains("strokeDash 3 1"));
    EXPECT_TRUE(surface.contains("moveTo 0 0"));
    EXPECT_TRUE(surface.contains("lineTo 10 0"));
    EXPECT_TRUE(surface.contains("lineTo 10 10"));
    EXPECT_EQ(surface.count("moveTo"), size_t(1));
    EXPECT_EQ(std::count(calls.begin(), calls.end(), std::string("stroke")), 1);
}

TEST_CASE(Draw_SelectedWireDrawsDotHandlesOnPathPoints) {
    RecordingSurface surface;
    Wire wire;
    wire.addPoint(0.0, 0.0);
    wire.addPoint(10.0, 0.0);
    wire.select();
    wire.draw(surface);

    // Dot handles draw a filled and stroked circle each
    EXPECT_EQ(surface.count("circle"), size_t(2));
    EXPECT_EQ(surface.count("rectangle"), size_t(0));
    EXPECT_EQ(surface.depth(), 0);
}

int main() {
    return circuitsketch::test::runAllTests();
}
