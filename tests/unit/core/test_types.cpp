#include <gtest/gtest.h>
#include <BezClip/Core/Types.h>
#include <BezClip/Core/Constants.h>
#include <BezClip/Core/Exception.h>

#include <cmath>
#include <limits>

using namespace Bez::Clip;

// =============================================================================
// Point2d Tests
// =============================================================================

TEST(Point2dTest, DefaultConstructor) {
    Point2d p;
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

TEST(Point2dTest, Arithmetic) {
    Point2d a(1.0, 2.0);
    Point2d b(3.0, 5.0);

    Point2d sum = a + b;
    Point2d diff = b - a;
    Point2d scaled = a * 3.0;

    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 7.0);
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 3.0);
    EXPECT_DOUBLE_EQ(scaled.x, 3.0);
    EXPECT_DOUBLE_EQ(scaled.y, 6.0);
}

TEST(Point2dTest, Norm) {
    Point2d p(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p.Norm(), 5.0);
}

TEST(Point2dTest, DotProduct) {
    Point2d a(1.0, 2.0);
    Point2d b(3.0, 4.0);
    EXPECT_DOUBLE_EQ(a.Dot(b), 11.0);
}

TEST(Point2dTest, CrossProduct) {
    Point2d a(1.0, 0.0);
    Point2d b(0.0, 1.0);
    EXPECT_DOUBLE_EQ(a.Cross(b), 1.0);
}

TEST(Point2dTest, Distance) {
    Point2d a(0.0, 0.0);
    Point2d b(3.0, 4.0);
    EXPECT_DOUBLE_EQ(a.DistanceTo(b), 5.0);
}

TEST(Point2dTest, Lerp) {
    Point2d a(0.0, 10.0);
    Point2d b(10.0, 20.0);

    EXPECT_EQ(a.Lerp(b, 0.0), a);
    EXPECT_EQ(a.Lerp(b, 1.0), b);

    Point2d mid = a.Lerp(b, 0.25);
    EXPECT_DOUBLE_EQ(mid.x, 2.5);
    EXPECT_DOUBLE_EQ(mid.y, 12.5);
}

TEST(Point2dTest, IsValid) {
    EXPECT_TRUE(Point2d(1.0, 2.0).IsValid());
    EXPECT_FALSE(Point2d(std::numeric_limits<double>::quiet_NaN(), 0.0).IsValid());
    EXPECT_FALSE(Point2d(0.0, std::numeric_limits<double>::infinity()).IsValid());
}

// =============================================================================
// Rect2d Tests
// =============================================================================

TEST(Rect2dTest, BasicProperties) {
    Rect2d r(10.0, 20.0, 100.0, 50.0);
    EXPECT_DOUBLE_EQ(r.Right(), 110.0);
    EXPECT_DOUBLE_EQ(r.Bottom(), 70.0);
    EXPECT_TRUE(r.IsValid());
    EXPECT_FALSE(Rect2d(0.0, 0.0, -1.0, 1.0).IsValid());
}

// =============================================================================
// Line2d Tests
// =============================================================================

TEST(Line2dTest, ConstructorNormalizes) {
    Line2d line(3.0, 4.0, 10.0);
    EXPECT_NEAR(line.a * line.a + line.b * line.b, 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(line.a, 0.6);
    EXPECT_DOUBLE_EQ(line.b, 0.8);
    EXPECT_DOUBLE_EQ(line.c, 2.0);
}

TEST(Line2dTest, ZeroNormThrows) {
    EXPECT_THROW(Line2d(0.0, 0.0, 1.0), DegenerateGeometryException);
}

TEST(Line2dTest, NonFiniteThrows) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Line2d(nan, 1.0, 0.0), DegenerateGeometryException);
    EXPECT_THROW(Line2d(1.0, 0.0, std::numeric_limits<double>::infinity()),
                 DegenerateGeometryException);
}

TEST(Line2dTest, DefaultIsXAxis) {
    Line2d line;
    EXPECT_TRUE(line.IsValid());
    EXPECT_TRUE(line.IsHorizontal());
    EXPECT_DOUBLE_EQ(line.SignedDistance({5.0, 3.0}), 3.0);
}

TEST(Line2dTest, FromPointsPassesThroughBoth) {
    Point2d p1(18.0, 122.0);
    Point2d p2(251.0, 242.0);
    Line2d line = Line2d::FromPoints(p1, p2);

    EXPECT_NEAR(line.a * line.a + line.b * line.b, 1.0, 1e-12);
    EXPECT_LT(std::abs(line.SignedDistance(p1)), 1e-9);
    EXPECT_LT(std::abs(line.SignedDistance(p2)), 1e-9);
}

TEST(Line2dTest, FromPointsVertical) {
    Line2d line = Line2d::FromPoints({5.0, 0.0}, {5.0, 10.0});

    EXPECT_TRUE(line.IsVertical());
    EXPECT_DOUBLE_EQ(line.b, 0.0);
    EXPECT_NEAR(line.Distance({5.0, 123.0}), 0.0, 1e-12);
    EXPECT_NEAR(line.Distance({8.0, 2.0}), 3.0, 1e-12);
    EXPECT_THROW(line.YAt(5.0), DegenerateGeometryException);
}

TEST(Line2dTest, FromPointsCoincidentThrows) {
    EXPECT_THROW(Line2d::FromPoints({1.0, 1.0}, {1.0, 1.0}), DegenerateGeometryException);
}

TEST(Line2dTest, YAt) {
    Line2d line = Line2d::FromPoints({0.0, 1.0}, {2.0, 5.0});
    EXPECT_NEAR(line.YAt(1.0), 3.0, 1e-12);
    EXPECT_NEAR(line.YAt(-1.0), -1.0, 1e-12);
}

TEST(Line2dTest, XIntercept) {
    Line2d line = Line2d::FromPoints({0.0, -2.0}, {4.0, 2.0});
    EXPECT_NEAR(line.XIntercept(), 2.0, 1e-12);

    Line2d horizontal = Line2d::FromPoints({0.0, 3.0}, {4.0, 3.0});
    EXPECT_TRUE(horizontal.IsHorizontal());
    EXPECT_THROW(horizontal.XIntercept(), DegenerateGeometryException);
}

TEST(Line2dTest, NegateFlipsSide) {
    Line2d line = Line2d::FromPoints({0.0, 0.0}, {10.0, 0.0});
    Point2d p(3.0, 4.0);

    EXPECT_DOUBLE_EQ(line.Negate().SignedDistance(p), -line.SignedDistance(p));
    EXPECT_NEAR(std::abs(line.SignedDistance(p)), 4.0, 1e-12);
}

TEST(Line2dTest, ParallelThrough) {
    Line2d line = Line2d::FromPoints({0.0, 0.0}, {10.0, 10.0});
    Point2d p(0.0, 4.0);
    Line2d parallel = line.ParallelThrough(p);

    EXPECT_DOUBLE_EQ(parallel.a, line.a);
    EXPECT_DOUBLE_EQ(parallel.b, line.b);
    EXPECT_NEAR(parallel.SignedDistance(p), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(parallel.c - line.c), 4.0 / std::sqrt(2.0), 1e-12);
}

TEST(Line2dTest, PerpendicularThrough) {
    Line2d line = Line2d::FromPoints({0.0, 0.0}, {10.0, 0.0});
    Line2d across = line.PerpendicularThrough({3.0, 7.0});

    EXPECT_TRUE(across.IsVertical());
    EXPECT_NEAR(across.Distance({3.0, -50.0}), 0.0, 1e-12);
    EXPECT_NEAR(across.Normal().Dot(line.Normal()), 0.0, 1e-12);
}

// =============================================================================
// ParamInterval Tests
// =============================================================================

TEST(ParamIntervalTest, Unit) {
    ParamInterval unit = ParamInterval::Unit();
    EXPECT_DOUBLE_EQ(unit.low, 0.0);
    EXPECT_DOUBLE_EQ(unit.high, 1.0);
    EXPECT_DOUBLE_EQ(unit.Width(), 1.0);
    EXPECT_DOUBLE_EQ(unit.Midpoint(), 0.5);
    EXPECT_TRUE(unit.IsValid());
}

TEST(ParamIntervalTest, Contains) {
    ParamInterval iv(0.25, 0.5);
    EXPECT_TRUE(iv.Contains(0.25));
    EXPECT_TRUE(iv.Contains(0.4));
    EXPECT_FALSE(iv.Contains(0.6));
    EXPECT_TRUE(iv.Contains(0.51, 0.02));
}

TEST(ParamIntervalTest, ComposeMapsIntoParent) {
    ParamInterval outer(0.2, 0.6);
    ParamInterval composed = outer.Compose(ParamInterval(0.25, 0.5));

    EXPECT_NEAR(composed.low, 0.3, 1e-15);
    EXPECT_NEAR(composed.high, 0.4, 1e-15);
}

TEST(ParamIntervalTest, ComposeWithUnitIsIdentity) {
    ParamInterval outer(0.125, 0.75);
    ParamInterval composed = outer.Compose(ParamInterval::Unit());

    EXPECT_DOUBLE_EQ(composed.low, outer.low);
    EXPECT_DOUBLE_EQ(composed.high, outer.high);
}

TEST(ParamIntervalTest, ComposeStaysInsideParent) {
    ParamInterval outer(0.1, 0.3);
    for (int i = 0; i <= 10; ++i) {
        double lo = i / 10.0;
        ParamInterval composed = outer.Compose(ParamInterval(lo, 1.0));
        EXPECT_GE(composed.low, outer.low);
        EXPECT_LE(composed.high, outer.high);
        EXPECT_LE(composed.low, composed.high);
    }
}

TEST(ParamIntervalTest, MapToOuter) {
    ParamInterval iv(0.5, 1.0);
    EXPECT_DOUBLE_EQ(iv.MapToOuter(0.0), 0.5);
    EXPECT_DOUBLE_EQ(iv.MapToOuter(0.5), 0.75);
    EXPECT_DOUBLE_EQ(iv.MapToOuter(1.0), 1.0);
}

TEST(ParamIntervalTest, Bisect) {
    auto [left, right] = ParamInterval(0.2, 0.6).Bisect();
    EXPECT_DOUBLE_EQ(left.low, 0.2);
    EXPECT_DOUBLE_EQ(left.high, 0.4);
    EXPECT_DOUBLE_EQ(right.low, 0.4);
    EXPECT_DOUBLE_EQ(right.high, 0.6);
}

TEST(ParamIntervalTest, IsValid) {
    EXPECT_TRUE(ParamInterval(0.3, 0.3).IsValid());
    EXPECT_FALSE(ParamInterval(0.5, 0.4).IsValid());
    EXPECT_FALSE(ParamInterval(-0.1, 0.4).IsValid());
    EXPECT_FALSE(ParamInterval(0.0, 1.5).IsValid());
}

// =============================================================================
// Constants Tests
// =============================================================================

TEST(ConstantsTest, Clamp) {
    EXPECT_DOUBLE_EQ(Clamp(1.5, 0.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(Clamp(-0.5, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(Clamp(0.25, 0.0, 1.0), 0.25);
}
