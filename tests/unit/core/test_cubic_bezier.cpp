/**
 * @file test_cubic_bezier.cpp
 * @brief Unit tests for Core/CubicBezier
 */

#include <BezClip/Core/CubicBezier.h>
#include <BezClip/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace Bez::Clip;

namespace {

bool PointNearEqual(const Point2d& a, const Point2d& b, double tol = 1e-9) {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol;
}

class CubicBezierTest : public ::testing::Test {
protected:
    CubicBezier curve_{{10.0, 5.0}, {3.0, 11.0}, {12.0, 20.0}, {6.0, 15.0}};
    CubicBezier curveA_{{18.0, 122.0}, {15.0, 178.0}, {247.0, 173.0}, {251.0, 242.0}};
};

} // namespace

// =============================================================================
// Construction / Access
// =============================================================================

TEST_F(CubicBezierTest, ControlPoints) {
    EXPECT_EQ(curve_.P0(), Point2d(10.0, 5.0));
    EXPECT_EQ(curve_.P1(), Point2d(3.0, 11.0));
    EXPECT_EQ(curve_.P2(), Point2d(12.0, 20.0));
    EXPECT_EQ(curve_.P3(), Point2d(6.0, 15.0));

    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(curve_.Point(i), curve_.Points()[i]);
    }
}

TEST_F(CubicBezierTest, PointIndexOutOfRangeThrows) {
    EXPECT_THROW(curve_.Point(4), InvalidArgumentException);
}

TEST_F(CubicBezierTest, DegenerateIsPoint) {
    CubicBezier point = CubicBezier::Degenerate({2.0, 3.0});
    EXPECT_TRUE(point.IsPoint());
    EXPECT_FALSE(curve_.IsPoint());
    EXPECT_TRUE(PointNearEqual(point.PointAt(0.37), {2.0, 3.0}));
}

TEST_F(CubicBezierTest, IsValid) {
    EXPECT_TRUE(curve_.IsValid());
    CubicBezier bad({0.0, 0.0}, {std::numeric_limits<double>::quiet_NaN(), 0.0},
                    {1.0, 1.0}, {2.0, 2.0});
    EXPECT_FALSE(bad.IsValid());
}

// =============================================================================
// Evaluation
// =============================================================================

TEST_F(CubicBezierTest, PointAtEndpoints) {
    EXPECT_EQ(curve_.PointAt(0.0), curve_.P0());
    EXPECT_EQ(curve_.PointAt(1.0), curve_.P3());
}

TEST_F(CubicBezierTest, PointAtMidpoint) {
    Point2d p = curve_.PointAt(0.5);
    EXPECT_DOUBLE_EQ(p.x, 7.625);
    EXPECT_DOUBLE_EQ(p.y, 14.125);
}

TEST_F(CubicBezierTest, StraightCurveIsLinearInT) {
    CubicBezier line({0.0, 0.0}, {1.0, 2.0}, {2.0, 4.0}, {3.0, 6.0});
    for (int i = 0; i <= 10; ++i) {
        double t = i / 10.0;
        EXPECT_TRUE(PointNearEqual(line.PointAt(t), {3.0 * t, 6.0 * t}, 1e-12));
    }
}

TEST_F(CubicBezierTest, BoundingBox) {
    Rect2d box = curve_.BoundingBox();
    EXPECT_DOUBLE_EQ(box.x, 3.0);
    EXPECT_DOUBLE_EQ(box.y, 5.0);
    EXPECT_DOUBLE_EQ(box.width, 9.0);
    EXPECT_DOUBLE_EQ(box.height, 15.0);

    for (int i = 0; i <= 20; ++i) {
        Point2d p = curve_.PointAt(i / 20.0);
        EXPECT_GE(p.x, box.x);
        EXPECT_LE(p.x, box.Right());
        EXPECT_GE(p.y, box.y);
        EXPECT_LE(p.y, box.Bottom());
    }
}

// =============================================================================
// Subdivision
// =============================================================================

TEST_F(CubicBezierTest, SplitAtContinuity) {
    for (double t : {0.1, 0.25, 0.5, 0.75, 0.9}) {
        auto [left, right] = curveA_.SplitAt(t);
        Point2d expected = curveA_.PointAt(t);

        EXPECT_TRUE(PointNearEqual(left.PointAt(1.0), expected)) << "t = " << t;
        EXPECT_TRUE(PointNearEqual(right.PointAt(0.0), expected)) << "t = " << t;
        EXPECT_EQ(left.P0(), curveA_.P0());
        EXPECT_EQ(right.P3(), curveA_.P3());
    }
}

TEST_F(CubicBezierTest, SplitAtReparameterizes) {
    double t = 0.3;
    auto [left, right] = curveA_.SplitAt(t);

    for (double u : {0.2, 0.5, 0.8}) {
        EXPECT_TRUE(PointNearEqual(left.PointAt(u), curveA_.PointAt(u * t)));
        EXPECT_TRUE(PointNearEqual(right.PointAt(u), curveA_.PointAt(t + u * (1.0 - t))));
    }
}

TEST_F(CubicBezierTest, SplitAtZero) {
    auto [left, right] = curve_.SplitAt(0.0);
    EXPECT_EQ(left, CubicBezier::Degenerate(curve_.P0()));
    EXPECT_EQ(right, curve_);
}

TEST_F(CubicBezierTest, SplitAtOne) {
    auto [left, right] = curve_.SplitAt(1.0);
    EXPECT_EQ(left, curve_);
    EXPECT_EQ(right, CubicBezier::Degenerate(curve_.P3()));
}

TEST_F(CubicBezierTest, SplitAtOutOfRangeThrows) {
    EXPECT_THROW(curve_.SplitAt(-0.1), InvalidArgumentException);
    EXPECT_THROW(curve_.SplitAt(1.5), InvalidArgumentException);
    EXPECT_THROW(curve_.SplitAt(std::numeric_limits<double>::quiet_NaN()),
                 InvalidArgumentException);
}

TEST_F(CubicBezierTest, Split2Pieces) {
    auto pieces = curveA_.Split2(0.25, 0.75);

    EXPECT_TRUE(PointNearEqual(pieces[0].PointAt(1.0), curveA_.PointAt(0.25)));
    EXPECT_TRUE(PointNearEqual(pieces[1].PointAt(0.0), curveA_.PointAt(0.25)));
    EXPECT_TRUE(PointNearEqual(pieces[1].PointAt(0.5), curveA_.PointAt(0.5)));
    EXPECT_TRUE(PointNearEqual(pieces[1].PointAt(1.0), curveA_.PointAt(0.75)));
    EXPECT_TRUE(PointNearEqual(pieces[2].PointAt(0.0), curveA_.PointAt(0.75)));
    EXPECT_EQ(pieces[2].P3(), curveA_.P3());
}

TEST_F(CubicBezierTest, Split2LowOne) {
    auto pieces = curve_.Split2(1.0, 1.0);

    EXPECT_EQ(pieces[0], curve_);
    EXPECT_TRUE(pieces[1].IsPoint());
    EXPECT_TRUE(pieces[2].IsPoint());
    EXPECT_EQ(pieces[1].P0(), curve_.P3());
    EXPECT_TRUE(pieces[1].IsValid());
}

TEST_F(CubicBezierTest, Split2EmptyMiddle) {
    auto pieces = curveA_.Split2(0.4, 0.4);
    EXPECT_TRUE(PointNearEqual(pieces[1].PointAt(0.0), curveA_.PointAt(0.4)));
    EXPECT_TRUE(PointNearEqual(pieces[1].PointAt(1.0), curveA_.PointAt(0.4)));
}

TEST_F(CubicBezierTest, Split2InvalidThrows) {
    EXPECT_THROW(curve_.Split2(0.6, 0.4), InvalidArgumentException);
    EXPECT_THROW(curve_.Split2(-0.1, 0.4), InvalidArgumentException);
    EXPECT_THROW(curve_.Split2(0.2, 1.1), InvalidArgumentException);
}

TEST_F(CubicBezierTest, Subcurve) {
    ParamInterval iv(0.2, 0.6);
    CubicBezier sub = curveA_.Subcurve(iv);

    for (double u : {0.0, 0.3, 0.7, 1.0}) {
        EXPECT_TRUE(PointNearEqual(sub.PointAt(u), curveA_.PointAt(iv.MapToOuter(u)), 1e-9));
    }
}

TEST_F(CubicBezierTest, Reversed) {
    CubicBezier rev = curveA_.Reversed();
    for (double t : {0.0, 0.2, 0.5, 0.9}) {
        EXPECT_TRUE(PointNearEqual(rev.PointAt(t), curveA_.PointAt(1.0 - t)));
    }
}

// =============================================================================
// Clipping Support
// =============================================================================

TEST_F(CubicBezierTest, FatLineBoundsControlPolygon) {
    FatLine fat = curveA_.GetFatLine();

    EXPECT_NEAR(fat.baseline.Distance(curveA_.P0()), 0.0, 1e-9);
    EXPECT_NEAR(fat.baseline.Distance(curveA_.P3()), 0.0, 1e-9);
    EXPECT_NEAR(fat.minLine.Distance(curveA_.P1()), 0.0, 1e-9);
    EXPECT_NEAR(fat.maxLine.Distance(curveA_.P2()), 0.0, 1e-9);
    EXPECT_NEAR(fat.Width(), 110.66983766, 1e-6);

    for (const Point2d& p : curveA_.Points()) {
        EXPECT_TRUE(fat.Contains(p, 1e-9));
    }
}

TEST_F(CubicBezierTest, ClipAgainstLine) {
    // y >= 0 keeps the upper half of a straight curve crossing y = 0 at t = 0.5
    CubicBezier line({0.0, -3.0}, {1.0, -1.0}, {2.0, 1.0}, {3.0, 3.0});

    auto clip = line.ClipAgainst(Line2d());
    ASSERT_TRUE(clip.has_value());
    EXPECT_NEAR(clip->low, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(clip->high, 1.0);

    EXPECT_FALSE(line.ClipAgainst(Line2d().Negate().WithC(-10.0)).has_value());
}
