#include <gtest/gtest.h>
#include <cmath>
#include "asteroids/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);

    Vector down = Vector::fromAngle(M_PI / 2);
    EXPECT_NEAR(down.x, 0.0, EPSILON);
    EXPECT_NEAR(down.y, 1.0, EPSILON);
}

TEST(VectorMathTest, VectorArithmetic) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    v1 += v2;
    EXPECT_EQ(v1, Vector(4.0, 6.0));

    Vector scaled = Vector(2.0, 3.0) * 2.0;
    EXPECT_DOUBLE_EQ(scaled.x, 4.0);
    EXPECT_DOUBLE_EQ(scaled.y, 6.0);
    EXPECT_EQ(-scaled, Vector(-4.0, -6.0));
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);
    EXPECT_DOUBLE_EQ(v.normalized().length(), 1.0);

    // Zero vector normalizes to +x instead of NaN
    Vector zero;
    EXPECT_EQ(zero.normalized(), Vector(1.0, 0.0));

    Vector rotated = Vector(1.0, 0.0).rotateByAngle(M_PI / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);
}

TEST(VectorMathTest, ClampLength) {
    Vector fast(300.0, 400.0);
    Vector clamped = fast.clampLength(100.0);
    EXPECT_NEAR(clamped.length(), 100.0, 1e-9);
    EXPECT_NEAR(clamped.x, 60.0, 1e-9);
    EXPECT_NEAR(clamped.y, 80.0, 1e-9);

    Vector slow(3.0, 4.0);
    EXPECT_EQ(slow.clampLength(100.0), slow);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    Vector between = p2 - p1;
    EXPECT_DOUBLE_EQ(between.x, 2.0);
    EXPECT_DOUBLE_EQ(between.y, 2.0);

    p1 += Vector(0.5, 0.5);
    EXPECT_EQ(p1, Position(1.5, 2.5));
    p1 = Position(1.0, 2.0);

    Vector v = static_cast<Vector>(p1);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);
}

TEST(VectorMathTest, WrapCoordinate) {
    EXPECT_DOUBLE_EQ(wrapCoordinate(100.0, 800.0), 100.0);
    EXPECT_DOUBLE_EQ(wrapCoordinate(-0.5, 800.0), 799.5);
    EXPECT_DOUBLE_EQ(wrapCoordinate(800.0, 800.0), 0.0);
    EXPECT_DOUBLE_EQ(wrapCoordinate(1650.0, 800.0), 50.0);
    EXPECT_DOUBLE_EQ(wrapCoordinate(-1650.0, 800.0), 750.0);

    // A tiny negative value must not round up to the extent itself
    double const tiny = wrapCoordinate(-1e-17, 800.0);
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, 800.0);
}

TEST(VectorMathTest, WrapPosition) {
    Position p = wrapPosition(Position(-10.0, 610.0), 800.0, 600.0);
    EXPECT_DOUBLE_EQ(p.x, 790.0);
    EXPECT_DOUBLE_EQ(p.y, 10.0);
}

TEST(VectorMathTest, ToroidalDeltaTakesShortestWay) {
    // Across the vertical seam
    Vector d = toroidalDelta(Position(790.0, 300.0), Position(10.0, 300.0), 800.0, 600.0);
    EXPECT_NEAR(d.x, 20.0, 1e-9);
    EXPECT_NEAR(d.y, 0.0, 1e-9);

    // Across the horizontal seam, pointing up
    d = toroidalDelta(Position(100.0, 5.0), Position(100.0, 595.0), 800.0, 600.0);
    EXPECT_NEAR(d.x, 0.0, 1e-9);
    EXPECT_NEAR(d.y, -10.0, 1e-9);

    // No seam involved
    d = toroidalDelta(Position(100.0, 100.0), Position(130.0, 140.0), 800.0, 600.0);
    EXPECT_NEAR(d.x, 30.0, 1e-9);
    EXPECT_NEAR(d.y, 40.0, 1e-9);
}

TEST(VectorMathTest, ToroidalDistanceIsSymmetric) {
    Position a(5.0, 5.0);
    Position b(795.0, 595.0);
    double const ab = toroidalDistance(a, b, 800.0, 600.0);
    double const ba = toroidalDistance(b, a, 800.0, 600.0);
    EXPECT_NEAR(ab, std::sqrt(200.0), 1e-9);
    EXPECT_NEAR(ab, ba, 1e-12);
}
