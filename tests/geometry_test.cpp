#include "gtest/gtest.h"
#include "geometry.hpp"

using namespace PTG;

TEST(GeometryTest, OrientationSign) {
    Point a(0, 0);
    Point b(1, 0);
    Point c(0, 1);

    EXPECT_GT(Orient2d(a, b, c), 0);   // ccw
    EXPECT_LT(Orient2d(a, c, b), 0);   // cw
    EXPECT_EQ(Orient2d(a, b, Point(2, 0)), 0);
}

TEST(GeometryTest, LeftOfDirectedLine) {
    Point a(0, 0);
    Point b(10, 0);

    EXPECT_TRUE(IsLeft(a, b, Point(5, 1)));
    EXPECT_FALSE(IsLeft(a, b, Point(5, -1)));
    EXPECT_FALSE(IsLeft(a, b, Point(5, 0)));

    EXPECT_EQ(LocatePntLine(Point(5, 1), a, b), PntLineLocationType::PL_LEFT);
    EXPECT_EQ(LocatePntLine(Point(5, -1), a, b), PntLineLocationType::PL_RIGHT);
    EXPECT_EQ(LocatePntLine(Point(-3, 0), a, b), PntLineLocationType::PL_ON_LINE);
}

TEST(GeometryTest, NearlyCollinearIsStillClassified) {
    // the adaptive predicate must not collapse tiny offsets to zero
    Point a(0.5, 0.5);
    Point b(12.0, 12.0);
    Point c(24.0, 24.0 + 1e-12);

    EXPECT_GT(Orient2d(a, b, c), 0);
}

TEST(GeometryTest, DistanceAndMidpoint) {
    Point a(1, 2);
    Point b(4, 6);

    EXPECT_DOUBLE_EQ(Distance(a, b), 5.0);
    EXPECT_DOUBLE_EQ(SquaredDistance(a, b), 25.0);
    EXPECT_DOUBLE_EQ(Distance(a, a), 0.0);

    Point m = Midpoint(a, b);
    EXPECT_DOUBLE_EQ(m.X(), 2.5);
    EXPECT_DOUBLE_EQ(m.Y(), 4.0);
}

TEST(GeometryTest, PointEquality) {
    EXPECT_TRUE(Point(1, 2) == Point(1, 2));
    EXPECT_TRUE(Point(1, 2) != Point(2, 1));
    EXPECT_TRUE(Point() == Point(0, 0));
}
