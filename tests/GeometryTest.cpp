#include "Geometry.hpp"
#include "Errors.hpp"
#include "TestRasters.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace PlateTrace;
using namespace PlateTrace::test;

TEST(BoundingBoxTest, DimensionsAreInclusive) {
    BoundingBox box(20, 10, 50, 80);
    EXPECT_EQ(box.height(), 31);
    EXPECT_EQ(box.width(), 71);
    EXPECT_TRUE(box.isValid());
    EXPECT_EQ(box.toRect(), cv::Rect(10, 20, 71, 31));
}

TEST(BoundingBoxTest, FromRectInvertsToRect) {
    cv::Rect rect(3, 7, 12, 5);
    BoundingBox box = BoundingBox::fromRect(rect);
    EXPECT_EQ(box, BoundingBox(7, 3, 11, 14));
    EXPECT_EQ(box.toRect(), rect);
}

TEST(BoundingBoxTest, DefaultIsInvalid) {
    EXPECT_FALSE(BoundingBox().isValid());
}

TEST(BoundingBoxTest, StreamsAsTuple) {
    std::ostringstream os;
    os << BoundingBox(1, 2, 3, 4);
    EXPECT_EQ(os.str(), "(1,2,3,4)");
}

TEST(ContourTest, AreaUsesAbsoluteShoelace) {
    Contour ccw = contourFromRowCol({{0, 0}, {10, 0}, {10, 20}, {0, 20}});
    Contour cw = contourFromRowCol({{0, 0}, {0, 20}, {10, 20}, {10, 0}});
    EXPECT_DOUBLE_EQ(ccw.area(), 200.0);
    EXPECT_DOUBLE_EQ(cw.area(), 200.0);
}

TEST(ContourTest, DegenerateContoursHaveZeroArea) {
    EXPECT_DOUBLE_EQ(Contour().area(), 0.0);
    EXPECT_DOUBLE_EQ(contourFromRowCol({{5, 5}}).area(), 0.0);
    EXPECT_DOUBLE_EQ(contourFromRowCol({{5, 5}, {5, 30}}).area(), 0.0);
}

TEST(ContourTest, PerimeterOfClosedSquare) {
    EXPECT_DOUBLE_EQ(square(0, 0, 10).perimeter(), 40.0);
}

TEST(ContourTest, BoundingBoxOfVertices) {
    Contour c = contourFromRowCol({{20, 10}, {50, 10}, {50, 80}, {20, 80}});
    EXPECT_EQ(c.boundingBox(), BoundingBox(20, 10, 50, 80));
    EXPECT_THROW(Contour().boundingBox(), EmptyInputError);
}

TEST(ContourTest, ConvexityCheck) {
    EXPECT_TRUE(square(0, 0, 10).isConvex());
    Contour dart = contourFromRowCol({{0, 0}, {50, 100}, {100, 0}, {50, 30}});
    EXPECT_FALSE(dart.isConvex());
}

TEST(ContourTest, PointAccessKeepsOrder) {
    Contour c = contourFromRowCol({{1, 2}, {3, 4}, {5, 6}});
    ASSERT_EQ(c.vertexCount(), 3u);
    EXPECT_EQ(c[0], cv::Point(2, 1));
    EXPECT_EQ(c[2], cv::Point(6, 5));
}
