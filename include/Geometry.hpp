#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <ostream>
#include <utility>
#include <vector>

namespace PlateTrace {

// Inclusive axis-aligned box in (row, column) raster coordinates
struct BoundingBox {
    int rowMin = 0;
    int colMin = 0;
    int rowMax = -1;
    int colMax = -1;

    BoundingBox() = default;
    BoundingBox(int rowMin, int colMin, int rowMax, int colMax)
        : rowMin(rowMin), colMin(colMin), rowMax(rowMax), colMax(colMax) {}

    static BoundingBox fromRect(const cv::Rect& rect);

    int height() const { return rowMax - rowMin + 1; }
    int width() const { return colMax - colMin + 1; }
    bool isValid() const { return rowMin <= rowMax && colMin <= colMax; }
    cv::Rect toRect() const { return cv::Rect(colMin, rowMin, width(), height()); }

    bool operator==(const BoundingBox& other) const {
        return rowMin == other.rowMin && colMin == other.colMin &&
               rowMax == other.rowMax && colMax == other.colMax;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const BoundingBox& box);

// Closed, ordered boundary curve. Point order is the traversal direction and
// the first point is where polygon approximation starts.
class Contour {
public:
    Contour() = default;
    explicit Contour(std::vector<cv::Point> points) : points_(std::move(points)) {}

    const std::vector<cv::Point>& points() const { return points_; }
    std::size_t vertexCount() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const cv::Point& operator[](std::size_t i) const { return points_[i]; }
    std::vector<cv::Point>::const_iterator begin() const { return points_.begin(); }
    std::vector<cv::Point>::const_iterator end() const { return points_.end(); }

    // Absolute shoelace area of the closed point sequence
    double area() const;
    double perimeter() const;
    // Extent of the vertices; throws EmptyInputError for an empty contour
    BoundingBox boundingBox() const;
    bool isConvex() const;

    bool operator==(const Contour& other) const { return points_ == other.points_; }
    bool operator!=(const Contour& other) const { return !(*this == other); }

private:
    std::vector<cv::Point> points_;
};

// A contour reduced to its essential vertices
using Polygon = Contour;

} // namespace PlateTrace
