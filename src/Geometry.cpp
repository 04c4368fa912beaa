#include "Geometry.hpp"
#include "Errors.hpp"

#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

namespace PlateTrace {

BoundingBox BoundingBox::fromRect(const Rect& rect) {
    return BoundingBox(rect.y, rect.x, rect.y + rect.height - 1, rect.x + rect.width - 1);
}

ostream& operator<<(ostream& os, const BoundingBox& box) {
    return os << "(" << box.rowMin << "," << box.colMin << "," << box.rowMax << "," << box.colMax << ")";
}

double Contour::area() const {
    if (points_.size() < 3) {
        return 0.0;
    }
    return contourArea(points_, false);
}

double Contour::perimeter() const {
    if (points_.size() < 2) {
        return 0.0;
    }
    return arcLength(points_, true);
}

BoundingBox Contour::boundingBox() const {
    if (points_.empty()) {
        throw EmptyInputError("Cannot compute the bounding box of an empty contour");
    }
    return BoundingBox::fromRect(boundingRect(points_));
}

bool Contour::isConvex() const {
    if (points_.size() < 3) {
        return false;
    }
    return isContourConvex(points_);
}

} // namespace PlateTrace
