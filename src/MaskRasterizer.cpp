#include "MaskRasterizer.hpp"
#include "Errors.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cv;
using namespace std;

namespace PlateTrace {

Mat MaskRasterizer::rasterize(const Polygon& polygon, const Size& size) {
    return rasterize(polygon, size.height, size.width);
}

Mat MaskRasterizer::rasterize(const Polygon& polygon, int rows, int cols) {
    if (rows < 0 || cols < 0) {
        throw invalid_argument("Mask dimensions must be non-negative, got " +
                               to_string(rows) + " x " + to_string(cols));
    }
    if (rows == 0 || cols == 0) {
        throw EmptyInputError("Cannot rasterize onto a zero-area mask");
    }
    if (polygon.empty()) {
        throw invalid_argument("Cannot rasterize an empty polygon");
    }

    Mat mask = Mat::zeros(rows, cols, CV_8UC1);
    vector<vector<Point>> polys = {polygon.points()};
    // FILLED covers the outline pixels as well as the interior, matching the
    // pixels findContours reports as the border
    drawContours(mask, polys, 0, Scalar(kFill), FILLED, LINE_8);
    return mask;
}

} // namespace PlateTrace
