#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>

namespace PlateTrace {

class MaskRasterizer {
public:
    static constexpr unsigned char kFill = 255;

    // Allocates a new zero CV_8UC1 raster of the given size and fills the
    // polygon interior and boundary with 255. The caller owns the result.
    // Negative sizes or an empty polygon throw std::invalid_argument, a zero
    // area size throws EmptyInputError.
    static cv::Mat rasterize(const Polygon& polygon, const cv::Size& size);
    static cv::Mat rasterize(const Polygon& polygon, int rows, int cols);
};

} // namespace PlateTrace
