#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>

namespace PlateTrace {

class RegionExtractor {
public:
    // Keeps source pixels where mask == 255 and zeroes the rest. Source and
    // mask sizes must match; the result has the source's channel count.
    static cv::Mat maskApply(const cv::Mat& source, const cv::Mat& mask);

    // Tightest inclusive box around the 255 pixels. Throws EmptyMaskError
    // when there are none.
    static BoundingBox boundingBoxOf(const cv::Mat& mask);

    // Copy of source[rowMin..rowMax, colMin..colMax]. Throws
    // OutOfBoundsError when the box is inverted or leaves the raster.
    static cv::Mat crop(const cv::Mat& source, const BoundingBox& box);
};

} // namespace PlateTrace
