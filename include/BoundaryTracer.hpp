#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace PlateTrace {

// Border following (Suzuki-Abe, 8-connectivity) over a binary raster.
class BoundaryTracer {
public:
    struct TraceParams {
        // Drop collinear run points, keeping only direction changes
        bool compressChains = true;
    };

    // Non-zero pixels are foreground. Throws EmptyInputError for a 0x0 raster
    // and std::invalid_argument for multi-channel input. An all-zero raster
    // yields an empty set.
    static std::vector<Contour> trace(const cv::Mat& binary, const TraceParams& params);
    static std::vector<Contour> trace(const cv::Mat& binary);
};

} // namespace PlateTrace
