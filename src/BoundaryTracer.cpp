#include "BoundaryTracer.hpp"
#include "Errors.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

using namespace cv;
using namespace std;

namespace PlateTrace {

vector<Contour> BoundaryTracer::trace(const Mat& binary, const TraceParams& params) {
    if (binary.empty()) {
        throw EmptyInputError("Cannot trace boundaries of an empty raster");
    }
    if (binary.channels() != 1) {
        throw invalid_argument("Boundary tracing expects a single-channel raster, got " +
                               to_string(binary.channels()) + " channels");
    }

    // findContours only reads 8-bit (or 32-bit label) images
    Mat foreground;
    if (binary.depth() == CV_8U) {
        foreground = binary;
    } else {
        compare(binary, Scalar(0), foreground, CMP_NE);
    }

    vector<vector<Point>> raw;
    vector<Vec4i> hierarchy;
    findContours(foreground, raw, hierarchy, RETR_TREE,
                 params.compressChains ? CHAIN_APPROX_SIMPLE : CHAIN_APPROX_NONE);

    vector<Contour> contours;
    contours.reserve(raw.size());
    for (auto& points : raw) {
        contours.emplace_back(std::move(points));
    }
    return contours;
}

vector<Contour> BoundaryTracer::trace(const Mat& binary) {
    return trace(binary, TraceParams{});
}

} // namespace PlateTrace
