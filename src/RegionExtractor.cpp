#include "RegionExtractor.hpp"
#include "Errors.hpp"
#include "MaskRasterizer.hpp"

#include <opencv2/imgproc.hpp>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace cv;
using namespace std;

namespace PlateTrace {

namespace {

void checkMask(const Mat& mask) {
    if (mask.empty()) {
        throw EmptyInputError("Mask is empty");
    }
    if (mask.type() != CV_8UC1) {
        throw invalid_argument("Mask must be a single-channel 8-bit raster");
    }
}

} // namespace

Mat RegionExtractor::maskApply(const Mat& source, const Mat& mask) {
    checkMask(mask);
    if (source.empty()) {
        throw EmptyInputError("Source raster is empty");
    }
    if (source.size() != mask.size()) {
        ostringstream msg;
        msg << "Source (" << source.rows << "x" << source.cols << ") and mask ("
            << mask.rows << "x" << mask.cols << ") sizes differ";
        throw invalid_argument(msg.str());
    }

    // Only exact 255 counts as inside
    Mat keep = (mask == MaskRasterizer::kFill);

    Mat result = Mat::zeros(source.size(), source.type());
    source.copyTo(result, keep);
    return result;
}

BoundingBox RegionExtractor::boundingBoxOf(const Mat& mask) {
    checkMask(mask);

    Mat filled = (mask == MaskRasterizer::kFill);
    vector<Point> pixels;
    findNonZero(filled, pixels);
    if (pixels.empty()) {
        throw EmptyMaskError("Mask has no filled pixels");
    }
    return BoundingBox::fromRect(boundingRect(pixels));
}

Mat RegionExtractor::crop(const Mat& source, const BoundingBox& box) {
    if (source.empty()) {
        throw EmptyInputError("Cannot crop an empty raster");
    }
    if (!box.isValid() || box.rowMin < 0 || box.colMin < 0 ||
        box.rowMax >= source.rows || box.colMax >= source.cols) {
        ostringstream msg;
        msg << "Crop box " << box << " exceeds raster extent " << source.rows << "x" << source.cols;
        throw OutOfBoundsError(msg.str());
    }
    return source(box.toRect()).clone();
}

} // namespace PlateTrace
