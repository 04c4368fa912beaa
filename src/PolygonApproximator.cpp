#include "PolygonApproximator.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace cv;
using namespace std;

namespace PlateTrace {

Polygon PolygonApproximator::approximate(const Contour& contour, double epsilon, bool closed) {
    if (epsilon < 0.0 || std::isnan(epsilon)) {
        throw invalid_argument("Approximation tolerance must be non-negative, got " + to_string(epsilon));
    }

    // Nothing left to remove from a point or a segment
    if (contour.vertexCount() < 3) {
        return contour;
    }

    vector<Point> approx;
    approxPolyDP(contour.points(), approx, epsilon, closed);
    return Polygon(std::move(approx));
}

} // namespace PlateTrace
