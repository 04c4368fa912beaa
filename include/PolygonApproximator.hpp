#pragma once

#include "Geometry.hpp"

namespace PlateTrace {

// Ramer-Douglas-Peucker simplification. For closed curves the anchor pair is
// chosen on the loop before splitting, so there are no fixed endpoints.
class PolygonApproximator {
public:
    // epsilon is the largest allowed distance between a dropped point and its
    // chord; negative values throw std::invalid_argument. The result can have
    // fewer than 3 vertices for degenerate input.
    static Polygon approximate(const Contour& contour, double epsilon, bool closed = true);
};

} // namespace PlateTrace
