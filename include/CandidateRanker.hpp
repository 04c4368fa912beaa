#pragma once

#include "Geometry.hpp"
#include <vector>

namespace PlateTrace {

class CandidateRanker {
public:
    static constexpr int kDefaultTopK = 10;

    // Largest enclosed area first; equal areas keep their input order.
    // Returns at most topK contours, none when topK <= 0.
    static std::vector<Contour> rank(const std::vector<Contour>& contours, int topK = kDefaultTopK);
};

} // namespace PlateTrace
