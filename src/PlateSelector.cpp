#include "PlateSelector.hpp"
#include "PolygonApproximator.hpp"

#include <stdexcept>
#include <utility>

using namespace std;

namespace PlateTrace {

bool QuadrilateralCriterion::accept(const Polygon& polygon) const {
    return polygon.vertexCount() == 4;
}

bool ConvexQuadrilateralCriterion::accept(const Polygon& polygon) const {
    return polygon.vertexCount() == 4 && polygon.isConvex();
}

const char* toString(SelectorState state) {
    switch (state) {
        case SelectorState::Searching: return "Searching";
        case SelectorState::Found: return "Found";
        case SelectorState::Exhausted: return "Exhausted";
    }
    return "Unknown";
}

PlateSelector::PlateSelector(double epsilon, shared_ptr<const CandidateCriterion> criterion)
    : epsilon_(epsilon), criterion_(std::move(criterion)) {
    if (!(epsilon_ >= 0.0)) {
        throw invalid_argument("Selector tolerance must be non-negative");
    }
    if (!criterion_) {
        criterion_ = make_shared<QuadrilateralCriterion>();
    }
}

Selection PlateSelector::select(const vector<Contour>& rankedCandidates) const {
    Selection selection;
    size_t next = 0;

    while (selection.state == SelectorState::Searching) {
        if (next >= rankedCandidates.size()) {
            selection.state = SelectorState::Exhausted;
            break;
        }

        Polygon approx = PolygonApproximator::approximate(rankedCandidates[next], epsilon_);
        selection.examined++;

        if (criterion_->accept(approx)) {
            selection.state = SelectorState::Found;
            selection.polygon = std::move(approx);
            selection.candidateIndex = static_cast<int>(next);
        }
        next++;
    }

    return selection;
}

} // namespace PlateTrace
