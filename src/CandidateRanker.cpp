#include "CandidateRanker.hpp"

#include <algorithm>
#include <utility>

using namespace std;

namespace PlateTrace {

vector<Contour> CandidateRanker::rank(const vector<Contour>& contours, int topK) {
    if (topK <= 0 || contours.empty()) {
        return {};
    }

    // Areas are computed once; the comparator only reads them
    vector<pair<size_t, double>> order;
    order.reserve(contours.size());
    for (size_t i = 0; i < contours.size(); i++) {
        order.emplace_back(i, contours[i].area());
    }

    stable_sort(order.begin(), order.end(), [](const pair<size_t, double>& a, const pair<size_t, double>& b) {
        return a.second > b.second;
    });

    size_t keep = min(static_cast<size_t>(topK), order.size());
    vector<Contour> ranked;
    ranked.reserve(keep);
    for (size_t i = 0; i < keep; i++) {
        ranked.push_back(contours[order[i].first]);
    }
    return ranked;
}

} // namespace PlateTrace
