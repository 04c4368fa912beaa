#pragma once

#include "Geometry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace PlateTrace {

// Decides whether an approximated candidate is taken as the plate.
class CandidateCriterion {
public:
    virtual ~CandidateCriterion() = default;
    virtual bool accept(const Polygon& polygon) const = 0;
    virtual std::string name() const = 0;
};

// First 4-vertex polygon wins. No convexity, angle or aspect check: this is a
// heuristic and produces false positives on 4-gons that are not plates.
class QuadrilateralCriterion : public CandidateCriterion {
public:
    bool accept(const Polygon& polygon) const override;
    std::string name() const override { return "quadrilateral"; }
};

// 4 vertices and convex
class ConvexQuadrilateralCriterion : public CandidateCriterion {
public:
    bool accept(const Polygon& polygon) const override;
    std::string name() const override { return "convex-quadrilateral"; }
};

enum class SelectorState {
    Searching,
    Found,
    Exhausted
};

const char* toString(SelectorState state);

struct Selection {
    SelectorState state = SelectorState::Searching;
    Polygon polygon;          // set only when Found
    int candidateIndex = -1;  // rank of the accepted candidate
    int examined = 0;         // candidates approximated before stopping

    bool found() const { return state == SelectorState::Found; }
};

class PlateSelector {
public:
    static constexpr double kDefaultEpsilon = 10.0;

    explicit PlateSelector(double epsilon = kDefaultEpsilon,
                           std::shared_ptr<const CandidateCriterion> criterion = nullptr);

    // Walks the ranked list in order and stops at the first accepted
    // candidate. Ends in Found or Exhausted, never throws for an empty list.
    Selection select(const std::vector<Contour>& rankedCandidates) const;

    double epsilon() const { return epsilon_; }
    const CandidateCriterion& criterion() const { return *criterion_; }

private:
    double epsilon_;
    std::shared_ptr<const CandidateCriterion> criterion_;
};

} // namespace PlateTrace
