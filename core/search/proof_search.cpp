#include "search/proof_search.hpp"
#include "duality/beta_duality.hpp"
#include "geometry/convex_hull.hpp"
#include "pairs/pair_hypotheses.hpp"
#include "search/closure_engine.hpp"
#include "search/hull_cache.hpp"
#include "util/debug_log.hpp"

#include <limits>
#include <stdexcept>

namespace vdc {

namespace {

Point2 pointOf(const HypothesisPtr& h) {
    const ExponentPair& p = h->exponentPair();
    return Point2(p.k, p.l);
}

std::string citation(const std::vector<HypothesisPtr>& pairs) {
    std::string out = "Follows from convexity and the exponent pairs ";
    for (size_t i = 0; i < pairs.size(); i++) {
        if (i > 0) out += ", ";
        out += pairs[i]->exponentPair().toString();
    }
    return out;
}

// Cheapest vertex triangle containing target; empty if none does.
std::vector<HypothesisPtr> bestTriangle(const std::vector<HypothesisPtr>& verts,
                                        const Point2& target) {
    double lowest = std::numeric_limits<double>::infinity();
    std::vector<HypothesisPtr> best;
    const size_t n = verts.size();
    for (size_t a = 0; a < n; a++) {
        for (size_t b = a + 1; b < n; b++) {
            for (size_t c = b + 1; c < n; c++) {
                Polytope tri = Polytope::fromVertices(
                    {pointOf(verts[a]), pointOf(verts[b]), pointOf(verts[c])});
                if (!tri.contains(target)) continue;
                double comp = verts[a]->proofComplexity() +
                              verts[b]->proofComplexity() +
                              verts[c]->proofComplexity();
                if (comp < lowest) {
                    lowest = comp;
                    best = {verts[a], verts[b], verts[c]};
                }
            }
        }
    }
    return best;
}

// Snapshot of the hypotheses available up to `year` (undated ones always are).
HypothesisSet availableBy(const HypothesisSet& hypotheses, int year) {
    HypothesisSet result;
    for (const auto& h : hypotheses) {
        std::optional<int> y = h->reference().year();
        if (!y || *y <= year) result.add(h);
    }
    return result;
}

} // namespace

std::string toString(ProofOptimization method) {
    switch (method) {
        case ProofOptimization::Date:       return "date";
        case ProofOptimization::Complexity: return "complexity";
        case ProofOptimization::None:       return "none";
    }
    return "unknown";
}

std::string toString(ProofStatus status) {
    switch (status) {
        case ProofStatus::Proved:       return "proved";
        case ProofStatus::NoResult:     return "no result";
        case ProofStatus::NotSupported: return "not supported";
    }
    return "unknown";
}

std::optional<HypothesisPtr> findProof(const Rational& k, const Rational& l,
                                       const HypothesisSet& hypotheses,
                                       bool optimize,
                                       const EngineConfig& config) {
    HypothesisSet working = hypotheses;
    working.addHypotheses(betaBoundsToExponentPairs(working));
    working.addHypotheses(computeExpPairs(working, config.closure));
    if (working.listHypotheses(HypothesisType::ExponentPair).empty()) {
        return std::nullopt;
    }

    const std::vector<HypothesisPtr>& verts = computeConvexHull(working);

    std::vector<Point2> coords;
    coords.reserve(verts.size());
    for (const auto& v : verts) coords.push_back(pointOf(v));

    const Point2 target(k, l);
    if (!Polytope::fromVertices(coords).contains(target)) {
        VDC_DEBUG_LOG("(%s, %s) lies outside the hull of %zu vertices",
                      toDecimalString(k, config.numeric).c_str(),
                      toDecimalString(l, config.numeric).c_str(), verts.size());
        return std::nullopt;
    }

    std::vector<HypothesisPtr> cited = verts;
    if (optimize) {
        std::vector<HypothesisPtr> tri = bestTriangle(verts, target);
        // No triangle exists when the hull has fewer than three vertices
        if (!tri.empty()) cited = std::move(tri);
    }
    return derivedExpPair(k, l, citation(cited), cited);
}

ProofResult findBestProof(const Rational& k, const Rational& l,
                          const HypothesisSet& hypotheses,
                          ProofOptimization method,
                          const EngineConfig& config) {
    ProofResult result;

    switch (method) {
        case ProofOptimization::Date: {
            std::optional<int> from_year;
            std::optional<int> to_year;
            for (const auto& h : hypotheses) {
                std::optional<int> y = h->reference().year();
                if (!y) continue;
                if (!from_year || *y < *from_year) from_year = y;
                if (!to_year || *y > *to_year) to_year = y;
            }

            if (!from_year) {
                // Nothing is dated, so every hypothesis is available at once
                if (auto proof = findProof(k, l, hypotheses, true, config)) {
                    result.status = ProofStatus::Proved;
                    result.proof = *proof;
                }
                return result;
            }

            size_t num_hypotheses = 0;
            for (int year = *from_year; year <= *to_year; year++) {
                HypothesisSet available = availableBy(hypotheses, year);
                if (available.size() == num_hypotheses) continue;
                num_hypotheses = available.size();

                if (auto proof = findProof(k, l, available, true, config)) {
                    VDC_DEBUG_LOG("earliest proof found with hypotheses up to %d", year);
                    result.status = ProofStatus::Proved;
                    result.proof = *proof;
                    return result;
                }
            }
            return result;
        }

        case ProofOptimization::Complexity: {
            // Minimising over containing triangles stands in for the
            // intractable global minimisation.
            if (auto proof = findProof(k, l, hypotheses, true, config)) {
                result.status = ProofStatus::Proved;
                result.proof = *proof;
            }
            return result;
        }

        case ProofOptimization::None:
            result.status = ProofStatus::NotSupported;
            return result;
    }

    throw std::logic_error("findBestProof: unimplemented optimisation method " +
                           std::to_string(static_cast<int>(method)));
}

} // namespace vdc
