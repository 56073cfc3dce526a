#pragma once

#include "kb/hypothesis.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace vdc {

// ─── HypothesisSet ─────────────────────────────────────────────
// Ordered collection of hypotheses, deduplicated by identity. Copying a
// set is a shallow copy: the copy shares the hypothesis objects but has
// its own membership and its own hull cache.
//
// The set owns one auxiliary cache, the convex hull of its exponent
// pairs. Every insertion that changes membership clears dataValid();
// only storeConvexHull() sets it again.

class HypothesisSet {
public:
    HypothesisSet() = default;
    explicit HypothesisSet(const std::vector<HypothesisPtr>& hypotheses);

    /// Insert one hypothesis. Returns false if it is already a member.
    /// Throws std::invalid_argument on a null pointer.
    bool add(const HypothesisPtr& h);

    /// Bulk insertion. Returns the number of new members.
    size_t addHypotheses(const std::vector<HypothesisPtr>& hypotheses);

    bool contains(const HypothesisPtr& h) const { return members_.count(h.get()) > 0; }

    /// All members of the given type, in insertion order.
    std::vector<HypothesisPtr> listHypotheses(HypothesisType type) const;

    /// First member whose name contains `keyword`.
    std::optional<HypothesisPtr> findHypothesis(const std::string& keyword) const;

    size_t size() const { return hypotheses_.size(); }
    bool empty() const { return hypotheses_.empty(); }

    std::vector<HypothesisPtr>::const_iterator begin() const { return hypotheses_.begin(); }
    std::vector<HypothesisPtr>::const_iterator end() const { return hypotheses_.end(); }

    // ── Hull cache ──
    bool dataValid() const { return data_valid_; }

    /// Cached hull, or nullptr when the cache is stale.
    const std::vector<HypothesisPtr>* cachedConvexHull() const;

    void storeConvexHull(std::vector<HypothesisPtr> vertices);

private:
    std::vector<HypothesisPtr> hypotheses_;
    std::unordered_set<const Hypothesis*> members_;

    std::vector<HypothesisPtr> convex_hull_;
    bool data_valid_ = false;
};

} // namespace vdc
