#include <gtest/gtest.h>
#include "kb/hypothesis.hpp"
#include "kb/hypothesis_set.hpp"
#include "kb/reference.hpp"
#include "pairs/pair_hypotheses.hpp"
#include "bounds/bound_hypotheses.hpp"
#include "search/hull_cache.hpp"
#include "transforms/default_transforms.hpp"
#include "transforms/transform_base.hpp"

#include <stdexcept>
#include <type_traits>

using namespace vdc;

namespace {
Rational q(const char* text) { return parseRational(text); }
}

// ─── Reference ─────────────────────────────────────────────────

TEST(ReferenceTest, MaxYearIgnoresUndated) {
    std::vector<Reference> refs = {
        Reference::literature("Bourgain", 2017),
        Reference::trivial(),
        Reference::literature("Huxley", 2005),
    };
    ASSERT_TRUE(Reference::maxYear(refs).has_value());
    EXPECT_EQ(*Reference::maxYear(refs), 2017);
}

TEST(ReferenceTest, MaxYearOfUndatedIsUnknown) {
    EXPECT_FALSE(Reference::maxYear({Reference::trivial(), Reference::conjectured()}).has_value());
    EXPECT_FALSE(Reference::maxYear({}).has_value());
}

TEST(ReferenceTest, YearString) {
    EXPECT_EQ(Reference::literature("Huxley", 2005).yearString(), "2005");
    EXPECT_EQ(Reference::trivial().yearString(), "Unknown date");
    EXPECT_EQ(Reference::derived(1991).kind(), Reference::Kind::Derived);
}

// ─── Hypothesis ────────────────────────────────────────────────

TEST(HypothesisTest, LiteratureExpPair) {
    auto h = literatureExpPair(q("13/84"), q("55/84"), Reference::literature("Bourgain", 2017));
    EXPECT_EQ(h->name(), "Bourgain exponent pair");
    EXPECT_EQ(h->type(), HypothesisType::ExponentPair);
    EXPECT_EQ(h->exponentPair(), ExponentPair(q("13/84"), q("55/84")));
    EXPECT_EQ(h->proof(), "See [Bourgain, 2017]");
    EXPECT_EQ(*h->reference().year(), 2017);
}

TEST(HypothesisTest, TrivialAndConjecture) {
    EXPECT_EQ(trivialExpPair()->exponentPair().toString(), "(0, 1)");
    EXPECT_EQ(exponentPairConjecture()->exponentPair().toString(), "(0, 0)");
    EXPECT_FALSE(trivialExpPair()->reference().year().has_value());
}

TEST(HypothesisTest, DerivedIsDatedByLatestDependency) {
    auto a = literatureExpPair(q("1/6"), q("2/3"), Reference::literature("van der Corput", 1920));
    auto b = literatureExpPair(q("32/205"), q("269/410"), Reference::literature("Huxley", 2005));
    auto d = derivedExpPair(q("1/6"), q("5/8"), "test", {a, b, trivialExpPair()});
    EXPECT_EQ(d->name(), "Derived exponent pair (1/6, 5/8)");
    EXPECT_EQ(d->reference().kind(), Reference::Kind::Derived);
    EXPECT_EQ(*d->reference().year(), 2005);
    EXPECT_EQ(d->dependencies().size(), 3u);
}

TEST(HypothesisTest, DependenciesAreDeduplicated) {
    auto t = trivialExpPair();
    auto d = derivedExpPair(q("0"), q("1"), "test", {t, t, t});
    EXPECT_EQ(d->dependencies().size(), 1u);
}

TEST(HypothesisTest, ProofComplexityIsRecursive) {
    HypothesisSet set;
    registerDefaultTransforms(set);
    auto b = *set.findHypothesis("van der Corput B transform");
    auto t = trivialExpPair();

    EXPECT_DOUBLE_EQ(t->proofComplexity(), 1.0);
    auto bt = applyTransform(b, t);
    EXPECT_DOUBLE_EQ(bt->proofComplexity(), 3.0);       // 1 + (1 + 1)
    auto bbt = applyTransform(b, bt);
    EXPECT_DOUBLE_EQ(bbt->proofComplexity(), 5.0);      // 1 + (3 + 1)
}

TEST(HypothesisTest, TypedAccessorRejectsWrongKind) {
    auto t = trivialExpPair();
    EXPECT_THROW(t->betaBound(), std::invalid_argument);
    EXPECT_THROW(t->transform(), std::invalid_argument);
}

TEST(HypothesisTest, SharedHandlesAreReadOnly) {
    static_assert(std::is_const<HypothesisPtr::element_type>::value,
                  "hypotheses are shared through pointers to const");
    auto h = trivialExpPair();
    HypothesisSet set;
    set.add(h);
    EXPECT_TRUE((std::is_same<decltype(*set.begin()), const HypothesisPtr&>::value));
    EXPECT_EQ(h->exponentPair(), ExponentPair(q("0"), q("1")));
}

TEST(HypothesisTest, PayloadMustMatchType) {
    EXPECT_THROW(Hypothesis("bad", HypothesisType::BetaBound, ExponentPair(q("0"), q("1")),
                            "", Reference::trivial()),
                 std::invalid_argument);
}

// ─── HypothesisSet ─────────────────────────────────────────────

TEST(HypothesisSetTest, AddDeduplicatesByIdentity) {
    HypothesisSet set;
    auto t = trivialExpPair();
    EXPECT_TRUE(set.add(t));
    EXPECT_FALSE(set.add(t));
    EXPECT_TRUE(set.add(trivialExpPair()));  // distinct object, same payload
    EXPECT_EQ(set.size(), 2u);
    EXPECT_THROW(set.add(nullptr), std::invalid_argument);
}

TEST(HypothesisSetTest, ListAndFind) {
    HypothesisSet set;
    set.add(trivialExpPair());
    registerDefaultTransforms(set);
    EXPECT_EQ(set.listHypotheses(HypothesisType::ExponentPair).size(), 1u);
    EXPECT_EQ(set.listHypotheses(HypothesisType::ExponentPairTransform).size(), 2u);
    EXPECT_TRUE(set.listHypotheses(HypothesisType::BetaBound).empty());

    auto b = set.findHypothesis("van der Corput B");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ((*b)->transform().name(), "van der Corput B transform");
    EXPECT_FALSE(set.findHypothesis("Vinogradov").has_value());
}

TEST(HypothesisSetTest, CopyIsShallowAndIndependent) {
    HypothesisSet set;
    auto t = trivialExpPair();
    set.add(t);

    HypothesisSet copy = set;
    copy.add(literatureExpPair(q("1/6"), q("2/3"), Reference::literature("van der Corput", 1920)));
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(copy.size(), 2u);
    EXPECT_EQ(*copy.begin(), t);
}

// ─── Hull cache ────────────────────────────────────────────────

TEST(HullCacheTest, FewerThanThreePairsIsWholeSet) {
    HypothesisSet set;
    auto t = trivialExpPair();
    auto p = literatureExpPair(q("1/2"), q("1/2"), Reference::literature("van der Corput", 1920));
    set.add(t);
    set.add(p);

    const auto& hull = computeConvexHull(set);
    ASSERT_EQ(hull.size(), 2u);
    EXPECT_EQ(hull[0], t);
    EXPECT_EQ(hull[1], p);
    EXPECT_TRUE(set.dataValid());
}

TEST(HullCacheTest, EqualKeysCountOnce) {
    HypothesisSet set;
    auto first = trivialExpPair();
    set.add(first);
    set.add(literatureExpPair(q("0"), q("1"), Reference::literature("Test", 2000)));

    const auto& hull = computeConvexHull(set);
    ASSERT_EQ(hull.size(), 1u);
    EXPECT_EQ(hull[0], first);
}

TEST(HullCacheTest, InteriorPairsAreDropped) {
    HypothesisSet set;
    auto ref = Reference::literature("Test", 2000);
    set.add(literatureExpPair(q("0"), q("1"), ref));
    set.add(literatureExpPair(q("1/2"), q("1/2"), ref));
    set.add(literatureExpPair(q("1/6"), q("2/3"), ref));
    set.add(literatureExpPair(q("1/5"), q("3/4"), ref));  // inside the triangle

    const auto& hull = computeConvexHull(set);
    EXPECT_EQ(hull.size(), 3u);
    for (const auto& v : hull) {
        EXPECT_NE(v->exponentPair(), ExponentPair(q("1/5"), q("3/4")));
    }
}

TEST(HullCacheTest, CachedUntilInsertion) {
    HypothesisSet set;
    set.add(trivialExpPair());
    EXPECT_FALSE(set.dataValid());

    const auto* first = &computeConvexHull(set);
    EXPECT_TRUE(set.dataValid());
    EXPECT_EQ(&computeConvexHull(set), first);
    EXPECT_EQ(first->size(), 1u);

    set.add(literatureExpPair(q("1/2"), q("1/2"), Reference::literature("van der Corput", 1920)));
    EXPECT_FALSE(set.dataValid());
    EXPECT_EQ(computeConvexHull(set).size(), 2u);
    EXPECT_TRUE(set.dataValid());
}

TEST(HullCacheTest, DuplicateInsertionKeepsCache) {
    HypothesisSet set;
    auto t = trivialExpPair();
    set.add(t);
    computeConvexHull(set);
    set.add(t);
    EXPECT_TRUE(set.dataValid());
}
