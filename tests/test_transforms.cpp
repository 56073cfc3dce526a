#include <gtest/gtest.h>
#include "kb/hypothesis_set.hpp"
#include "pairs/pair_hypotheses.hpp"
#include "transforms/default_transforms.hpp"
#include "transforms/transform_base.hpp"
#include "transforms/van_der_corput.hpp"

#include <stdexcept>

using namespace vdc;

namespace {
ExponentPair ep(const char* k, const char* l) {
    return ExponentPair(parseRational(k), parseRational(l));
}
}

// ─── A process ─────────────────────────────────────────────────

TEST(TransformTest, AFixesTrivialPair) {
    VanDerCorputA a;
    EXPECT_EQ(a.map(ep("0", "1")), ep("0", "1"));
}

TEST(TransformTest, AOfHalfHalf) {
    VanDerCorputA a;
    EXPECT_EQ(a.map(ep("1/2", "1/2")), ep("1/6", "2/3"));
    EXPECT_EQ(a.map(ep("1/6", "2/3")), ep("1/14", "11/14"));
}

TEST(TransformTest, AUndefinedAtMinusOne) {
    VanDerCorputA a;
    EXPECT_THROW(a.map(ep("-1", "0")), std::domain_error);
}

// ─── B process ─────────────────────────────────────────────────

TEST(TransformTest, BOfTrivialPair) {
    VanDerCorputB b;
    EXPECT_EQ(b.map(ep("0", "1")), ep("1/2", "1/2"));
    EXPECT_EQ(b.map(ep("1/14", "11/14")), ep("2/7", "4/7"));
}

TEST(TransformTest, BIsAnInvolution) {
    HypothesisSet set;
    registerDefaultTransforms(set);
    auto b = *set.findHypothesis("van der Corput B transform");

    for (const auto& p : {ep("0", "1"), ep("1/6", "2/3"), ep("13/84", "55/84"),
                          ep("32/205", "269/410"), ep("-3", "7/5")}) {
        auto h = literatureExpPair(p.k, p.l, Reference::literature("Test", 2000));
        auto twice = applyTransform(b, applyTransform(b, h));
        EXPECT_EQ(twice->exponentPair(), p) << p.toString();
    }
}

// ─── Application and registration ─────────────────────────────

TEST(TransformTest, ApplyCitesPairAndTransform) {
    HypothesisSet set;
    registerDefaultTransforms(set);
    auto b = *set.findHypothesis("van der Corput B transform");
    auto t = trivialExpPair();

    auto image = applyTransform(b, t);
    EXPECT_EQ(image->exponentPair(), ep("1/2", "1/2"));
    EXPECT_EQ(image->name(), "Derived exponent pair (1/2, 1/2)");
    ASSERT_EQ(image->dependencies().size(), 2u);
    EXPECT_EQ(image->dependencies()[0], t);
    EXPECT_EQ(image->dependencies()[1], b);
    EXPECT_EQ(*image->reference().year(), 1920);
}

TEST(TransformTest, ApplyRejectsWrongKinds) {
    HypothesisSet set;
    registerDefaultTransforms(set);
    auto b = *set.findHypothesis("van der Corput B transform");
    auto t = trivialExpPair();

    EXPECT_THROW(applyTransform(t, t), std::invalid_argument);
    EXPECT_THROW(applyTransform(b, b), std::invalid_argument);
    EXPECT_THROW(applyTransform(nullptr, t), std::invalid_argument);
}

TEST(TransformTest, DefaultTransformsRegistered) {
    HypothesisSet set;
    registerDefaultTransforms(set);
    auto transforms = set.listHypotheses(HypothesisType::ExponentPairTransform);
    ASSERT_EQ(transforms.size(), 2u);
    EXPECT_EQ(transforms[0]->name(), "van der Corput A transform");
    EXPECT_EQ(transforms[1]->name(), "van der Corput B transform");
}
