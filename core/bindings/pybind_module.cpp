// PyBind11 bindings for the vdc C++ core.
// Exposes hypotheses, hypothesis sets, transforms and the proof search to Python.
// Rationals cross the boundary as strings ("13/84").

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "bounds/beta_bound.hpp"
#include "bounds/bound_hypotheses.hpp"
#include "duality/beta_duality.hpp"
#include "kb/hypothesis.hpp"
#include "kb/hypothesis_set.hpp"
#include "kb/reference.hpp"
#include "pairs/pair_hypotheses.hpp"
#include "search/closure_engine.hpp"
#include "search/hull_cache.hpp"
#include "search/proof_search.hpp"
#include "transforms/default_transforms.hpp"

#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

// Read-only view handed to Python; hypotheses are immutable once built.
struct HypothesisHandle {
    vdc::HypothesisPtr ptr;
};

HypothesisHandle wrap(const vdc::HypothesisPtr& h) { return HypothesisHandle{h}; }

std::vector<HypothesisHandle> wrapAll(const std::vector<vdc::HypothesisPtr>& hs) {
    std::vector<HypothesisHandle> out;
    out.reserve(hs.size());
    for (const auto& h : hs) out.push_back(wrap(h));
    return out;
}

std::optional<HypothesisHandle> wrapOptional(const vdc::HypothesisPtr& h) {
    if (!h) return std::nullopt;
    return wrap(h);
}

std::vector<vdc::Rational> parseAll(const std::vector<std::string>& texts) {
    std::vector<vdc::Rational> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(vdc::parseRational(t));
    return out;
}

} // namespace

PYBIND11_MODULE(vdc_bindings, m) {
    m.doc() = "van der Corput exponent pair engine";

    // ── Reference ──
    py::class_<vdc::Reference>(m, "Reference")
        .def_static("literature", &vdc::Reference::literature)
        .def_static("trivial", &vdc::Reference::trivial)
        .def_static("conjectured", &vdc::Reference::conjectured)
        .def_static("derived", &vdc::Reference::derived)
        .def("author", &vdc::Reference::author)
        .def("year", &vdc::Reference::year);

    py::enum_<vdc::HypothesisType>(m, "HypothesisType")
        .value("EXPONENT_PAIR", vdc::HypothesisType::ExponentPair)
        .value("EXPONENT_PAIR_TRANSFORM", vdc::HypothesisType::ExponentPairTransform)
        .value("BETA_BOUND", vdc::HypothesisType::BetaBound);

    // ── Hypothesis ──
    py::class_<HypothesisHandle>(m, "Hypothesis")
        .def_property_readonly("name", [](const HypothesisHandle& h) { return h.ptr->name(); })
        .def_property_readonly("type", [](const HypothesisHandle& h) { return h.ptr->type(); })
        .def_property_readonly("proof", [](const HypothesisHandle& h) { return h.ptr->proof(); })
        .def_property_readonly("reference", [](const HypothesisHandle& h) {
            return h.ptr->reference();
        })
        .def_property_readonly("k", [](const HypothesisHandle& h) {
            return vdc::toString(h.ptr->exponentPair().k);
        })
        .def_property_readonly("l", [](const HypothesisHandle& h) {
            return vdc::toString(h.ptr->exponentPair().l);
        })
        .def("dependencies", [](const HypothesisHandle& h) {
            return wrapAll(h.ptr->dependencies());
        })
        .def("proof_complexity", [](const HypothesisHandle& h) {
            return h.ptr->proofComplexity();
        })
        .def("__repr__", [](const HypothesisHandle& h) { return h.ptr->name(); });

    // ── HypothesisSet ──
    py::class_<vdc::HypothesisSet>(m, "HypothesisSet")
        .def(py::init<>())
        .def("add", [](vdc::HypothesisSet& s, const HypothesisHandle& h) {
            return s.add(h.ptr);
        })
        .def("__len__", &vdc::HypothesisSet::size)
        .def("data_valid", &vdc::HypothesisSet::dataValid)
        .def("copy", [](const vdc::HypothesisSet& s) { return vdc::HypothesisSet(s); });

    // ── Constructors ──
    m.def("literature_exp_pair", [](const std::string& k, const std::string& l,
                                   const vdc::Reference& ref) {
        return wrap(vdc::literatureExpPair(vdc::parseRational(k), vdc::parseRational(l), ref));
    });
    m.def("trivial_exp_pair", []() { return wrap(vdc::trivialExpPair()); });
    m.def("exponent_pair_conjecture", []() {
        return wrap(vdc::exponentPairConjecture());
    });
    m.def("literature_beta_bound", [](const std::string& x0, const std::string& x1,
                                     const std::vector<std::string>& coefficients,
                                     const vdc::Reference& ref) {
        vdc::BetaBound bound(vdc::Interval(vdc::parseRational(x0), vdc::parseRational(x1)),
                             parseAll(coefficients));
        return wrap(vdc::literatureBetaBound(bound, ref));
    });
    m.def("register_default_transforms", &vdc::registerDefaultTransforms);

    // ── Engine ──
    m.def("compute_exp_pairs", [](const vdc::HypothesisSet& s, int search_depth, bool prune) {
        vdc::ClosureConfig config;
        config.search_depth = search_depth;
        config.prune = prune;
        return wrapAll(vdc::computeExpPairs(s, config));
    }, py::arg("hypothesis_set"), py::arg("search_depth") = 5, py::arg("prune") = true);

    m.def("compute_convex_hull", [](vdc::HypothesisSet& s) {
        return wrapAll(vdc::computeConvexHull(s));
    });

    m.def("beta_bounds_to_exponent_pairs", [](const vdc::HypothesisSet& s) {
        return wrapAll(vdc::betaBoundsToExponentPairs(s));
    });

    py::enum_<vdc::ProofOptimization>(m, "ProofOptimization")
        .value("DATE", vdc::ProofOptimization::Date)
        .value("COMPLEXITY", vdc::ProofOptimization::Complexity)
        .value("NONE", vdc::ProofOptimization::None);

    m.def("find_proof", [](const std::string& k, const std::string& l,
                          const vdc::HypothesisSet& s, bool optimize)
          -> std::optional<HypothesisHandle> {
        auto proof = vdc::findProof(vdc::parseRational(k), vdc::parseRational(l), s, optimize);
        if (!proof) return std::nullopt;
        return wrap(*proof);
    }, py::arg("k"), py::arg("l"), py::arg("hypotheses"), py::arg("optimize") = true);

    m.def("find_best_proof", [](const std::string& k, const std::string& l,
                               const vdc::HypothesisSet& s, vdc::ProofOptimization method)
          -> std::optional<HypothesisHandle> {
        auto result = vdc::findBestProof(vdc::parseRational(k), vdc::parseRational(l), s, method);
        if (result.status == vdc::ProofStatus::NotSupported) {
            throw py::value_error("optimisation method " + vdc::toString(method) + " is not supported");
        }
        return wrapOptional(result.proof);
    }, py::arg("k"), py::arg("l"), py::arg("hypotheses"),
       py::arg("method") = vdc::ProofOptimization::Date);
}
