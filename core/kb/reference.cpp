#include "kb/reference.hpp"

#include <algorithm>

namespace vdc {

Reference Reference::literature(std::string author, int year) {
    return Reference(Kind::Literature, std::move(author), year);
}

Reference Reference::trivial() {
    return Reference(Kind::Trivial, "Trivial", std::nullopt);
}

Reference Reference::conjectured() {
    return Reference(Kind::Conjectured, "Conjectured", std::nullopt);
}

Reference Reference::derived(std::optional<int> year) {
    return Reference(Kind::Derived, "Derived", year);
}

std::optional<int> Reference::maxYear(const std::vector<Reference>& refs) {
    std::optional<int> latest;
    for (const auto& r : refs) {
        if (!r.year()) continue;
        if (!latest || *r.year() > *latest) latest = r.year();
    }
    return latest;
}

std::string Reference::yearString() const {
    return year_ ? std::to_string(*year_) : std::string("Unknown date");
}

} // namespace vdc
