#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vdc {

/// Bibliographic source of a hypothesis. Literature references carry an
/// author and a year; the synthetic kinds cover trivial facts, open
/// conjectures and results derived inside the engine.
class Reference {
public:
    enum class Kind { Literature, Trivial, Conjectured, Derived };

    static Reference literature(std::string author, int year);
    static Reference trivial();
    static Reference conjectured();
    /// A derived result dated by its latest dependency (nullopt if undated).
    static Reference derived(std::optional<int> year);

    /// Latest known year across refs, or nullopt when none is dated.
    static std::optional<int> maxYear(const std::vector<Reference>& refs);

    Kind kind() const { return kind_; }
    const std::string& author() const { return author_; }
    std::optional<int> year() const { return year_; }

    /// "2017", or "Unknown date".
    std::string yearString() const;

private:
    Reference(Kind kind, std::string author, std::optional<int> year)
        : kind_(kind), author_(std::move(author)), year_(year) {}

    Kind kind_;
    std::string author_;
    std::optional<int> year_;
};

} // namespace vdc
