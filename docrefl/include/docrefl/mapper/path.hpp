#pragma once

#include <initializer_list>

#include "../drefl/drefl.hpp"

namespace dr::mapper {

// Chain of logical field names, e.g. `address.zip_code`.
struct PathExpression final {
    std::vector<std::string> hops;

    PathExpression() = default;
    // Each element may itself be dotted: `{"address", "?", "zip_code"}` or `{"address.zip_code"}`.
    PathExpression(std::initializer_list<std::string_view> hops);
    PathExpression(std::string_view expression) : PathExpression(parse(expression)) {}
    PathExpression(char const* expression) : PathExpression(parse(expression)) {}
    PathExpression(std::string const& expression) : PathExpression(parse(expression)) {}

    // Splits on `.`; the transparent markers `?` and `each` are accepted and dropped.
    static auto parse(std::string_view expression) -> PathExpression;

    auto empty() const -> bool { return hops.empty(); }
    auto size() const -> size_t { return hops.size(); }

    auto operator==(PathExpression const& rhs) const -> bool = default;
};

struct PathStep final {
    std::string logical_name;
    // Empty for transparent steps.
    std::string segment;
    bool transparent = false;
};

struct ResolvedPath final {
    std::string path;
    std::vector<PathStep> steps;
};

auto resolve_path_steps(
    drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression, drefl::TypeRegistry& registry
) -> ResolvedPath;

inline auto resolve_path(
    drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression, drefl::TypeRegistry& registry
) -> std::string {
    return resolve_path_steps(descriptor, expression, registry).path;
}

}
