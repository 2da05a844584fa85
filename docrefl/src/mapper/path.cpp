#include <docrefl/mapper/path.hpp>

#include <docrefl/mapper/errors.hpp>
#include <docrefl/prelude/misc.hpp>

namespace dr::mapper {

namespace {

constexpr std::string_view optional_marker = "?";
constexpr std::string_view element_marker = "each";

auto is_transparent_marker(std::string_view hop) -> bool {
    return hop == optional_marker || hop == element_marker;
}

}

PathExpression::PathExpression(std::initializer_list<std::string_view> hops) {
    for (auto hop : hops) {
        auto parsed = parse(hop);
        this->hops.insert(this->hops.end(), parsed.hops.begin(), parsed.hops.end());
    }
}

auto PathExpression::parse(std::string_view expression) -> PathExpression {
    PathExpression result{};
    if (expression.empty()) { return result; }
    for (auto hop : split_string(expression, '.')) {
        if (hop.empty()) {
            throw InvalidPathError{expression};
        }
        if (!is_transparent_marker(hop)) {
            result.hops.emplace_back(hop);
        }
    }
    return result;
}

auto resolve_path_steps(
    drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression, drefl::TypeRegistry& registry
) -> ResolvedPath {
    if (expression.empty()) {
        throw EmptyPathError{};
    }

    ResolvedPath result{};
    auto current = &descriptor;
    drefl::FieldDescriptor const* leaf = nullptr;
    for (auto const& hop : expression.hops) {
        if (leaf != nullptr) {
            if (leaf->nested == nullptr) {
                throw InvalidPathError{leaf->logical_name, leaf->type_name, hop};
            }
            current = &leaf->nested(registry);
        }

        auto field = current->find_field(hop);
        if (field == nullptr) {
            throw UnknownFieldError{current->name, hop, result.path};
        }
        result.path = join_path(result.path, field->external_name);
        result.steps.push_back(PathStep{
            .logical_name = field->logical_name,
            .segment = field->external_name,
        });

        if (field->is_record() && field->optional) {
            result.steps.push_back(PathStep{.logical_name = std::string{optional_marker}, .transparent = true});
        } else if (field->is_record_collection()) {
            result.steps.push_back(PathStep{.logical_name = std::string{element_marker}, .transparent = true});
        }
        leaf = field;
    }
    return result;
}

}
