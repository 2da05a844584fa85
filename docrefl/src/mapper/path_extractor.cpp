#include <docrefl/mapper/path_extractor.hpp>

#include <docrefl/prelude/misc.hpp>
#include <docrefl/runtime/logger.hpp>

namespace dr::mapper {

namespace {

constexpr std::string_view optional_value_segment = "value";

auto extract_into(
    drefl::RecordTypeDescriptor const& descriptor,
    drefl::TypeRegistry& registry,
    std::string_view prefix,
    ExtractOptions const& options,
    std::vector<PathPair>& paths
) -> void {
    for (auto const& field : descriptor.fields) {
        auto path = join_path(prefix, field.external_name);
        if (field.is_record()) {
            extract_into(field.nested(registry), registry, path, options, paths);
        } else if (field.is_record_collection()) {
            log::debug("mapper", "Skip path '{}': collections of {} are not expanded", path, field.type_name);
        } else {
            if (field.optional && options.optional_value_suffix) {
                path = join_path(path, optional_value_segment);
            }
            paths.emplace_back(path, path);
        }
    }
}

}

auto extract_paths(
    drefl::RecordTypeDescriptor const& descriptor,
    drefl::TypeRegistry& registry,
    std::string_view prefix,
    ExtractOptions const& options
) -> std::vector<PathPair> {
    std::vector<PathPair> paths{};
    extract_into(descriptor, registry, prefix, options, paths);
    return paths;
}

auto unflatten(std::vector<std::pair<std::string, serde::Value>> const& entries) -> serde::Value {
    serde::Value root{serde::Value::Table{}};
    for (auto const& [path, value] : entries) {
        auto segments = split_string(path, '.');
        auto current = &root;
        for (size_t i = 0; i + 1 < segments.size(); i++) {
            auto& child = (*current)[segments[i]];
            if (!child.is_table()) {
                child = serde::Value::Table{};
            }
            current = &child;
        }
        (*current)[segments.back()] = value;
    }
    return root;
}

}
