#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "path.hpp"
#include "../prelude/idiom.hpp"

namespace dr::mapper {

// Path lookup by external path, memoized per type.
using PathTable = StringHashMap<std::string>;

// Binds a configuration to a type registry and exposes path resolution, path extraction,
// construction and writing for the registry's types.
struct Mapper final : PImpl<Mapper> {
    struct Impl;

    Mapper();
    // Owns a registry carrying the config's renames.
    explicit Mapper(MapperConfig config);
    // Borrows `registry`, which must outlive the mapper; the config's renames are not applied.
    Mapper(MapperConfig config, drefl::TypeRegistry& registry);
    ~Mapper();

    auto config() const -> MapperConfig const&;
    auto registry() -> drefl::TypeRegistry&;

    template <typename T>
    auto descriptor() -> drefl::RecordTypeDescriptor const& {
        return registry().descriptor<T>();
    }

    template <typename T>
    auto resolve_path(PathExpression const& expression) -> std::string {
        return resolve_path(descriptor<T>(), expression);
    }
    auto resolve_path(drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression) -> std::string;

    template <typename T>
    auto resolve_path_steps(PathExpression const& expression) -> ResolvedPath {
        return resolve_path_steps(descriptor<T>(), expression);
    }
    auto resolve_path_steps(
        drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression
    ) -> ResolvedPath;

    template <typename T>
    auto extract_paths(std::string_view prefix = "") -> std::vector<PathPair> {
        return extract_paths(descriptor<T>(), prefix);
    }
    auto extract_paths(
        drefl::RecordTypeDescriptor const& descriptor, std::string_view prefix = ""
    ) -> std::vector<PathPair>;

    template <typename T>
    auto path_table() -> PathTable const& {
        return path_table(descriptor<T>());
    }
    auto path_table(drefl::RecordTypeDescriptor const& descriptor) -> PathTable const&;

    template <typename T>
    auto materialize(serde::Value const& data) -> T {
        return instance_cast<T>(materialize(descriptor<T>(), data));
    }
    auto materialize(drefl::RecordTypeDescriptor const& descriptor, serde::Value const& data) -> drefl::Instance;

    template <typename T>
    auto to_document(T const& object) -> serde::Value {
        return to_document(descriptor<T>(), &object);
    }
    auto to_document(drefl::RecordTypeDescriptor const& descriptor, void const* object) -> serde::Value;
};

// Default-configured mapper over the process-wide registry.
auto default_mapper() -> Mapper&;

template <typename T>
auto resolve_path(PathExpression const& expression) -> std::string {
    return default_mapper().resolve_path<T>(expression);
}

template <typename T>
auto extract_paths() -> std::vector<PathPair> {
    return default_mapper().extract_paths<T>();
}

template <typename T>
auto materialize(serde::Value const& data) -> T {
    return default_mapper().materialize<T>(data);
}

template <typename T>
auto to_document(T const& object) -> serde::Value {
    return default_mapper().to_document(object);
}

}
