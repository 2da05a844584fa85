#pragma once

#include "field_descriptor.hpp"
#include "../utils/srefl.hpp"
#include "../prelude/idiom.hpp"

namespace dr::drefl {

// External names keyed by `"<type name>.<logical field name>"`; they take precedence over `Rename`.
using NameOverrides = StringHashMap<std::string>;

template <typename T>
auto srefl_provider() -> MetadataProvider;

// Cache of record type descriptors keyed by type identity. A descriptor is computed once, the first
// time its type is requested, and never changes afterwards. Safe for concurrent use.
struct TypeRegistry final : PImpl<TypeRegistry> {
    struct Impl;

    TypeRegistry();
    explicit TypeRegistry(NameOverrides overrides);
    ~TypeRegistry();

    auto register_provider(MetadataProvider provider) -> void;

    template <typename T>
    auto descriptor() -> RecordTypeDescriptor const& {
        if (auto desc = try_get(typeid(T)); desc) {
            return *desc;
        }
        if constexpr (srefl::is_reflectable<T>) {
            return get_or_describe(typeid(T), srefl_provider<T>());
        } else {
            return get(typeid(T));
        }
    }

    // Throws `UnknownTypeError` if no provider is registered for `type`.
    auto get(std::type_index type) -> RecordTypeDescriptor const&;
    // Only descriptors that have already been computed.
    auto try_get(std::type_index type) const -> RecordTypeDescriptor const*;
    auto find(std::string_view name) const -> RecordTypeDescriptor const*;

    auto overrides() const -> NameOverrides const&;

private:
    auto get_or_describe(std::type_index type, MetadataProvider const& fallback) -> RecordTypeDescriptor const&;
};

// The process-wide registry, without name overrides.
auto global_registry() -> TypeRegistry&;

}
