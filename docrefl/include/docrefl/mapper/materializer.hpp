#pragma once

#include "../drefl/drefl.hpp"

namespace dr::mapper {

struct MaterializeOptions final {
    // Integers that are neither a case name nor an ordinal may match an enumerator value.
    bool enum_code_fallback = true;
    // Accept int32 values for int64 fields.
    bool allow_integer_widening = false;
};

// Builds an instance of the type described by `descriptor` from a document table.
// Throws a `FieldBuildError` for the first field that cannot be built.
auto materialize(
    drefl::RecordTypeDescriptor const& descriptor,
    serde::Value const& data,
    drefl::TypeRegistry& registry,
    MaterializeOptions const& options = {}
) -> drefl::Instance;

template <typename T>
auto instance_cast(drefl::Instance&& instance) -> T {
    auto value = aa::any_cast<T>(&instance);
    if (value == nullptr) {
        throw drefl::UnknownTypeError{"Instance does not hold the requested type"};
    }
    return std::move(*value);
}

}
