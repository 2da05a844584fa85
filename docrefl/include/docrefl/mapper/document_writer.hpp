#pragma once

#include "../drefl/drefl.hpp"

namespace dr::mapper {

// How an empty optional field is written.
enum class NoneHandling : uint8_t {
    // As an explicit null.
    encode,
    // Left out of the document.
    ignore,
};

// Writes `object`, an instance of the type described by `descriptor`, as a table keyed by external names.
auto to_document(
    drefl::RecordTypeDescriptor const& descriptor,
    void const* object,
    drefl::TypeRegistry& registry,
    NoneHandling none_handling = NoneHandling::encode
) -> serde::Value;

}
