#pragma once

#include <utility>

#include "../drefl/drefl.hpp"

namespace dr::mapper {

// (source, destination) external paths; both are equal under the current policy.
using PathPair = std::pair<std::string, std::string>;

struct ExtractOptions final {
    // Optional non-record leaves get a trailing `.value` segment.
    bool optional_value_suffix = true;
};

// Every leaf-reachable external path of `descriptor`, depth-first in declaration order.
// Collections of records are skipped.
auto extract_paths(
    drefl::RecordTypeDescriptor const& descriptor,
    drefl::TypeRegistry& registry,
    std::string_view prefix = "",
    ExtractOptions const& options = {}
) -> std::vector<PathPair>;

// Builds the nested table described by dotted `(path, value)` entries, e.g. `a.b = 1` becomes `{a: {b: 1}}`.
auto unflatten(std::vector<std::pair<std::string, serde::Value>> const& entries) -> serde::Value;

}
