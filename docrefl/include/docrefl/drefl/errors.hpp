#pragma once

#include "../utils/serde.hpp"

namespace dr::drefl {

// A descriptor breaks its invariants, e.g. two fields share an external name.
struct InvalidDescriptorError final : Exception {
    using Exception::Exception;
};

// No provider is registered for a requested type and the type has no static reflection.
struct UnknownTypeError final : Exception {
    using Exception::Exception;
};

}
