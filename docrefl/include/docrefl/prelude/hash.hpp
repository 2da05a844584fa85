#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace dr {

struct StringHash final {
    using is_transparent = void;

    size_t operator()(char const* str) const { return std::hash<std::string_view>{}(str); }
    size_t operator()(std::string_view str) const { return std::hash<std::string_view>{}(str); }
    size_t operator()(std::string const& str) const { return std::hash<std::string_view>{}(str); }
};

}
