#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dr {

template <typename... Ts>
struct FunctorsHelper final : Ts... {
    FunctorsHelper(Ts&&... ts) : Ts(std::forward<Ts>(ts))... {}
    using Ts::operator()...;
};
template <typename... Ts>
FunctorsHelper(Ts...) -> FunctorsHelper<Ts...>;

inline auto join_path(std::string_view prefix, std::string_view segment) -> std::string {
    if (prefix.empty()) { return std::string{segment}; }
    std::string path{};
    path.reserve(prefix.size() + segment.size() + 1);
    path.append(prefix).append(1, '.').append(segment);
    return path;
}

inline auto split_string(std::string_view str, char delimiter) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts{};
    size_t start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}
