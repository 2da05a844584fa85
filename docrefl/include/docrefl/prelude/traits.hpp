#pragma once

#include <type_traits>
#include <concepts>
#include <string>
#include <vector>
#include <map>
#include <unordered_map>

namespace dr::traits {

template <typename T>
constexpr bool AlwaysFalse = false;

template <typename T>
concept Enum = std::is_enum_v<T>;

template <typename T>
struct SequenceHelper final {
    static constexpr bool value = false;
};
template <typename E, typename A>
struct SequenceHelper<std::vector<E, A>> final {
    static constexpr bool value = true;
    using element_type = E;
};
template <typename T>
concept Sequence = SequenceHelper<T>::value;

// Maps keyed by string, the only key type a document can carry.
template <typename T>
struct StringMapHelper final {
    static constexpr bool value = false;
};
template <typename E, typename H, typename K, typename A>
struct StringMapHelper<std::unordered_map<std::string, E, H, K, A>> final {
    static constexpr bool value = true;
    using element_type = E;
};
template <typename E, typename C, typename A>
struct StringMapHelper<std::map<std::string, E, C, A>> final {
    static constexpr bool value = true;
    using element_type = E;
};
template <typename T>
concept StringMap = StringMapHelper<T>::value;

}
