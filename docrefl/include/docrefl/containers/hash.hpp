#pragma once

#include <unordered_map>
#include <unordered_set>

#include "../prelude/hash.hpp"

namespace dr {

template <typename V>
using StringHashMap = std::unordered_map<std::string, V, StringHash, std::equal_to<>>;

using StringHashSet = std::unordered_set<std::string, StringHash, std::equal_to<>>;

}
