#pragma once

#include <filesystem>
#include <string>

#include "../prelude/option.hpp"

namespace dr {

// Whole content of a text file, or empty if it cannot be opened.
auto read_text_file(std::filesystem::path const& path) -> Option<std::string>;

}
