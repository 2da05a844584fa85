#include <docrefl/utils/file.hpp>

#include <fstream>

namespace dr {

auto read_text_file(std::filesystem::path const& path) -> Option<std::string> {
    std::ifstream fin(path, std::ios::ate | std::ios::binary);
    if (!fin) { return {}; }
    auto size = fin.tellg();
    std::string data(static_cast<size_t>(size), '\0');
    fin.seekg(0);
    fin.read(data.data(), size);
    return data;
}

}
