#pragma once

#include <filesystem>
#include <unordered_map>

#include "document_writer.hpp"
#include "materializer.hpp"
#include "path_extractor.hpp"

namespace dr::mapper {

// Unreadable or invalid mapper configuration.
struct ConfigError final : Exception {
    using Exception::Exception;
};

struct MapperConfig final {
    bool optional_value_suffix = true;
    NoneHandling none_handling = NoneHandling::encode;
    bool enum_code_fallback = true;
    bool allow_integer_widening = false;
    // Level of the `mapper` logger, one of `trace` .. `critical` or `off`.
    std::string log_level = "info";
    std::string log_file;
    // `"Type.field" = "external name"`.
    std::unordered_map<std::string, std::string> renames;

    static auto from_toml(std::string_view toml_str) -> MapperConfig;

    auto extract_options() const -> ExtractOptions;
    auto materialize_options() const -> MaterializeOptions;
    auto name_overrides() const -> drefl::NameOverrides;

    // Applies `log_level` and `log_file` to the process-wide logger manager.
    // Mappers do not call it.
    auto apply_logging() const -> void;
};

DR_SREFL(
    type(MapperConfig),
    field(optional_value_suffix, Defaulted{}),
    field(none_handling, Defaulted{}),
    field(enum_code_fallback, Defaulted{}),
    field(allow_integer_widening, Defaulted{}),
    field(log_level, Defaulted{}),
    field(log_file, Defaulted{}),
    field(renames, Defaulted{})
)

auto load_config(std::filesystem::path const& path) -> MapperConfig;

}
