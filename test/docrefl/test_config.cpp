#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include <docrefl/runtime/logger.hpp>
#include <docrefl/utils/file.hpp>

#include "models.hpp"

using namespace dr::mapper;
using dr::rt::LogLevel;

namespace {

auto count_occurrences(std::string_view text, std::string_view word) -> size_t {
    size_t count = 0;
    for (auto pos = text.find(word); pos != std::string_view::npos; pos = text.find(word, pos + word.size())) {
        ++count;
    }
    return count;
}

}

TEST(MapperConfig, Defaults) {
    auto config = MapperConfig::from_toml("");
    EXPECT_TRUE(config.optional_value_suffix);
    EXPECT_EQ(config.none_handling, NoneHandling::encode);
    EXPECT_TRUE(config.enum_code_fallback);
    EXPECT_FALSE(config.allow_integer_widening);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_TRUE(config.renames.empty());
}

TEST(MapperConfig, AllKeys) {
    auto config = MapperConfig::from_toml(R"(
optional_value_suffix = false
none_handling = "ignore"
enum_code_fallback = false
allow_integer_widening = true
log_level = "warn"

[renames]
"Address.city" = "town"
)");
    EXPECT_FALSE(config.optional_value_suffix);
    EXPECT_EQ(config.none_handling, NoneHandling::ignore);
    EXPECT_FALSE(config.enum_code_fallback);
    EXPECT_TRUE(config.allow_integer_widening);
    EXPECT_EQ(config.log_level, "warn");
    ASSERT_EQ(config.renames.size(), 1u);
    EXPECT_EQ(config.renames.at("Address.city"), "town");

    Mapper mapper{config};
    EXPECT_EQ(mapper.resolve_path<models::Person>("address.city"), "address.town");
    EXPECT_EQ(mapper.path_table<models::Address>().count("town"), 1u);
}

TEST(MapperConfig, InvalidValues) {
    EXPECT_THROW(MapperConfig::from_toml("none_handling = \"drop\""), ConfigError);
    EXPECT_THROW(MapperConfig::from_toml("enum_code_fallback = 1"), ConfigError);
    EXPECT_THROW(MapperConfig::from_toml("log_level = \"loud\""), ConfigError);
    EXPECT_THROW(MapperConfig::from_toml("renames = [1, 2]"), ConfigError);
    EXPECT_THROW(MapperConfig::from_toml("optional_value_suffix = "), ConfigError);
}

TEST(MapperConfig, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "docrefl_test_config.toml";
    {
        std::ofstream fout(path);
        fout << "allow_integer_widening = true\n";
    }
    auto config = load_config(path);
    EXPECT_TRUE(config.allow_integer_widening);
    std::filesystem::remove(path);

    EXPECT_THROW(load_config(path), ConfigError);
}

TEST(MapperConfig, ConstructingMapperKeepsLogLevel) {
    auto& manager = dr::rt::logger_manager();
    manager.set_level("mapper", LogLevel::debug);

    MapperConfig config{};
    config.log_level = "error";
    Mapper mapper{config};
    default_mapper();
    ASSERT_TRUE(manager.get_level("mapper").has_value());
    EXPECT_EQ(manager.get_level("mapper").value(), LogLevel::debug);

    config.apply_logging();
    EXPECT_EQ(manager.get_level("mapper").value(), LogLevel::error);
    EXPECT_FALSE(manager.get_level("unknown").has_value());

    manager.set_level("mapper", LogLevel::info);
}

TEST(MapperConfig, LogFileAttachedOnce) {
    auto path = std::filesystem::temp_directory_path() / "docrefl_test_log_file.log";
    std::filesystem::remove(path);

    MapperConfig config{};
    config.log_file = path.string();
    config.apply_logging();
    dr::log::warn("mapper", "first mapper line");
    config.apply_logging();
    Mapper mapper{config};
    dr::log::warn("mapper", "second mapper line");
    dr::rt::logger_manager().flush();

    auto text = dr::read_text_file(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(count_occurrences(text.value(), "first mapper line"), 1u);
    EXPECT_EQ(count_occurrences(text.value(), "second mapper line"), 1u);
}
