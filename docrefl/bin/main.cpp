#include <cstring>

#include <fmt/format.h>

#include <docrefl/mapper/mapper.hpp>
#include <docrefl/runtime/logger.hpp>
#include <docrefl/utils/file.hpp>

namespace sample {

enum class Status : uint8_t {
    active,
    inactive,
    suspended,
};

struct Address final {
    std::string street;
    std::string city;
    int32_t zip_code = 0;
};
DR_SREFL(type(Address), field(street), field(city), field(zip_code, dr::Rename{"zip"}))

struct Skill final {
    std::string name;
    int32_t level = 0;
};
DR_SREFL(type(Skill), field(name), field(level))

struct Person final {
    std::string name;
    int32_t age = 0;
    dr::Option<std::string> email;
    Status status = Status::active;
    dr::Option<Address> address;
    std::vector<std::string> tags;
    std::vector<Skill> skills;
};
DR_SREFL(
    type(Person),
    field(name),
    field(age),
    field(email),
    field(status, dr::Defaulted{}),
    field(address),
    field(tags, dr::Defaulted{}),
    field(skills, dr::Defaulted{})
)

}

namespace {

struct InspectOptions final {
    std::string config_file;
    std::string document_file;
};

auto parse_options(int argc, char** argv, InspectOptions& opt) -> bool {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) { return false; }
            opt.config_file = argv[++i];
        } else if (opt.document_file.empty()) {
            opt.document_file = argv[i];
        } else {
            dr::log::warn("general", "Unknown command line option '{}'", argv[i]);
        }
    }
    return !opt.document_file.empty();
}

auto inspect(InspectOptions const& opt) -> void {
    auto config = opt.config_file.empty() ? dr::mapper::MapperConfig{} : dr::mapper::load_config(opt.config_file);
    config.apply_logging();
    dr::mapper::Mapper mapper{std::move(config)};

    auto text = dr::read_text_file(opt.document_file);
    if (!text.has_value()) {
        throw dr::Exception{fmt::format("Failed to open document '{}'", opt.document_file)};
    }
    auto document = dr::serde::Value::from_json(text.value());
    auto person = mapper.materialize<sample::Person>(document);

    fmt::print("paths of {}:\n", mapper.descriptor<sample::Person>().name);
    for (auto const& [from, to] : mapper.extract_paths<sample::Person>()) {
        fmt::print("  {} -> {}\n", from, to);
    }
    fmt::print("document:\n{}\n", mapper.to_document(person).to_json(2));
}

}

int main(int argc, char** argv) {
    InspectOptions opt{};
    if (!parse_options(argc, argv, opt)) {
        fmt::print(stderr, "usage: docrefl_inspect [--config file.toml] <document.json>\n");
        return 2;
    }

    try {
        inspect(opt);
    } catch (dr::Exception const& e) {
        dr::log::error("general", "{}", e.what());
        return 1;
    }
    return 0;
}
