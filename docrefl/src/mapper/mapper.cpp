#include <docrefl/mapper/mapper.hpp>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <docrefl/runtime/logger.hpp>

namespace dr::mapper {

struct Mapper::Impl final {
    Impl() : Impl(MapperConfig{}) {}

    Impl(MapperConfig&& config)
        : config(std::move(config))
        , owned_registry(std::make_unique<drefl::TypeRegistry>(this->config.name_overrides()))
        , registry(owned_registry.get()) {}

    Impl(MapperConfig&& config, drefl::TypeRegistry& registry)
        : config(std::move(config)), registry(&registry)
    {
        if (!this->config.renames.empty()) {
            log::warn("mapper", "Renames in config are ignored by a mapper over a shared registry");
        }
    }

    auto path_table(drefl::RecordTypeDescriptor const& descriptor) -> PathTable const& {
        {
            std::shared_lock lock{mutex};
            if (auto it = path_tables.find(descriptor.type); it != path_tables.end()) {
                return *it->second;
            }
        }

        auto table = std::make_unique<PathTable>();
        for (auto& [from, to] : mapper::extract_paths(descriptor, *registry, "", config.extract_options())) {
            table->insert_or_assign(std::move(from), std::move(to));
        }

        std::unique_lock lock{mutex};
        return *path_tables.try_emplace(descriptor.type, std::move(table)).first->second;
    }

    MapperConfig config;
    std::unique_ptr<drefl::TypeRegistry> owned_registry;
    drefl::TypeRegistry* registry = nullptr;

    std::shared_mutex mutex;
    std::unordered_map<std::type_index, std::unique_ptr<PathTable>> path_tables;
};

Mapper::Mapper() = default;
Mapper::Mapper(MapperConfig config) : PImpl(std::move(config)) {}
Mapper::Mapper(MapperConfig config, drefl::TypeRegistry& registry) : PImpl(std::move(config), registry) {}
Mapper::~Mapper() = default;

auto Mapper::config() const -> MapperConfig const& {
    return impl()->config;
}

auto Mapper::registry() -> drefl::TypeRegistry& {
    return *impl()->registry;
}

auto Mapper::resolve_path(
    drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression
) -> std::string {
    return mapper::resolve_path(descriptor, expression, registry());
}

auto Mapper::resolve_path_steps(
    drefl::RecordTypeDescriptor const& descriptor, PathExpression const& expression
) -> ResolvedPath {
    return mapper::resolve_path_steps(descriptor, expression, registry());
}

auto Mapper::extract_paths(
    drefl::RecordTypeDescriptor const& descriptor, std::string_view prefix
) -> std::vector<PathPair> {
    return mapper::extract_paths(descriptor, registry(), prefix, impl()->config.extract_options());
}

auto Mapper::path_table(drefl::RecordTypeDescriptor const& descriptor) -> PathTable const& {
    return impl()->path_table(descriptor);
}

auto Mapper::materialize(
    drefl::RecordTypeDescriptor const& descriptor, serde::Value const& data
) -> drefl::Instance {
    return mapper::materialize(descriptor, data, registry(), impl()->config.materialize_options());
}

auto Mapper::to_document(drefl::RecordTypeDescriptor const& descriptor, void const* object) -> serde::Value {
    return mapper::to_document(descriptor, object, registry(), impl()->config.none_handling);
}

auto default_mapper() -> Mapper& {
    static Mapper mapper{MapperConfig{}, drefl::global_registry()};
    return mapper;
}

}
