#include <docrefl/drefl/type_registry.hpp>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <fmt/format.h>

#include <docrefl/drefl/errors.hpp>
#include <docrefl/runtime/logger.hpp>

namespace dr::drefl {

namespace {

auto validate_descriptor(RecordTypeDescriptor const& desc) -> void {
    StringHashSet logical_names{};
    StringHashSet external_names{};
    for (auto const& field : desc.fields) {
        if (!logical_names.insert(field.logical_name).second) {
            throw InvalidDescriptorError{
                fmt::format("Duplicate field '{}' in type {}", field.logical_name, desc.name)
            };
        }
        if (!external_names.insert(field.external_name).second) {
            throw InvalidDescriptorError{fmt::format(
                "Duplicate external name '{}' (field '{}') in type {}",
                field.external_name, field.logical_name, desc.name
            )};
        }
    }
}

}

struct TypeRegistry::Impl final {
    Impl() = default;
    Impl(NameOverrides&& overrides) : overrides(std::move(overrides)) {}

    auto register_provider(MetadataProvider&& provider) -> void {
        std::unique_lock lock{mutex};
        auto type = provider.type;
        providers.insert_or_assign(type, std::move(provider));
    }

    auto try_get(std::type_index type) const -> RecordTypeDescriptor const* {
        std::shared_lock lock{mutex};
        if (auto it = descriptors.find(type); it != descriptors.end()) {
            return it->second.get();
        }
        return nullptr;
    }

    auto find(std::string_view name) const -> RecordTypeDescriptor const* {
        std::shared_lock lock{mutex};
        if (auto it = map_name.find(name); it != map_name.end()) {
            return it->second;
        }
        return nullptr;
    }

    auto get_or_describe(std::type_index type, MetadataProvider const* fallback) -> RecordTypeDescriptor const& {
        if (auto desc = try_get(type); desc) {
            return *desc;
        }

        MetadataProvider provider{};
        {
            std::shared_lock lock{mutex};
            if (auto it = providers.find(type); it != providers.end()) {
                provider = it->second;
            }
        }
        if (!provider.describe) {
            if (fallback == nullptr || !fallback->describe) {
                throw UnknownTypeError{fmt::format("No metadata provider for type {}", type.name())};
            }
            provider = *fallback;
        }

        // Described outside the lock; nested descriptors are resolved lazily, so this never re-enters.
        auto desc = std::make_unique<RecordTypeDescriptor>(provider.describe());
        desc->type = type;
        apply_overrides(*desc);
        validate_descriptor(*desc);

        std::unique_lock lock{mutex};
        auto [it, inserted] = descriptors.try_emplace(type, std::move(desc));
        if (inserted) {
            map_name.insert({it->second->name, it->second.get()});
            log::debug("mapper", "Described type {} with {} fields", it->second->name, it->second->fields.size());
        }
        return *it->second;
    }

    auto apply_overrides(RecordTypeDescriptor& desc) const -> void {
        if (overrides.empty()) { return; }
        for (auto& field : desc.fields) {
            auto key = desc.name + "." + field.logical_name;
            if (auto it = overrides.find(key); it != overrides.end()) {
                field.external_name = it->second;
            }
        }
    }

    NameOverrides overrides;

    mutable std::shared_mutex mutex;
    std::unordered_map<std::type_index, MetadataProvider> providers;
    std::unordered_map<std::type_index, std::unique_ptr<RecordTypeDescriptor>> descriptors;
    std::unordered_map<std::string_view, RecordTypeDescriptor const*> map_name;
};

TypeRegistry::TypeRegistry() = default;
TypeRegistry::TypeRegistry(NameOverrides overrides) : PImpl(std::move(overrides)) {}
TypeRegistry::~TypeRegistry() = default;

auto TypeRegistry::register_provider(MetadataProvider provider) -> void {
    impl()->register_provider(std::move(provider));
}

auto TypeRegistry::get(std::type_index type) -> RecordTypeDescriptor const& {
    return impl()->get_or_describe(type, nullptr);
}

auto TypeRegistry::try_get(std::type_index type) const -> RecordTypeDescriptor const* {
    return impl()->try_get(type);
}

auto TypeRegistry::find(std::string_view name) const -> RecordTypeDescriptor const* {
    return impl()->find(name);
}

auto TypeRegistry::overrides() const -> NameOverrides const& {
    return impl()->overrides;
}

auto TypeRegistry::get_or_describe(
    std::type_index type, MetadataProvider const& fallback
) -> RecordTypeDescriptor const& {
    return impl()->get_or_describe(type, &fallback);
}

auto global_registry() -> TypeRegistry& {
    static TypeRegistry registry{};
    return registry;
}

}
