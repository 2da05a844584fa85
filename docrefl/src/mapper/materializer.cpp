#include <docrefl/mapper/materializer.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <docrefl/mapper/errors.hpp>
#include <docrefl/prelude/misc.hpp>
#include <docrefl/runtime/logger.hpp>

namespace dr::mapper {

namespace {

template <typename Error, typename... Args>
[[noreturn]] auto fail(Args&&... args) -> void {
    Error error{std::forward<Args>(args)...};
    log::debug("mapper", "{}", error.what());
    throw error;
}

struct Materializer final {
    drefl::TypeRegistry& registry;
    MaterializeOptions const& options;

    auto build(
        drefl::RecordTypeDescriptor const& descriptor, serde::Value const& data, std::string const& path
    ) -> drefl::Instance {
        if (!data.is_table()) {
            fail<NestedTypeError>(path, std::string{data.type_name()});
        }
        auto instance = descriptor.construct();
        auto object = descriptor.address(instance);
        for (auto const& field : descriptor.fields) {
            build_field(field, object, data, join_path(path, field.logical_name));
        }
        return instance;
    }

    auto build_field(
        drefl::FieldDescriptor const& field, void* object, serde::Value const& data, std::string const& path
    ) -> void {
        auto value = data.try_at(field.external_name);
        if (value == nullptr) {
            if (field.has_default) { return; }
            if (field.optional) {
                field.accessor.set_null(object);
                return;
            }
            fail<MissingFieldError>(path);
        }

        if (value->is_null()) {
            if (field.optional || field.kind == drefl::FieldKind::record || field.kind == drefl::FieldKind::enumeration) {
                field.accessor.set_null(object);
                return;
            }
            fail<TypeCastError>(path, expected_type_name(field), std::string{value->type_name()});
        }

        switch (field.kind) {
            case drefl::FieldKind::enumeration:
                field.accessor.set_enum(object, decode_enum(field, *value, path));
                break;
            case drefl::FieldKind::record:
                if (!value->is_table()) {
                    fail<NestedTypeError>(path, std::string{value->type_name()});
                }
                field.accessor.set_record(object, build(field.nested(registry), *value, path));
                break;
            case drefl::FieldKind::scalar:
                check_scalar(field.scalar_type, *value, path);
                field.accessor.set_value(object, *value);
                break;
            case drefl::FieldKind::sequence:
            case drefl::FieldKind::map:
                check_collection(field, *value, path);
                field.accessor.set_value(object, *value);
                break;
        }
    }

    auto decode_enum(
        drefl::FieldDescriptor const& field, serde::Value const& value, std::string const& path
    ) const -> size_t {
        auto const& cases = field.enum_cases;
        if (auto str = value.try_get_ref<serde::Value::String>(); str) {
            if (auto it = std::find(cases.begin(), cases.end(), *str); it != cases.end()) {
                return static_cast<size_t>(it - cases.begin());
            }
        } else if (value.is_integer()) {
            auto number = value.as_integer();
            if (number >= 0 && static_cast<size_t>(number) < cases.size()) {
                return static_cast<size_t>(number);
            }
            if (options.enum_code_fallback) {
                auto const& codes = field.enum_codes;
                if (auto it = std::find(codes.begin(), codes.end(), number); it != codes.end()) {
                    return static_cast<size_t>(it - codes.begin());
                }
            }
        }
        fail<EnumDecodeError>(path, value.to_json());
    }

    auto check_scalar(drefl::ScalarType type, serde::Value const& value, std::string const& path) const -> void {
        auto expected = drefl::scalar_value_type(type);
        if (value.type() == expected) { return; }
        if (
            options.allow_integer_widening
            && expected == serde::Value::Type::int64
            && value.type() == serde::Value::Type::int32
        ) {
            return;
        }
        fail<TypeCastError>(path, std::string{drefl::scalar_type_name(type)}, std::string{value.type_name()});
    }

    auto check_collection(
        drefl::FieldDescriptor const& field, serde::Value const& value, std::string const& path
    ) const -> void {
        if (field.element_is_record) {
            fail<UnsupportedTypeError>(path, field.type_name);
        }
        if (field.kind == drefl::FieldKind::sequence) {
            auto array = value.try_get_ref<serde::Value::Array>();
            if (array == nullptr) {
                fail<TypeCastError>(path, expected_type_name(field), std::string{value.type_name()});
            }
            for (size_t i = 0; i < array->size(); i++) {
                check_scalar(field.scalar_type, (*array)[i], fmt::format("{}[{}]", path, i));
            }
        } else {
            auto table = value.try_get_ref<serde::Value::Table>();
            if (table == nullptr) {
                fail<TypeCastError>(path, expected_type_name(field), std::string{value.type_name()});
            }
            for (auto const& [key, element] : *table) {
                check_scalar(field.scalar_type, element, join_path(path, key));
            }
        }
    }

    static auto expected_type_name(drefl::FieldDescriptor const& field) -> std::string {
        switch (field.kind) {
            case drefl::FieldKind::scalar:
                return std::string{drefl::scalar_type_name(field.scalar_type)};
            case drefl::FieldKind::sequence:
                return std::string{serde::Value::type_name(serde::Value::Type::array)};
            case drefl::FieldKind::map:
            case drefl::FieldKind::record:
                return std::string{serde::Value::type_name(serde::Value::Type::table)};
            case drefl::FieldKind::enumeration:
                return field.type_name;
        }
        return field.type_name;
    }
};

}

auto materialize(
    drefl::RecordTypeDescriptor const& descriptor,
    serde::Value const& data,
    drefl::TypeRegistry& registry,
    MaterializeOptions const& options
) -> drefl::Instance {
    Materializer materializer{registry, options};
    return materializer.build(descriptor, data, "");
}

}
