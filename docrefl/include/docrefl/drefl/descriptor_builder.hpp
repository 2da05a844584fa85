#pragma once

#include <tuple>
#include <typeinfo>

#include <magic_enum.hpp>

#include "type_registry.hpp"
#include "errors.hpp"
#include "../prelude/option.hpp"
#include "../prelude/traits.hpp"

namespace dr::drefl {

namespace details {

template <typename T>
struct ScalarTypeOf final {
    static constexpr bool value = false;
};
template <>
struct ScalarTypeOf<bool> final {
    static constexpr bool value = true;
    static constexpr ScalarType type = ScalarType::boolean;
};
template <>
struct ScalarTypeOf<int32_t> final {
    static constexpr bool value = true;
    static constexpr ScalarType type = ScalarType::int32;
};
template <>
struct ScalarTypeOf<int64_t> final {
    static constexpr bool value = true;
    static constexpr ScalarType type = ScalarType::int64;
};
template <>
struct ScalarTypeOf<double> final {
    static constexpr bool value = true;
    static constexpr ScalarType type = ScalarType::float64;
};
template <>
struct ScalarTypeOf<std::string> final {
    static constexpr bool value = true;
    static constexpr ScalarType type = ScalarType::string;
};

template <typename T>
concept Scalar = ScalarTypeOf<T>::value;

template <typename T>
concept Collection = traits::Sequence<T> || traits::StringMap<T>;

template <typename T>
concept Record = std::is_class_v<T>
    && std::is_default_constructible_v<T>
    && std::is_copy_constructible_v<T>
    && !Scalar<T> && !Collection<T> && !traits::Optional<T>;

template <typename T>
struct CollectionElement final {
    using type = void;
};
template <traits::Sequence T>
struct CollectionElement<T> final {
    using type = typename traits::SequenceHelper<T>::element_type;
};
template <traits::StringMap T>
struct CollectionElement<T> final {
    using type = typename traits::StringMapHelper<T>::element_type;
};

template <typename T>
constexpr auto kind_of() -> FieldKind {
    if constexpr (Scalar<T>) {
        return FieldKind::scalar;
    } else if constexpr (traits::Enum<T>) {
        return FieldKind::enumeration;
    } else if constexpr (traits::Sequence<T>) {
        return FieldKind::sequence;
    } else if constexpr (traits::StringMap<T>) {
        return FieldKind::map;
    } else if constexpr (Record<T>) {
        return FieldKind::record;
    } else {
        static_assert(traits::AlwaysFalse<T>, "unsupported field type");
    }
}

template <typename T>
auto type_name_of() -> std::string {
    if constexpr (traits::Optional<T>) {
        return "Option<" + type_name_of<typename traits::OptionHelper<T>::inner_type>() + ">";
    } else if constexpr (Scalar<T>) {
        return std::string{scalar_type_name(ScalarTypeOf<T>::type)};
    } else if constexpr (traits::Enum<T>) {
        return std::string{magic_enum::enum_type_name<T>()};
    } else if constexpr (traits::Sequence<T>) {
        return "vector<" + type_name_of<typename CollectionElement<T>::type>() + ">";
    } else if constexpr (traits::StringMap<T>) {
        return "map<string, " + type_name_of<typename CollectionElement<T>::type>() + ">";
    } else if constexpr (srefl::is_reflectable<T>) {
        return std::string{srefl::refl<T>().type_name};
    } else {
        return typeid(T).name();
    }
}

template <typename U>
auto nested_resolver() -> std::function<NestedResolver> {
    return [](TypeRegistry& registry) -> RecordTypeDescriptor const& {
        return registry.descriptor<U>();
    };
}

template <Scalar S>
auto scalar_from_value(serde::Value const& value) -> S {
    if constexpr (std::is_same_v<S, int64_t>) {
        return value.as_integer();
    } else {
        return value.get_ref<S>();
    }
}

template <Collection C>
auto collection_from_value(serde::Value const& value) -> C {
    using Elem = typename CollectionElement<C>::type;
    C result{};
    if constexpr (traits::Sequence<C>) {
        auto const& array = value.get_ref<serde::Value::Array>();
        result.reserve(array.size());
        for (auto const& element : array) {
            result.push_back(scalar_from_value<Elem>(element));
        }
    } else {
        for (auto const& [key, element] : value.get_ref<serde::Value::Table>()) {
            result.emplace(key, scalar_from_value<Elem>(element));
        }
    }
    return result;
}

template <Collection C>
auto collection_to_value(C const& collection) -> serde::Value {
    if constexpr (traits::Sequence<C>) {
        serde::Value::Array array{};
        array.reserve(collection.size());
        for (auto const& element : collection) {
            array.emplace_back(static_cast<typename CollectionElement<C>::type>(element));
        }
        return array;
    } else {
        serde::Value::Table table{};
        for (auto const& [key, element] : collection) {
            table.emplace(key, element);
        }
        return table;
    }
}

template <traits::Enum E>
auto enum_to_value(E value) -> serde::Value {
    if (auto name = magic_enum::enum_name(value); !name.empty()) {
        return name;
    }
    return static_cast<int64_t>(magic_enum::enum_integer(value));
}

template <typename FieldT, typename V>
auto assign(FieldT& field, V&& value) -> void {
    if constexpr (traits::Optional<FieldT>) {
        field.emplace(std::forward<V>(value));
    } else {
        field = std::forward<V>(value);
    }
}

template <typename FieldT>
auto inner_ref(FieldT const& field) -> typename traits::OptionHelper<FieldT>::inner_type const* {
    if constexpr (traits::Optional<FieldT>) {
        return field.has_value() ? &field.value() : nullptr;
    } else {
        return &field;
    }
}

template <typename T, typename FieldT>
auto make_accessor(FieldT T::* ptr) -> FieldAccessor {
    using Inner = typename traits::OptionHelper<FieldT>::inner_type;
    constexpr auto kind = kind_of<Inner>();

    auto field_of = [ptr](void* object) -> FieldT& { return static_cast<T*>(object)->*ptr; };
    auto cfield_of = [ptr](void const* object) -> FieldT const& { return static_cast<T const*>(object)->*ptr; };

    FieldAccessor accessor{};
    accessor.set_null = [field_of](void* object) {
        if constexpr (traits::Optional<FieldT>) {
            field_of(object).reset();
        } else if constexpr (kind == FieldKind::enumeration) {
            field_of(object) = magic_enum::enum_value<FieldT>(0);
        } else {
            field_of(object) = FieldT{};
        }
    };
    accessor.is_empty = [cfield_of](void const* object) -> bool {
        return inner_ref(cfield_of(object)) == nullptr;
    };

    if constexpr (kind == FieldKind::scalar) {
        accessor.set_value = [field_of](void* object, serde::Value const& value) {
            assign(field_of(object), scalar_from_value<Inner>(value));
        };
        accessor.get_value = [cfield_of](void const* object) -> serde::Value {
            auto inner = inner_ref(cfield_of(object));
            return inner ? serde::Value{*inner} : serde::Value{};
        };
    } else if constexpr (kind == FieldKind::enumeration) {
        accessor.set_enum = [field_of](void* object, size_t ordinal) {
            assign(field_of(object), magic_enum::enum_value<Inner>(ordinal));
        };
        accessor.get_value = [cfield_of](void const* object) -> serde::Value {
            auto inner = inner_ref(cfield_of(object));
            return inner ? enum_to_value(*inner) : serde::Value{};
        };
    } else if constexpr (kind == FieldKind::record) {
        accessor.set_record = [field_of](void* object, Instance&& nested) {
            auto value = aa::any_cast<Inner>(&nested);
            if (value == nullptr) {
                throw InvalidDescriptorError{"Nested instance does not match the declared field type"};
            }
            assign(field_of(object), std::move(*value));
        };
        accessor.get_record = [cfield_of](void const* object) -> void const* {
            return inner_ref(cfield_of(object));
        };
    } else {
        using Elem = typename CollectionElement<Inner>::type;
        if constexpr (Scalar<Elem>) {
            accessor.set_value = [field_of](void* object, serde::Value const& value) {
                assign(field_of(object), collection_from_value<Inner>(value));
            };
            accessor.get_value = [cfield_of](void const* object) -> serde::Value {
                auto inner = inner_ref(cfield_of(object));
                return inner ? collection_to_value(*inner) : serde::Value{};
            };
        } else if constexpr (Record<Elem>) {
            accessor.for_each_element = [cfield_of](
                void const* object, std::function<ElementVisitor> const& func
            ) {
                auto inner = inner_ref(cfield_of(object));
                if (inner == nullptr) { return; }
                if constexpr (traits::Sequence<Inner>) {
                    for (auto const& element : *inner) {
                        func("", &element);
                    }
                } else {
                    for (auto const& [key, element] : *inner) {
                        func(key, &element);
                    }
                }
            };
        } else {
            static_assert(traits::AlwaysFalse<Elem>, "collections may only hold scalars or records");
        }
    }
    return accessor;
}

inline auto apply_attribute(FieldDescriptor& field, Rename const& rename) -> void {
    field.external_name = rename.name;
}
inline auto apply_attribute(FieldDescriptor& field, Defaulted const&) -> void {
    field.has_default = true;
}

}

// Builds the descriptor of record type `T` from its fields' member pointers.
//
//     DescriptorBuilder<Address>{"Address"}
//         .field("city", &Address::city, Rename{"c"})
//         .field("zip_code", &Address::zip_code)
//         .build();
template <typename T>
struct DescriptorBuilder final {
    explicit DescriptorBuilder(std::string_view type_name) : type_name_(type_name) {}

    template <typename FieldT, typename... AttribTs>
    auto field(std::string_view name, FieldT T::* ptr, AttribTs const&... attribs) -> DescriptorBuilder& {
        using Inner = typename traits::OptionHelper<FieldT>::inner_type;
        static_assert(!traits::Optional<Inner>, "nested Option is not supported");

        FieldDescriptor desc{};
        desc.logical_name = name;
        desc.external_name = name;
        desc.type_name = details::type_name_of<FieldT>();
        desc.kind = details::kind_of<Inner>();
        desc.optional = traits::Optional<FieldT>;
        (details::apply_attribute(desc, attribs), ...);

        if constexpr (details::Scalar<Inner>) {
            desc.scalar_type = details::ScalarTypeOf<Inner>::type;
        } else if constexpr (traits::Enum<Inner>) {
            static_assert(
                magic_enum::enum_count<Inner>() > 0,
                "enum has no case inside [MAGIC_ENUM_RANGE_MIN, MAGIC_ENUM_RANGE_MAX]"
            );
            for (auto case_name : magic_enum::enum_names<Inner>()) {
                desc.enum_cases.emplace_back(case_name);
            }
            for (auto value : magic_enum::enum_values<Inner>()) {
                desc.enum_codes.push_back(static_cast<int64_t>(magic_enum::enum_integer(value)));
            }
        } else if constexpr (details::Record<Inner>) {
            desc.nested = details::nested_resolver<Inner>();
        } else {
            using Elem = typename details::CollectionElement<Inner>::type;
            if constexpr (details::Scalar<Elem>) {
                desc.scalar_type = details::ScalarTypeOf<Elem>::type;
            } else {
                desc.element_is_record = true;
                desc.nested = details::nested_resolver<Elem>();
            }
        }

        desc.accessor = details::make_accessor<T>(ptr);
        fields_.push_back(std::move(desc));
        return *this;
    }

    auto build() -> RecordTypeDescriptor {
        return RecordTypeDescriptor{
            .type = typeid(T),
            .name = std::move(type_name_),
            .fields = std::move(fields_),
            .construct = []() -> Instance { return Instance{T{}}; },
            .address = [](Instance& instance) -> void* { return aa::any_cast<T>(&instance); },
        };
    }

private:
    std::string type_name_;
    std::vector<FieldDescriptor> fields_;
};

template <typename T>
auto srefl_provider() -> MetadataProvider {
    return MetadataProvider{
        .type = typeid(T),
        .describe = []() -> RecordTypeDescriptor {
            constexpr auto sinfo = srefl::refl<T>();
            DescriptorBuilder<T> builder{sinfo.type_name};
            srefl::for_each(sinfo.members, [&builder](auto const& member) {
                std::apply([&builder, &member](auto const&... attribs) {
                    builder.field(member.name, member.ptr, attribs...);
                }, member.attributes);
            });
            return builder.build();
        },
    };
}

// Provider for a type declared with `DR_SREFL`, for registering it under a registry explicitly.
template <typename T>
auto make_provider() -> MetadataProvider {
    static_assert(srefl::is_reflectable<T>, "type has no DR_SREFL declaration");
    return srefl_provider<T>();
}

}
