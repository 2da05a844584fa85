#pragma once

#include <string_view>
#include <tuple>
#include <type_traits>

#include "../macros/map.hpp"

// Field attributes understood by the document mapper
namespace dr {

// External (document) name of a field, when it differs from the declared name.
struct Rename final {
    std::string_view name;
};

// Mark a field whose default member initializer is used when the document omits it.
struct Defaulted final {};

}

namespace dr::srefl {

template <typename TypeT, typename FieldT, typename... AttribTs>
struct FieldInfo final {
    using FieldType = FieldT;
    using TypeType = TypeT;

    std::string_view name;
    FieldT TypeT::* ptr;
    std::tuple<AttribTs...> attributes;

    consteval FieldInfo(
        std::string_view name, FieldT TypeT::* ptr, AttribTs... attribs
    ) : name(name), ptr(ptr), attributes(std::make_tuple(attribs...)) {}
};

template <typename TypeT, typename... FieldTs>
struct TypeInfo final {
    using value_type = TypeT;
    std::string_view type_name;
    std::tuple<FieldTs...> members;
};

template <typename TypeT, typename... FieldTs, typename FieldT>
consteval auto operator+(TypeInfo<TypeT, FieldTs...> lhs, FieldT rhs) -> TypeInfo<TypeT, FieldTs..., FieldT> {
    return TypeInfo<TypeT, FieldTs..., FieldT>{
        .type_name = lhs.type_name,
        .members = std::tuple_cat(lhs.members, std::make_tuple(rhs)),
    };
}

template <typename T>
consteval auto refl_ptr(T const*) -> TypeInfo<T> {
    return TypeInfo<T>{
        .type_name = {"<unknown type>"},
    };
}
template <typename T>
consteval auto refl() -> decltype(auto) {
    T const* ptr = nullptr;
    return refl_ptr(ptr);
}

template <typename T>
constexpr bool is_reflectable = refl<T>().type_name != "<unknown type>";

template <size_t I = 0, typename Func, typename... Ts>
constexpr auto for_each(std::tuple<Ts...> const& members, Func&& func) -> void {
    if constexpr (I < sizeof...(Ts)) {
        func(std::get<I>(members));
        for_each<I + 1>(members, std::forward<Func>(func));
    }
}

// Declares the static reflection of a record type; must appear in the namespace of the type.
//
//     DR_SREFL(type(Address), field(city, Rename{"c"}), field(zip_code))
#define DR_SREFL_type(ty, ...) consteval auto refl_ptr(ty const*) -> decltype(auto) { \
    return ::dr::srefl::TypeInfo<ty>{.type_name = #ty}
#define DR_SREFL_ID_type(ty, ...) ty
#define DR_SREFL(ty, ...) DR_EVAL_MACRO_ONCE(DR_SREFL_##ty) \
    __VA_OPT__(DR_SREFL_INNER(DR_EVAL_MACRO_ONCE(DR_SREFL_ID_##ty), __VA_ARGS__)) \
    ; }

#define DR_SREFL_INNER(ty, ...) __VA_OPT__(DR_EVAL_MACRO(DR_SREFL_INNER_HELPER(ty, __VA_ARGS__)))
#define DR_SREFL_INNER_HELPER(ty, first, ...) DR_EVAL_MACRO_ONCE( \
        DR_EVAL_MACRO_ONCE(DR_SREFL_NAME_##first)DR_EXPAND_ARGS(ty, DR_EVAL_MACRO_ONCE(DR_SREFL_LIST_##first)) \
    ) __VA_OPT__(DR_SREFL_INNER_HELPER2 DR_PARENS (ty, __VA_ARGS__))
#define DR_SREFL_INNER_HELPER2() DR_SREFL_INNER_HELPER

#define DR_SREFL_LIST_field(...) __VA_ARGS__
#define DR_SREFL_NAME_field(...) DR_SREFL_field
#define DR_SREFL_field(ty, nm, ...) + ::dr::srefl::FieldInfo(#nm, &ty::nm __VA_OPT__(,) __VA_ARGS__)

}
