#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "patchable.hpp"
#include "struct_introspection.hpp"

namespace PluralKit {

// Wire adapter for types the library does not own (UUIDs, colors, time
// points). A specialization provides
//
//   using wire_type = ...;
//   static constexpr bool to_wire(const T&, wire_type&);
//   static constexpr std::optional<T> from_wire(const wire_type&);
//
// Types of this library carry the same contract as members instead:
// transform_to(wire_type&) const and static transform_from(const wire_type&).
template<class T>
struct WireCodec;

// Enumerations written as strings. Specialize with
//   static constexpr std::array<std::pair<E, std::string_view>, N> entries{...};
template<class E>
struct EnumNames;

namespace static_schema {

namespace detail {

template<class T> struct is_optional : std::false_type {};
template<class T> struct is_optional<std::optional<T>> : std::true_type {};

template<class T> struct is_vector : std::false_type {};
template<class T, class A> struct is_vector<std::vector<T, A>> : std::true_type {};

template<class T>
struct always_false : std::false_type {};

} // namespace detail

template<class T>
concept CodecTransformer = requires(const T& v, typename WireCodec<T>::wire_type& w,
                                    const typename WireCodec<T>::wire_type& cw) {
    typename WireCodec<T>::wire_type;
    { WireCodec<T>::to_wire(v, w) } -> std::same_as<bool>;
    { WireCodec<T>::from_wire(cw) } -> std::same_as<std::optional<T>>;
};

template<class T>
concept MemberTransformer = requires(const T& v, typename T::wire_type& w,
                                     const typename T::wire_type& cw) {
    typename T::wire_type;
    { v.transform_to(w) } -> std::same_as<bool>;
    { T::transform_from(cw).has_value() } -> std::convertible_to<bool>;
};

template<class T>
concept Transformer = CodecTransformer<T> || MemberTransformer<T>;

template<class T>
struct transform_traits;

template<CodecTransformer T>
struct transform_traits<T> {
    using wire_type = typename WireCodec<T>::wire_type;
};

template<MemberTransformer T>
    requires (!CodecTransformer<T>)
struct transform_traits<T> {
    using wire_type = typename T::wire_type;
};

template<Transformer T>
using wire_type_t = typename transform_traits<T>::wire_type;

template<Transformer T>
constexpr bool to_wire(const T& value, wire_type_t<T>& wire) {
    if constexpr (CodecTransformer<T>) {
        return WireCodec<T>::to_wire(value, wire);
    } else {
        return value.transform_to(wire);
    }
}

template<Transformer T>
constexpr std::optional<T> from_wire(const wire_type_t<T>& wire) {
    if constexpr (CodecTransformer<T>) {
        return WireCodec<T>::from_wire(wire);
    } else {
        auto r = T::transform_from(wire);
        if(!r.has_value()) {
            return std::nullopt;
        }
        return std::optional<T>(std::move(*r));
    }
}

template<class T>
concept JsonPatchable = is_patchable_v<T>;

template<class T>
concept JsonNullable = detail::is_optional<T>::value;

template<class T>
concept JsonBool = std::same_as<T, bool>;

template<class T>
concept JsonNumber = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>;

template<class T>
concept JsonString = std::same_as<T, std::string> || std::same_as<T, std::string_view>;

template<class T>
concept JsonEnum = std::is_enum_v<T> && requires {
    { EnumNames<T>::entries.size() } -> std::convertible_to<std::size_t>;
};

template<class T>
concept JsonArray = detail::is_vector<T>::value;

template<class T>
concept JsonObject = std::is_class_v<T>
    && !Transformer<T> && !JsonPatchable<T> && !JsonNullable<T>
    && !JsonString<T> && !JsonArray<T>
    && (introspection::has_struct_meta<T> || std::is_aggregate_v<T>);

template<class T>
concept JsonValue = Transformer<T> || JsonPatchable<T> || JsonNullable<T> || JsonBool<T>
    || JsonNumber<T> || JsonString<T> || JsonEnum<T> || JsonArray<T> || JsonObject<T>;

// Field may be absent from an object: optional fields decode as empty,
// patch fields as Unmodified.
template<class T>
concept JsonOmittable = JsonNullable<T> || JsonPatchable<T>;

// Emit-if-touched: an Unmodified patch field contributes nothing to its object.
template<class Field>
constexpr bool isUntouched(const Field& f) {
    if constexpr (JsonPatchable<Field>) {
        return f.is_unmodified();
    } else {
        return false;
    }
}

template<JsonEnum E>
constexpr std::optional<std::string_view> enumToString(E value) {
    for(const auto& [v, name] : EnumNames<E>::entries) {
        if(v == value) {
            return name;
        }
    }
    return std::nullopt;
}

template<JsonEnum E>
constexpr std::optional<E> enumFromString(std::string_view name) {
    for(const auto& [v, n] : EnumNames<E>::entries) {
        if(n == name) {
            return v;
        }
    }
    return std::nullopt;
}

} // namespace static_schema

} // namespace PluralKit
