#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "options.hpp"

namespace PluralKit {

// Explicit field list of a model. Specialize as
//
//   template<> struct StructMeta<Member> {
//       using Fields = StructFields<Field<&Member::id, "id">, ...>;
//       using Options = OptionsPack<options::allow_excess_fields<>>;   // optional
//   };
//
// Fields must be listed in declaration order and cover every member, since
// parsing builds the object by aggregate initialization in that order.
// Aggregates without a specialization are reflected with PFR.
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = key;
    static constexpr T C::* MemberP = MPtr;
};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
inline constexpr bool is_fields_pack = false;

template<class... F>
inline constexpr bool is_fields_pack<StructFields<F...>> = true;

template<class T>
concept described = requires { typename StructMeta<T>::Fields; }
    && is_fields_pack<typename StructMeta<T>::Fields>;

template<class T>
struct struct_options_impl {
    using type = options::detail::no_options;
};

template<class T>
    requires requires { typename StructMeta<T>::Options; }
struct struct_options_impl<T> {
    using type = options::detail::field_options<typename StructMeta<T>::Options>;
};


// Aggregates without a StructMeta: members in declaration order, named as declared.
template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    using structureElementOptionsByIndex = options::detail::no_options;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

// Models with a StructMeta: exactly the listed fields.
template <class T>
    requires described<T>
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const T & s) {
        using F = std::tuple_element_t<Index, Fields>;
        return (s.*(F::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<std::size_t Index>
    using structureElementOptionsByIndex =
        options::detail::field_options<typename std::tuple_element_t<Index, Fields>::OptionsP>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();
};

} // namespace detail

template<class T>
inline constexpr bool has_struct_meta = detail::described<std::remove_cv_t<T>>;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
using structureElementOptionsByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementOptionsByIndex<Index>;

// Wire name: the key<> of an explicit field list, the member name otherwise.
template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

template<class StructT>
using structureOptions = typename detail::struct_options_impl<std::remove_cv_t<StructT>>::type;

} // namespace introspection

} // namespace PluralKit
