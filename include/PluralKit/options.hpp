#pragma once
#include <concepts>
#include <cstddef>
#include <type_traits>

#include "const_string.hpp"

#ifndef PLURALKIT_MAX_NESTING_DEPTH
#define PLURALKIT_MAX_NESTING_DEPTH 64
#endif

namespace PluralKit {

// Per-field or per-struct wire options, listed in StructMeta.
template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

namespace options {

namespace detail {

struct not_json_tag{};
struct key_tag{};
struct allow_excess_fields_tag{};

}

// Field is neither written nor read; it is value-initialized when parsing.
struct not_json {
    using tag = detail::not_json_tag;
};

// Wire name of a field, when it differs from the C++ name.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ PluralKit ]]] key contains control or quote characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
};

// Unknown keys of an object are skipped instead of failing the parse.
template<std::size_t MaxSkipDepth = PLURALKIT_MAX_NESTING_DEPTH>
struct allow_excess_fields {
    static_assert(MaxSkipDepth > 0, "[[[ PluralKit ]]] skipping needs at least one level");
    static constexpr std::size_t SkipDepthLimit = MaxSkipDepth;
    using tag = detail::allow_excess_fields_tag;
};

namespace detail {

template<class Opt, class Tag>
concept tagged_with = requires { typename Opt::tag; } && std::same_as<typename Opt::tag, Tag>;

// First option carrying Tag, or void.
template<class Tag, class... Opts>
struct lookup {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct lookup<Tag, First, Rest...>
    : std::conditional_t<tagged_with<First, Tag>, std::type_identity<First>, lookup<Tag, Rest...>> {};

template<class OptPack> struct field_options;

template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    template<class Tag>
    using get_option = typename lookup<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = (tagged_with<Opts, Tag> || ...);
};

using no_options = field_options<OptionsPack<>>;

} // namespace detail

} // namespace options

} // namespace PluralKit
