#pragma once

#include <array>
#include <string_view>
#include <utility>

#include "../static_schema.hpp"

namespace PluralKit {

namespace models {

enum class Privacy {
    Public,
    Private
};

// Privacy of each part of a member, as returned by the service. Reflected by
// member name.
struct MemberPrivacy {
    Privacy visibility;
    Privacy name;
    Privacy description;
    Privacy birthday;
    Privacy pronouns;
    Privacy avatar;
    Privacy metadata;

    friend constexpr bool operator==(const MemberPrivacy&, const MemberPrivacy&) = default;
};

} // namespace models

template<>
struct EnumNames<models::Privacy> {
    static constexpr std::array<std::pair<models::Privacy, std::string_view>, 2> entries{{
        {models::Privacy::Public, "public"},
        {models::Privacy::Private, "private"},
    }};
};

} // namespace PluralKit
