#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../color.hpp"
#include "../limited.hpp"
#include "../options.hpp"
#include "../patchable.hpp"
#include "../references.hpp"
#include "../struct_introspection.hpp"
#include "../timestamp.hpp"
#include "../uuid.hpp"
#include "privacy.hpp"

namespace PluralKit {

namespace models {

enum class ProxyTagError {
    CombinedLimitExceeded
};

constexpr std::string_view error_to_string(ProxyTagError e) {
    switch(e) {
    case ProxyTagError::CombinedLimitExceeded: return "proxy tags must not exceed 100 total characters";
    }
    return "N/A";
}

// ProxyTag as it appears in JSON.
struct ProxyTagWire {
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
};

/// Text around a message that makes it be proxied as a member, e.g. "{text}-A".
/// The service limits prefix and suffix together, not each one.
class ProxyTag {
    std::optional<std::string> m_prefix;
    std::optional<std::string> m_suffix;

    constexpr ProxyTag(std::optional<std::string> prefix, std::optional<std::string> suffix)
        : m_prefix(std::move(prefix)), m_suffix(std::move(suffix)) {}

public:
    static constexpr std::size_t SizeLimit = 100;
    using wire_type = ProxyTagWire;

    static constexpr std::expected<ProxyTag, ProxyTagError> make(std::optional<std::string> prefix,
                                                                 std::optional<std::string> suffix) {
        const std::size_t length = (prefix ? prefix->size() : 0) + (suffix ? suffix->size() : 0);
        if(length > SizeLimit) {
            return std::unexpected(ProxyTagError::CombinedLimitExceeded);
        }
        return ProxyTag(std::move(prefix), std::move(suffix));
    }

    constexpr const std::optional<std::string> & prefix() const noexcept { return m_prefix; }
    constexpr const std::optional<std::string> & suffix() const noexcept { return m_suffix; }

    constexpr bool transform_to(ProxyTagWire & out) const {
        out.prefix = m_prefix;
        out.suffix = m_suffix;
        return true;
    }
    static constexpr std::expected<ProxyTag, ProxyTagError> transform_from(const ProxyTagWire & w) {
        return make(w.prefix, w.suffix);
    }

    friend constexpr bool operator==(const ProxyTag&, const ProxyTag&) = default;
};


struct Member {
    ShortId id;
    Uuid uuid;
    ShortId system_id;
    LimitedStr<100> name;
    std::optional<LimitedStr<100>> display_name;
    std::optional<Rgb8> color;
    std::optional<Timestamp> birthday;
    std::optional<LimitedStr<100>> pronouns;
    std::optional<LimitedUrl<256>> avatar;
    std::optional<LimitedUrl<256>> webhook_avatar;
    std::optional<LimitedUrl<256>> banner;
    std::optional<LimitedStr<1000>> description;
    std::optional<Timestamp> created;
    std::vector<ProxyTag> proxy_tags;
    bool keep_proxy_tags;
    bool text_to_speech;
    std::optional<bool> autoproxy_enabled;
    std::optional<std::uint32_t> message_count;
    std::optional<Timestamp> last_message_timestamp;
    std::optional<MemberPrivacy> privacy;

    GenericRef ref() const {
        return GenericRef(uuid);
    }
};


struct MemberPrivacyPatch {
    Patchable<Privacy> visibility;
    Patchable<Privacy> name;
    Patchable<Privacy> description;
    Patchable<Privacy> birthday;
    Patchable<Privacy> pronouns;
    Patchable<Privacy> avatar;
    Patchable<Privacy> metadata;

    // Every field patched to the same value.
    static constexpr MemberPrivacyPatch all(Privacy p) {
        return MemberPrivacyPatch{p, p, p, p, p, p, p};
    }

    static const MemberPrivacyPatch PUBLIC;
    static const MemberPrivacyPatch PRIVATE;

    friend constexpr bool operator==(const MemberPrivacyPatch&, const MemberPrivacyPatch&) = default;
};

inline constexpr MemberPrivacyPatch MemberPrivacyPatch::PUBLIC = MemberPrivacyPatch::all(Privacy::Public);
inline constexpr MemberPrivacyPatch MemberPrivacyPatch::PRIVATE = MemberPrivacyPatch::all(Privacy::Private);


// Changes to a member. Only patched fields are written; proxy_tags is always
// written and replaces the whole list.
struct MemberPatch {
    Patchable<LimitedStr<100>> name;
    Patchable<std::optional<LimitedStr<100>>> display_name;
    Patchable<std::optional<Rgb8>> color;
    Patchable<std::optional<Timestamp>> birthday;
    Patchable<std::optional<LimitedStr<100>>> pronouns;
    Patchable<std::optional<LimitedUrl<256>>> avatar;
    Patchable<std::optional<LimitedUrl<256>>> webhook_avatar;
    Patchable<std::optional<LimitedUrl<256>>> banner;
    Patchable<std::optional<LimitedStr<1000>>> description;
    std::vector<ProxyTag> proxy_tags;
    Patchable<bool> keep_proxy_tags;
    Patchable<bool> text_to_speech;
    Patchable<std::optional<bool>> autoproxy_enabled;
    Patchable<MemberPrivacyPatch> privacy;
};

} // namespace models


template<> struct StructMeta<models::Member> {
    using M = models::Member;
    using Fields = StructFields<
        Field<&M::id, "id">,
        Field<&M::uuid, "uuid">,
        Field<&M::system_id, "system_id", options::key<"system">>,
        Field<&M::name, "name">,
        Field<&M::display_name, "display_name">,
        Field<&M::color, "color">,
        Field<&M::birthday, "birthday">,
        Field<&M::pronouns, "pronouns">,
        Field<&M::avatar, "avatar", options::key<"avatar_url">>,
        Field<&M::webhook_avatar, "webhook_avatar", options::key<"webhook_avatar_url">>,
        Field<&M::banner, "banner">,
        Field<&M::description, "description">,
        Field<&M::created, "created">,
        Field<&M::proxy_tags, "proxy_tags">,
        Field<&M::keep_proxy_tags, "keep_proxy_tags", options::key<"keep_proxy">>,
        Field<&M::text_to_speech, "text_to_speech">,
        Field<&M::autoproxy_enabled, "autoproxy_enabled">,
        Field<&M::message_count, "message_count">,
        Field<&M::last_message_timestamp, "last_message_timestamp">,
        Field<&M::privacy, "privacy">
    >;
    // the service adds fields over time
    using Options = OptionsPack<options::allow_excess_fields<>>;
};

template<> struct StructMeta<models::MemberPrivacyPatch> {
    using M = models::MemberPrivacyPatch;
    using Fields = StructFields<
        Field<&M::visibility, "visibility">,
        Field<&M::name, "name">,
        Field<&M::description, "description">,
        Field<&M::birthday, "birthday">,
        Field<&M::pronouns, "pronouns">,
        Field<&M::avatar, "avatar">,
        Field<&M::metadata, "metadata">
    >;
};

template<> struct StructMeta<models::MemberPatch> {
    using M = models::MemberPatch;
    using Fields = StructFields<
        Field<&M::name, "name">,
        Field<&M::display_name, "display_name">,
        Field<&M::color, "color">,
        Field<&M::birthday, "birthday">,
        Field<&M::pronouns, "pronouns">,
        Field<&M::avatar, "avatar", options::key<"avatar_url">>,
        Field<&M::webhook_avatar, "webhook_avatar", options::key<"webhook_avatar_url">>,
        Field<&M::banner, "banner">,
        Field<&M::description, "description">,
        Field<&M::proxy_tags, "proxy_tags">,
        Field<&M::keep_proxy_tags, "keep_proxy_tags", options::key<"keep_proxy">>,
        Field<&M::text_to_speech, "text_to_speech">,
        Field<&M::autoproxy_enabled, "autoproxy_enabled">,
        Field<&M::privacy, "privacy">
    >;
};

} // namespace PluralKit
