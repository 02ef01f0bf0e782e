#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

#include <PluralKit/error_formatting.hpp>
#include <PluralKit/limited.hpp>
#include <PluralKit/models/member.hpp>
#include <PluralKit/parser.hpp>
#include <PluralKit/references.hpp>
#include <PluralKit/serializer.hpp>
#include <PluralKit/url.hpp>
#include <PluralKit/uuid.hpp>

// Checks that need libcurl or Boost.Uuid and so cannot run at compile time.

using namespace PluralKit;
using namespace PluralKit::models;

namespace {

constexpr std::string_view kMemberUuid = "5cfa8d7a-3c8f-4d2c-9a0e-0123456789ab";

constexpr std::string_view kMemberJson = R"({
    "id": "abcde",
    "uuid": "5cfa8d7a-3c8f-4d2c-9a0e-0123456789ab",
    "system": "exmpl",
    "name": "Ada",
    "display_name": null,
    "color": "FF00ff",
    "birthday": "2000-02-29",
    "pronouns": "she/her",
    "avatar_url": "https://example.com/avatar.png",
    "webhook_avatar_url": null,
    "banner": null,
    "description": "Counts things.",
    "created": "2021-06-15T08:00:00.000001Z",
    "proxy_tags": [{"prefix": "a:", "suffix": null}, {"prefix": null, "suffix": "-a"}],
    "keep_proxy": false,
    "text_to_speech": true,
    "autoproxy_enabled": null,
    "message_count": 1234,
    "last_message_timestamp": null,
    "tts": false,
    "future_field": {"nested": [1, 2, {"deep": true}]}
})";

// ============================================================================
// URL and UUID codecs
// ============================================================================

bool test_url_parse() {
    auto u = Url::parse("https://example.com/avatar.png");
    return u && u->scheme() == "https" && u->host() == "example.com"
        && u->str() == "https://example.com/avatar.png";
}

bool test_url_parse_rejects_garbage() {
    return !Url::parse("") && !Url::parse("not a url") && !Url::parse("https://exa mple.com/");
}

bool test_limited_url_checks_length_first() {
    auto tooLong = LimitedUrl<10>::make("https://example.com/a.png");
    auto tooLongAndBroken = LimitedUrl<5>::make("not a url");
    auto broken = LimitedUrl<256>::make("not a url");
    return !tooLong && std::holds_alternative<LimitError>(tooLong.error())
        && std::get<LimitError>(tooLong.error()).limit == 10
        && !tooLongAndBroken && std::holds_alternative<LimitError>(tooLongAndBroken.error())
        && !broken && std::holds_alternative<UrlError>(broken.error());
}

bool test_limited_url_at_limit() {
    constexpr std::string_view text = "https://example.com/";
    auto u = LimitedUrl<text.size()>::make(text);
    return u && u->url().host() == "example.com" && u->str() == text;
}

// The stored text is libcurl's normalised form; that is what the bound must hold for
bool test_limited_url_bounds_normalised_text() {
    auto over = LimitedUrl<19>::make("https://example.com");
    auto fits = LimitedUrl<20>::make("https://example.com");
    if(over || !std::holds_alternative<LimitError>(over.error()) || !fits) return false;
    const LimitError & e = std::get<LimitError>(over.error());
    auto again = LimitedUrl<20>::make(fits->str());
    return e.value == "https://example.com/" && e.limit == 19
        && fits->str() == "https://example.com/"
        && again && *again == *fits;
}

bool test_url_parse_needs_hierarchical_form() {
    auto mail = Url::parse("mailto:someone@example.com");
    auto data = Url::parse("data:image/png;base64,AAAA");
    auto custom = Url::parse("pk-custom://assets/a.png");
    return !mail && mail.error() == UrlError{CURLUE_BAD_SLASHES}
        && !data && data.error() == UrlError{CURLUE_BAD_SLASHES}
        && custom && custom->scheme() == "pk-custom";
}

bool test_limited_url_unchecked() {
    auto u = Url::parse("https://example.com/avatar.png");
    if(!u) return false;
    const LimitedUrl<5> v = LimitedUrl<5>::unchecked(*u);
    std::string out;
    return v.str() == "https://example.com/avatar.png"
        && v.str().size() > LimitedUrl<5>::limit
        && v.url() == *u
        && Serialize(v, out) && out == R"("https://example.com/avatar.png")";
}

bool test_limited_values_hash() {
    std::unordered_set<LimitedStr<10>> names;
    names.insert(*LimitedStr<10>::make("Ada"));
    names.insert(*LimitedStr<10>::make("Ada"));
    names.insert(LimitedStr<10>::unchecked("Ada"));
    names.insert(*LimitedStr<10>::make("Grace"));

    std::unordered_set<LimitedUrl<64>> urls;
    urls.insert(*LimitedUrl<64>::make("https://example.com/a.png"));
    urls.insert(*LimitedUrl<64>::make("https://example.com/a.png"));
    urls.insert(*LimitedUrl<64>::make("https://example.com/b.png"));
    return names.size() == 2 && names.contains(*LimitedStr<10>::make("Grace"))
        && urls.size() == 2 && urls.contains(*LimitedUrl<64>::make("https://example.com/b.png"));
}

bool test_uuid_text() {
    auto u = parse_uuid("5CFA8D7A-3C8F-4D2C-9A0E-0123456789AB");
    return u && uuid_to_string(*u) == kMemberUuid
        && !parse_uuid("abcde") && !parse_uuid("");
}

// ============================================================================
// References
// ============================================================================

bool test_generic_ref_to_string() {
    auto u = parse_uuid(kMemberUuid);
    auto id = ShortId::parse("abcde");
    return u && id
        && GenericRef(*id).to_string() == "abcde"
        && GenericRef(*u).to_string() == kMemberUuid
        && GenericRef(*u) != GenericRef(*id);
}

bool test_system_ref_to_string() {
    auto u = parse_uuid(kMemberUuid);
    return u
        && SystemRef::current().to_string() == "@me"
        && SystemRef(std::uint64_t{466378653216014359}).to_string() == "466378653216014359"
        && SystemRef(*u).to_string() == kMemberUuid
        && SystemRef::parse("exmpl")->to_string() == "exmpl";
}

bool test_system_ref_current_is_not_text() {
    auto r = SystemRef::parse("@me");
    return !r && r.error() == ShortIdError::IncorrectLength
        && SystemRef::current().is_current()
        && !SystemRef(std::uint64_t{1}).is_current();
}

// ============================================================================
// Member resource
// ============================================================================

bool test_member_parse() {
    auto res = Parse<Member>(kMemberJson);
    if(!res) {
        std::cerr << ParseResultToString(res, kMemberJson) << "\n";
        return false;
    }
    const Member & m = *res;
    return m.id.view() == "abcde"
        && uuid_to_string(m.uuid) == kMemberUuid
        && m.system_id.view() == "exmpl"
        && m.name.str() == "Ada"
        && !m.display_name
        && m.color == std::optional<Rgb8>(Rgb8{255, 0, 255})
        && m.birthday && format_timestamp(*m.birthday) == std::optional<std::string>("2000-02-29T00:00:00Z")
        && m.avatar && m.avatar->url().host() == "example.com"
        && !m.webhook_avatar
        && m.proxy_tags.size() == 2
        && m.proxy_tags[0].prefix() == std::optional<std::string>("a:")
        && m.proxy_tags[1].suffix() == std::optional<std::string>("-a")
        && !m.keep_proxy_tags && m.text_to_speech
        && !m.autoproxy_enabled
        && m.message_count == std::optional<std::uint32_t>(1234)
        && !m.privacy
        && m.ref() == GenericRef(m.uuid);
}

bool test_member_parse_rejects_long_avatar() {
    const std::string json = R"({"id": "abcde", "uuid": "5cfa8d7a-3c8f-4d2c-9a0e-0123456789ab", "system": "exmpl",
        "name": "Ada", "avatar_url": "https://example.com/)" + std::string(300, 'a') + R"(",
        "proxy_tags": [], "keep_proxy": false, "text_to_speech": false})";
    auto res = Parse<Member>(json);
    return !res && res.error() == ParseError::TRANSFORMER_ERROR
        && res.errorPath() == json_path::JsonPath("avatar_url");
}

bool test_member_parse_rejects_bad_uuid() {
    auto res = Parse<Member>(R"({"id": "abcde", "uuid": "abcde", "system": "exmpl", "name": "Ada",
        "proxy_tags": [], "keep_proxy": false, "text_to_speech": false})");
    return !res && res.error() == ParseError::TRANSFORMER_ERROR
        && res.errorPath() == json_path::JsonPath("uuid");
}

bool test_member_roundtrip() {
    auto first = Parse<Member>(kMemberJson);
    if(!first) return false;
    std::string out;
    if(!Serialize(*first, out)) return false;
    auto second = Parse<Member>(out);
    return second
        && second->uuid == first->uuid
        && second->color == first->color
        && second->created == first->created
        && second->proxy_tags == first->proxy_tags
        && second->avatar == first->avatar
        && out.find("\"system\":\"exmpl\"") != std::string::npos
        && out.find("\"keep_proxy\":false") != std::string::npos;
}

// ============================================================================
// Member patches
// ============================================================================

bool test_member_patch_emits_touched_fields() {
    MemberPatch patch;
    patch.name = *LimitedStr<100>::make("Ada");
    patch.color = std::optional<Rgb8>(Rgb8{255, 0, 255});
    patch.avatar = std::optional<LimitedUrl<256>>(*LimitedUrl<256>::make("https://example.com/a.png"));
    patch.description = std::nullopt;
    patch.proxy_tags.push_back(*ProxyTag::make("a:", std::nullopt));
    patch.privacy = MemberPrivacyPatch::PRIVATE;

    std::string out;
    if(!Serialize(patch, out)) return false;
    return out == R"({"name":"Ada","color":"ff00ff","avatar_url":"https://example.com/a.png","description":null,)"
                  R"("proxy_tags":[{"prefix":"a:","suffix":null}],)"
                  R"("privacy":{"visibility":"private","name":"private","description":"private",)"
                  R"("birthday":"private","pronouns":"private","avatar":"private","metadata":"private"}})";
}

bool test_member_patch_clears_with_null() {
    MemberPatch patch;
    patch.avatar = std::nullopt;
    patch.webhook_avatar = std::nullopt;
    patch.autoproxy_enabled = std::nullopt;
    patch.keep_proxy_tags = true;

    std::string out;
    return Serialize(patch, out)
        && out == R"({"avatar_url":null,"webhook_avatar_url":null,"proxy_tags":[],"keep_proxy":true,"autoproxy_enabled":null})";
}

bool test_member_patch_parse() {
    auto res = Parse<MemberPatch>(R"({"proxy_tags": [], "banner": "https://example.com/b.png", "pronouns": null})");
    return res
        && res->banner.is_patched() && res->banner.value()->str() == "https://example.com/b.png"
        && res->pronouns.is_patched() && !res->pronouns.value()
        && res->name.is_unmodified() && res->privacy.is_unmodified();
}

// ============================================================================
// Error messages
// ============================================================================

bool test_error_messages() {
    const std::string limit = LimitErrorToString(LimitError{"abc", 2});
    const std::string urlLimit = LimitedUrlErrorToString(LimitedUrl<5>::make("https://example.com").error());
    const std::string urlBroken = LimitedUrlErrorToString(LimitedUrl<256>::make("not a url").error());
    return limit == R"("abc" should not exceed length 2)"
        && urlLimit == R"(Url "https://example.com" should not exceed length 5)"
        && urlBroken.starts_with("invalid url: ")
        && JsonPathToString(json_path::JsonPath("proxy_tags", 1, "prefix")) == "$.proxy_tags[1].prefix"
        && JsonPathToString(json_path::JsonPath()) == "$"
        && error_to_string(ShortIdError::IncorrectLength) == "A ShortId should only be 5 characters in length"
        && error_to_string(ProxyTagError::CombinedLimitExceeded) == "proxy tags must not exceed 100 total characters";
}

bool test_parse_result_message() {
    constexpr std::string_view json = R"({"visibility": "friends"})";
    auto res = Parse<MemberPrivacy>(json);
    const std::string msg = ParseResultToString(res, json);
    return msg.starts_with("When parsing $.visibility, parsing error 'UNKNOWN_ENUM_VALUE'")
        && msg.find("<-- here -->") != std::string::npos;
}

bool test_serialize_result_message() {
    Patchable<bool> untouched;
    std::string out;
    auto res = Serialize(untouched, out);
    return !res && SerializeResultToString(res) == "Serialization error 'UNMODIFIED_PATCHABLE'";
}

struct TestCase {
    const char * name;
    bool (*run)();
};

const TestCase kTests[] = {
    {"url_parse", test_url_parse},
    {"url_parse_rejects_garbage", test_url_parse_rejects_garbage},
    {"limited_url_checks_length_first", test_limited_url_checks_length_first},
    {"limited_url_at_limit", test_limited_url_at_limit},
    {"limited_url_bounds_normalised_text", test_limited_url_bounds_normalised_text},
    {"url_parse_needs_hierarchical_form", test_url_parse_needs_hierarchical_form},
    {"limited_url_unchecked", test_limited_url_unchecked},
    {"limited_values_hash", test_limited_values_hash},
    {"uuid_text", test_uuid_text},
    {"generic_ref_to_string", test_generic_ref_to_string},
    {"system_ref_to_string", test_system_ref_to_string},
    {"system_ref_current_is_not_text", test_system_ref_current_is_not_text},
    {"member_parse", test_member_parse},
    {"member_parse_rejects_long_avatar", test_member_parse_rejects_long_avatar},
    {"member_parse_rejects_bad_uuid", test_member_parse_rejects_bad_uuid},
    {"member_roundtrip", test_member_roundtrip},
    {"member_patch_emits_touched_fields", test_member_patch_emits_touched_fields},
    {"member_patch_clears_with_null", test_member_patch_clears_with_null},
    {"member_patch_parse", test_member_patch_parse},
    {"error_messages", test_error_messages},
    {"parse_result_message", test_parse_result_message},
    {"serialize_result_message", test_serialize_result_message},
};

} // namespace

int main() {
    int failed = 0;
    for(const TestCase & t : kTests) {
        if(t.run()) {
            std::cout << "[ OK ] " << t.name << "\n";
        } else {
            std::cout << "[FAIL] " << t.name << "\n";
            failed ++;
        }
    }
    std::cout << (sizeof(kTests) / sizeof(kTests[0]) - failed) << " passed, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}
