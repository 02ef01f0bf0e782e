// Building a member patch and reading a member back
// Compile: g++ -std=c++23 -I../include member_patch.cpp -lcurl -lfmt -o member_patch

#include <PluralKit/error_formatting.hpp>
#include <PluralKit/models/member.hpp>
#include <PluralKit/parser.hpp>
#include <PluralKit/references.hpp>
#include <PluralKit/serializer.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace PluralKit;
using namespace PluralKit::models;

int main() {
    // Rename, recolour, drop the avatar, hide everything
    MemberPatch patch;

    auto name = LimitedStr<100>::make("Ada");
    if (!name) {
        std::cerr << LimitErrorToString(name.error()) << std::endl;
        return 1;
    }
    patch.name = *name;
    patch.color = std::optional<Rgb8>(Rgb8{0x7f, 0x3f, 0xbf});
    patch.avatar = std::nullopt;
    patch.privacy = MemberPrivacyPatch::PRIVATE;

    auto tag = ProxyTag::make("ada:", std::nullopt);
    if (!tag) {
        std::cerr << error_to_string(tag.error()) << std::endl;
        return 1;
    }
    patch.proxy_tags.push_back(*tag);

    std::string body;
    auto written = Serialize(patch, body);
    if (!written) {
        std::cerr << SerializeResultToString(written) << std::endl;
        return 1;
    }
    auto target = GenericRef::parse("abcde");
    if (!target) {
        std::cerr << error_to_string(target.error()) << std::endl;
        return 1;
    }
    std::cout << "PATCH /v2/members/" << target->to_string() << std::endl;
    std::cout << body << std::endl;

    // A response as the service sends it
    constexpr std::string_view response = R"({
        "id": "abcde",
        "uuid": "5cfa8d7a-3c8f-4d2c-9a0e-0123456789ab",
        "system": "exmpl",
        "name": "Ada",
        "color": "7f3fbf",
        "avatar_url": null,
        "proxy_tags": [{"prefix": "ada:", "suffix": null}],
        "keep_proxy": false,
        "text_to_speech": false,
        "created": "2024-03-01T10:15:00Z"
    })";

    auto member = Parse<Member>(response);
    if (!member) {
        std::cerr << ParseResultToString(member, response) << std::endl;
        return 1;
    }
    std::cout << "Member " << member->name.str() << " (" << member->ref().to_string() << ")"
              << " of system " << member->system_id.view() << std::endl;
    std::cout << "Own system: GET /v2/systems/" << SystemRef::current().to_string() << std::endl;
    if (member->color) {
        std::cout << "Color: #" << to_hex(*member->color) << std::endl;
    }
    if (member->created) {
        std::cout << "Created: " << format_timestamp(*member->created).value_or("?") << std::endl;
    }

    // Oversized proxy tags are refused before anything is sent
    auto tooLong = ProxyTag::make(std::string(60, '['), std::string(41, ']'));
    if (!tooLong) {
        std::cout << "Rejected: " << error_to_string(tooLong.error()) << std::endl;
    }
    return 0;
}
