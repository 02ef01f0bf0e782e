#include "../test_helpers.hpp"
#include <PluralKit/patchable.hpp>
#include <PluralKit/color.hpp>
#include <PluralKit/timestamp.hpp>
#include <PluralKit/limited.hpp>
#include <PluralKit/options.hpp>
#include <PluralKit/struct_introspection.hpp>
#include <optional>
#include <string>

using namespace PluralKit;
using namespace TestHelpers;

// ============================================================================
// States
// ============================================================================

constexpr bool test_patchable_default_is_unmodified() {
    Patchable<int> p;
    return p.is_unmodified() && !p.is_patched() && p.get_if() == nullptr;
}
static_assert(test_patchable_default_is_unmodified());

constexpr bool test_patchable_patched() {
    Patchable<int> p = 7;
    return p.is_patched() && *p.get_if() == 7 && p.value() == 7;
}
static_assert(test_patchable_patched());

// Patched(nullopt) is a real patch, not "untouched"
constexpr bool test_patchable_patched_to_empty() {
    Patchable<std::optional<int>> p = std::nullopt;
    return p.is_patched() && !p.value().has_value();
}
static_assert(test_patchable_patched_to_empty());

constexpr bool test_patchable_reset() {
    Patchable<int> p = 7;
    p.reset();
    return p.is_unmodified() && p == Patchable<int>(unmodified);
}
static_assert(test_patchable_reset());

constexpr bool test_patchable_equality() {
    return Patchable<int>(1) == Patchable<int>(1)
        && Patchable<int>(1) != Patchable<int>(2)
        && Patchable<int>() != Patchable<int>(0);
}
static_assert(test_patchable_equality());

// ============================================================================
// Emit-if-touched serialization
// ============================================================================

namespace {

struct ColorPatch {
    Patchable<std::optional<Rgb8>> color;
    Patchable<std::optional<Timestamp>> birthday;
    Patchable<LimitedStr<20>> name;
    int revision;
};

} // namespace

template<> struct PluralKit::StructMeta<ColorPatch> {
    using Fields = StructFields<
        Field<&ColorPatch::color, "color">,
        Field<&ColorPatch::birthday, "birthday">,
        Field<&ColorPatch::name, "name", options::key<"display">>,
        Field<&ColorPatch::revision, "revision", options::not_json>
    >;
};

constexpr bool test_untouched_fields_are_absent() {
    ColorPatch p{};
    return TestSerialize(p, "{}");
}
static_assert(test_untouched_fields_are_absent(), "nothing touched, nothing written");

constexpr bool test_color_touched_is_hex() {
    ColorPatch p{};
    p.color = std::optional<Rgb8>(Rgb8{255, 0, 0});
    return TestSerialize(p, R"({"color":"ff0000"})");
}
static_assert(test_color_touched_is_hex());

constexpr bool test_touched_empty_is_null() {
    ColorPatch p{};
    p.color = std::nullopt;
    p.birthday = std::nullopt;
    return TestSerialize(p, R"({"color":null,"birthday":null})");
}
static_assert(test_touched_empty_is_null(), "Patched(nullopt) clears the field on the server");

constexpr bool test_timestamp_touched() {
    using namespace std::chrono;
    ColorPatch p{};
    p.birthday = std::optional<Timestamp>(Timestamp(sys_days(year{2020} / 2 / 29)));
    return TestSerialize(p, R"({"birthday":"2020-02-29T00:00:00Z"})");
}
static_assert(test_timestamp_touched());

constexpr bool test_touched_uses_key_and_skips_not_json() {
    ColorPatch p{};
    p.name = *LimitedStr<20>::make("Ada");
    p.revision = 3;
    return TestSerialize(p, R"({"display":"Ada"})");
}
static_assert(test_touched_uses_key_and_skips_not_json());

// Serializing an untouched Patchable by itself bypasses field suppression
constexpr bool test_direct_unmodified_is_contract_violation() {
    Patchable<std::optional<Rgb8>> color;
    return SerializeFailsWith(color, SerializeError::UNMODIFIED_PATCHABLE);
}
static_assert(test_direct_unmodified_is_contract_violation());

constexpr bool test_direct_patched_serializes_value() {
    Patchable<std::optional<Rgb8>> color = std::optional<Rgb8>(Rgb8{0, 128, 255});
    Patchable<std::optional<Rgb8>> cleared = std::nullopt;
    return TestSerialize(color, R"("0080ff")")
        && TestSerialize(cleared, "null");
}
static_assert(test_direct_patched_serializes_value());

// ============================================================================
// Decoding patches
// ============================================================================

constexpr bool test_parse_absent_is_unmodified() {
    return TestParse<ColorPatch>(R"({"color": null})", [](const ColorPatch& p) {
        return p.color.is_patched() && !p.color.value().has_value()
            && p.birthday.is_unmodified()
            && p.name.is_unmodified()
            && p.revision == 0;
    });
}
static_assert(test_parse_absent_is_unmodified(), "absent means Unmodified, null means cleared");

constexpr bool test_parse_patched_values() {
    return TestParse<ColorPatch>(R"({"color": "00FF00", "display": "Bo"})", [](const ColorPatch& p) {
        return p.color.value() == std::optional<Rgb8>(Rgb8{0, 255, 0})
            && p.name.value().str() == "Bo";
    });
}
static_assert(test_parse_patched_values());

constexpr bool test_parse_null_for_required_patch() {
    return ParseFailsWith<ColorPatch>(R"({"display": null})", ParseError::NULL_IN_NON_OPTIONAL);
}
static_assert(test_parse_null_for_required_patch());
