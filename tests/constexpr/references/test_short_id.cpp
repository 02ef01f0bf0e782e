#include "../test_helpers.hpp"
#include <PluralKit/references.hpp>
#include <string_view>

using namespace PluralKit;
using namespace TestHelpers;

constexpr bool test_short_id_valid() {
    auto id = ShortId::parse("ptckn");
    return id.has_value() && id->view() == "ptckn" && id->to_string() == "ptckn";
}
static_assert(test_short_id_valid(), "canonical text equals the input");

constexpr bool test_short_id_uppercase() {
    auto id = ShortId::parse("Ptckn");
    return !id && id.error() == ShortIdError::InvalidCharacters;
}
static_assert(test_short_id_uppercase());

constexpr bool test_short_id_digits_and_symbols() {
    for (std::string_view s : {"ptck1", "ptc-n", "ptc n", "\xC3\xA9xyz"}) {
        auto id = ShortId::parse(s);
        if (id || id.error() != ShortIdError::InvalidCharacters) return false;
    }
    return true;
}
static_assert(test_short_id_digits_and_symbols());

constexpr bool test_short_id_length() {
    for (std::string_view s : {"", "ptck", "ptckna", "abcdefghij"}) {
        auto id = ShortId::parse(s);
        if (id || id.error() != ShortIdError::IncorrectLength) return false;
    }
    return true;
}
static_assert(test_short_id_length());

// Both checks fail: length wins
constexpr bool test_short_id_length_checked_first() {
    auto id = ShortId::parse("12345678");
    return !id && id.error() == ShortIdError::IncorrectLength;
}
static_assert(test_short_id_length_checked_first());

constexpr bool test_short_id_boundary_letters() {
    return ShortId::parse("azazz").has_value()
        && !ShortId::parse("`azaz").has_value()
        && !ShortId::parse("azaz{").has_value();
}
static_assert(test_short_id_boundary_letters());

constexpr bool test_short_id_equality() {
    return *ShortId::parse("abcde") == *ShortId::parse("abcde")
        && *ShortId::parse("abcde") != *ShortId::parse("abcdf");
}
static_assert(test_short_id_equality());

// ============================================================================
// References built from text
// ============================================================================

constexpr bool test_generic_ref_parse() {
    auto r = GenericRef::parse("ptckn");
    return r.has_value() && std::holds_alternative<ShortId>(r->get());
}
static_assert(test_generic_ref_parse());

constexpr bool test_generic_ref_parse_propagates_error() {
    auto r = GenericRef::parse("PTCKN");
    return !r && r.error() == ShortIdError::InvalidCharacters;
}
static_assert(test_generic_ref_parse_propagates_error());

constexpr bool test_system_ref_parse() {
    auto r = SystemRef::parse("rwqjp");
    return r.has_value() && !r->is_current();
}
static_assert(test_system_ref_parse());

// "@me" is not a short id; Current is only built directly
constexpr bool test_system_ref_current_does_not_parse() {
    auto r = SystemRef::parse("@me");
    return !r && r.error() == ShortIdError::IncorrectLength
        && SystemRef::current().is_current();
}
static_assert(test_system_ref_current_does_not_parse());

// ============================================================================
// JSON
// ============================================================================

constexpr bool test_short_id_json() {
    auto id = ShortId::parse("ptckn");
    return id
        && TestParseEquals<ShortId>(R"("ptckn")", *id)
        && TestSerialize(*id, R"("ptckn")");
}
static_assert(test_short_id_json());

constexpr bool test_short_id_json_invalid() {
    return ParseFailsWith<ShortId>(R"("PTCKN")", ParseError::TRANSFORMER_ERROR)
        && ParseFailsWith<ShortId>(R"("abc")", ParseError::TRANSFORMER_ERROR)
        && ParseFailsWith<ShortId>("null", ParseError::NULL_IN_NON_OPTIONAL);
}
static_assert(test_short_id_json_invalid());
