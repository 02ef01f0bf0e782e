#include "../test_helpers.hpp"
#include <PluralKit/timestamp.hpp>
#include <chrono>
#include <optional>

using namespace PluralKit;
using namespace TestHelpers;
using namespace std::chrono;

constexpr Timestamp at(year_month_day d, hours h = hours{0}, minutes m = minutes{0},
                       seconds s = seconds{0}, microseconds us = microseconds{0}) {
    return Timestamp(sys_days(d)) + h + m + s + us;
}

// ============================================================================
// Rendering
// ============================================================================

static_assert(format_timestamp(at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}))
              == std::optional<std::string>("2023-04-01T12:30:05Z"));
static_assert(format_timestamp(at(year{1970} / 1 / 1)) == std::optional<std::string>("1970-01-01T00:00:00Z"));
static_assert(format_timestamp(at(year{2022} / 12 / 31, hours{23}, minutes{59}, seconds{59}, microseconds{120}))
              == std::optional<std::string>("2022-12-31T23:59:59.000120Z"), "microseconds are written only when present");
static_assert(format_timestamp(at(year{1969} / 7 / 20, hours{20}, minutes{17}))
              == std::optional<std::string>("1969-07-20T20:17:00Z"), "before the epoch");
static_assert(!format_timestamp(at(year{10000} / 1 / 1)), "five digit years have no text form");

// ============================================================================
// Parsing
// ============================================================================

static_assert(parse_timestamp("2023-04-01T12:30:05Z") == at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}));
static_assert(parse_timestamp("2023-04-01t12:30:05z") == at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}));
static_assert(parse_timestamp("2023-04-01T12:30:05.5Z")
              == at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}, microseconds{500000}));
static_assert(parse_timestamp("2023-04-01T12:30:05.123456789Z")
              == at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}, microseconds{123456}),
              "nanoseconds are truncated");
static_assert(parse_timestamp("2023-04-01T14:30:05+02:00") == at(year{2023} / 4 / 1, hours{12}, minutes{30}, seconds{5}));
static_assert(parse_timestamp("2023-04-01T00:00:00-05:30") == at(year{2023} / 4 / 1, hours{5}, minutes{30}));
static_assert(parse_timestamp("2000-02-29") == at(year{2000} / 2 / 29), "bare dates are midnight UTC");
static_assert(parse_timestamp("2016-12-31T23:59:60Z") == at(year{2016} / 12 / 31, hours{23}, minutes{59}, seconds{59}),
              "a leap second folds into the last second of its minute");
static_assert(!parse_timestamp("2016-12-31T23:59:61Z"));

static_assert(!parse_timestamp(""));
static_assert(!parse_timestamp("2023-02-29"), "not a leap year");
static_assert(!parse_timestamp("2023-13-01"));
static_assert(!parse_timestamp("2023-04-01T24:00:00Z"));
static_assert(!parse_timestamp("2023-04-01T12:30:05"), "date-times need an offset");
static_assert(!parse_timestamp("2023-04-01T12:30:05.Z"));
static_assert(!parse_timestamp("2023-04-01T12:30:05.1234567890Z"));
static_assert(!parse_timestamp("2023-04-01T12:30:05+0200"));
static_assert(!parse_timestamp("2023-04-01T12:30:05Z "));
static_assert(!parse_timestamp("23-04-01"));

// ============================================================================
// JSON
// ============================================================================

constexpr bool test_timestamp_json() {
    const Timestamp t = at(year{2021} / 6 / 15, hours{8}, minutes{0}, seconds{0}, microseconds{1});
    return TestSerialize(t, R"("2021-06-15T08:00:00.000001Z")")
        && TestParseEquals<Timestamp>(R"("2021-06-15T08:00:00.000001Z")", t)
        && TestRoundTripSemantic(t);
}
static_assert(test_timestamp_json());

constexpr bool test_timestamp_json_out_of_range() {
    return SerializeFailsWith(at(year{12000} / 1 / 1), SerializeError::TRANSFORMER_ERROR)
        && ParseFailsWith<Timestamp>(R"("yesterday")", ParseError::TRANSFORMER_ERROR);
}
static_assert(test_timestamp_json_out_of_range());
