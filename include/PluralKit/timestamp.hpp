#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "static_schema.hpp"

namespace PluralKit {

using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

namespace timestamp_details {

constexpr void appendDigits(std::string & out, long long v, int width) {
    char buf[20] = {};
    for(int i = width - 1; i >= 0; i --) {
        buf[i] = static_cast<char>('0' + v % 10);
        v /= 10;
    }
    out.append(buf, static_cast<std::size_t>(width));
}

constexpr bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Fixed-width decimal field at s[pos]; advances pos.
constexpr bool readDigits(std::string_view s, std::size_t & pos, int width, int & out) {
    if(pos + static_cast<std::size_t>(width) > s.size()) {
        return false;
    }
    int v = 0;
    for(int i = 0; i < width; i ++) {
        const char c = s[pos + static_cast<std::size_t>(i)];
        if(!isDigit(c)) {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += static_cast<std::size_t>(width);
    out = v;
    return true;
}

constexpr bool expect(std::string_view s, std::size_t & pos, char c) {
    if(pos >= s.size() || s[pos] != c) {
        return false;
    }
    pos ++;
    return true;
}

} // namespace timestamp_details

// "2023-04-01T12:30:05Z", with ".ffffff" when there are sub-second digits.
// Years outside 0000-9999 have no such form.
constexpr std::optional<std::string> format_timestamp(Timestamp t) {
    using namespace std::chrono;
    const sys_days midnight = floor<days>(t);
    const year_month_day ymd(midnight);
    const int y = static_cast<int>(ymd.year());
    if(y < 0 || y > 9999) {
        return std::nullopt;
    }
    const hh_mm_ss<microseconds> hms(t - midnight);

    std::string out;
    timestamp_details::appendDigits(out, y, 4);
    out.push_back('-');
    timestamp_details::appendDigits(out, static_cast<unsigned>(ymd.month()), 2);
    out.push_back('-');
    timestamp_details::appendDigits(out, static_cast<unsigned>(ymd.day()), 2);
    out.push_back('T');
    timestamp_details::appendDigits(out, hms.hours().count(), 2);
    out.push_back(':');
    timestamp_details::appendDigits(out, hms.minutes().count(), 2);
    out.push_back(':');
    timestamp_details::appendDigits(out, hms.seconds().count(), 2);
    if(hms.subseconds().count() != 0) {
        out.push_back('.');
        timestamp_details::appendDigits(out, hms.subseconds().count(), 6);
    }
    out.push_back('Z');
    return out;
}

// RFC 3339 date-time with 'Z' or a +HH:MM/-HH:MM offset, up to nine fraction
// digits (truncated to microseconds), or a bare "YYYY-MM-DD" read as midnight UTC.
// A leap second (":60") is read as ":59".
constexpr std::optional<Timestamp> parse_timestamp(std::string_view s) {
    using namespace std::chrono;
    using timestamp_details::readDigits;
    using timestamp_details::expect;

    std::size_t pos = 0;
    int y = 0, mo = 0, d = 0;
    if(!readDigits(s, pos, 4, y) || !expect(s, pos, '-')
        || !readDigits(s, pos, 2, mo) || !expect(s, pos, '-')
        || !readDigits(s, pos, 2, d)) {
        return std::nullopt;
    }
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if(!ymd.ok()) {
        return std::nullopt;
    }
    if(pos == s.size()) {
        return Timestamp(sys_days(ymd));
    }

    if(s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') {
        return std::nullopt;
    }
    pos ++;
    int hh = 0, mm = 0, ss = 0;
    if(!readDigits(s, pos, 2, hh) || !expect(s, pos, ':')
        || !readDigits(s, pos, 2, mm) || !expect(s, pos, ':')
        || !readDigits(s, pos, 2, ss)) {
        return std::nullopt;
    }
    if(hh > 23 || mm > 59 || ss > 60) {
        return std::nullopt;
    }
    if(ss == 60) {
        ss = 59;
    }

    long long micros = 0;
    if(pos < s.size() && s[pos] == '.') {
        pos ++;
        int fracDigits = 0;
        while(pos < s.size() && timestamp_details::isDigit(s[pos])) {
            if(fracDigits < 6) {
                micros = micros * 10 + (s[pos] - '0');
            }
            fracDigits ++;
            pos ++;
        }
        if(fracDigits == 0 || fracDigits > 9) {
            return std::nullopt;
        }
        for(int i = fracDigits; i < 6; i ++) {
            micros *= 10;
        }
    }

    minutes offset{0};
    if(pos >= s.size()) {
        return std::nullopt;
    }
    if(s[pos] == 'Z' || s[pos] == 'z') {
        pos ++;
    } else if(s[pos] == '+' || s[pos] == '-') {
        const bool negative = s[pos] == '-';
        pos ++;
        int oh = 0, om = 0;
        if(!readDigits(s, pos, 2, oh) || !expect(s, pos, ':') || !readDigits(s, pos, 2, om)) {
            return std::nullopt;
        }
        if(oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset = hours{oh} + minutes{om};
        if(negative) {
            offset = -offset;
        }
    } else {
        return std::nullopt;
    }
    if(pos != s.size()) {
        return std::nullopt;
    }

    return Timestamp(sys_days(ymd)) + hours{hh} + minutes{mm} + seconds{ss} + microseconds{micros} - offset;
}

template<>
struct WireCodec<Timestamp> {
    using wire_type = std::string;

    static constexpr bool to_wire(const Timestamp & t, std::string & out) {
        std::optional<std::string> text = format_timestamp(t);
        if(!text) {
            return false;
        }
        out = std::move(*text);
        return true;
    }
    static constexpr std::optional<Timestamp> from_wire(const std::string & s) {
        return parse_timestamp(s);
    }
};

} // namespace PluralKit
