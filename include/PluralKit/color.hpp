#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "static_schema.hpp"

namespace PluralKit {

struct Rgb8 {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend constexpr bool operator==(const Rgb8&, const Rgb8&) = default;
};

namespace color_details {

constexpr char hexDigits[] = "0123456789abcdef";

constexpr int hexValue(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace color_details

// "ff0000"
constexpr std::string to_hex(Rgb8 c) {
    std::string out(6, '0');
    const std::uint8_t bytes[3] = {c.r, c.g, c.b};
    for(int i = 0; i < 3; i ++) {
        out[i * 2]     = color_details::hexDigits[bytes[i] >> 4];
        out[i * 2 + 1] = color_details::hexDigits[bytes[i] & 0xF];
    }
    return out;
}

// Exactly six hex digits, either case, no leading '#'.
constexpr std::optional<Rgb8> parse_hex(std::string_view s) {
    if(s.size() != 6) {
        return std::nullopt;
    }
    std::uint8_t bytes[3] = {};
    for(int i = 0; i < 3; i ++) {
        const int hi = color_details::hexValue(s[i * 2]);
        const int lo = color_details::hexValue(s[i * 2 + 1]);
        if(hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return Rgb8{bytes[0], bytes[1], bytes[2]};
}

template<>
struct WireCodec<Rgb8> {
    using wire_type = std::string;

    static constexpr bool to_wire(const Rgb8 & c, std::string & out) {
        out = to_hex(c);
        return true;
    }
    static constexpr std::optional<Rgb8> from_wire(const std::string & s) {
        return parse_hex(s);
    }
};

} // namespace PluralKit
