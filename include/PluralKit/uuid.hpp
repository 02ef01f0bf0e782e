#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

#include "static_schema.hpp"

namespace PluralKit {

// Storage-stable identity of systems, members and groups.
using Uuid = boost::uuids::uuid;

inline std::optional<Uuid> parse_uuid(std::string_view text) {
    boost::uuids::string_generator gen;
    try {
        return gen(text.begin(), text.end());
    } catch(const std::runtime_error &) {
        // string_generator reports malformed input only by throwing
        return std::nullopt;
    }
}

inline std::string uuid_to_string(const Uuid & u) {
    return boost::uuids::to_string(u);
}

template<>
struct WireCodec<Uuid> {
    using wire_type = std::string;

    static bool to_wire(const Uuid & u, std::string & out) {
        out = uuid_to_string(u);
        return true;
    }
    static std::optional<Uuid> from_wire(const std::string & s) {
        return parse_uuid(s);
    }
};

} // namespace PluralKit
