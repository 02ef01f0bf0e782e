#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "uuid.hpp"

namespace PluralKit {

enum class ShortIdError {
    InvalidCharacters,
    IncorrectLength
};

constexpr std::string_view error_to_string(ShortIdError e) {
    switch(e) {
    case ShortIdError::InvalidCharacters: return "A ShortId should only contain alphabetical characters (a-z)";
    case ShortIdError::IncorrectLength: return "A ShortId should only be 5 characters in length";
    }
    return "N/A";
}

/// Five a-z characters, e.g. "ptckn". Used for systems, members and groups.
///
/// The service may reassign short ids on request, so they identify a resource
/// for display and lookup only. Store the Uuid instead.
class ShortId {
public:
    static constexpr std::size_t Length = 5;

private:
    std::array<char, Length> m_chars{};

    constexpr ShortId() = default;

public:
    using wire_type = std::string;

    // Length is checked before characters: "TOOLONG" is IncorrectLength.
    static constexpr std::expected<ShortId, ShortIdError> parse(std::string_view s) {
        if(s.size() != Length) {
            return std::unexpected(ShortIdError::IncorrectLength);
        }
        ShortId id;
        for(std::size_t i = 0; i < Length; i ++) {
            if(s[i] < 'a' || s[i] > 'z') {
                return std::unexpected(ShortIdError::InvalidCharacters);
            }
            id.m_chars[i] = s[i];
        }
        return id;
    }

    constexpr std::string_view view() const noexcept {
        return std::string_view(m_chars.data(), Length);
    }
    constexpr std::string to_string() const {
        return std::string(view());
    }

    constexpr bool transform_to(std::string & out) const {
        out = to_string();
        return true;
    }
    static constexpr std::expected<ShortId, ShortIdError> transform_from(const std::string & s) {
        return parse(s);
    }

    friend constexpr bool operator==(const ShortId&, const ShortId&) = default;
};


// Member or group, addressed by short id or uuid.
class GenericRef {
    std::variant<ShortId, Uuid> m_ref;

public:
    constexpr GenericRef(ShortId id): m_ref(id) {}
    explicit GenericRef(const Uuid & u): m_ref(u) {}

    // Text always means a short id; uuids are parsed with parse_uuid.
    static constexpr std::expected<GenericRef, ShortIdError> parse(std::string_view s) {
        std::expected<ShortId, ShortIdError> id = ShortId::parse(s);
        if(!id) {
            return std::unexpected(id.error());
        }
        return GenericRef(*id);
    }

    constexpr const std::variant<ShortId, Uuid> & get() const noexcept { return m_ref; }

    std::string to_string() const {
        if(const ShortId * id = std::get_if<ShortId>(&m_ref)) {
            return id->to_string();
        }
        return uuid_to_string(std::get<Uuid>(m_ref));
    }

    friend bool operator==(const GenericRef&, const GenericRef&) = default;
};


// System, addressed by short id, uuid, Discord account id, or as the
// authenticated caller ("@me").
class SystemRef {
public:
    struct Current {
        friend constexpr bool operator==(const Current&, const Current&) = default;
    };
    static constexpr std::string_view CurrentToken = "@me";

private:
    std::variant<ShortId, Uuid, std::uint64_t, Current> m_ref;

    constexpr SystemRef(Current c): m_ref(c) {}

public:
    constexpr SystemRef(ShortId id): m_ref(id) {}
    explicit SystemRef(const Uuid & u): m_ref(u) {}
    constexpr explicit SystemRef(std::uint64_t discordAccountId): m_ref(discordAccountId) {}

    // No text parses to this; it is built only by the caller.
    static constexpr SystemRef current() {
        return SystemRef(Current{});
    }

    static constexpr std::expected<SystemRef, ShortIdError> parse(std::string_view s) {
        std::expected<ShortId, ShortIdError> id = ShortId::parse(s);
        if(!id) {
            return std::unexpected(id.error());
        }
        return SystemRef(*id);
    }

    constexpr bool is_current() const noexcept {
        return std::holds_alternative<Current>(m_ref);
    }
    constexpr const std::variant<ShortId, Uuid, std::uint64_t, Current> & get() const noexcept { return m_ref; }

    std::string to_string() const {
        return std::visit([]<class R>(const R & r) -> std::string {
            if constexpr (std::is_same_v<R, ShortId>) {
                return r.to_string();
            } else if constexpr (std::is_same_v<R, Uuid>) {
                return uuid_to_string(r);
            } else if constexpr (std::is_same_v<R, std::uint64_t>) {
                return std::to_string(r);
            } else {
                static_assert(std::is_same_v<R, Current>, "every SystemRef alternative needs a text form");
                return std::string(CurrentToken);
            }
        }, m_ref);
    }

    friend bool operator==(const SystemRef&, const SystemRef&) = default;
};

} // namespace PluralKit
