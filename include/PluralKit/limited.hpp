#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "url.hpp"

namespace PluralKit {

// Input longer than the bound of the type it was meant for.
struct LimitError {
    std::string value;
    std::size_t limit = 0;

    friend constexpr bool operator==(const LimitError&, const LimitError&) = default;
};

/// String of at most L bytes.
///
/// make() enforces the bound. unchecked() trusts the caller, for values that
/// were already validated, e.g. returned by the service itself; an oversized
/// value built that way is rejected by the service, not here.
template<std::size_t L>
class LimitedStr {
    std::string m_value;

    constexpr explicit LimitedStr(std::string v): m_value(std::move(v)) {}

public:
    static constexpr std::size_t limit = L;
    using wire_type = std::string;

    static constexpr std::expected<LimitedStr, LimitError> make(std::string_view s) {
        if(s.size() > L) {
            return std::unexpected(LimitError{std::string(s), L});
        }
        return LimitedStr(std::string(s));
    }

    static constexpr LimitedStr unchecked(std::string s) {
        return LimitedStr(std::move(s));
    }

    constexpr const std::string & str() const noexcept { return m_value; }
    constexpr std::string_view view() const noexcept { return m_value; }
    constexpr std::size_t size() const noexcept { return m_value.size(); }

    constexpr operator std::string_view() const noexcept { return m_value; }
    constexpr const std::string & operator*() const noexcept { return m_value; }
    constexpr const std::string * operator->() const noexcept { return &m_value; }

    constexpr bool transform_to(std::string & out) const {
        out = m_value;
        return true;
    }
    static constexpr std::expected<LimitedStr, LimitError> transform_from(const std::string & s) {
        return make(s);
    }

    friend constexpr bool operator==(const LimitedStr&, const LimitedStr&) = default;
    friend constexpr auto operator<=>(const LimitedStr&, const LimitedStr&) = default;
};


// Length violation or URL grammar violation. The raw text is bounded first,
// then parsed, then the normalised text is bounded again.
using LimitedUrlError = std::variant<LimitError, UrlError>;

/// URL whose text is at most L bytes. Same trust rules as LimitedStr.
template<std::size_t L>
class LimitedUrl {
    Url m_url;

    explicit LimitedUrl(Url u): m_url(std::move(u)) {}

public:
    static constexpr std::size_t limit = L;
    using wire_type = std::string;

    static std::expected<LimitedUrl, LimitedUrlError> make(std::string_view s) {
        if(s.size() > L) {
            return std::unexpected(LimitedUrlError(LimitError{std::string(s), L}));
        }
        std::expected<Url, UrlError> u = Url::parse(s);
        if(!u) {
            return std::unexpected(LimitedUrlError(u.error()));
        }
        // Normalisation can lengthen the text ("https://a.b" gains a '/')
        if(u->str().size() > L) {
            return std::unexpected(LimitedUrlError(LimitError{u->str(), L}));
        }
        return LimitedUrl(std::move(*u));
    }

    static LimitedUrl unchecked(Url u) {
        return LimitedUrl(std::move(u));
    }

    const Url & url() const noexcept { return m_url; }
    const std::string & str() const noexcept { return m_url.str(); }

    const Url & operator*() const noexcept { return m_url; }
    const Url * operator->() const noexcept { return &m_url; }

    bool transform_to(std::string & out) const {
        out = m_url.str();
        return true;
    }
    static std::expected<LimitedUrl, LimitedUrlError> transform_from(const std::string & s) {
        return make(s);
    }

    friend bool operator==(const LimitedUrl&, const LimitedUrl&) = default;
};

} // namespace PluralKit

template<std::size_t L>
struct std::hash<PluralKit::LimitedStr<L>> {
    std::size_t operator()(const PluralKit::LimitedStr<L> & s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};

template<std::size_t L>
struct std::hash<PluralKit::LimitedUrl<L>> {
    std::size_t operator()(const PluralKit::LimitedUrl<L> & u) const noexcept {
        return std::hash<std::string_view>{}(u.str());
    }
};
