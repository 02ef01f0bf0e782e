#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace PluralKit {

// Failure of the URL grammar parser, carrying libcurl's code.
struct UrlError {
    CURLUcode code = CURLUE_OK;

    friend bool operator==(const UrlError&, const UrlError&) = default;
};

inline std::string_view error_to_string(UrlError e) {
    const char * s = curl_url_strerror(e.code);
    return s ? std::string_view(s) : std::string_view("unknown URL error");
}

namespace url_details {

struct CurlUrlDeleter {
    void operator()(CURLU * h) const noexcept {
        curl_url_cleanup(h);
    }
};

struct CurlStringDeleter {
    void operator()(char * s) const noexcept {
        curl_free(s);
    }
};

using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

// Missing parts (no host, no query) read as empty.
inline CURLUcode get_part(CURLU * h, CURLUPart part, std::string & out) {
    char * raw = nullptr;
    CURLUcode rc = curl_url_get(h, part, &raw, 0);
    CurlString owned(raw);
    if(rc != CURLUE_OK) {
        out.clear();
        return rc;
    }
    out = owned ? std::string(owned.get()) : std::string();
    return CURLUE_OK;
}

} // namespace url_details

// Absolute URL, validated and normalised by libcurl. Any scheme is accepted,
// but only in hierarchical form ("scheme://..."): "mailto:" and "data:" URLs
// fail with CURLUE_BAD_SLASHES.
class Url {
    std::string m_text;
    std::string m_scheme;
    std::string m_host;

    Url() = default;

public:
    static std::expected<Url, UrlError> parse(std::string_view text) {
        url_details::CurlUrlHandle h(curl_url());
        if(!h) {
            return std::unexpected(UrlError{CURLUE_OUT_OF_MEMORY});
        }
        const std::string input(text);
        if(CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, input.c_str(), CURLU_NON_SUPPORT_SCHEME);
            rc != CURLUE_OK) {
            return std::unexpected(UrlError{rc});
        }

        Url u;
        if(CURLUcode rc = url_details::get_part(h.get(), CURLUPART_URL, u.m_text); rc != CURLUE_OK) {
            return std::unexpected(UrlError{rc});
        }
        if(CURLUcode rc = url_details::get_part(h.get(), CURLUPART_SCHEME, u.m_scheme); rc != CURLUE_OK) {
            return std::unexpected(UrlError{rc});
        }
        if(CURLUcode rc = url_details::get_part(h.get(), CURLUPART_HOST, u.m_host);
            rc != CURLUE_OK && rc != CURLUE_NO_HOST) {
            return std::unexpected(UrlError{rc});
        }
        return u;
    }

    const std::string & str() const noexcept { return m_text; }
    std::string_view scheme() const noexcept { return m_scheme; }
    std::string_view host() const noexcept { return m_host; }

    friend bool operator==(const Url & a, const Url & b) {
        return a.m_text == b.m_text;
    }
};

} // namespace PluralKit
