#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "errors.hpp"
#include "json.hpp"
#include "json_path.hpp"
#include "limited.hpp"
#include "parse_result.hpp"
#include "serializer.hpp"
#include "url.hpp"

namespace PluralKit {

namespace error_formatting_detail {

constexpr std::string_view ws = " \t\n\r\f\v";

inline std::string_view trim(std::string_view s) {
    const std::size_t first = s.find_first_not_of(ws);
    if(first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace error_formatting_detail

// "$.proxy_tags[1].prefix"
inline std::string JsonPathToString(const json_path::JsonPath & jp) {
    std::string out = "$";
    for(const json_path::PathElement & el : jp.storage) {
        if(el.is_index()) {
            out += fmt::format("[{}]", el.array_index);
        } else {
            out += fmt::format(".{}", el.field_name);
        }
    }
    return out;
}

inline std::string LimitErrorToString(const LimitError & e) {
    return fmt::format("\"{}\" should not exceed length {}", e.value, e.limit);
}

inline std::string LimitedUrlErrorToString(const LimitedUrlError & e) {
    if(const LimitError * le = std::get_if<LimitError>(&e)) {
        return fmt::format("Url \"{}\" should not exceed length {}", le->value, le->limit);
    }
    return fmt::format("invalid url: {}", error_to_string(std::get<UrlError>(e)));
}

template <class InpIter, class ReaderError>
std::string ParseResultToString(const ParseResult<InpIter, ReaderError> & res, std::string_view input, std::size_t window = 40) {
    if(res) {
        return "no error";
    }
    const std::string jsonPath = JsonPathToString(res.errorPath());

    std::string reason(error_to_string(res.error()));
    if(res.error() == ParseError::READER_ERROR) {
        reason = fmt::format("{} ({})", reason, error_to_string(res.readerError()));
    }

    std::string fragment;
    if constexpr(std::is_convertible_v<InpIter, const char*>) {
        const char * pos = res.pos();
        if(pos >= input.data() && pos <= input.data() + input.size()) {
            const std::size_t offset = static_cast<std::size_t>(pos - input.data());
            const std::size_t from = offset > window ? offset - window : 0;
            const std::string_view before = error_formatting_detail::trim(input.substr(from, offset - from));
            const std::string_view after = error_formatting_detail::trim(input.substr(offset, window));
            fragment = fmt::format(": '...{} <-- here --> {}...'", before, after);
        }
    }
    return fmt::format("When parsing {}, parsing error '{}'{}", jsonPath, reason, fragment);
}

template <class OutIter, class WriterError>
std::string SerializeResultToString(const SerializeResult<OutIter, WriterError> & res) {
    if(res) {
        return "no error";
    }
    return fmt::format("Serialization error '{}'", error_to_string(res.error()));
}

} // namespace PluralKit
