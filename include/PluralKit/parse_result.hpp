#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "errors.hpp"
#include "json_path.hpp"

namespace PluralKit {


template <class InpIter, class ReaderError>
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    ReaderError m_readerError{};
    InpIter m_pos;

    json_path::JsonPath currentPath;

public:
    using iterator_type = InpIter;
    using reader_error_type = ReaderError;

    constexpr ParseResult(ParseError err, ReaderError rerr, InpIter pos, json_path::JsonPath jsonP):
        m_error(err), m_readerError(rerr), m_pos(pos), currentPath(std::move(jsonP))
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    constexpr InpIter pos() const {
        return m_pos;
    }

    constexpr ParseError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
    constexpr const json_path::JsonPath & errorPath() const {
        return currentPath;
    }
};

// Result of Parse<T>(input): the status plus the value, present on success.
// Validated types have no empty state, so the value cannot be a preallocated
// out-parameter.
template <class T, class InpIter, class ReaderError>
class ParsedValue : public ParseResult<InpIter, ReaderError> {
    std::optional<T> m_value;

public:
    constexpr ParsedValue(ParseResult<InpIter, ReaderError> res, std::optional<T> value):
        ParseResult<InpIter, ReaderError>(std::move(res)), m_value(std::move(value))
    {}

    constexpr bool has_value() const {
        return m_value.has_value();
    }

    // Throws std::bad_optional_access when parsing failed.
    constexpr const T & value() const & {
        return m_value.value();
    }
    constexpr T && value() && {
        return std::move(m_value).value();
    }

    constexpr const T & operator*() const & {
        return *m_value;
    }
    constexpr const T * operator->() const {
        return std::addressof(*m_value);
    }
};

} // namespace PluralKit
