#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "reader_concept.hpp"
#include "writer_concept.hpp"

namespace PluralKit {

enum class JsonIteratorReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    ILLFORMED_ARRAY,
    SKIPPING_STACK_OVERFLOW,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
};

constexpr std::string_view error_to_string(JsonIteratorReaderError e) {
    switch(e) {
    case JsonIteratorReaderError::NO_ERROR: return "NO_ERROR";
    case JsonIteratorReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA";
    case JsonIteratorReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS";
    case JsonIteratorReaderError::ILLFORMED_NULL: return "ILLFORMED_NULL";
    case JsonIteratorReaderError::ILLFORMED_BOOL: return "ILLFORMED_BOOL";
    case JsonIteratorReaderError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT";
    case JsonIteratorReaderError::ILLFORMED_STRING: return "ILLFORMED_STRING";
    case JsonIteratorReaderError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER";
    case JsonIteratorReaderError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY";
    case JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW: return "SKIPPING_STACK_OVERFLOW";
    case JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE";
    }
    return "N/A";
}

template<class It, class Sent>
class JsonIteratorReader {
public:
    using iterator_type = It;
    using error_type = JsonIteratorReaderError;
    struct ArrayFrame {};
    struct MapFrame {};

    constexpr JsonIteratorReader(It first, Sent last)
        : m_error(JsonIteratorReaderError::NO_ERROR), current_(first), end_(last) {}

    constexpr It current() const { return current_; }
    constexpr JsonIteratorReaderError getError() const { return m_error; }

    constexpr reader::TryParseStatus start_value_and_try_read_null() {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(*current_ != 'n') {
            return reader::TryParseStatus::no_match;
        }
        ++current_;
        if(!match_literal("ull") || !atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NULL);
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    constexpr reader::TryParseStatus read_bool(bool & b) {
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        switch(*current_) {
        case 't':
            ++current_;
            if(match_literal("rue") && atPlainEnd()) {
                b = true;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        case 'f':
            ++current_;
            if(match_literal("alse") && atPlainEnd()) {
                b = false;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        default:
            return reader::TryParseStatus::no_match;
        }
    }

    // Integers only; a fraction or exponent is reported as no_match after the
    // token is consumed.
    template<class NumberT>
    constexpr reader::TryParseStatus read_number(NumberT & storage) {
        static_assert(std::is_integral_v<NumberT>, "[[[ PluralKit ]]] only integral storage is supported");
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(*current_ != '-' && !isDigit(*current_)) {
            return reader::TryParseStatus::no_match;
        }
        bool negative = false;
        if(*current_ == '-') {
            negative = true;
            ++current_;
            if(atEnd() || !isDigit(*current_)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return reader::TryParseStatus::error;
            }
        }

        using Unsigned = std::make_unsigned_t<NumberT>;
        constexpr Unsigned posLimit = static_cast<Unsigned>(std::numeric_limits<NumberT>::max());
        Unsigned negLimit = 0;
        if constexpr (std::is_signed_v<NumberT>) {
            negLimit = posLimit + 1u;
        }
        const Unsigned limit = negative ? negLimit : posLimit;

        Unsigned acc = 0;
        bool overflow = false;
        bool leadingZero = *current_ == '0';
        std::size_t digits = 0;
        while(!atEnd() && isDigit(*current_)) {
            const Unsigned d = static_cast<Unsigned>(*current_ - '0');
            if(acc > limit / 10u || (acc == limit / 10u && d > limit % 10u)) {
                overflow = true;
            } else {
                acc = acc * 10u + d;
            }
            ++digits;
            ++current_;
        }
        if(leadingZero && digits > 1) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return reader::TryParseStatus::error;
        }
        if(!atEnd() && (*current_ == '.' || *current_ == 'e' || *current_ == 'E')) {
            if(!skip_number_tail()) {
                return reader::TryParseStatus::error;
            }
            return reader::TryParseStatus::no_match;
        }
        if(!atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return reader::TryParseStatus::error;
        }
        if(overflow) {
            setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
            return reader::TryParseStatus::error;
        }
        if constexpr (std::is_signed_v<NumberT>) {
            if(negative) {
                storage = acc == negLimit ? std::numeric_limits<NumberT>::min()
                                          : static_cast<NumberT>(-static_cast<NumberT>(acc));
                return reader::TryParseStatus::ok;
            }
        }
        storage = static_cast<NumberT>(acc);
        return reader::TryParseStatus::ok;
    }

    constexpr reader::TryParseStatus read_string(std::string & out) {
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(*current_ != '"') {
            return reader::TryParseStatus::no_match;
        }
        out.clear();
        return read_string_body(&out) ? reader::TryParseStatus::ok : reader::TryParseStatus::error;
    }

    constexpr reader::IterationStatus read_array_begin(ArrayFrame &) {
        return read_container_begin('[', ']');
    }

    constexpr reader::IterationStatus read_map_begin(MapFrame &) {
        return read_container_begin('{', '}');
    }

    constexpr reader::IterationStatus advance_after_value(ArrayFrame &) {
        return advance_in_container(']', JsonIteratorReaderError::ILLFORMED_ARRAY);
    }

    constexpr reader::IterationStatus advance_after_value(MapFrame &) {
        return advance_in_container('}', JsonIteratorReaderError::ILLFORMED_OBJECT);
    }

    constexpr bool read_key(std::string & key) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(*current_ != '"') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        key.clear();
        return read_string_body(&key);
    }

    constexpr bool move_to_value(MapFrame &) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(*current_ != ':') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        ++current_;
        return true;
    }

    template<std::size_t MaxSkipNesting>
    constexpr bool skip_value() {
        return skip_value_internal(MaxSkipNesting);
    }

    constexpr bool finish() {
        skip_whitespace();
        if(!atEnd()) {
            setError(JsonIteratorReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

private:
    JsonIteratorReaderError m_error;
    It current_;
    Sent end_;

    constexpr void setError(JsonIteratorReaderError e) {
        if(m_error == JsonIteratorReaderError::NO_ERROR) {
            m_error = e;
        }
    }

    constexpr bool atEnd() const { return current_ == end_; }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }
    static constexpr bool isDigit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    // A literal or number must be followed by a structural character or whitespace.
    constexpr bool atPlainEnd() const {
        if(atEnd()) return true;
        const char c = *current_;
        return isSpace(c) || c == ',' || c == ']' || c == '}' || c == ':';
    }

    constexpr void skip_whitespace() {
        while(!atEnd() && isSpace(*current_)) {
            ++current_;
        }
    }

    constexpr bool match_literal(std::string_view lit) {
        for(char c : lit) {
            if(atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if(*current_ != c) {
                return false;
            }
            ++current_;
        }
        return true;
    }

    constexpr bool skip_number_tail() {
        if(*current_ == '.') {
            ++current_;
            if(atEnd() || !isDigit(*current_)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            while(!atEnd() && isDigit(*current_)) ++current_;
        }
        if(!atEnd() && (*current_ == 'e' || *current_ == 'E')) {
            ++current_;
            if(!atEnd() && (*current_ == '+' || *current_ == '-')) ++current_;
            if(atEnd() || !isDigit(*current_)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            while(!atEnd() && isDigit(*current_)) ++current_;
        }
        if(!atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    constexpr reader::IterationStatus read_container_begin(char open, char close) {
        reader::IterationStatus st;
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return st;
        }
        if(*current_ != open) {
            st.status = reader::TryParseStatus::no_match;
            return st;
        }
        ++current_;
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return st;
        }
        st.status = reader::TryParseStatus::ok;
        if(*current_ == close) {
            ++current_;
            st.has_value = false;
        } else {
            st.has_value = true;
        }
        return st;
    }

    constexpr reader::IterationStatus advance_in_container(char close, JsonIteratorReaderError err) {
        reader::IterationStatus st;
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return st;
        }
        if(*current_ == ',') {
            ++current_;
            skip_whitespace();
            if(!atEnd() && *current_ == close) {
                setError(err);
                return st;
            }
            st.status = reader::TryParseStatus::ok;
            st.has_value = true;
            return st;
        }
        if(*current_ == close) {
            ++current_;
            st.status = reader::TryParseStatus::ok;
            st.has_value = false;
            return st;
        }
        setError(err);
        return st;
    }

    static constexpr void append_utf8(std::string * out, std::uint32_t cp) {
        if(!out) return;
        if(cp < 0x80) {
            out->push_back(static_cast<char>(cp));
        } else if(cp < 0x800) {
            out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if(cp < 0x10000) {
            out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    constexpr bool read_hex4(std::uint32_t & cp) {
        cp = 0;
        for(int i = 0; i < 4; i ++) {
            if(atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = *current_;
            std::uint32_t v;
            if(c >= '0' && c <= '9') v = static_cast<std::uint32_t>(c - '0');
            else if(c >= 'a' && c <= 'f') v = static_cast<std::uint32_t>(c - 'a' + 10);
            else if(c >= 'A' && c <= 'F') v = static_cast<std::uint32_t>(c - 'A' + 10);
            else {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            cp = (cp << 4) | v;
            ++current_;
        }
        return true;
    }

    // Positioned on the opening quote. out may be null when skipping.
    constexpr bool read_string_body(std::string * out) {
        ++current_;
        while(true) {
            if(atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = *current_;
            if(c == '"') {
                ++current_;
                return true;
            }
            if(static_cast<unsigned char>(c) < 0x20) {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            if(c != '\\') {
                if(out) out->push_back(c);
                ++current_;
                continue;
            }
            ++current_;
            if(atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char e = *current_;
            ++current_;
            switch(e) {
            case '"':  append_utf8(out, '"');  break;
            case '\\': append_utf8(out, '\\'); break;
            case '/':  append_utf8(out, '/');  break;
            case 'b':  append_utf8(out, '\b'); break;
            case 'f':  append_utf8(out, '\f'); break;
            case 'n':  append_utf8(out, '\n'); break;
            case 'r':  append_utf8(out, '\r'); break;
            case 't':  append_utf8(out, '\t'); break;
            case 'u': {
                std::uint32_t cp = 0;
                if(!read_hex4(cp)) return false;
                if(cp >= 0xD800 && cp <= 0xDBFF) {
                    if(!match_literal("\\u")) {
                        setError(JsonIteratorReaderError::ILLFORMED_STRING);
                        return false;
                    }
                    std::uint32_t low = 0;
                    if(!read_hex4(low)) return false;
                    if(low < 0xDC00 || low > 0xDFFF) {
                        setError(JsonIteratorReaderError::ILLFORMED_STRING);
                        return false;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if(cp >= 0xDC00 && cp <= 0xDFFF) {
                    setError(JsonIteratorReaderError::ILLFORMED_STRING);
                    return false;
                }
                append_utf8(out, cp);
                break;
            }
            default:
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
        }
    }

    constexpr bool skip_value_internal(std::size_t depthLeft) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        switch(*current_) {
        case '"':
            return read_string_body(nullptr);
        case 'n':
            return start_value_and_try_read_null() == reader::TryParseStatus::ok;
        case 't':
        case 'f': {
            bool b = false;
            return read_bool(b) == reader::TryParseStatus::ok;
        }
        case '[':
        case '{': {
            if(depthLeft == 0) {
                setError(JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW);
                return false;
            }
            const bool isMap = *current_ == '{';
            reader::IterationStatus st = isMap ? read_container_begin('{', '}') : read_container_begin('[', ']');
            while(st.status == reader::TryParseStatus::ok && st.has_value) {
                if(isMap) {
                    MapFrame fr;
                    skip_whitespace();
                    if(atEnd() || *current_ != '"') {
                        setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
                        return false;
                    }
                    if(!read_string_body(nullptr) || !move_to_value(fr)) return false;
                }
                if(!skip_value_internal(depthLeft - 1)) return false;
                st = isMap ? advance_in_container('}', JsonIteratorReaderError::ILLFORMED_OBJECT)
                           : advance_in_container(']', JsonIteratorReaderError::ILLFORMED_ARRAY);
            }
            return st.status == reader::TryParseStatus::ok;
        }
        default: {
            const It start = current_;
            std::int64_t discard = 0;
            const reader::TryParseStatus st = read_number(discard);
            if(st == reader::TryParseStatus::error) {
                if(m_error == JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE) {
                    m_error = JsonIteratorReaderError::NO_ERROR;
                    return true;
                }
                return false;
            }
            if(st == reader::TryParseStatus::no_match) {
                // fraction or exponent was consumed by read_number; anything
                // else is not a JSON value
                if(m_error == JsonIteratorReaderError::NO_ERROR && current_ != start) {
                    return true;
                }
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            return true;
        }
        }
    }
};

static_assert(reader::ReaderLike<JsonIteratorReader<const char*, const char*>>);


enum class JsonIteratorWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW
};

template<class It, class Sent>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    using error_type = JsonIteratorWriterError;
    struct ArrayFrame {};
    struct MapFrame {};

    constexpr JsonIteratorWriter(It first, Sent last)
        : m_error(JsonIteratorWriterError::NO_ERROR), m_current(first), end_(last) {}

    constexpr It current() const { return m_current; }
    constexpr JsonIteratorWriterError getError() const { return m_error; }

    constexpr bool write_array_begin(ArrayFrame &) { return put('['); }
    constexpr bool write_map_begin(MapFrame &) { return put('{'); }
    constexpr bool advance_after_value(ArrayFrame &) { return put(','); }
    constexpr bool advance_after_value(MapFrame &) { return put(','); }
    constexpr bool move_to_value(MapFrame &) { return put(':'); }
    constexpr bool write_array_end(ArrayFrame &) { return put(']'); }
    constexpr bool write_map_end(MapFrame &) { return put('}'); }

    constexpr bool write_null() {
        return serialize_literal("null");
    }
    constexpr bool write_bool(const bool & obj) {
        return serialize_literal(obj ? "true" : "false");
    }

    template<class NumberT>
    constexpr bool write_number(const NumberT & v) {
        static_assert(std::is_integral_v<NumberT>, "[[[ PluralKit ]]] only integral values are supported");
        char buf[24];
        char * p = buf + sizeof(buf);
        using Unsigned = std::make_unsigned_t<NumberT>;
        Unsigned u = static_cast<Unsigned>(v);
        bool negative = false;
        if constexpr (std::is_signed_v<NumberT>) {
            if(v < 0) {
                negative = true;
                u = Unsigned(-(v + 1)) + 1u;
            }
        }
        do {
            *--p = static_cast<char>('0' + static_cast<unsigned>(u % 10u));
            u /= 10u;
        } while(u != 0);
        if(negative) {
            *--p = '-';
        }
        return serialize_literal(std::string_view(p, static_cast<std::size_t>(buf + sizeof(buf) - p)));
    }

    constexpr bool write_string(std::string_view s) {
        constexpr char hex[] = "0123456789abcdef";
        if(!put('"')) return false;
        for(char c : s) {
            switch(c) {
            case '"':  if(!serialize_literal("\\\"")) return false; break;
            case '\\': if(!serialize_literal("\\\\")) return false; break;
            case '\b': if(!serialize_literal("\\b")) return false; break;
            case '\f': if(!serialize_literal("\\f")) return false; break;
            case '\n': if(!serialize_literal("\\n")) return false; break;
            case '\r': if(!serialize_literal("\\r")) return false; break;
            case '\t': if(!serialize_literal("\\t")) return false; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    const unsigned char u = static_cast<unsigned char>(c);
                    const char esc[] = {'\\', 'u', '0', '0', hex[u >> 4], hex[u & 0xF]};
                    if(!serialize_literal(std::string_view(esc, sizeof(esc)))) return false;
                } else if(!put(c)) {
                    return false;
                }
            }
        }
        return put('"');
    }

private:
    JsonIteratorWriterError m_error;
    It m_current;
    Sent end_;

    constexpr bool put(char c) {
        if(m_current == end_) {
            m_error = JsonIteratorWriterError::OUTPUT_OVERFLOW;
            return false;
        }
        *m_current++ = c;
        return true;
    }

    constexpr bool serialize_literal(std::string_view lit) {
        for(char c : lit) {
            if(!put(c)) return false;
        }
        return true;
    }
};

static_assert(writer::WriterLike<JsonIteratorWriter<char*, char*>>);

} // namespace PluralKit
