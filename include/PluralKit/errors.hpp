#pragma once

#include <string_view>

namespace PluralKit {

enum class ParseError {
    NO_ERROR,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    NULL_IN_NON_OPTIONAL,
    UNKNOWN_ENUM_VALUE,

    EXCESS_FIELD,
    DUPLICATE_KEY_IN_MAP,
    MISSING_REQUIRED_FIELD,

    TRANSFORMER_ERROR,
    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR";
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE";
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE";
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE";
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE";
    case ParseError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE";
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL";
    case ParseError::UNKNOWN_ENUM_VALUE: return "UNKNOWN_ENUM_VALUE";
    case ParseError::EXCESS_FIELD: return "EXCESS_FIELD";
    case ParseError::DUPLICATE_KEY_IN_MAP: return "DUPLICATE_KEY_IN_MAP";
    case ParseError::MISSING_REQUIRED_FIELD: return "MISSING_REQUIRED_FIELD";
    case ParseError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR";
    case ParseError::READER_ERROR: return "READER_ERROR";
    }
    return "N/A";
}

enum class SerializeError {
    NO_ERROR,
    TRANSFORMER_ERROR,
    // An untouched Patchable reached the value serializer. Struct serialization
    // drops untouched fields before that point, so this is a caller defect.
    UNMODIFIED_PATCHABLE,
    WRITER_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR";
    case SerializeError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR";
    case SerializeError::UNMODIFIED_PATCHABLE: return "UNMODIFIED_PATCHABLE";
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR";
    }
    return "N/A";
}

} // namespace PluralKit
