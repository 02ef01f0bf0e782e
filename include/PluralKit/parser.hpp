#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "json_path.hpp"
#include "json.hpp"
#include "errors.hpp"
#include "parse_result.hpp"

namespace PluralKit {


namespace  parser_details {


template <class InpIter, class ReaderError>
class DeserializationContext {
    ReaderError reader_error = {};
    ParseError error = ParseError::NO_ERROR;
    InpIter m_pos{};

    json_path::JsonPath currentPath;

public:
    struct PathGuard {
        DeserializationContext & ctx;

        constexpr ~PathGuard() {
            if(ctx.error == ParseError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };


    constexpr bool withParseError(ParseError err, const reader::ReaderLike auto & reader) {
        error = err;
        if(err == ParseError::NO_ERROR) {
            error = ParseError::READER_ERROR;
        }
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    constexpr bool withReaderError(const reader::ReaderLike auto & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }
    constexpr ParseError currentError(){return error;}

    constexpr ParseResult<InpIter, ReaderError> result() const {
        return ParseResult<InpIter, ReaderError>(error, reader_error, m_pos, currentPath);
    }

    constexpr PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_child({index});
        return PathGuard{*this};
    }
    constexpr PathGuard getMapItemGuard(std::string_view key) {
        currentPath.push_child({key});
        return PathGuard{*this};
    }
};

// Every ParseValue overload fills an empty slot. Validated types have no
// default state, so values are only constructed once their JSON is known.

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx);


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonBool<ObjT>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    bool b = false;
    if (reader::TryParseStatus st = reader.read_bool(b); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
    }
    slot = b;
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonNumber<ObjT>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    ObjT n{};
    if (reader::TryParseStatus st = reader.template read_number<ObjT>(n);
                st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
    }
    slot = n;
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires std::same_as<ObjT, std::string>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    std::string s;
    if (reader::TryParseStatus st = reader.read_string(s); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
    }
    slot = std::move(s);
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonEnum<ObjT>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    std::string s;
    if (reader::TryParseStatus st = reader.read_string(s); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
    }
    std::optional<ObjT> e = static_schema::enumFromString<ObjT>(s);
    if(!e) {
        return ctx.withParseError(ParseError::UNKNOWN_ENUM_VALUE, reader);
    }
    slot = *e;
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonArray<ObjT>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    using ElemT = typename ObjT::value_type;

    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    ObjT items;
    std::size_t index = 0;
    while(iterStatus.has_value) {
        typename CTX::PathGuard guard = ctx.getArrayItemGuard(index);
        std::optional<ElemT> item;
        if(!ParseValue<options::detail::no_options>(item, reader, ctx)) {
            return false;
        }
        items.push_back(std::move(*item));
        index ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    slot = std::move(items);
    return true;
}


template <class ObjT, std::size_t I>
constexpr bool fieldIsNotJSON() {
    using FieldOpts = introspection::structureElementOptionsByIndex<I, ObjT>;
    return FieldOpts::template has_option<options::detail::not_json_tag>;
}

template <class ObjT, std::size_t I>
constexpr std::string_view fieldJsonName() {
    using FieldOpts = introspection::structureElementOptionsByIndex<I, ObjT>;
    if constexpr (FieldOpts::template has_option<options::detail::key_tag>) {
        using KeyOpt = typename FieldOpts::template get_option<options::detail::key_tag>;
        return KeyOpt::desc.toStringView();
    } else {
        return introspection::structureElementNameByIndex<I, ObjT>;
    }
}

template <class ObjT, std::size_t... I>
using field_slots_t = std::tuple<std::optional<introspection::structureElementTypeByIndex<I, ObjT>>...>;

template <class ObjT, reader::ReaderLike Tokenizer, class CTX, class Slots, std::size_t... I>
constexpr bool ParseStructField(Slots & slots, Tokenizer & reader, CTX &ctx, std::index_sequence<I...>, std::size_t index) {
    bool ok = false;
    (
        (index == I
            ? (ok = ParseValue<introspection::structureElementOptionsByIndex<I, ObjT>>(std::get<I>(slots), reader, ctx), true)
            : false)
        || ...
        );
    return ok;
}

// Fields absent from the document: optional ones become empty, patch fields
// Unmodified, not_json fields value-initialized.
template <class ObjT, std::size_t I, reader::ReaderLike Tokenizer, class CTX, class Slots>
constexpr bool FillAbsentField(Slots & slots, Tokenizer & reader, CTX &ctx) {
    using FieldT = introspection::structureElementTypeByIndex<I, ObjT>;
    auto & slot = std::get<I>(slots);
    if(slot.has_value()) {
        return true;
    }
    if constexpr (fieldIsNotJSON<ObjT, I>() || static_schema::JsonOmittable<FieldT>) {
        slot.emplace();
        return true;
    } else {
        typename CTX::PathGuard guard = ctx.getMapItemGuard(fieldJsonName<ObjT, I>());
        return ctx.withParseError(ParseError::MISSING_REQUIRED_FIELD, reader);
    }
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::JsonObject<ObjT>
constexpr bool ParseNonNullValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    constexpr std::size_t fieldsCount = introspection::structureElementsCount<ObjT>;
    using StructOpts = introspection::structureOptions<ObjT>;
    using Seq = std::make_index_sequence<fieldsCount>;

    typename Tokenizer::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    constexpr std::array<std::string_view, fieldsCount> names = []<std::size_t... I>(std::index_sequence<I...>) {
        return std::array<std::string_view, sizeof...(I)>{ fieldJsonName<ObjT, I>()... };
    }(Seq{});
    constexpr std::array<bool, fieldsCount> isFieldSkipped = []<std::size_t... I>(std::index_sequence<I...>) {
        return std::array<bool, sizeof...(I)>{ fieldIsNotJSON<ObjT, I>()... };
    }(Seq{});

    auto slots = []<std::size_t... I>(std::index_sequence<I...>) {
        return field_slots_t<ObjT, I...>{};
    }(Seq{});
    std::array<bool, fieldsCount> parsedFieldsByIndex{};

    std::string key;
    while(iterStatus.has_value) {
        if(!reader.read_key(key)) {
            return ctx.withReaderError(reader);
        }
        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        std::size_t structIndex = fieldsCount;
        for(std::size_t i = 0; i < fieldsCount; i ++) {
            if(!isFieldSkipped[i] && names[i] == key) {
                structIndex = i;
                break;
            }
        }

        if(structIndex == fieldsCount) {
            if constexpr (StructOpts::template has_option<options::detail::allow_excess_fields_tag>) {
                using Opt = typename StructOpts::template get_option<options::detail::allow_excess_fields_tag>;
                if(!reader.template skip_value<Opt::SkipDepthLimit>()) {
                    return ctx.withReaderError(reader);
                }
            } else if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                using Opt = typename Opts::template get_option<options::detail::allow_excess_fields_tag>;
                if(!reader.template skip_value<Opt::SkipDepthLimit>()) {
                    return ctx.withReaderError(reader);
                }
            } else {
                return ctx.withParseError(ParseError::EXCESS_FIELD, reader);
            }
        } else {
            typename CTX::PathGuard guard = ctx.getMapItemGuard(names[structIndex]);
            if(parsedFieldsByIndex[structIndex]) {
                return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
            }
            if(!ParseStructField<ObjT>(slots, reader, ctx, Seq{}, structIndex)) {
                return false;
            }
            parsedFieldsByIndex[structIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    const bool complete = [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (FillAbsentField<ObjT, I>(slots, reader, ctx) && ...);
    }(Seq{});
    if(!complete) {
        return false;
    }

    [&]<std::size_t... I>(std::index_sequence<I...>) {
        slot.emplace(ObjT{ std::move(*std::get<I>(slots))... });
    }(Seq{});
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(std::optional<ObjT> & slot, Tokenizer & reader, CTX &ctx) {
    if constexpr (static_schema::JsonPatchable<ObjT>) {
        // present in the document, so patched; null is handled by the inner type
        std::optional<typename ObjT::value_type> inner;
        if(!ParseValue<Opts>(inner, reader, ctx)) {
            return false;
        }
        slot.emplace(std::move(*inner));
        return true;
    } else if constexpr (static_schema::JsonNullable<ObjT>) {
        if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
            slot.emplace(std::nullopt);
            return true;
        } else if(r == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        std::optional<typename ObjT::value_type> inner;
        if(!ParseValue<Opts>(inner, reader, ctx)) {
            return false;
        }
        slot.emplace(std::move(inner));
        return true;
    } else if constexpr (static_schema::Transformer<ObjT>) {
        using WireT = static_schema::wire_type_t<ObjT>;
        std::optional<WireT> wire;
        if(!ParseValue<Opts>(wire, reader, ctx)) {
            return false;
        }
        std::optional<ObjT> v = static_schema::from_wire<ObjT>(*wire);
        if(!v) {
            return ctx.withParseError(ParseError::TRANSFORMER_ERROR, reader);
        }
        slot = std::move(v);
        return true;
    } else {
        if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        } else if(r == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        return ParseNonNullValue<Opts>(slot, reader, ctx);
    }
}


} // namespace parser_details


template <static_schema::JsonValue InputObjectT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(Reader & reader) {
    using CtxT = parser_details::DeserializationContext<typename Reader::iterator_type, typename Reader::error_type>;

    CtxT ctx;
    std::optional<InputObjectT> value;

    parser_details::ParseValue<options::detail::no_options>(value, reader, ctx);

    if(ctx.currentError() == ParseError::NO_ERROR) {
        if(!reader.finish()) {
            ctx.withReaderError(reader);
        }
    }
    if(ctx.currentError() != ParseError::NO_ERROR) {
        value.reset();
    }
    return ParsedValue<InputObjectT, typename Reader::iterator_type, typename Reader::error_type>(ctx.result(), std::move(value));
}

template <static_schema::JsonValue InputObjectT, CharInputIterator It, CharSentinelFor<It> Sent, class Reader = JsonIteratorReader<It, Sent>>
constexpr auto Parse(It begin, const Sent & end) {
    Reader reader(begin, end);
    return ParseWithReader<InputObjectT>(reader);
}

template<static_schema::JsonValue InputObjectT>
constexpr auto Parse(std::string_view sv) {
    return Parse<InputObjectT>(sv.data(), sv.data() + sv.size());
}

// Assigns obj only when the whole document parsed.
template<static_schema::JsonValue InputObjectT>
constexpr auto Parse(InputObjectT& obj, std::string_view sv) {
    auto res = Parse<InputObjectT>(sv);
    if(res) {
        obj = std::move(res).value();
    }
    return static_cast<ParseResult<const char*, JsonIteratorReaderError>>(res);
}

} // namespace PluralKit
