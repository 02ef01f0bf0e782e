#pragma once

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "json.hpp"
#include "errors.hpp"
#include "writer_concept.hpp"

namespace PluralKit {


template <class OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
public:
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos):
        m_error(err), m_writerError(werr), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
};


namespace  serializer_details {


template <CharOutputIterator OutIter, class WriterError>
class SerializationContext {

    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};
    OutIter m_pos;

public:
    constexpr SerializationContext(OutIter it): m_pos(it){}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = SerializeError::WRITER_ERROR;
        writerError = writer.getError();
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr bool withError(SerializeError err, Writer & writer) {
        error = err;
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr void finish(Writer & writer) {
        if(error == SerializeError::NO_ERROR) {
            m_pos = writer.current();
        }
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(error, writerError, m_pos);
    }
};


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const ObjT & obj, Writer & writer, CTX & ctx);


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonObject<ObjT>
constexpr bool SerializeObject(const ObjT & obj, Writer & writer, CTX & ctx) {
    typename Writer::MapFrame frame;
    if(!writer.write_map_begin(frame)) {
        return ctx.withWriterError(writer);
    }

    bool first = true;
    auto one = [&]<std::size_t I>(std::integral_constant<std::size_t, I>) -> bool {
        using FieldOpts = introspection::structureElementOptionsByIndex<I, ObjT>;
        if constexpr (FieldOpts::template has_option<options::detail::not_json_tag>) {
            return true;
        } else {
            const auto & field = introspection::getStructElementByIndex<I>(obj);
            if(static_schema::isUntouched(field)) {
                return true;
            }
            if(!first) {
                if(!writer.advance_after_value(frame)) {
                    return ctx.withWriterError(writer);
                }
            }
            first = false;

            std::string_view name;
            if constexpr (FieldOpts::template has_option<options::detail::key_tag>) {
                using KeyOpt = typename FieldOpts::template get_option<options::detail::key_tag>;
                name = KeyOpt::desc.toStringView();
            } else {
                name = introspection::structureElementNameByIndex<I, ObjT>;
            }
            if(!writer.write_string(name)) {
                return ctx.withWriterError(writer);
            }
            if(!writer.move_to_value(frame)) {
                return ctx.withWriterError(writer);
            }
            return SerializeValue<FieldOpts>(field, writer, ctx);
        }
    };

    const bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (one(std::integral_constant<std::size_t, I>{}) && ...);
    }(std::make_index_sequence<introspection::structureElementsCount<ObjT>>{});
    if(!ok) {
        return false;
    }

    if(!writer.write_map_end(frame)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const ObjT & obj, Writer & writer, CTX & ctx) {
    if constexpr (static_schema::JsonPatchable<ObjT>) {
        // objects drop untouched fields; reaching here unmodified is a caller bug
        if(obj.is_unmodified()) {
            return ctx.withError(SerializeError::UNMODIFIED_PATCHABLE, writer);
        }
        return SerializeValue<Opts>(obj.value(), writer, ctx);
    } else if constexpr (static_schema::JsonNullable<ObjT>) {
        if(!obj.has_value()) {
            if(!writer.write_null()) {
                return ctx.withWriterError(writer);
            }
            return true;
        }
        return SerializeValue<Opts>(*obj, writer, ctx);
    } else if constexpr (static_schema::Transformer<ObjT>) {
        static_schema::wire_type_t<ObjT> wire{};
        if(!static_schema::to_wire(obj, wire)) {
            return ctx.withError(SerializeError::TRANSFORMER_ERROR, writer);
        }
        return SerializeValue<Opts>(wire, writer, ctx);
    } else if constexpr (static_schema::JsonBool<ObjT>) {
        if(!writer.write_bool(obj)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else if constexpr (static_schema::JsonNumber<ObjT>) {
        if(!writer.write_number(obj)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else if constexpr (static_schema::JsonString<ObjT>) {
        if(!writer.write_string(std::string_view(obj))) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else if constexpr (static_schema::JsonEnum<ObjT>) {
        std::optional<std::string_view> name = static_schema::enumToString(obj);
        if(!name) {
            return ctx.withError(SerializeError::TRANSFORMER_ERROR, writer);
        }
        if(!writer.write_string(*name)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else if constexpr (static_schema::JsonArray<ObjT>) {
        typename Writer::ArrayFrame frame;
        if(!writer.write_array_begin(frame)) {
            return ctx.withWriterError(writer);
        }
        bool first = true;
        for(const auto & item : obj) {
            if(!first && !writer.advance_after_value(frame)) {
                return ctx.withWriterError(writer);
            }
            first = false;
            if(!SerializeValue<options::detail::no_options>(item, writer, ctx)) {
                return false;
            }
        }
        if(!writer.write_array_end(frame)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else {
        static_assert(static_schema::JsonObject<ObjT>,
                      "[[[ PluralKit ]]] T is not a supported serializable value type");
        return SerializeObject<Opts>(obj, writer, ctx);
    }
}

} // namespace serializer_details


template <static_schema::JsonValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());

    serializer_details::SerializeValue<options::detail::no_options>(obj, writer, ctx);
    ctx.finish(writer);
    return ctx.result();
}

template <static_schema::JsonValue InputObjectT, CharOutputIterator It, CharSentinelForOut<It> Sent, class Writer = JsonIteratorWriter<It, Sent>>
constexpr SerializeResult<It, typename Writer::error_type> Serialize(const InputObjectT & obj, It begin, const Sent & end) {
    Writer writer(begin, end);
    return SerializeWithWriter(obj, writer);
}


namespace io_details {
struct limitless_sentinel {};

constexpr bool operator==(const std::back_insert_iterator<std::string>&,
                                 const limitless_sentinel&) noexcept {
    return false;
}

constexpr bool operator==(const limitless_sentinel&,
                                 const std::back_insert_iterator<std::string>&) noexcept {
    return false;
}
}

// Replaces the content of out. On failure out holds the partial document.
template<static_schema::JsonValue InputObjectT>
constexpr auto Serialize(const InputObjectT& obj, std::string& out)
{
    using io_details::limitless_sentinel;

    out.clear();

    auto it  = std::back_inserter(out);
    limitless_sentinel end{};

    return Serialize(obj, it, end);
}

} // namespace PluralKit
