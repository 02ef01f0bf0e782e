#pragma once

#include <concepts>
#include <cstdint>
#include <iterator>
#include <string_view>

namespace PluralKit {

template <class It>
concept CharOutputIterator = std::output_iterator<It, char>;

template <class Sent, class It>
concept CharSentinelForOut = std::sentinel_for<Sent, It>;

namespace writer {

/// Interface the serializer needs from a format writer.
template<typename W>
concept WriterLike = requires(W writer,
                              W& mutable_writer,
                              const bool& bool_ref,
                              const std::int64_t& int_ref,
                              std::string_view str,
                              typename W::ArrayFrame & arrFrameRef,
                              typename W::MapFrame & mapFrameRef
                              ) {
    typename W::iterator_type;
    typename W::ArrayFrame;
    typename W::MapFrame;
    typename W::error_type;

    { writer.current() } -> std::same_as<typename W::iterator_type>;
    { writer.getError() } -> std::same_as<typename W::error_type>;

    { mutable_writer.write_array_begin(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.write_number(int_ref) } -> std::same_as<bool>;
    { mutable_writer.write_string(str) } -> std::same_as<bool>;
};

} // namespace writer

} // namespace PluralKit
