#pragma once

#include <concepts>
#include <cstdint>
#include <iterator>
#include <string>

namespace PluralKit {

// Input the JSON reader walks one char at a time.
template <class It>
concept CharInputIterator = std::input_iterator<It>
    && std::convertible_to<std::iter_reference_t<It>, char>;

template <class It, class Sent>
concept CharSentinelFor = CharInputIterator<It> && std::sentinel_for<Sent, It>;

namespace reader {

enum class TryParseStatus {
    no_match,   // not our case, iterator unchanged
    ok,         // parsed and consumed
    error       // malformed, reader error already set
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

/// Interface the parser needs from a format reader.
template<typename R>
concept ReaderLike = requires(R reader,
                              R& mutable_reader,
                              bool& bool_ref,
                              std::int64_t& int_ref,
                              std::string& string_ref,
                              typename R::ArrayFrame & arrFrameRef,
                              typename R::MapFrame & mapFrameRef
                              ) {
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_key(string_ref) } -> std::same_as<bool>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<std::int64_t>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string(string_ref) } -> std::same_as<TryParseStatus>;

    { mutable_reader.template skip_value<2>() } -> std::same_as<bool>;
    { mutable_reader.finish() } -> std::same_as<bool>;
};

} // namespace reader

} // namespace PluralKit
