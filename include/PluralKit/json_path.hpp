#pragma once

#include <cstddef>
#include <limits>
#include <string_view>
#include <type_traits>
#include <vector>

namespace PluralKit {
namespace json_path {

inline constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

struct PathElement {
    std::size_t      array_index = NotAnIndex;   // arrays
    std::string_view field_name;                 // object keys, always static

    constexpr PathElement() = default;

    constexpr PathElement(std::size_t index)
        : array_index(index)
    {}

    constexpr PathElement(std::string_view key)
        : field_name(key)
    {}

    constexpr bool is_index() const {
        return array_index != NotAnIndex;
    }

    friend constexpr bool operator==(const PathElement&, const PathElement&) = default;
};

// Location of a value inside a document, root excluded. Used to report where
// a parse stopped.
struct JsonPath {
    std::vector<PathElement> storage;

    constexpr JsonPath() = default;

    // JsonPath("proxy_tags", 1, "prefix")
    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0)
    constexpr JsonPath(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElement{std::string_view(arg)};
            } else {
                static_assert(std::is_convertible_v<ArgT, std::size_t>,
                              "Use integers or str-compatible segments in JsonPath construction");
                return PathElement{static_cast<std::size_t>(arg)};
            }
        };
        (storage.push_back(toPathElement(args)), ...);
    }

    constexpr void push_child(PathElement el) {
        storage.push_back(el);
    }

    constexpr void pop() {
        storage.pop_back();
    }

    friend constexpr bool operator==(const JsonPath&, const JsonPath&) = default;
};

} // namespace json_path
} // namespace PluralKit
