#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace PluralKit {

// State of a patch field that is not part of the patch.
struct Unmodified {
    friend constexpr bool operator==(const Unmodified&, const Unmodified&) = default;
};

inline constexpr Unmodified unmodified{};

// Field of a patch document: either Unmodified (left as-is on the server) or
// Patched with a value. Use Patchable<std::optional<T>> for fields that can be
// cleared, so that Patched(std::nullopt) is written as an explicit null while
// Unmodified is not written at all.
template<class T>
class Patchable {
    std::variant<Unmodified, T> m_state;

public:
    using value_type = T;

    constexpr Patchable() = default;
    constexpr Patchable(Unmodified) noexcept {}

    template<class U = T>
        requires (std::is_constructible_v<T, U&&>
                  && !std::is_same_v<std::remove_cvref_t<U>, Patchable>
                  && !std::is_same_v<std::remove_cvref_t<U>, Unmodified>)
    constexpr Patchable(U&& v) : m_state(std::in_place_index<1>, std::forward<U>(v)) {}

    constexpr bool is_unmodified() const noexcept {
        return m_state.index() == 0;
    }
    constexpr bool is_patched() const noexcept {
        return m_state.index() == 1;
    }

    // nullptr when Unmodified.
    constexpr const T* get_if() const noexcept {
        return std::get_if<1>(&m_state);
    }

    // Throws std::bad_variant_access when Unmodified.
    constexpr const T& value() const {
        return std::get<1>(m_state);
    }

    constexpr void reset() noexcept {
        m_state.template emplace<0>();
    }

    friend constexpr bool operator==(const Patchable&, const Patchable&) = default;
};

template<class T>
struct is_patchable : std::false_type {};

template<class T>
struct is_patchable<Patchable<T>> : std::true_type {};

template<class T>
inline constexpr bool is_patchable_v = is_patchable<std::remove_cvref_t<T>>::value;

} // namespace PluralKit
