#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace PluralKit {

// Structural string usable as a template argument, e.g. options::key<"avatar_url">.
template <std::size_t N> struct ConstString
{
    constexpr ConstString(const char (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32 || m_data[i] == '"' || m_data[i] == '\\') return false;
        }
        return true;
    }
    constexpr std::string_view toStringView() const {
        return {&m_data[0], N};
    }

    char m_data[N+1];
    static constexpr std::size_t Length = N;
};
template <std::size_t N>
ConstString(const char (&str)[N])->ConstString<N-1>;

} // namespace PluralKit
