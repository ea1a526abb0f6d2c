#pragma once
#include <cstdint>
#include <string_view>

namespace FormFusion {

template <typename CharT, std::size_t N> struct ConstString
{
    // Field keys must not contain control characters or path separators,
    // otherwise they could never match a single shifted key.
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
            if(m_data[i] == '.' || m_data[i] == '[' || m_data[i] == ']') return false;
        }
        return true;
    }
    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

} // namespace FormFusion
