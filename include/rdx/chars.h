#pragma once

#include "common.h"

#include <array>

namespace rdx {

template<typename CharT, typename = void>
struct is_character : std::false_type {};
template<typename CharT>
struct is_character<CharT, std::enable_if_t<std::is_same<std::remove_cv_t<CharT>, char>::value>> : std::true_type {};
template<typename CharT>
struct is_character<CharT, std::enable_if_t<std::is_same<std::remove_cv_t<CharT>, wchar_t>::value>> : std::true_type {};

namespace detail {
struct char_tbl_t {
    std::array<std::uint8_t, 256> digs{};
    RDX_CONSTEXPR char_tbl_t() {
        for (unsigned ch = 0; ch < 256; ++ch) {
            if (ch >= '0' && ch <= '9') {
                digs[ch] = ch - '0';
            } else if (ch >= 'a' && ch <= 'z') {
                digs[ch] = ch - 'a' + 10;
            } else if (ch >= 'A' && ch <= 'Z') {
                digs[ch] = ch - 'A' + 10;
            } else {
                digs[ch] = 255;
            }
        }
    }
};
#if __cplusplus < 201703L
extern RDX_EXPORT const char_tbl_t g_char_tbl;
#else   // __cplusplus < 201703L
static constexpr char_tbl_t g_char_tbl{};
#endif  // __cplusplus < 201703L
}  // namespace detail

const RDX_CONSTEXPR unsigned min_radix = 2;
const RDX_CONSTEXPR unsigned max_radix = 36;

// digit value of a character in any radix up to 36, 255 if the character is not a digit
template<typename CharT, typename = std::enable_if_t<std::is_integral<CharT>::value>>
RDX_CONSTEXPR std::enable_if_t<sizeof(CharT) != 1, unsigned> dig_v(CharT ch) {
    return (ch & 0xff) == ch ? detail::g_char_tbl.digs[static_cast<std::uint8_t>(ch)] : 255;
}
template<typename CharT, typename = std::enable_if_t<std::is_integral<CharT>::value>>
RDX_CONSTEXPR std::enable_if_t<sizeof(CharT) == 1, unsigned> dig_v(CharT ch) {
    return detail::g_char_tbl.digs[static_cast<std::uint8_t>(ch)];
}

inline const char* get_digit_chars(bool upper) noexcept {
    return upper ? "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ" : "0123456789abcdefghijklmnopqrstuvwxyz";
}

inline char digit_to_char(unsigned dig, bool upper = false) noexcept {
    assert(dig < max_radix);
    return get_digit_chars(upper)[dig];
}

}  // namespace rdx
