#pragma once

#include "membuffer.h"

#include <cstring>
#include <limits>
#include <string>

namespace rdx {

// --------------------------

enum class fmt_flags : unsigned {
    none = 0,
    uppercase = 1,
    sign_pos = 2,
};
RDX_IMPLEMENT_BITWISE_OPS_FOR_ENUM(fmt_flags);

struct fmt_opts {
    RDX_CONSTEXPR fmt_opts() noexcept = default;
    RDX_CONSTEXPR explicit fmt_opts(unsigned r, fmt_flags fl = fmt_flags::none) noexcept : radix(r), flags(fl) {}
    unsigned radix = 10;
    fmt_flags flags = fmt_flags::none;
};

class RDX_EXPORT_ALL_STUFF_FOR_GNUC format_error : public std::runtime_error {
 public:
    RDX_EXPORT explicit format_error(const char* message);
    RDX_EXPORT explicit format_error(const std::string& message);
    RDX_EXPORT const char* what() const noexcept override;
};

// unsigned 128-bit integer
struct uint128_t {
    std::uint64_t hi;
    std::uint64_t lo;
    friend bool operator==(const uint128_t& lhs, const uint128_t& rhs) noexcept {
        return lhs.hi == rhs.hi && lhs.lo == rhs.lo;
    }
    friend bool operator!=(const uint128_t& lhs, const uint128_t& rhs) noexcept { return !(lhs == rhs); }
};

// --------------------------

namespace scvt {

template<typename Ty>
struct fp_traits;

template<typename TyTo, typename TyFrom>
TyTo bit_cast(const TyFrom& v) noexcept {
    static_assert(sizeof(TyTo) == sizeof(TyFrom), "bad bit cast");
    TyTo ret;
    std::memcpy(&ret, &v, sizeof(TyFrom));
    return ret;
}

template<>
struct fp_traits<float> {
    static_assert(sizeof(float) == sizeof(std::uint32_t), "type size mismatch");
    enum : unsigned { total_bits = 32, bits_per_mantissa = 23 };
    enum : std::uint64_t { mantissa_mask = (1ull << bits_per_mantissa) - 1, hidden_bit = 1ull << bits_per_mantissa };
    enum : int {
        exp_max = (1 << (total_bits - bits_per_mantissa - 1)) - 1,
        exp_bias = exp_max >> 1,
        denormal_exp = 1 - exp_bias - static_cast<int>(bits_per_mantissa),
        max_exp = exp_max - exp_bias - static_cast<int>(bits_per_mantissa),
    };
    static std::uint64_t to_u64(float f) noexcept { return bit_cast<std::uint32_t>(f); }
    static float from_u64(std::uint64_t u64) noexcept { return bit_cast<float>(static_cast<std::uint32_t>(u64)); }
};

template<>
struct fp_traits<double> {
    static_assert(sizeof(double) == sizeof(std::uint64_t), "type size mismatch");
    enum : unsigned { total_bits = 64, bits_per_mantissa = 52 };
    enum : std::uint64_t { mantissa_mask = (1ull << bits_per_mantissa) - 1, hidden_bit = 1ull << bits_per_mantissa };
    enum : int {
        exp_max = (1 << (total_bits - bits_per_mantissa - 1)) - 1,
        exp_bias = exp_max >> 1,
        denormal_exp = 1 - exp_bias - static_cast<int>(bits_per_mantissa),
        max_exp = exp_max - exp_bias - static_cast<int>(bits_per_mantissa),
    };
    static std::uint64_t to_u64(double f) noexcept { return bit_cast<std::uint64_t>(f); }
    static double from_u64(std::uint64_t u64) noexcept { return bit_cast<double>(u64); }
};

// --------------------------

// Exact count of digits of the largest `bits`-wide unsigned value written in `radix`
inline RDX_CONSTEXPR unsigned max_radix_digits(unsigned bits, unsigned radix) noexcept {
    assert(bits <= 128 && radix >= 2);
    // value is kept as four 32-bit limbs, most significant first
    std::uint32_t v[4] = {0, 0, 0, 0};
    for (unsigned n = 0; n < 4; ++n) {
        if (bits <= 32 * (3 - n)) { continue; }
        const unsigned limb_bits = bits - 32 * (3 - n);
        v[n] = limb_bits >= 32 ? 0xffffffff : (1u << limb_bits) - 1;
    }
    unsigned count = 0;
    do {
        std::uint64_t rem = 0;
        for (unsigned n = 0; n < 4; ++n) {
            const std::uint64_t cur = (rem << 32) | v[n];
            v[n] = static_cast<std::uint32_t>(cur / radix), rem = cur % radix;
        }
        ++count;
    } while (v[0] | v[1] | v[2] | v[3]);
    return count;
}

// Radix-2 worst case for an unsigned type
template<typename Ty>
struct max_int_digits : std::integral_constant<unsigned, 8 * sizeof(Ty)> {};

// Longest significant digit run produced by the float formatter: 17 zero bits of a fraction above 1e-5,
// 53 mantissa bits, guard and carry digits
const RDX_CONSTEXPR unsigned max_radix_float_digits = 72;

// Longest exponent: 1074 in radix 2
const RDX_CONSTEXPR unsigned max_radix_exp_digits = 11;

// Longest float representation without sign: `d.ddd...e-xxx`
const RDX_CONSTEXPR unsigned max_radix_float_len = max_radix_float_digits + 4 + max_radix_exp_digits;

// --------------------------

template<typename CharT, typename Ty>
RDX_EXPORT void fmt_integer_common(basic_membuffer<CharT>& s, Ty val, bool is_signed, fmt_opts fmt);

template<typename StrTy, typename Ty,
         typename = std::enable_if_t<!std::is_convertible<StrTy&, basic_membuffer<typename StrTy::value_type>&>::value>>
void fmt_integer_common(StrTy& s, Ty val, bool is_signed, fmt_opts fmt) {
    inline_basic_dynbuffer<typename StrTy::value_type> buf;
    fmt_integer_common(buf, val, is_signed, fmt);
    s.append(buf.data(), buf.size());
}

template<typename CharT>
RDX_EXPORT void fmt_float_common(basic_membuffer<CharT>& s, std::uint64_t u64, fmt_opts fmt, unsigned bpm, int exp_max);

template<typename StrTy,
         typename = std::enable_if_t<!std::is_convertible<StrTy&, basic_membuffer<typename StrTy::value_type>&>::value>>
void fmt_float_common(StrTy& s, std::uint64_t u64, fmt_opts fmt, unsigned bpm, int exp_max) {
    inline_basic_dynbuffer<typename StrTy::value_type> buf;
    fmt_float_common(buf, u64, fmt, bpm, exp_max);
    s.append(buf.data(), buf.size());
}

template<typename StrTy, typename Ty>
void fmt_integer(StrTy& s, Ty val, fmt_opts fmt = {}) {
    using UTy = typename std::make_unsigned<Ty>::type;
    using ReducedTy = std::conditional_t<(sizeof(UTy) <= sizeof(std::uint32_t)), std::uint32_t, std::uint64_t>;
    const bool is_signed = std::is_signed<Ty>::value;
    fmt_integer_common(s, static_cast<ReducedTy>(val), is_signed, fmt);
}

template<typename StrTy>
void fmt_integer(StrTy& s, uint128_t val, fmt_opts fmt = {}) {
    fmt_integer_common(s, val, false, fmt);
}

template<typename StrTy, typename Ty>
void fmt_float(StrTy& s, Ty val, fmt_opts fmt = {}) {
    fmt_float_common(s, fp_traits<Ty>::to_u64(val), fmt, fp_traits<Ty>::bits_per_mantissa, fp_traits<Ty>::exp_max);
}

}  // namespace scvt

// --------------------------

template<typename Ty, typename CharT = char>
struct string_converter;

#define RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(ty, fmt_func) \
    template<typename CharT> \
    struct string_converter<ty, CharT> { \
        template<typename StrTy> \
        void to_string(StrTy& s, ty val, fmt_opts fmt) const { \
            fmt_func(s, val, fmt); \
        } \
    };
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(signed char, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(signed short, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(signed, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(signed long, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(signed long long, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(unsigned char, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(unsigned short, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(unsigned, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(unsigned long, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(unsigned long long, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(uint128_t, scvt::fmt_integer)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(float, scvt::fmt_float)
RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER(double, scvt::fmt_float)
#undef RDX_SCVT_IMPLEMENT_STANDARD_STRING_CONVERTER

template<typename StrTy, typename Ty>
StrTy& to_basic_string(StrTy& s, const Ty& val, fmt_opts fmt = {}) {
    string_converter<Ty, typename StrTy::value_type>{}.to_string(s, val, fmt);
    return s;
}

template<typename Ty, typename... Opts>
std::string to_string(const Ty& val, const Opts&... opts) {
    inline_dynbuffer buf;
    to_basic_string(buf, val, fmt_opts(opts...));
    return std::string(buf.data(), buf.size());
}

template<typename Ty, typename... Opts>
std::wstring to_wstring(const Ty& val, const Opts&... opts) {
    inline_wdynbuffer buf;
    to_basic_string(buf, val, fmt_opts(opts...));
    return std::wstring(buf.data(), buf.size());
}

template<typename Ty, typename... Opts>
char* to_chars(char* p, const Ty& val, const Opts&... opts) {
    membuffer buf(p);
    return to_basic_string(buf, val, fmt_opts(opts...)).curr();
}

template<typename Ty, typename... Opts>
wchar_t* to_wchars(wchar_t* p, const Ty& val, const Opts&... opts) {
    wmembuffer buf(p);
    return to_basic_string(buf, val, fmt_opts(opts...)).curr();
}

template<typename Ty, typename... Opts>
char* to_chars_n(char* p, std::size_t n, const Ty& val, const Opts&... opts) {
    inline_dynbuffer buf;
    to_basic_string(buf, val, fmt_opts(opts...));
    if (buf.size() > n) { throw format_error("insufficient buffer capacity"); }
    return std::copy_n(buf.data(), buf.size(), p);
}

template<typename Ty, typename... Opts>
wchar_t* to_wchars_n(wchar_t* p, std::size_t n, const Ty& val, const Opts&... opts) {
    inline_wdynbuffer buf;
    to_basic_string(buf, val, fmt_opts(opts...));
    if (buf.size() > n) { throw format_error("insufficient buffer capacity"); }
    return std::copy_n(buf.data(), buf.size(), p);
}

}  // namespace rdx
