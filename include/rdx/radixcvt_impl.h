#pragma once

#include "extended_float.h"

#include <iterator>

namespace rdx {
namespace scvt {

inline void check_radix(unsigned radix) {
    if (radix < min_radix || radix > max_radix) { throw format_error("invalid radix"); }
}

// Digit pairs for all remainders `0..radix^2-1`, two characters per remainder
RDX_EXPORT const char* get_digit_pairs(unsigned radix, bool upper) noexcept;

// `divisor` is the largest power `radix^step` which fits in 64 bits, `ctlz` is its count of leading zero bits
struct radix_divisor_t {
    std::uint64_t divisor;
    unsigned step;
    unsigned ctlz;
};

RDX_EXPORT radix_divisor_t get_radix_divisor(unsigned radix) noexcept;

// ---- 128-bit division

// divides `hi:lo` by the divisor, `hi` must be less than the divisor
inline std::uint64_t udivrem128(std::uint64_t hi, std::uint64_t lo, const radix_divisor_t& d,
                                std::uint64_t& rem) noexcept {
    assert(hi < d.divisor);
#if RDX_USE_COMPILER_128BIT_EXTENSIONS != 0 && defined(__GNUC__) && defined(__x86_64__)
    const gcc_ints::uint128 num = (static_cast<gcc_ints::uint128>(hi) << 64) | lo;
    const std::uint64_t q = static_cast<std::uint64_t>(num / d.divisor);
    rem = lo - q * d.divisor;
    return q;
#else
    // normalize divisor and divide by 32-bit halves
    const unsigned s = d.ctlz;
    const std::uint64_t v = d.divisor << s, b = 1ull << 32;
    if (s) { hi = (hi << s) | (lo >> (64 - s)), lo <<= s; }
    const std::uint64_t vn1 = hi32(v), vn0 = lo32(v), un1 = hi32(lo), un0 = lo32(lo);

    std::uint64_t q1 = hi / vn1, rhat = hi - q1 * vn1;
    while (q1 >= b || q1 * vn0 > make64(rhat, un1)) {
        --q1, rhat += vn1;
        if (rhat >= b) { break; }
    }

    const std::uint64_t un21 = make64(hi, un1) - q1 * v;
    std::uint64_t q0 = un21 / vn1;
    rhat = un21 - q0 * vn1;
    while (q0 >= b || q0 * vn0 > make64(rhat, un0)) {
        --q0, rhat += vn1;
        if (rhat >= b) { break; }
    }

    rem = (make64(un21, un0) - q0 * v) >> s;
    return make64(q1, q0);
#endif
}

inline uint128_t udivrem128(const uint128_t& x, const radix_divisor_t& d, std::uint64_t& rem) noexcept {
    const std::uint64_t q_hi = x.hi / d.divisor;
    return uint128_t{q_hi, udivrem128(x.hi - q_hi * d.divisor, x.lo, d, rem)};
}

// ---- integer digits

template<typename CharT, typename Ty>
CharT* gen_radix_digits(CharT* p, Ty v, unsigned radix, const char* pairs) noexcept {
    static_assert(std::is_same<Ty, std::uint32_t>::value || std::is_same<Ty, std::uint64_t>::value,
                  "32- or 64-bit unsigned integer is expected");
    const Ty radix2 = radix * radix, radix4 = radix2 * radix2;
    while (v >= radix4) {
        const Ty r = v % radix4;
        v /= radix4;
        const unsigned r1 = 2 * static_cast<unsigned>(r / radix2), r2 = 2 * static_cast<unsigned>(r % radix2);
        *--p = pairs[r2 + 1], *--p = pairs[r2];
        *--p = pairs[r1 + 1], *--p = pairs[r1];
    }
    while (v >= radix2) {
        const unsigned r = 2 * static_cast<unsigned>(v % radix2);
        v /= radix2;
        *--p = pairs[r + 1], *--p = pairs[r];
    }
    const unsigned r = 2 * static_cast<unsigned>(v);
    *--p = pairs[r + 1];
    if (v >= radix) { *--p = pairs[r]; }
    return p;
}

// writes exactly `n` digits padding with zeroes
template<typename CharT>
CharT* gen_radix_digits_n(CharT* p, std::uint64_t v, unsigned n, unsigned radix, const char* pairs) noexcept {
    CharT* p0 = p - n;
    p = gen_radix_digits(p, v, radix, pairs);
    assert(p >= p0);
    while (p != p0) { *--p = '0'; }
    return p;
}

template<typename CharT>
CharT* gen_radix_digits(CharT* p, uint128_t v, unsigned radix, const char* pairs) noexcept {
    if (!v.hi) { return gen_radix_digits(p, v.lo, radix, pairs); }
    const radix_divisor_t d = get_radix_divisor(radix);
    std::uint64_t rem = 0;
    v = udivrem128(v, d, rem);
    p = gen_radix_digits_n(p, rem, d.step, radix, pairs);
    if (v.hi) {
        v = udivrem128(v, d, rem);
        p = gen_radix_digits_n(p, rem, d.step, radix, pairs);
        assert(!v.hi);
    }
    return gen_radix_digits(p, v.lo, radix, pairs);
}

// Writes `val` into the tail of the buffer, returns the index of the first written character
template<typename CharT, typename Ty>
std::size_t fmt_radix_integer(Ty val, unsigned radix, const char* pairs, CharT* buf, std::size_t size) noexcept {
    assert(radix >= min_radix && radix <= max_radix);
    assert(size >= max_radix_digits(8 * sizeof(Ty), radix));
    return static_cast<std::size_t>(gen_radix_digits(buf + size, val, radix, pairs) - buf);
}

// ---- floating-point digits

class fp_radix_fmt_t {
 public:
    // Generates digits of `fp` exactly: `delta_exp` is the binary exponent of the half distance
    // to the next representable value, the previous one is twice closer if `closer_below` is set
    RDX_EXPORT fp_radix_fmt_t(const fp_ext_t& fp, int delta_exp, bool closer_below, unsigned radix) noexcept;

    // `fp` is decomposed from the type with `bpm`-bit mantissa and `exp_max` exponent field limit,
    // neighbours are taken from the same type
    static fp_radix_fmt_t from_bits(const fp_ext_t& fp, unsigned radix, unsigned bpm, int exp_max) noexcept {
        return fp_radix_fmt_t(fp, fp.exp - 1,
                              fp.frac == 1ull << bpm && fp.exp > 1 - (exp_max >> 1) - static_cast<int>(bpm), radix);
    }

    bool is_scientific() const noexcept { return scientific_; }
    int get_exp() const noexcept { return exp_; }

    unsigned get_len() const noexcept {
        const unsigned n_int = scientific_ ? 1 : n_int_;
        unsigned len = n_digs_ + (n_digs_ > n_int ? 1 : 2);
        if (scientific_) {
            unsigned e = static_cast<unsigned>(exp_ < 0 ? -exp_ : exp_);
            len += exp_ < 0 ? 3 : 2;
            while (e >= radix_) { e /= radix_, ++len; }
        }
        return len;
    }

    template<typename CharT>
    void generate(CharT* p, bool uppercase) const noexcept;

 private:
    enum : unsigned { digs_buf_size = 2200 };
    unsigned radix_;
    int exp_ = 0;
    bool scientific_ = false;
    unsigned first_ = 0;
    unsigned n_int_ = 0;
    unsigned n_digs_ = 0;
    std::uint8_t digs_buf_[digs_buf_size];
};

template<typename CharT>
void fp_radix_fmt_t::generate(CharT* p, bool uppercase) const noexcept {
    const char* digs = get_digit_chars(uppercase);
    const std::uint8_t* d = digs_buf_ + first_;
    unsigned n_int = n_int_;
    if (scientific_) {
        p = gen_radix_digits(p, static_cast<std::uint32_t>(exp_ < 0 ? -exp_ : exp_), radix_,
                             get_digit_pairs(radix_, uppercase));
        if (exp_ < 0) { *--p = '-'; }
        *--p = radix_ < 15 ? (uppercase ? 'E' : 'e') : '^';
        n_int = 1;
    }
    if (n_digs_ > n_int) {
        for (unsigned n = n_digs_; n > n_int; --n) { *--p = digs[d[n - 1]]; }
    } else {
        *--p = '0';
    }
    *--p = '.';
    for (unsigned n = n_int; n > 0; --n) { *--p = digs[d[n - 1]]; }
}

// Writes finite positive `val` starting at `buf`, returns the end of written characters
template<typename CharT, typename Ty>
CharT* fmt_radix_float(CharT* buf, std::size_t size, Ty val, unsigned radix, bool uppercase) noexcept {
    assert(radix >= min_radix && radix <= max_radix);
    assert(size >= max_radix_float_len);
    const fp_radix_fmt_t fp = fp_radix_fmt_t::from_bits(fp_ext_t::from_float(val), radix,
                                                        fp_traits<Ty>::bits_per_mantissa, fp_traits<Ty>::exp_max);
    const unsigned len = fp.get_len();
    assert(len <= size);
    fp.generate(buf + len, uppercase);
    return buf + len;
}

// ---- integer

template<typename Ty>
bool make_magnitude(Ty& val, bool is_signed) noexcept {
    if (is_signed && (val & (static_cast<Ty>(1) << (8 * sizeof(Ty) - 1)))) {
        val = ~val + 1;  // negative value
        return true;
    }
    return false;
}

inline bool make_magnitude(uint128_t&, bool) noexcept { return false; }

template<typename CharT, typename Ty>
void fmt_integer_common(basic_membuffer<CharT>& s, Ty val, bool is_signed, fmt_opts fmt) {
    check_radix(fmt.radix);
    const bool uppercase = !!(fmt.flags & fmt_flags::uppercase);
    CharT buf[1 + max_int_digits<Ty>::value];
    CharT* p = buf + 1;
    const bool neg = make_magnitude(val, is_signed);
    p += fmt_radix_integer(val, fmt.radix, get_digit_pairs(fmt.radix, uppercase), p, max_int_digits<Ty>::value);
    if (neg) {
        *--p = '-';
    } else if (!!(fmt.flags & fmt_flags::sign_pos)) {
        *--p = '+';
    }
    s.append(p, std::end(buf));
}

// ---- float

template<typename CharT>
void fmt_float_common(basic_membuffer<CharT>& s, std::uint64_t u64, fmt_opts fmt, unsigned bpm, int exp_max) {
    check_radix(fmt.radix);
    const bool uppercase = !!(fmt.flags & fmt_flags::uppercase);
    const std::uint64_t sign_bit = static_cast<std::uint64_t>(1 + exp_max) << bpm;
    if (u64 & sign_bit) {
        s.push_back('-');  // negative value
        u64 &= ~sign_bit;
    } else if (!!(fmt.flags & fmt_flags::sign_pos)) {
        s.push_back('+');
    }

    if (static_cast<int>((u64 >> bpm) & exp_max) == exp_max) {
        // Print infinity or NaN
        const char* sval = (u64 & ((1ull << bpm) - 1)) == 0 ? (uppercase ? "INF" : "inf") :
                                                               (uppercase ? "NAN" : "nan");
        for (; *sval; ++sval) { s.push_back(*sval); }
        return;
    }

    if (!u64) {
        s.push_back('0'), s.push_back('.'), s.push_back('0');
        return;
    }

    const fp_radix_fmt_t fp = fp_radix_fmt_t::from_bits(fp_ext_t::from_bits(u64, bpm, exp_max), fmt.radix, bpm,
                                                        exp_max);
    const unsigned len = fp.get_len();
    if (s.avail() >= len) {
        fp.generate(s.curr() + len, uppercase);
        s.advance(len);
    } else {
        CharT buf[max_radix_float_len];
        assert(len <= max_radix_float_len);
        fp.generate(buf + len, uppercase);
        s.append(buf, buf + len);
    }
}

}  // namespace scvt
}  // namespace rdx
