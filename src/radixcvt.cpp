#include "rdx/radixcvt_impl.h"

#include <algorithm>
#include <cmath>

namespace rdx {

#if __cplusplus < 201703L
namespace detail {
const char_tbl_t g_char_tbl;
}
#endif  // __cplusplus < 201703L

format_error::format_error(const char* message) : std::runtime_error(message) {}
format_error::format_error(const std::string& message) : std::runtime_error(message) {}
const char* format_error::what() const noexcept { return std::runtime_error::what(); }

namespace scvt {

namespace {

struct digit_pairs_tbl_t {
    // two characters for each of `radix^2` remainders of each radix
    enum : unsigned { radix_tbl_size = 2 * (max_radix * (max_radix + 1) * (2 * max_radix + 1) / 6 - 1) };
    std::array<unsigned, max_radix + 1> offset{};
    std::array<char, radix_tbl_size> lower{};
    std::array<char, radix_tbl_size> upper{};
    RDX_CONSTEXPR digit_pairs_tbl_t() {
        unsigned pos = 0;
        for (unsigned radix = min_radix; radix <= max_radix; ++radix) {
            offset[radix] = pos;
            for (unsigned hi = 0; hi < radix; ++hi) {
                for (unsigned lo = 0; lo < radix; ++lo, pos += 2) {
                    lower[pos] = hi < 10 ? '0' + hi : 'a' + hi - 10;
                    lower[pos + 1] = lo < 10 ? '0' + lo : 'a' + lo - 10;
                    upper[pos] = hi < 10 ? '0' + hi : 'A' + hi - 10;
                    upper[pos + 1] = lo < 10 ? '0' + lo : 'A' + lo - 10;
                }
            }
        }
    }
};

struct radix_divisor_tbl_t {
    std::array<radix_divisor_t, max_radix + 1> divisors{};
    RDX_CONSTEXPR radix_divisor_tbl_t() {
        for (unsigned radix = min_radix; radix <= max_radix; ++radix) {
            radix_divisor_t& d = divisors[radix];
            d.divisor = radix, d.step = 1, d.ctlz = 0;
            while (d.divisor <= ~0ull / radix) { d.divisor *= radix, ++d.step; }
            while (!(d.divisor & (msb64 >> d.ctlz))) { ++d.ctlz; }
        }
    }
};

const RDX_CONSTEXPR digit_pairs_tbl_t g_digit_pairs_tbl{};
const RDX_CONSTEXPR radix_divisor_tbl_t g_radix_divisor_tbl{};

}  // namespace

const char* get_digit_pairs(unsigned radix, bool upper) noexcept {
    assert(radix >= min_radix && radix <= max_radix);
    return (upper ? g_digit_pairs_tbl.upper.data() : g_digit_pairs_tbl.lower.data()) + g_digit_pairs_tbl.offset[radix];
}

radix_divisor_t get_radix_divisor(unsigned radix) noexcept {
    assert(radix >= min_radix && radix <= max_radix);
    return g_radix_divisor_tbl.divisors[radix];
}

// --------------------------

namespace {

// Multi-word unsigned integer, least significant word first
enum : unsigned { bignum_max_size = 18 };

struct bignum_t {
    std::uint64_t x[bignum_max_size]{};
    unsigned sz = 0;
};

inline void bignum_trim(bignum_t& b) {
    while (b.sz > 0 && !b.x[b.sz - 1]) { --b.sz; }
}

void bignum_set_shifted(bignum_t& b, std::uint64_t v, unsigned shift) {
    const unsigned n = shift / 64, s = shift % 64;
    assert(n + 2 <= bignum_max_size);
    std::fill_n(b.x, n, 0);
    b.x[n] = v << s, b.x[n + 1] = s ? v >> (64 - s) : 0;
    b.sz = n + 2;
    bignum_trim(b);
}

void bignum_mul(bignum_t& b, unsigned mul) {
    std::uint64_t higher = 0;
    for (unsigned n = 0; n < b.sz; ++n) {
        std::uint64_t hi;
        const std::uint64_t lo = umul128(b.x[n], mul, hi);
        b.x[n] = lo + higher;
        higher = hi + (b.x[n] < lo);
    }
    if (higher) {
        assert(b.sz < bignum_max_size);
        b.x[b.sz++] = higher;
    }
    bignum_trim(b);
}

void bignum_add(bignum_t& b, const bignum_t& other) {
    if (b.sz < other.sz) { std::fill(b.x + b.sz, b.x + other.sz, 0), b.sz = other.sz; }
    unsigned carry = 0, n = 0;
    for (; n < other.sz; ++n) {
        const std::uint64_t sum = b.x[n] + other.x[n] + carry;
        carry = carry ? sum <= b.x[n] : sum < b.x[n];
        b.x[n] = sum;
    }
    for (; carry && n < b.sz; ++n) { carry = !++b.x[n]; }
    if (carry) {
        assert(b.sz < bignum_max_size);
        b.x[b.sz++] = 1;
    }
}

// `b` must not be less than `other`
void bignum_sub(bignum_t& b, const bignum_t& other) {
    unsigned borrow = 0, n = 0;
    for (; n < other.sz; ++n) {
        const std::uint64_t x = b.x[n];
        b.x[n] = x - other.x[n] - borrow;
        borrow = borrow ? x <= other.x[n] : x < other.x[n];
    }
    for (; borrow && n < b.sz; ++n) { borrow = !b.x[n]--; }
    assert(!borrow);
    bignum_trim(b);
}

int bignum_cmp(const bignum_t& lhs, const bignum_t& rhs) {
    if (lhs.sz != rhs.sz) { return lhs.sz < rhs.sz ? -1 : 1; }
    for (unsigned n = lhs.sz; n > 0; --n) {
        if (lhs.x[n - 1] != rhs.x[n - 1]) { return lhs.x[n - 1] < rhs.x[n - 1] ? -1 : 1; }
    }
    return 0;
}

// compares with `2^e`
int bignum_cmp_pow2(const bignum_t& b, int e) {
    if (e < 0) { return b.sz ? 1 : -1; }
    const unsigned n = static_cast<unsigned>(e) / 64;
    const std::uint64_t bit = 1ull << (e % 64);
    if (b.sz != n + 1) { return b.sz < n + 1 ? -1 : 1; }
    if (b.x[n] != bit) { return b.x[n] < bit ? -1 : 1; }
    for (unsigned k = 0; k < n; ++k) {
        if (b.x[k]) { return 1; }
    }
    return 0;
}

// divides by a small divisor, returns the remainder
unsigned bignum_divrem(bignum_t& b, unsigned div) {
    std::uint64_t rem = 0;
    for (unsigned n = b.sz; n > 0; --n) {
        const std::uint64_t x = b.x[n - 1];
        std::uint64_t cur = make64(rem, hi32(x));
        const std::uint64_t q_hi = cur / div;
        cur = make64(cur % div, lo32(x));
        b.x[n - 1] = make64(q_hi, cur / div), rem = cur % div;
    }
    bignum_trim(b);
    return static_cast<unsigned>(rem);
}

// cuts off and returns bits above `k`-th, these must fit in one word
unsigned bignum_split(bignum_t& b, unsigned k) {
    const unsigned n = k / 64, s = k % 64;
    if (b.sz <= n) { return 0; }
    assert(b.sz <= n + 2);
    std::uint64_t higher = b.x[n] >> s;
    if (s && n + 1 < b.sz) { higher |= b.x[n + 1] << (64 - s); }
    b.x[n] &= (1ull << s) - 1;
    b.sz = n + 1;
    bignum_trim(b);
    return static_cast<unsigned>(higher);
}

bignum_t bignum_from(std::uint64_t v) {
    bignum_t b;
    bignum_set_shifted(b, v, 0);
    return b;
}

}  // namespace

fp_radix_fmt_t::fp_radix_fmt_t(const fp_ext_t& fp, int delta_exp, bool closer_below, unsigned radix) noexcept
    : radix_(radix) {
    assert(radix >= min_radix && radix <= max_radix);
    assert(fp.frac != 0);
    const double value = std::ldexp(static_cast<double>(fp.frac), fp.exp);
    const int delta_lo_exp = closer_below ? delta_exp - 1 : delta_exp;
    const unsigned center = digs_buf_size / 2;
    unsigned int_pos = center, frac_pos = center;

    if (fp.exp <= 0) {
        // Integral part fits in 64 bits, fraction and deltas are integers scaled by `2^k`
        const unsigned k = static_cast<unsigned>(-std::min(fp.exp, delta_lo_exp));
        std::uint64_t integer = fp.exp > -64 ? fp.frac >> -fp.exp : 0;
        const std::uint64_t frac_bits = fp.exp > -64 ? fp.frac & ((1ull << -fp.exp) - 1) : fp.frac;
        bignum_t fraction, delta, delta_lo;
        bignum_set_shifted(fraction, frac_bits, static_cast<unsigned>(fp.exp + static_cast<int>(k)));
        bignum_set_shifted(delta, 1, static_cast<unsigned>(delta_exp + static_cast<int>(k)));
        bignum_set_shifted(delta_lo, 1, static_cast<unsigned>(delta_lo_exp + static_cast<int>(k)));

        // Generate fractional digits while they are significant
        if (bignum_cmp(fraction, delta_lo) >= 0) {
            do {
                bignum_mul(fraction, radix), bignum_mul(delta, radix), bignum_mul(delta_lo, radix);
                const unsigned dig = bignum_split(fraction, k);
                digs_buf_[frac_pos++] = static_cast<std::uint8_t>(dig);
                // round to even
                const int half = bignum_cmp_pow2(fraction, static_cast<int>(k) - 1);
                if (half > 0 || (half == 0 && (dig & 1))) {
                    bignum_t upper = fraction;
                    bignum_add(upper, delta);
                    if (bignum_cmp_pow2(upper, static_cast<int>(k)) > 0) {
                        while (true) {
                            if (frac_pos == center) {
                                ++integer;  // carry to integral part
                                break;
                            }
                            const unsigned last = digs_buf_[--frac_pos] + 1;
                            if (last < radix) {
                                digs_buf_[frac_pos++] = static_cast<std::uint8_t>(last);
                                break;
                            }
                        }
                        break;
                    }
                }
            } while (bignum_cmp(fraction, delta_lo) >= 0 && frac_pos < digs_buf_size);
        }

        // Generate integral digits
        do {
            digs_buf_[--int_pos] = static_cast<std::uint8_t>(integer % radix);
            integer /= radix;
        } while (integer > 0);
    } else {
        // Integral value, all of its digits are generated exactly
        bignum_t integer;
        bignum_set_shifted(integer, fp.frac, static_cast<unsigned>(fp.exp));
        do {
            digs_buf_[--int_pos] = static_cast<std::uint8_t>(bignum_divrem(integer, radix));
        } while (integer.sz);

        // Find the longest run of low digits which can be rounded off to zeroes without leaving
        // the neighbourhood of the value, `rem` is the value of these digits, `unit` is `radix^n`
        const unsigned len = center - int_pos;
        unsigned n = 0;
        bignum_t rem = bignum_from(0), unit = bignum_from(1);
        const auto is_rounded_off = [delta_exp, delta_lo_exp](const bignum_t& r, const bignum_t& u) {
            if (bignum_cmp_pow2(r, delta_lo_exp) < 0) { return true; }
            bignum_t up = u;
            bignum_sub(up, r);
            return bignum_cmp_pow2(up, delta_exp) < 0;
        };
        while (n + 1 < len) {
            bignum_t next_rem = unit, next_unit = unit;
            bignum_mul(next_rem, digs_buf_[center - 1 - n]);
            bignum_add(next_rem, rem);
            bignum_mul(next_unit, radix);
            if (!is_rounded_off(next_rem, next_unit)) { break; }
            rem = next_rem, unit = next_unit, ++n;
        }

        if (n > 0) {
            bignum_t up = unit;
            bignum_sub(up, rem);
            const bool down_ok = bignum_cmp_pow2(rem, delta_lo_exp) < 0;
            const bool up_ok = bignum_cmp_pow2(up, delta_exp) < 0;
            // round to nearest, ties to even
            bool round_up = false;
            const int cmp = bignum_cmp(rem, up);
            if (cmp == 0) {
                round_up = (digs_buf_[center - 1 - n] & 1) ? up_ok : !down_ok;
            } else {
                round_up = cmp < 0 ? !down_ok : up_ok;
            }
            std::fill_n(&digs_buf_[center - n], n, 0);
            if (round_up) {
                unsigned pos = center - 1 - n;
                while (true) {
                    if (pos < int_pos) {
                        digs_buf_[--int_pos] = 1;  // carry to a new digit
                        break;
                    }
                    if (++digs_buf_[pos] < radix) { break; }
                    digs_buf_[pos--] = 0;
                }
            }
        }
    }

    if (value > 1e-5 && value < 1e9) {
        n_int_ = center - int_pos;
        unsigned n_frac = std::min(frac_pos - center, max_radix_float_digits - n_int_);
        while (n_frac && !digs_buf_[center + n_frac - 1]) { --n_frac; }
        first_ = int_pos, n_digs_ = n_int_ + n_frac;
        return;
    }

    scientific_ = true;
    unsigned first = int_pos;
    if (value < 1) {
        assert(frac_pos > center);
        // estimate the exponent and move to the first significant digit
        exp_ = static_cast<int>(std::floor(std::log(value) / std::log(static_cast<double>(radix))));
        first = static_cast<unsigned>(std::max<int>(center, std::min<int>(center - exp_ - 1, frac_pos - 1)));
        while (first > center && digs_buf_[first - 1]) { --first; }
        while (first + 1 < frac_pos && !digs_buf_[first]) { ++first; }
    }
    exp_ = static_cast<int>(center) - static_cast<int>(first) - 1;

    unsigned last = std::min(frac_pos, first + max_radix_float_digits + 1);
    while (last > first + 1 && !digs_buf_[last - 1]) { --last; }
    first_ = first, n_int_ = 1, n_digs_ = last - first;
}

template RDX_EXPORT void fmt_integer_common(membuffer&, std::uint32_t, bool, fmt_opts);
template RDX_EXPORT void fmt_integer_common(membuffer&, std::uint64_t, bool, fmt_opts);
template RDX_EXPORT void fmt_integer_common(membuffer&, uint128_t, bool, fmt_opts);
template RDX_EXPORT void fmt_float_common(membuffer&, std::uint64_t, fmt_opts, unsigned, int);

template RDX_EXPORT void fmt_integer_common(wmembuffer&, std::uint32_t, bool, fmt_opts);
template RDX_EXPORT void fmt_integer_common(wmembuffer&, std::uint64_t, bool, fmt_opts);
template RDX_EXPORT void fmt_integer_common(wmembuffer&, uint128_t, bool, fmt_opts);
template RDX_EXPORT void fmt_float_common(wmembuffer&, std::uint64_t, fmt_opts, unsigned, int);

}  // namespace scvt

}  // namespace rdx
