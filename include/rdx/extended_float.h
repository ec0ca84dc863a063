#pragma once

#include "radixcvt.h"

#include <array>
#include <utility>

namespace rdx {
namespace scvt {

const RDX_CONSTEXPR std::uint64_t msb64 = 1ull << 63;
inline RDX_CONSTEXPR std::uint64_t lo32(std::uint64_t x) { return x & 0xffffffff; }
inline RDX_CONSTEXPR std::uint64_t hi32(std::uint64_t x) { return x >> 32; }
template<typename TyH, typename TyL>
RDX_CONSTEXPR std::uint64_t make64(TyH hi, TyL lo) {
    return (static_cast<std::uint64_t>(hi) << 32) | static_cast<std::uint64_t>(lo);
}

inline std::uint64_t umul128(std::uint64_t x, std::uint64_t y, std::uint64_t& result_hi) noexcept {
#if RDX_USE_COMPILER_128BIT_EXTENSIONS != 0 && defined(_MSC_VER) && defined(_M_X64)
    return _umul128(x, y, &result_hi);
#elif RDX_USE_COMPILER_128BIT_EXTENSIONS != 0 && defined(__GNUC__) && defined(__x86_64__)
    gcc_ints::uint128 p = static_cast<gcc_ints::uint128>(x) * y;
    result_hi = static_cast<std::uint64_t>(p >> 64);
    return static_cast<std::uint64_t>(p);
#else
    const std::uint64_t lower = lo32(x) * lo32(y), higher = hi32(x) * hi32(y);
    const std::uint64_t mid1 = lo32(x) * hi32(y), mid2 = hi32(x) * lo32(y) + hi32(lower);
    const std::uint64_t t = lo32(mid1) + lo32(mid2);
    result_hi = higher + hi32(mid1) + hi32(mid2) + hi32(t);
    return make64(lo32(t), lo32(lower));
#endif
}

// --------------------------

// Multiplication parameters for radix 2-36: `limit` is the largest fraction which can be multiplied
// without overflow plus one, zero for powers of two; `shift` is the exponent increment for powers of two,
// or the bit length of the radix otherwise
struct radix_mul_tbl_t {
    std::array<std::uint64_t, max_radix + 1> limit{};
    std::array<unsigned, max_radix + 1> shift{};
    RDX_CONSTEXPR radix_mul_tbl_t() {
        for (unsigned n = min_radix; n <= max_radix; ++n) {
            unsigned log = 0;
            while ((2u << log) <= n) { ++log; }
            if ((1u << log) == n) {
                limit[n] = 0, shift[n] = log;
            } else {
                limit[n] = ~0ull / n + 1, shift[n] = log + 1;
            }
        }
    }
};
#if __cplusplus < 201703L
extern RDX_EXPORT const radix_mul_tbl_t g_radix_mul_tbl;
#else   // __cplusplus < 201703L
static constexpr radix_mul_tbl_t g_radix_mul_tbl{};
#endif  // __cplusplus < 201703L

// Extended precision floating-point value `frac * 2^exp`
struct fp_ext_t {
    std::uint64_t frac;
    std::int32_t exp;

    template<typename Ty, typename = std::enable_if_t<std::is_unsigned<Ty>::value && sizeof(Ty) <= sizeof(std::uint64_t)>>
    static RDX_CONSTEXPR fp_ext_t from_integer(Ty i) noexcept {
        return fp_ext_t{i, 0};
    }

    // decomposes sign-stripped IEEE-754 bit pattern (not infinity or NaN)
    RDX_EXPORT static fp_ext_t from_bits(std::uint64_t u64, unsigned bpm, int exp_max) noexcept;

    template<typename Ty>
    static fp_ext_t from_float(Ty f) noexcept {
        return from_bits(fp_traits<Ty>::to_u64(f), fp_traits<Ty>::bits_per_mantissa, fp_traits<Ty>::exp_max);
    }

    // nearest IEEE-754 bit pattern, rounding half to even
    RDX_NODISCARD RDX_EXPORT std::uint64_t to_bits(unsigned bpm, int exp_max) const noexcept;

    template<typename Ty>
    RDX_NODISCARD Ty as_float() const noexcept {
        return fp_traits<Ty>::from_u64(to_bits(fp_traits<Ty>::bits_per_mantissa, fp_traits<Ty>::exp_max));
    }

    RDX_EXPORT void normalize() noexcept;

    RDX_NODISCARD RDX_EXPORT fp_ext_t add(const fp_ext_t& other) const noexcept;

    RDX_NODISCARD fp_ext_t add_integer(std::uint64_t i) const noexcept { return add(from_integer(i)); }

    RDX_NODISCARD fp_ext_t add_unchecked(const fp_ext_t& other) const noexcept {
        assert(exp == other.exp);
        const std::uint64_t sum = frac + other.frac;
        if (sum < frac) { return fp_ext_t{(frac >> 1) + (other.frac >> 1), exp + 1}; }
        return fp_ext_t{sum, exp};
    }

    RDX_NODISCARD fp_ext_t sub_unchecked(const fp_ext_t& other) const noexcept {
        assert(exp == other.exp && frac >= other.frac);
        return fp_ext_t{frac - other.frac, exp};
    }

    // upper half of the product rounded half up
    RDX_NODISCARD fp_ext_t fast_multiply(const fp_ext_t& other) const noexcept {
        std::uint64_t hi;
        const std::uint64_t lo = umul128(frac, other.frac, hi);
        return fp_ext_t{hi + (lo >> 63), exp + other.exp + 64};
    }

    RDX_NODISCARD fp_ext_t mul_radix_unchecked(unsigned n) const noexcept {
        assert(n >= min_radix && n <= max_radix);
        const int shift = static_cast<int>(g_radix_mul_tbl.shift[n]);
        const std::uint64_t limit = g_radix_mul_tbl.limit[n];
        if (!limit) { return fp_ext_t{frac, exp + shift}; }
        if (frac < limit) { return fp_ext_t{frac * n, exp}; }
        return fp_ext_t{(frac >> shift) * n, exp + shift};
    }

    // the value is returned unchanged if its exponent has already left `double` range
    RDX_NODISCARD fp_ext_t mul_radix(unsigned n) const noexcept {
        return exp < fp_traits<double>::max_exp ? mul_radix_unchecked(n) : *this;
    }

    // lower and upper halfway points to the neighbouring values of `bpm`-bit mantissa type,
    // sharing the exponent of the normalized upper one
    RDX_NODISCARD RDX_EXPORT std::pair<fp_ext_t, fp_ext_t> get_boundaries(unsigned bpm) const noexcept;

    template<typename Ty = double>
    RDX_NODISCARD std::pair<fp_ext_t, fp_ext_t> normalized_boundaries() const noexcept {
        return get_boundaries(fp_traits<Ty>::bits_per_mantissa);
    }

    friend bool operator==(const fp_ext_t& lhs, const fp_ext_t& rhs) noexcept {
        return lhs.frac == rhs.frac && lhs.exp == rhs.exp;
    }
    friend bool operator!=(const fp_ext_t& lhs, const fp_ext_t& rhs) noexcept { return !(lhs == rhs); }
};

// --------------------------

// Cached powers of ten `10^(cached_pow10_first + cached_pow10_step * index)`
const RDX_CONSTEXPR unsigned cached_pow10_count = 87;
const RDX_CONSTEXPR int cached_pow10_first = -348;
const RDX_CONSTEXPR int cached_pow10_step = 8;

RDX_EXPORT fp_ext_t get_cached_pow10(unsigned index) noexcept;

// Finds the power of ten which brings normalized value with binary exponent `exp2` into
// the [-60, -32] exponent window, returns the power and its decimal exponent
RDX_EXPORT std::pair<fp_ext_t, int> find_cached_pow10(int exp2) noexcept;

}  // namespace scvt
}  // namespace rdx
