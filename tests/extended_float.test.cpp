#include <catch2/catch.hpp>
#include <rdx/extended_float.h>

#include <limits>

using rdx::scvt::fp_ext_t;
using rdx::scvt::fp_traits;

#define TEST(name) TEST_CASE("extended-float " name, "[rdx][extended_float]")  // NOLINT

namespace {

const std::uint64_t pow2_63 = 1ull << 63;

fp_ext_t normalized(fp_ext_t fp) {
    fp.normalize();
    return fp;
}

const std::uint64_t g_integers[] = {
    0,          1,          7,          15,         112,        119,        127,       240,      247,
    255,        2032,       2039,       2047,       4080,       4087,       4095,      65520,    65527,
    65535,      1048560,    1048567,    1048575,    16777200,   16777207,   16777215,  268435440, 268435447,
    268435455,  4294967280, 4294967287, 4294967295, 18446744073709551615ull,
};

const double g_floats[] = {
    1e-40, 2e-40, 1e-35, 2e-35, 1e-30, 2e-30, 1e-25, 2e-25, 1e-20, 2e-20, 1e-15, 2e-15, 1e-10,
    2e-10, 1e-5,  2e-5,  1e0,   2e0,   1e5,   2e5,   1e10,  2e10,  1e15,  2e15,  1e20,  2e20,
};

}  // namespace

TEST("traits") {
    REQUIRE(static_cast<int>(fp_traits<float>::exp_max) == 255);
    REQUIRE(static_cast<int>(fp_traits<float>::exp_bias) == 127);
    REQUIRE(static_cast<int>(fp_traits<float>::denormal_exp) == -149);
    REQUIRE(static_cast<int>(fp_traits<float>::max_exp) == 105);
    REQUIRE(static_cast<std::uint64_t>(fp_traits<float>::mantissa_mask) == 0x7fffff);
    REQUIRE(static_cast<std::uint64_t>(fp_traits<float>::hidden_bit) == 0x800000);
    REQUIRE(static_cast<int>(fp_traits<double>::exp_max) == 2047);
    REQUIRE(static_cast<int>(fp_traits<double>::exp_bias) == 1023);
    REQUIRE(static_cast<int>(fp_traits<double>::denormal_exp) == -1074);
    REQUIRE(static_cast<int>(fp_traits<double>::max_exp) == 972);
    REQUIRE(static_cast<std::uint64_t>(fp_traits<double>::hidden_bit) == 1ull << 52);
    REQUIRE(fp_traits<float>::to_u64(1.f) == 0x3f800000);
    REQUIRE(fp_traits<double>::to_u64(-2.) == 0xc000000000000000ull);
    REQUIRE(fp_traits<double>::from_u64(0x3ff8000000000000ull) == 1.5);
    REQUIRE(fp_traits<float>::from_u64(0x7f7fffff) == std::numeric_limits<float>::max());
}

TEST("from integer") {
    REQUIRE(fp_ext_t::from_integer(0u) == (fp_ext_t{0, 0}));
    REQUIRE(fp_ext_t::from_integer(static_cast<std::uint8_t>(255)) == (fp_ext_t{255, 0}));
    REQUIRE(fp_ext_t::from_integer(static_cast<std::uint16_t>(65535)) == (fp_ext_t{65535, 0}));
    REQUIRE(fp_ext_t::from_integer(~0ull) == (fp_ext_t{~0ull, 0}));
}

TEST("from float") {
    SECTION("float") {
        REQUIRE(fp_ext_t::from_float(0.f) == (fp_ext_t{0, -149}));
        REQUIRE(fp_ext_t::from_float(1e-45f) == (fp_ext_t{1, -149}));
        REQUIRE(fp_ext_t::from_float(1e-40f) == (fp_ext_t{71362, -149}));
        REQUIRE(fp_ext_t::from_float(2e-40f) == (fp_ext_t{142725, -149}));
        REQUIRE(fp_ext_t::from_float(1e-20f) == (fp_ext_t{12379400, -90}));
        REQUIRE(fp_ext_t::from_float(2e-20f) == (fp_ext_t{12379400, -89}));
        REQUIRE(fp_ext_t::from_float(1.f) == (fp_ext_t{8388608, -23}));
        REQUIRE(fp_ext_t::from_float(2.f) == (fp_ext_t{8388608, -22}));
        REQUIRE(fp_ext_t::from_float(1e20f) == (fp_ext_t{11368684, 43}));
        REQUIRE(fp_ext_t::from_float(2e20f) == (fp_ext_t{11368684, 44}));
        REQUIRE(fp_ext_t::from_float(3.402823e38f) == (fp_ext_t{16777213, 104}));
    }
    SECTION("double") {
        REQUIRE(fp_ext_t::from_float(0.) == (fp_ext_t{0, -1074}));
        REQUIRE(fp_ext_t::from_float(5e-324) == (fp_ext_t{1, -1074}));
        REQUIRE(fp_ext_t::from_float(1e-250) == (fp_ext_t{6448907850777164, -883}));
        REQUIRE(fp_ext_t::from_float(1e-150) == (fp_ext_t{7371020360979573, -551}));
        REQUIRE(fp_ext_t::from_float(1e-45) == (fp_ext_t{6427752177035961, -202}));
        REQUIRE(fp_ext_t::from_float(1e-40) == (fp_ext_t{4903985730770844, -185}));
        REQUIRE(fp_ext_t::from_float(2e-40) == (fp_ext_t{4903985730770844, -184}));
        REQUIRE(fp_ext_t::from_float(1e-20) == (fp_ext_t{6646139978924579, -119}));
        REQUIRE(fp_ext_t::from_float(2e-20) == (fp_ext_t{6646139978924579, -118}));
        REQUIRE(fp_ext_t::from_float(1.) == (fp_ext_t{4503599627370496, -52}));
        REQUIRE(fp_ext_t::from_float(2.) == (fp_ext_t{4503599627370496, -51}));
        REQUIRE(fp_ext_t::from_float(1e20) == (fp_ext_t{6103515625000000, 14}));
        REQUIRE(fp_ext_t::from_float(2e20) == (fp_ext_t{6103515625000000, 15}));
        REQUIRE(fp_ext_t::from_float(1e40) == (fp_ext_t{8271806125530277, 80}));
        REQUIRE(fp_ext_t::from_float(2e40) == (fp_ext_t{8271806125530277, 81}));
        REQUIRE(fp_ext_t::from_float(1e150) == (fp_ext_t{5503284107318959, 446}));
        REQUIRE(fp_ext_t::from_float(1e250) == (fp_ext_t{6290184345309700, 778}));
        REQUIRE(fp_ext_t::from_float(std::numeric_limits<double>::max()) == (fp_ext_t{9007199254740991, 971}));
    }
}

TEST("normalize") {
    REQUIRE(normalized({1, -149}) == (fp_ext_t{pow2_63, -212}));
    REQUIRE(normalized({71362, -149}) == (fp_ext_t{10043308644012916736ull, -196}));
    REQUIRE(normalized({12379400, -90}) == (fp_ext_t{13611294244890214400ull, -130}));
    REQUIRE(normalized({8388608, -23}) == (fp_ext_t{pow2_63, -63}));
    REQUIRE(normalized({11368684, 43}) == (fp_ext_t{12500000250510966784ull, 3}));
    REQUIRE(normalized({16777213, 104}) == (fp_ext_t{18446740775174668288ull, 64}));

    REQUIRE(normalized({1, -1074}) == (fp_ext_t{pow2_63, -1137}));
    REQUIRE(normalized({6448907850777164, -883}) == (fp_ext_t{13207363278391631872ull, -894}));
    REQUIRE(normalized({7371020360979573, -551}) == (fp_ext_t{15095849699286165504ull, -562}));
    REQUIRE(normalized({6427752177035961, -202}) == (fp_ext_t{13164036458569648128ull, -213}));
    REQUIRE(normalized({4903985730770844, -185}) == (fp_ext_t{10043362776618688512ull, -196}));
    REQUIRE(normalized({6646139978924579, -119}) == (fp_ext_t{13611294676837537792ull, -130}));
    REQUIRE(normalized({6103515625000000, 14}) == (fp_ext_t{12500000000000000000ull, 3}));
    REQUIRE(normalized({8271806125530277, 80}) == (fp_ext_t{16940658945086007296ull, 69}));
    REQUIRE(normalized({5503284107318959, 446}) == (fp_ext_t{11270725851789228032ull, 435}));
    REQUIRE(normalized({6290184345309700, 778}) == (fp_ext_t{12882297539194265600ull, 767}));
    REQUIRE(normalized({9007199254740991, 971}) == (fp_ext_t{18446744073709549568ull, 960}));

    SECTION("zero is left untouched") { REQUIRE(normalized({0, 5}) == (fp_ext_t{0, 5})); }

    SECTION("idempotent") {
        for (double f : g_floats) {
            const fp_ext_t fp = normalized(fp_ext_t::from_float(f));
            REQUIRE((fp.frac >> 63) == 1);
            REQUIRE(normalized(fp) == fp);
        }
    }
}

TEST("as float") {
    const float f32_inf = std::numeric_limits<float>::infinity();
    const double f64_inf = std::numeric_limits<double>::infinity();

    SECTION("float") {
        REQUIRE((fp_ext_t{pow2_63, -213}.as_float<float>()) == 0.f);
        REQUIRE((fp_ext_t{pow2_63, -212}.as_float<float>()) == 1e-45f);
        REQUIRE((fp_ext_t{10043308644012916736ull, -196}.as_float<float>()) == 1e-40f);
        REQUIRE((fp_ext_t{13611294244890214400ull, -130}.as_float<float>()) == 1e-20f);
        REQUIRE((fp_ext_t{pow2_63, -63}.as_float<float>()) == 1.f);
        REQUIRE((fp_ext_t{12500000250510966784ull, 3}.as_float<float>()) == 1e20f);
        REQUIRE((fp_ext_t{18446740775174668288ull, 64}.as_float<float>()) == 3.402823e38f);
        REQUIRE((fp_ext_t{1048575, 108}.as_float<float>()) == 3.4028204e38f);
        REQUIRE((fp_ext_t{16777216, 104}.as_float<float>()) == f32_inf);
        REQUIRE((fp_ext_t{1048576, 108}.as_float<float>()) == f32_inf);
        REQUIRE((fp_ext_t{16940658945086007296ull, 69}.as_float<float>()) == f32_inf);
    }

    SECTION("double") {
        REQUIRE((fp_ext_t{pow2_63, -1138}.as_float<double>()) == 0.);
        REQUIRE((fp_ext_t{pow2_63, -1137}.as_float<double>()) == 5e-324);
        REQUIRE((fp_ext_t{13207363278391631872ull, -894}.as_float<double>()) == 1e-250);
        REQUIRE((fp_ext_t{15095849699286165504ull, -562}.as_float<double>()) == 1e-150);
        REQUIRE((fp_ext_t{13164036458569648128ull, -213}.as_float<double>()) == 1e-45);
        REQUIRE((fp_ext_t{10043362776618688512ull, -196}.as_float<double>()) == 1e-40);
        REQUIRE((fp_ext_t{13611294676837537792ull, -130}.as_float<double>()) == 1e-20);
        REQUIRE((fp_ext_t{12500000000000000000ull, 3}.as_float<double>()) == 1e20);
        REQUIRE((fp_ext_t{16940658945086007296ull, 69}.as_float<double>()) == 1e40);
        REQUIRE((fp_ext_t{11270725851789228032ull, 435}.as_float<double>()) == 1e150);
        REQUIRE((fp_ext_t{12882297539194265600ull, 767}.as_float<double>()) == 1e250);
        REQUIRE((fp_ext_t{9007199254740991, 971}.as_float<double>()) == std::numeric_limits<double>::max());
        REQUIRE((fp_ext_t{18446744073709549568ull, 960}.as_float<double>()) == std::numeric_limits<double>::max());
        REQUIRE((fp_ext_t{9007199254740992, 971}.as_float<double>()) == f64_inf);
        REQUIRE((fp_ext_t{18446744073709549568ull, 961}.as_float<double>()) == f64_inf);
    }

    SECTION("integers") {
        for (std::uint64_t i : g_integers) {
            REQUIRE((fp_ext_t{i, 0}.as_float<float>()) == static_cast<float>(i));
            REQUIRE((fp_ext_t{i, 0}.as_float<double>()) == static_cast<double>(i));
        }
    }

    SECTION("rounding half to even") {
        // 2^53 + 1 and 2^53 + 3 are halfway between doubles
        REQUIRE((fp_ext_t{(1ull << 53) + 1, 0}.as_float<double>()) == 9007199254740992.);
        REQUIRE((fp_ext_t{(1ull << 53) + 3, 0}.as_float<double>()) == 9007199254740996.);
        REQUIRE((fp_ext_t{(1ull << 24) + 1, 0}.as_float<float>()) == 16777216.f);
        REQUIRE((fp_ext_t{(1ull << 24) + 3, 0}.as_float<float>()) == 16777220.f);
    }

    SECTION("float and double decompositions agree") {
        for (double f : g_floats) {
            const float f32 = static_cast<float>(f);
            REQUIRE(normalized(fp_ext_t::from_float(f32)) == normalized(fp_ext_t::from_float(static_cast<double>(f32))));
            REQUIRE(fp_ext_t::from_float(f32).as_float<float>() == f32);
            REQUIRE(fp_ext_t::from_float(f).as_float<double>() == f);
            REQUIRE(normalized(fp_ext_t::from_float(f)).as_float<double>() == f);
        }
    }
}

TEST("add") {
    REQUIRE(fp_ext_t::from_integer(1u).add_unchecked(fp_ext_t::from_integer(2u)).as_float<double>() == 3.);
    REQUIRE(fp_ext_t::from_float(1.f).add(fp_ext_t::from_float(2.)).as_float<double>() == 3.);
    REQUIRE(fp_ext_t::from_integer(1u).add(fp_ext_t::from_float(2.)).as_float<double>() == 3.);
    REQUIRE(fp_ext_t::from_float(1e-45f).add(fp_ext_t::from_float(2.)).as_float<double>() == 2.);
    REQUIRE(fp_ext_t::from_float(2.).add(fp_ext_t::from_float(1e-45f)).as_float<double>() == 2.);
    REQUIRE(fp_ext_t::from_integer(10000000000000000000ull)
                .add(fp_ext_t::from_integer(10000000000000000000ull))
                .as_float<double>() == 2e19);

    const fp_ext_t max{~0ull, fp_traits<double>::max_exp};
    REQUIRE(max.add(max).as_float<double>() == std::numeric_limits<double>::infinity());
}

TEST("add integer") {
    REQUIRE(fp_ext_t::from_integer(1u).add_integer(2) == (fp_ext_t{3, 0}));
    REQUIRE(fp_ext_t::from_float(2.).add_integer(1).as_float<double>() == 3.);
    REQUIRE(fp_ext_t::from_float(1e10).add_integer(7).as_float<double>() == 10000000007.);
    REQUIRE(fp_ext_t::from_integer(~0ull).add_integer(~0ull) == (fp_ext_t{~0ull - 1, 1}));
    // fraction bits below the integer exponent are dropped
    REQUIRE(fp_ext_t::from_float(0.5).add_integer(1).as_float<double>() == 1.);
}

TEST("subtract") {
    REQUIRE(fp_ext_t::from_integer(5u).sub_unchecked(fp_ext_t::from_integer(3u)).as_float<double>() == 2.);
    REQUIRE(fp_ext_t::from_float(3.).sub_unchecked(fp_ext_t::from_float(2.)) == (fp_ext_t{1ull << 51, -51}));
}

TEST("fast multiply") {
    const fp_ext_t one = normalized(fp_ext_t::from_integer(1u));
    const fp_ext_t ten = normalized(fp_ext_t::from_integer(10u));
    REQUIRE(one.fast_multiply(ten).as_float<double>() == 10.);
    REQUIRE(ten.fast_multiply(ten).as_float<double>() == 100.);

    const fp_ext_t x = normalized(fp_ext_t::from_float(1.5));
    const fp_ext_t y = normalized(fp_ext_t::from_float(2.5));
    REQUIRE(x.fast_multiply(y).as_float<double>() == 3.75);

    REQUIRE(fp_ext_t{~0ull, 0}.fast_multiply(fp_ext_t{~0ull, 0}) == (fp_ext_t{~0ull - 1, 64}));
    // low half of 2^63 rounds the upper half up
    REQUIRE(fp_ext_t{pow2_63 + 1, 0}.fast_multiply(fp_ext_t{pow2_63, 0}) == (fp_ext_t{(1ull << 62) + 1, 64}));
}

TEST("multiply by radix") {
    const fp_ext_t x = fp_ext_t::from_integer(1u);
    const fp_ext_t y = fp_ext_t::from_integer(10000000000000000000ull);
    const fp_ext_t z = fp_ext_t::from_float(std::numeric_limits<double>::max());
    for (unsigned n = rdx::min_radix; n <= rdx::max_radix; ++n) {
        const double f = n;
        REQUIRE(x.mul_radix(n).as_float<double>() == f);
        REQUIRE(y.mul_radix(n).as_float<double>() == f * 1e19);
        REQUIRE(z.mul_radix(n).as_float<double>() == std::numeric_limits<double>::infinity());
        REQUIRE(x.mul_radix_unchecked(n).as_float<double>() == f);
        REQUIRE(y.mul_radix_unchecked(n) == y.mul_radix(n));
    }

    SECTION("powers of two only move the exponent") {
        REQUIRE(y.mul_radix(2) == (fp_ext_t{y.frac, 1}));
        REQUIRE(y.mul_radix(32) == (fp_ext_t{y.frac, 5}));
    }

    SECTION("values out of double range are kept") {
        const fp_ext_t huge{1, fp_traits<double>::max_exp + 1};
        REQUIRE(huge.mul_radix(10) == huge);
    }
}

TEST("boundaries") {
    SECTION("regular value") {
        const fp_ext_t fp = fp_ext_t::from_float(3.);
        const auto b = fp.normalized_boundaries();
        REQUIRE(b.first.exp == b.second.exp);
        REQUIRE((b.second.frac >> 63) == 1);
        REQUIRE(b.second.frac - normalized(fp).frac == normalized(fp).frac - b.first.frac);
    }

    SECTION("lowest value of a binade") {
        const fp_ext_t fp = fp_ext_t::from_float(2.);
        const auto b = fp.normalized_boundaries();
        const std::uint64_t mid = normalized(fp).frac;
        REQUIRE(b.first.exp == b.second.exp);
        REQUIRE(b.second.frac - mid == 2 * (mid - b.first.frac));
    }

    SECTION("float") {
        const fp_ext_t fp = fp_ext_t::from_float(1.5f);
        const auto b = fp.normalized_boundaries<float>();
        REQUIRE(b.second == (fp_ext_t{(3ull << 62) + (1ull << 39), -63}));
        REQUIRE(b.first == (fp_ext_t{(3ull << 62) - (1ull << 39), -63}));
    }
}
