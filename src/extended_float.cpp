#include "rdx/extended_float.h"

namespace rdx {
namespace scvt {

#if __cplusplus < 201703L
const radix_mul_tbl_t g_radix_mul_tbl;
#endif  // __cplusplus < 201703L

fp_ext_t fp_ext_t::from_bits(std::uint64_t u64, unsigned bpm, int exp_max) noexcept {
    const std::uint64_t hidden_bit = 1ull << bpm;
    const int exp_bias = exp_max >> 1;
    fp_ext_t fp{u64 & (hidden_bit - 1), static_cast<int>((u64 >> bpm) & exp_max)};
    assert(fp.exp != exp_max);
    if (fp.exp != 0) {
        fp.frac |= hidden_bit;
        fp.exp -= exp_bias + static_cast<int>(bpm);
    } else {
        fp.exp = 1 - exp_bias - static_cast<int>(bpm);  // denormalized value
    }
    return fp;
}

std::uint64_t fp_ext_t::to_bits(unsigned bpm, int exp_max) const noexcept {
    if (!frac) { return 0; }
    const std::uint64_t inf_bits = static_cast<std::uint64_t>(exp_max) << bpm;
    fp_ext_t fp = *this;
    fp.normalize();

    // Biased exponent of the most significant bit
    int exp2 = fp.exp + 63 + (exp_max >> 1);
    if (exp2 >= exp_max) { return inf_bits; }
    if (exp2 < -static_cast<int>(bpm)) { return 0; }

    // Retained bits, including the hidden one for normalized values
    const unsigned n_bits = exp2 > 0 ? 1 + bpm : static_cast<unsigned>(static_cast<int>(bpm) + exp2);
    std::uint64_t m = 0, rest = fp.frac;
    if (n_bits) { m = fp.frac >> (64 - n_bits), rest = fp.frac << n_bits; }

    // Round half to even
    if (rest > msb64 || (rest == msb64 && (m & 1))) {
        ++m;
        if (m >> n_bits) { ++exp2; }  // carry to the next power of two
    }

    if (exp2 >= exp_max) { return inf_bits; }
    if (exp2 <= 0) { return m; }  // denormalized value
    return (static_cast<std::uint64_t>(exp2) << bpm) | (m & ((1ull << bpm) - 1));
}

void fp_ext_t::normalize() noexcept {
    if (!frac) { return; }
    for (unsigned shift = 32; shift; shift >>= 1) {
        if (!(frac >> (64 - shift))) { frac <<= shift, exp -= static_cast<int>(shift); }
    }
}

fp_ext_t fp_ext_t::add(const fp_ext_t& other) const noexcept {
    const fp_ext_t& x = exp >= other.exp ? *this : other;
    fp_ext_t y = exp >= other.exp ? other : *this;
    const int diff = x.exp - y.exp;
    if (diff >= 64) { return x; }
    y.frac >>= diff, y.exp += diff;
    return x.add_unchecked(y);
}

std::pair<fp_ext_t, fp_ext_t> fp_ext_t::get_boundaries(unsigned bpm) const noexcept {
    assert(frac != 0);
    fp_ext_t upper{(frac << 1) + 1, exp - 1};
    upper.normalize();

    // Neighbour below the lowest value of a binade is twice as close
    const int l_shift = frac == 1ull << bpm ? 2 : 1;
    fp_ext_t lower{(frac << l_shift) - 1, exp - l_shift};
    lower.frac <<= lower.exp - upper.exp;
    lower.exp = upper.exp;
    return {lower, upper};
}

// --------------------------

namespace {
// normalized `10^k` values rounded to 64 bits
const fp_ext_t g_cached_pow10[cached_pow10_count] = {
    {18054884314459144840ull, -1220}, {13451937075301367670ull, -1193}, {10022474136428063862ull, -1166},
    {14934650266808366570ull, -1140}, {11127181549972568877ull, -1113}, {16580792590934885855ull, -1087},
    {12353653155963782858ull, -1060}, {18408377700990114895ull, -1034}, {13715310171984221708ull, -1007},
    {10218702384817765436ull, -980}, {15227053142812498563ull, -954}, {11345038669416679861ull, -927},
    {16905424996341287883ull, -901}, {12595523146049147757ull, -874}, {9384396036005875287ull, -847},
    {13983839803942852151ull, -821}, {10418772551374772303ull, -794}, {15525180923007089351ull, -768},
    {11567161174868858868ull, -741}, {17236413322193710309ull, -715}, {12842128665889583758ull, -688},
    {9568131466127621947ull, -661}, {14257626930069360058ull, -635}, {10622759856335341974ull, -608},
    {15829145694278690180ull, -582}, {11793632577567316726ull, -555}, {17573882009934360870ull, -529},
    {13093562431584567480ull, -502}, {9755464219737475723ull, -475}, {14536774485912137811ull, -449},
    {10830740992659433045ull, -422}, {16139061738043178685ull, -396}, {12024538023802026127ull, -369},
    {17917957937422433684ull, -343}, {13349918974505688015ull, -316}, {9946464728195732843ull, -289},
    {14821387422376473014ull, -263}, {11042794154864902060ull, -236}, {16455045573212060422ull, -210},
    {12259964326927110867ull, -183}, {18268770466636286478ull, -157}, {13611294676837538539ull, -130},
    {10141204801825835212ull, -103}, {15111572745182864684ull, -77}, {11258999068426240000ull, -50},
    {16777216000000000000ull, -24}, {12500000000000000000ull, 3}, {9313225746154785156ull, 30},
    {13877787807814456755ull, 56}, {10339757656912845936ull, 83}, {15407439555097886824ull, 109},
    {11479437019748901445ull, 136}, {17105694144590052135ull, 162}, {12744735289059618216ull, 189},
    {9495567745759798747ull, 216}, {14149498560666738074ull, 242}, {10542197943230523224ull, 269},
    {15709099088952724970ull, 295}, {11704190886730495818ull, 322}, {17440603504673385349ull, 348},
    {12994262207056124023ull, 375}, {9681479787123295682ull, 402}, {14426529090290212157ull, 428},
    {10748601772107342003ull, 455}, {16016664761464807395ull, 481}, {11933345169920330789ull, 508},
    {17782069995880619868ull, 534}, {13248674568444952270ull, 561}, {9871031767461413346ull, 588},
    {14708983551653345445ull, 614}, {10959046745042015199ull, 641}, {16330252207878254650ull, 667},
    {12166986024289022870ull, 694}, {18130221999122236476ull, 720}, {13508068024458167312ull, 747},
    {10064294952495520794ull, 774}, {14996968138956309548ull, 800}, {11173611982879273257ull, 827},
    {16649979327439178909ull, 853}, {12405201291620119593ull, 880}, {9242595204427927429ull, 907},
    {13772540099066387757ull, 933}, {10261342003245940623ull, 960}, {15290591125556738113ull, 986},
    {11392378155556871081ull, 1013}, {16975966327722178521ull, 1039}, {12648080533535911531ull, 1066},
};
}  // namespace

fp_ext_t get_cached_pow10(unsigned index) noexcept {
    assert(index < cached_pow10_count);
    return g_cached_pow10[index];
}

std::pair<fp_ext_t, int> find_cached_pow10(int exp2) noexcept {
    const double one_log_ten = 0.30102999566398114;
    const int approx = static_cast<int>(-(exp2 + 87) * one_log_ten);
    int idx = (approx - cached_pow10_first) / cached_pow10_step;
    while (true) {
        assert(idx >= 0 && idx < static_cast<int>(cached_pow10_count));
        const int current = exp2 + g_cached_pow10[idx].exp + 64;
        if (current < -60) {
            ++idx;
        } else if (current > -32) {
            --idx;
        } else {
            return {g_cached_pow10[idx], cached_pow10_first + idx * cached_pow10_step};
        }
    }
}

}  // namespace scvt
}  // namespace rdx
