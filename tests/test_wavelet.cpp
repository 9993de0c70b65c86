#include "wavelet.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

static constexpr double TOL = 1e-12;

static void assert_near(double const a, double const b, char const* msg) {
    if (std::abs(a - b) > TOL) {
        std::cerr << msg << ": expected " << b << ", got " << a << std::endl;
        assert(false);
    }
}

static double dot(std::vector<double> const& a, std::vector<double> const& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
}

static double norm(std::vector<double> const& v) {
    return std::sqrt(dot(v, v));
}

// Haar filter coefficients match expected values.
static void test_haar_coefficients() {
    auto const w = make_wavelet("haar");
    double const s = std::sqrt(2.0) / 2.0;

    assert(w.name == "haar");
    assert(w.family == WaveletFamily::haar);
    assert(w.dec_len() == 2);
    assert(w.rec_len() == 2);

    assert_near(w.dec_lo[0],  s, "dec_lo[0]");
    assert_near(w.dec_lo[1],  s, "dec_lo[1]");
    assert_near(w.dec_hi[0], -s, "dec_hi[0]");
    assert_near(w.dec_hi[1],  s, "dec_hi[1]");
    assert_near(w.rec_lo[0],  s, "rec_lo[0]");
    assert_near(w.rec_lo[1],  s, "rec_lo[1]");
    assert_near(w.rec_hi[0],  s, "rec_hi[0]");
    assert_near(w.rec_hi[1], -s, "rec_hi[1]");
}

// Names and aliases resolve to the same family.
static void test_name_aliases() {
    assert(make_wavelet("db1").name == "haar");
    assert(parse_wavelet_family("daubechies4") == WaveletFamily::daubechies4);
    assert(parse_wavelet_family("db8") == WaveletFamily::daubechies8);
    assert(parse_wavelet_family("biorthogonal22") == WaveletFamily::biorthogonal22);
    assert(parse_wavelet_family("bior4.4") == WaveletFamily::biorthogonal44);

    for (auto const family : {WaveletFamily::haar, WaveletFamily::daubechies4,
                              WaveletFamily::daubechies8, WaveletFamily::biorthogonal22,
                              WaveletFamily::biorthogonal44}) {
        assert(parse_wavelet_family(wavelet_family_name(family)) == family);
        assert(wavelet_for(family).family == family);
    }
}

// Every family keeps all four filters at one length.
static void test_filter_lengths() {
    struct Expected { WaveletFamily family; int length; };
    Expected const cases[] = {
        {WaveletFamily::haar, 2},
        {WaveletFamily::daubechies4, 4},
        {WaveletFamily::daubechies8, 9},
        {WaveletFamily::biorthogonal22, 5},
        {WaveletFamily::biorthogonal44, 9},
    };
    for (auto const& c : cases) {
        auto const& w = wavelet_for(c.family);
        assert(w.dec_len() == c.length);
        assert(static_cast<int>(w.dec_hi.size()) == c.length);
        assert(w.rec_len() == c.length);
        assert(static_cast<int>(w.rec_hi.size()) == c.length);
    }
}

// Low-pass and high-pass filters are orthogonal and unit-norm.
static void test_haar_orthogonality() {
    auto const w = make_wavelet("haar");

    assert_near(dot(w.dec_lo, w.dec_hi), 0.0, "dec orthogonality");
    assert_near(dot(w.rec_lo, w.rec_hi), 0.0, "rec orthogonality");
    assert_near(norm(w.dec_lo), 1.0, "dec_lo unit norm");
    assert_near(norm(w.dec_hi), 1.0, "dec_hi unit norm");
    assert_near(norm(w.rec_lo), 1.0, "rec_lo unit norm");
    assert_near(norm(w.rec_hi), 1.0, "rec_hi unit norm");
}

// db4: unit norm, quadrature mirror highpass, reversed synthesis filters.
static void test_db4_quadrature_mirror() {
    auto const& w = wavelet_for(WaveletFamily::daubechies4);
    int const L = w.dec_len();

    // Published values carry 16 significant digits.
    assert(std::abs(norm(w.dec_lo) - 1.0) < 1e-10);
    assert_near(dot(w.dec_lo, w.dec_hi), 0.0, "db4 dec orthogonality");
    for (int k = 0; k < L; ++k) {
        double const sign = (k % 2 == 0) ? 1.0 : -1.0;
        assert_near(w.dec_hi[k], sign * w.dec_lo[L - 1 - k], "db4 dec_hi mirror");
        assert_near(w.rec_lo[k], w.dec_lo[L - 1 - k], "db4 rec_lo reversed");
        assert_near(w.rec_hi[k], w.dec_hi[L - 1 - k], "db4 rec_hi reversed");
    }
}

// db8 and bior4.4 reuse their decomposition filters for reconstruction;
// bior2.2 does not.
static void test_reused_reconstruction_filters() {
    for (auto const family : {WaveletFamily::daubechies8, WaveletFamily::biorthogonal44}) {
        auto const& w = wavelet_for(family);
        assert(w.rec_lo == w.dec_lo);
        assert(w.rec_hi == w.dec_hi);
    }
    auto const& bior22 = wavelet_for(WaveletFamily::biorthogonal22);
    assert(bior22.rec_lo != bior22.dec_lo);
    assert(bior22.rec_hi != bior22.dec_hi);
}

// wavelet_for hands out the same record on every call.
static void test_table_is_stable() {
    auto const* first = &wavelet_for(WaveletFamily::daubechies4);
    auto const* second = &wavelet_for(WaveletFamily::daubechies4);
    assert(first == second);
}

static void test_normalize_filter() {
    auto const normalized = normalize_filter({1.0, 2.0, 3.0, 4.0});
    assert_near(norm(normalized), 1.0, "normalized norm");
    assert_near(normalized[1] / normalized[0], 2.0, "normalized ratio");

    auto const zeros = normalize_filter({0.0, 0.0});
    assert(zeros[0] == 0.0 && zeros[1] == 0.0);
}

// Unknown wavelet name or tag throws.
static void test_unknown_wavelet() {
    bool threw = false;
    try {
        make_wavelet("not_a_wavelet");
    } catch (std::invalid_argument const&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        wavelet_for(static_cast<WaveletFamily>(42));
    } catch (std::invalid_argument const&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_haar_coefficients();
    test_name_aliases();
    test_filter_lengths();
    test_haar_orthogonality();
    test_db4_quadrature_mirror();
    test_reused_reconstruction_filters();
    test_table_is_stable();
    test_normalize_filter();
    test_unknown_wavelet();

    std::cout << "All wavelet tests passed." << std::endl;
    return 0;
}
