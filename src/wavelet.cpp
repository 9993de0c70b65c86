#include "wavelet.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

static Wavelet make_haar() {
    double const s = std::sqrt(2.0) / 2.0;
    return Wavelet{
        .family = WaveletFamily::haar,
        .name = "haar",
        .dec_lo = { s,  s},
        .dec_hi = {-s,  s},
        .rec_lo = { s,  s},
        .rec_hi = { s, -s},
    };
}

static Wavelet make_db4() {
    double const h0 =  0.4829629131445341;
    double const h1 =  0.8365163037378079;
    double const h2 =  0.2241438680420134;
    double const h3 = -0.1294095225512604;
    // dec_hi[k] = (-1)^k dec_lo[L-1-k]; reconstruction filters are the
    // time-reversed decomposition filters.
    return Wavelet{
        .family = WaveletFamily::daubechies4,
        .name = "db4",
        .dec_lo = { h0,  h1,  h2,  h3},
        .dec_hi = { h3, -h2,  h1, -h0},
        .rec_lo = { h3,  h2,  h1,  h0},
        .rec_hi = {-h0,  h1, -h2,  h3},
    };
}

// 9-tap approximation. Reconstruction reuses the decomposition filters, so this
// bank does not reconstruct perfectly.
static Wavelet make_db8() {
    std::vector<double> const lo = {
        0.32580343, 0.01094572, -0.84322608, 0.04068942, 0.41809227,
        -0.04068942, -0.84322608, -0.01094572, 0.32580343};
    std::vector<double> const hi = {
        0.32580343, -0.01094572, -0.84322608, -0.04068942, 0.41809227,
        0.04068942, -0.84322608, 0.01094572, 0.32580343};
    return Wavelet{
        .family = WaveletFamily::daubechies8,
        .name = "db8",
        .dec_lo = lo,
        .dec_hi = hi,
        .rec_lo = lo,
        .rec_hi = hi,
    };
}

static Wavelet make_bior22() {
    double const s = std::sqrt(2.0) / 2.0;
    return Wavelet{
        .family = WaveletFamily::biorthogonal22,
        .name = "bior2.2",
        .dec_lo = {-0.1767766952966369, 0.3535533905932738, 1.0606601717798214,
                   0.3535533905932738, -0.1767766952966369},
        .dec_hi = {0.0, 0.0, s, -s, 0.0},
        .rec_lo = {0.0, 0.0, s,  s, 0.0},
        .rec_hi = {0.1767766952966369, 0.3535533905932738, -1.0606601717798214,
                   0.3535533905932738, 0.1767766952966369},
    };
}

static Wavelet make_bior44() {
    double const s = std::sqrt(2.0) / 2.0;
    std::vector<double> const lo = {
        0.03782845550699535, -0.023849465019380396, -0.11062440441842342,
        0.37740285561265297, 0.85269867900940344, 0.37740285561265297,
        -0.11062440441842342, -0.023849465019380396, 0.03782845550699535};
    std::vector<double> const hi = {0.0, 0.0, 0.0, s, -s, 0.0, 0.0, 0.0, 0.0};
    return Wavelet{
        .family = WaveletFamily::biorthogonal44,
        .name = "bior4.4",
        .dec_lo = lo,
        .dec_hi = hi,
        .rec_lo = lo,
        .rec_hi = hi,
    };
}

static constexpr std::size_t num_families = 5;

// Indexed by the underlying value of WaveletFamily.
static std::array<Wavelet, num_families> const& wavelet_table() {
    static std::array<Wavelet, num_families> const table = {
        make_haar(),
        make_db4(),
        make_db8(),
        make_bior22(),
        make_bior44(),
    };
    return table;
}

Wavelet const& wavelet_for(WaveletFamily family) {
    auto const index = static_cast<std::size_t>(family);
    if (index >= num_families) {
        throw std::invalid_argument(
            "Unknown wavelet family tag " + std::to_string(index));
    }
    return wavelet_table()[index];
}

Wavelet make_wavelet(std::string const& name) {
    return wavelet_for(parse_wavelet_family(name));
}

WaveletFamily parse_wavelet_family(std::string const& name) {
    if (name == "haar" || name == "db1") {
        return WaveletFamily::haar;
    }
    if (name == "db4" || name == "daubechies4") {
        return WaveletFamily::daubechies4;
    }
    if (name == "db8" || name == "daubechies8") {
        return WaveletFamily::daubechies8;
    }
    if (name == "bior2.2" || name == "biorthogonal22") {
        return WaveletFamily::biorthogonal22;
    }
    if (name == "bior4.4" || name == "biorthogonal44") {
        return WaveletFamily::biorthogonal44;
    }
    throw std::invalid_argument("Unknown wavelet: " + name);
}

std::string wavelet_family_name(WaveletFamily family) {
    return wavelet_for(family).name;
}

std::vector<double> normalize_filter(std::vector<double> taps) {
    double sum_sq = 0.0;
    for (double const t : taps) {
        sum_sq += t * t;
    }
    double const norm = std::sqrt(sum_sq);
    if (norm > 0.0) {
        for (double& t : taps) {
            t /= norm;
        }
    }
    return taps;
}
