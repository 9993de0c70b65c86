#pragma once

#include <string>
#include <vector>

/// Wavelet families with a built-in filter bank.
enum class WaveletFamily { haar, daubechies4, daubechies8, biorthogonal22, biorthogonal44 };

constexpr WaveletFamily default_wavelet_family = WaveletFamily::daubechies4;

/// A discrete wavelet defined by its four filter banks.
/// The decomposition (analysis) filters split a signal into lowpass and highpass
/// subbands. The reconstruction (synthesis) filters recombine them.
/// All four filters of a built-in family share one length.
struct Wavelet {
    WaveletFamily family;
    std::string name;
    std::vector<double> dec_lo;   // decomposition lowpass  (analysis scaling)
    std::vector<double> dec_hi;   // decomposition highpass (analysis wavelet)
    std::vector<double> rec_lo;   // reconstruction lowpass  (synthesis scaling)
    std::vector<double> rec_hi;   // reconstruction highpass (synthesis wavelet)

    int dec_len() const { return static_cast<int>(dec_lo.size()); }
    int rec_len() const { return static_cast<int>(rec_lo.size()); }
};

/// Immutable filter bank of a family. The reference stays valid for the
/// lifetime of the process.
/// Throws std::invalid_argument for a value outside the enumeration.
Wavelet const& wavelet_for(WaveletFamily family);

/// Accepted names: "haar"/"db1", "db4"/"daubechies4", "db8"/"daubechies8",
/// "bior2.2"/"biorthogonal22", "bior4.4"/"biorthogonal44".
Wavelet make_wavelet(std::string const& name);

/// Parse a wavelet family from one of the names accepted by make_wavelet.
WaveletFamily parse_wavelet_family(std::string const& name);

/// Canonical short name ("haar", "db4", "db8", "bior2.2", "bior4.4").
std::string wavelet_family_name(WaveletFamily family);

/// Scale a filter to unit L2 norm. An all-zero filter is returned unchanged.
std::vector<double> normalize_filter(std::vector<double> taps);
