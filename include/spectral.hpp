#pragma once

#include <torch/torch.h>

#include <cstdint>

#include "transform.hpp"
#include "wavelet.hpp"

constexpr int64_t default_analysis_levels = 5;
constexpr int64_t default_denoise_levels = 6;

/// Decoded audio handed over by an ingestion layer. Samples are treated as a
/// single mono channel; sample_rate and channels are informational.
struct AudioData {
    torch::Tensor samples;   // [N]
    int64_t sample_rate;
    int64_t channels;
};

struct AudioAnalysisResult {
    int64_t levels;                     // requested depth
    torch::Tensor energy_distribution;  // [num_bands], sums to 1 unless all-zero
    CoefficientBuffer coefficients;
    int64_t original_length;

    /// Depth actually reached, which may be below `levels`.
    int64_t depth() const { return coefficients.depth(); }
};

/// Scalar summaries of an energy distribution.
struct WaveletFeatures {
    double total_energy;
    double low_band_energy;    // band 0 (final approximation)
    double high_band_energy;   // band 1 (coarsest detail), 0 if absent
    double centroid;           // sum_i i * energy[i]
    double entropy;            // -sum energy[i] * log2(energy[i]) over non-zero entries
};

/// Sum of squared samples.
double band_energy(torch::Tensor const& band);

/// sign(x) * max(|x| - threshold, 0), element-wise.
/// Throws std::invalid_argument for a negative threshold.
torch::Tensor soft_threshold(torch::Tensor const& coeffs, double threshold);

WaveletFeatures extract_features(AudioAnalysisResult const& analysis);

/// Scale samples so the largest magnitude is 1. Silence is returned unchanged.
torch::Tensor peak_normalize(torch::Tensor const& samples);

/// First-order pre-emphasis: y[0] = x[0], y[i] = x[i] - alpha * x[i-1].
torch::Tensor pre_emphasize(torch::Tensor const& samples, double alpha = 0.97);

/// Band energy analysis and threshold denoising on top of a DwtEngine.
class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(WaveletFamily family = default_wavelet_family);

    DwtEngine const& engine() const { return engine_; }

    /// Multi-level decomposition with the per-band energy normalized by the
    /// total. An all-zero signal leaves the distribution all-zero.
    AudioAnalysisResult analyze(
        torch::Tensor const& samples,
        int64_t levels = default_analysis_levels) const;

    AudioAnalysisResult analyze(
        AudioData const& audio,
        int64_t levels = default_analysis_levels) const;

    /// Soft-threshold every coefficient, the approximation band included, and
    /// reconstruct. The result is not truncated to the input length.
    torch::Tensor denoise(
        torch::Tensor const& samples,
        double threshold,
        int64_t levels = default_denoise_levels) const;

private:
    DwtEngine engine_;
};
