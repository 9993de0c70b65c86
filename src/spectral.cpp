#include "spectral.hpp"

#include "tensor_util.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

double band_energy(torch::Tensor const& band) {
    if (band.numel() == 0) {
        return 0.0;
    }
    return band.to(torch::kFloat64).square().sum().item<double>();
}

torch::Tensor soft_threshold(torch::Tensor const& coeffs, double threshold) {
    if (threshold < 0.0) {
        throw std::invalid_argument(
            "threshold must be >= 0, got " + std::to_string(threshold));
    }
    auto x = coeffs.to(torch::kFloat64);
    return torch::sign(x) * torch::clamp_min(x.abs() - threshold, 0.0);
}

WaveletFeatures extract_features(AudioAnalysisResult const& analysis) {
    WaveletFeatures features{};
    auto const& dist = analysis.energy_distribution;
    int64_t const bands = dist.defined() ? dist.numel() : 0;
    if (bands == 0) {
        return features;
    }

    auto values = dist.to(torch::kFloat64).contiguous();
    auto const acc = values.accessor<double, 1>();

    features.low_band_energy = acc[0];
    if (bands > 1) {
        features.high_band_energy = acc[1];
    }
    for (int64_t i = 0; i < bands; ++i) {
        double const e = acc[i];
        features.total_energy += e;
        features.centroid += static_cast<double>(i) * e;
        if (e > 0.0) {
            features.entropy -= e * std::log2(e);
        }
    }
    return features;
}

torch::Tensor peak_normalize(torch::Tensor const& samples) {
    auto x = as_float64_1d(samples, "samples");
    if (x.numel() == 0) {
        return x.clone();
    }
    double const peak = x.abs().max().item<double>();
    if (peak > 0.0) {
        return x / peak;
    }
    return x.clone();
}

torch::Tensor pre_emphasize(torch::Tensor const& samples, double alpha) {
    auto x = as_float64_1d(samples, "samples");
    int64_t const n = x.size(0);
    auto y = x.clone();
    if (n > 1) {
        y.slice(0, 1, n).sub_(x.slice(0, 0, n - 1), alpha);
    }
    return y;
}

SpectralAnalyzer::SpectralAnalyzer(WaveletFamily family)
    : engine_(family) {}

AudioAnalysisResult SpectralAnalyzer::analyze(
    torch::Tensor const& samples,
    int64_t levels) const {

    auto x = as_float64_1d(samples, "samples");
    auto coefficients = engine_.decompose_levels(x, levels);

    std::vector<double> per_band;
    per_band.reserve(coefficients.band_lengths.size());
    double total = 0.0;
    for (int64_t i = 0; i < coefficients.num_bands(); ++i) {
        per_band.push_back(band_energy(coefficients.band(i)));
        total += per_band.back();
    }
    if (total > 0.0) {
        for (double& e : per_band) {
            e /= total;
        }
    }
    auto energies = torch::tensor(per_band, float64_opts());

    return AudioAnalysisResult{
        .levels = levels,
        .energy_distribution = energies,
        .coefficients = std::move(coefficients),
        .original_length = x.size(0),
    };
}

AudioAnalysisResult SpectralAnalyzer::analyze(
    AudioData const& audio,
    int64_t levels) const {
    return analyze(audio.samples, levels);
}

torch::Tensor SpectralAnalyzer::denoise(
    torch::Tensor const& samples,
    double threshold,
    int64_t levels) const {

    auto coefficients = engine_.decompose_levels(samples, levels);
    coefficients.coeffs = soft_threshold(coefficients.coeffs, threshold);
    return engine_.reconstruct_levels(coefficients);
}
