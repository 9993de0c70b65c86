#pragma once

#include <torch/torch.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

inline double max_abs_diff(torch::Tensor const& a, torch::Tensor const& b) {
    return (a - b).abs().max().item<double>();
}

/// Max absolute difference over the first original.size(0) samples of `reconstructed`.
inline double leading_diff(torch::Tensor const& original, torch::Tensor const& reconstructed) {
    int64_t const n = original.size(0);
    assert(reconstructed.size(0) >= n);
    return max_abs_diff(reconstructed.slice(0, 0, n), original);
}

inline void assert_near(double const a, double const b, double const tol, std::string const& msg) {
    if (std::abs(a - b) > tol) {
        std::cerr << msg << ": expected " << b << ", got " << a << std::endl;
        assert(false);
    }
}

/// Deterministic test signal: two tones plus a slow ramp, so no two samples
/// repeat and the mirror boundaries are not trivially symmetric.
inline torch::Tensor make_test_signal(int64_t n) {
    std::vector<double> samples(n);
    for (int64_t i = 0; i < n; ++i) {
        double const t = static_cast<double>(i) / static_cast<double>(n);
        samples[i] = std::sin(2.0 * M_PI * 5.0 * t) +
                     0.3 * std::cos(2.0 * M_PI * 17.0 * t) +
                     0.01 * static_cast<double>(i);
    }
    return torch::tensor(samples, torch::kFloat64);
}

inline torch::Tensor make_tone(int64_t n, double cycles, double amplitude) {
    auto t = torch::arange(n, torch::kFloat64) / static_cast<double>(n);
    return amplitude * torch::sin(2.0 * M_PI * cycles * t);
}
