#include "transform.hpp"

#include "tensor_util.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

// ========================== Helper functions ==========================

static int64_t coeff_count(CoefficientBuffer const& buffer) {
    return buffer.coeffs.defined() ? buffer.coeffs.numel() : 0;
}

/// Check that band lengths are non-negative and sum to the coefficient count.
static void validate_band_layout(CoefficientBuffer const& buffer) {
    if (buffer.coeffs.defined() && buffer.coeffs.dim() != 1) {
        throw std::invalid_argument(
            "Coefficient buffer must be 1-D, got " +
            std::to_string(buffer.coeffs.dim()) + " dimensions");
    }
    int64_t total = 0;
    for (size_t i = 0; i < buffer.band_lengths.size(); ++i) {
        int64_t const len = buffer.band_lengths[i];
        if (len < 0) {
            throw std::invalid_argument(
                "Band " + std::to_string(i) + " has negative length " + std::to_string(len));
        }
        total += len;
    }
    if (total != coeff_count(buffer)) {
        throw std::invalid_argument(
            "Band lengths sum to " + std::to_string(total) +
            " but the buffer holds " + std::to_string(coeff_count(buffer)) + " coefficients");
    }
}

[[noreturn]] static void throw_too_short(int64_t n, int64_t required, Wavelet const& wavelet) {
    throw std::invalid_argument(
        "Signal length " + std::to_string(n) + " is shorter than the " +
        std::to_string(required) + " samples wavelet " + wavelet.name +
        " needs for boundary extension");
}

static CoefficientBuffer empty_buffer() {
    return CoefficientBuffer{torch::empty({0}, float64_opts()), {}};
}

/// Spread `band` onto the even positions of a zero tensor of length `size`.
/// Samples that would land at or beyond `size` are dropped.
static torch::Tensor upsample_zero(torch::Tensor const& band, int64_t size) {
    auto up = torch::zeros({size}, band.options());
    int64_t const used = std::min(band.size(0), (size + 1) / 2);
    if (used > 0) {
        up.slice(0, 0, 2 * used, 2).copy_(band.slice(0, 0, used));
    }
    return up;
}

/// out[i] = sum_j x[i * stride + j] * filter[j] for i in [0, out_len).
/// The caller guarantees x is long enough for every window.
static torch::Tensor correlate(
    torch::Tensor const& x,
    torch::Tensor const& filter,
    int64_t stride,
    int64_t out_len) {

    auto windows = x.unfold(0, filter.size(0), stride).slice(0, 0, out_len);  // [out_len, L]
    return torch::mv(windows, filter);
}

// ========================== CoefficientBuffer ==========================

int64_t CoefficientBuffer::band_offset(int64_t index) const {
    if (index < 0 || index >= num_bands()) {
        throw std::out_of_range(
            "Band index " + std::to_string(index) + " out of range for " +
            std::to_string(num_bands()) + " bands");
    }
    int64_t offset = 0;
    for (int64_t i = 0; i < index; ++i) {
        offset += band_lengths[i];
    }
    return offset;
}

torch::Tensor CoefficientBuffer::band(int64_t index) const {
    int64_t const offset = band_offset(index);
    return coeffs.slice(0, offset, offset + band_lengths[index]);
}

// ========================== DwtEngine ==========================

DwtEngine::DwtEngine(WaveletFamily family)
    : wavelet_(&wavelet_for(family)),
      filter_length_(wavelet_->dec_len()),
      dec_lo_(torch::tensor(wavelet_->dec_lo, float64_opts())),
      dec_hi_(torch::tensor(wavelet_->dec_hi, float64_opts())),
      rec_lo_(torch::tensor(wavelet_->rec_lo, float64_opts())),
      rec_hi_(torch::tensor(wavelet_->rec_hi, float64_opts())) {}

int64_t DwtEngine::min_signal_length() const {
    return std::max<int64_t>(1, filter_length_ - 1);
}

torch::Tensor DwtEngine::extend(torch::Tensor const& signal) const {
    auto x = as_float64_1d(signal, "signal");
    int64_t const n = x.size(0);
    int64_t const pad = filter_length_ - 1;
    if (n < min_signal_length()) {
        throw_too_short(n, min_signal_length(), *wavelet_);
    }
    auto left = x.slice(0, 0, pad).flip(0);
    auto right = x.slice(0, n - pad, n).flip(0);
    return torch::cat({left, x, right});
}

CoefficientBuffer DwtEngine::decompose(torch::Tensor const& signal) const {
    auto x = as_float64_1d(signal, "signal");
    if (x.size(0) == 0) {
        return empty_buffer();
    }

    auto padded = extend(x);
    int64_t const out_len = padded.size(0) / 2;

    // The last window may run past the padded signal; zero tail stands in for
    // the missing terms.
    auto tail = torch::zeros({filter_length_}, padded.options());
    auto source = torch::cat({padded, tail});

    auto approx = correlate(source, dec_lo_, 2, out_len);
    auto detail = correlate(source, dec_hi_, 2, out_len);

    return CoefficientBuffer{torch::cat({approx, detail}), {out_len, out_len}};
}

torch::Tensor DwtEngine::reconstruct(
    torch::Tensor const& approx_band,
    torch::Tensor const& detail_band) const {

    auto approx = as_float64_1d(approx_band, "approximation band");
    auto detail = as_float64_1d(detail_band, "detail band");

    int64_t const out_len = 2 * approx.size(0);
    if (out_len == 0) {
        return torch::empty({0}, float64_opts());
    }

    // Each output sample i sees upsampled positions [i, i + L).
    int64_t const size = out_len + filter_length_;
    auto up_approx = upsample_zero(approx, size);
    auto up_detail = upsample_zero(detail, size);

    return correlate(up_approx, rec_lo_, 1, out_len) +
           correlate(up_detail, rec_hi_, 1, out_len);
}

torch::Tensor DwtEngine::reconstruct(CoefficientBuffer const& buffer) const {
    validate_band_layout(buffer);
    if (buffer.num_bands() == 0) {
        return torch::empty({0}, float64_opts());
    }
    if (buffer.num_bands() != 2) {
        throw std::invalid_argument(
            "Single-level reconstruction expects exactly 2 bands, got " +
            std::to_string(buffer.num_bands()));
    }
    return reconstruct(buffer.band(0), buffer.band(1));
}

CoefficientBuffer DwtEngine::decompose_levels(
    torch::Tensor const& signal,
    int64_t max_levels) const {

    if (max_levels < 0) {
        throw std::invalid_argument("max_levels must be >= 0, got " + std::to_string(max_levels));
    }
    auto x = as_float64_1d(signal, "signal");
    int64_t const n = x.size(0);
    if (n == 0) {
        return empty_buffer();
    }

    // A signal shorter than the extension needs only fails once a step runs.
    // Details are collected finest first and emitted in reverse.
    std::vector<torch::Tensor> details;
    auto running = x;
    for (int64_t level = 0; level < max_levels; ++level) {
        if (running.size(0) < 2) {
            break;
        }
        auto step = decompose(running);
        details.push_back(step.band(1));
        running = step.band(0);
    }

    std::vector<torch::Tensor> parts;
    parts.reserve(details.size() + 1);
    CoefficientBuffer result;
    result.band_lengths.reserve(details.size() + 1);

    parts.push_back(running);
    result.band_lengths.push_back(running.size(0));
    for (auto it = details.rbegin(); it != details.rend(); ++it) {
        parts.push_back(*it);
        result.band_lengths.push_back(it->size(0));
    }
    result.coeffs = torch::cat(parts);
    return result;
}

torch::Tensor DwtEngine::reconstruct_levels(CoefficientBuffer const& buffer) const {
    validate_band_layout(buffer);
    if (buffer.num_bands() == 0) {
        return torch::empty({0}, float64_opts());
    }

    auto running = buffer.band(0).clone();
    for (int64_t i = 1; i < buffer.num_bands(); ++i) {
        running = reconstruct(running, buffer.band(i));
    }
    return running;
}

int64_t DwtEngine::max_decomposition_depth(int64_t signal_length, int64_t max_levels) const {
    if (max_levels < 0) {
        throw std::invalid_argument("max_levels must be >= 0, got " + std::to_string(max_levels));
    }
    int64_t depth = 0;
    int64_t n = signal_length;
    while (depth < max_levels && n >= 2) {
        if (n < min_signal_length()) {
            throw_too_short(n, min_signal_length(), *wavelet_);
        }
        n = (n + 2 * (filter_length_ - 1)) / 2;
        ++depth;
    }
    return depth;
}
