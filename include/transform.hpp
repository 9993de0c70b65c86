#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <vector>

#include "wavelet.hpp"

/// Flat wavelet coefficients plus the length of every band in them.
///
/// Invariant: the band lengths sum to coeffs.size(0).
/// A single-level result holds two equal-length bands [approx, detail].
/// A multi-level result of depth D holds D+1 bands ordered coarse-to-fine:
/// band 0 is the final approximation, bands 1..D are details from the coarsest
/// scale (produced last) to the finest (produced first). reconstruct_levels
/// depends on this order.
struct CoefficientBuffer {
    torch::Tensor coeffs;                 // [sum(band_lengths)], float64
    std::vector<int64_t> band_lengths;

    int64_t num_bands() const { return static_cast<int64_t>(band_lengths.size()); }

    /// Decomposition steps represented: num_bands() - 1, or 0 when empty.
    int64_t depth() const { return band_lengths.empty() ? 0 : num_bands() - 1; }

    /// Offset of band `index` within coeffs.
    int64_t band_offset(int64_t index) const;

    /// View of band `index`. Throws std::out_of_range for a bad index.
    torch::Tensor band(int64_t index) const;
};

/// Single and multi-level discrete wavelet transform over 1-D signals.
/// Boundaries are handled by symmetric extension of L-1 samples on each side,
/// where L is the filter length of the wavelet.
///
/// The engine is immutable after construction and safe to share between threads.
class DwtEngine {
public:
    explicit DwtEngine(WaveletFamily family = default_wavelet_family);

    Wavelet const& wavelet() const { return *wavelet_; }
    int64_t filter_length() const { return filter_length_; }

    /// Shortest non-empty signal that boundary extension accepts.
    int64_t min_signal_length() const;

    /// Mirror L-1 samples onto each end without repeating the endpoint.
    /// Result length: signal.size(0) + 2 * (L - 1).
    /// Throws std::invalid_argument when the signal is shorter than L - 1.
    torch::Tensor extend(torch::Tensor const& signal) const;

    /// One analysis step. Returns [approx, detail], each padded_length / 2 long.
    /// An empty signal yields an empty buffer with no bands.
    CoefficientBuffer decompose(torch::Tensor const& signal) const;

    /// One synthesis step. Output length is 2 * approx.size(0); detail may be
    /// shorter than approx, missing samples contribute nothing.
    torch::Tensor reconstruct(torch::Tensor const& approx, torch::Tensor const& detail) const;

    /// Inverse of decompose(). Throws std::invalid_argument unless the buffer
    /// holds exactly two bands whose lengths sum to the coefficient count.
    torch::Tensor reconstruct(CoefficientBuffer const& buffer) const;

    /// Repeatedly decompose the running approximation, at most max_levels times,
    /// stopping early once it holds fewer than two samples.
    /// A signal shorter than min_signal_length() is returned as a single band
    /// when no step runs, and rejected when one does.
    CoefficientBuffer decompose_levels(torch::Tensor const& signal, int64_t max_levels) const;

    /// Inverse of decompose_levels(). The result is not truncated and is usually
    /// longer than the original signal because of boundary padding.
    torch::Tensor reconstruct_levels(CoefficientBuffer const& buffer) const;

    /// Depth decompose_levels() reaches for a signal of this length. Throws
    /// std::invalid_argument in the same cases decompose_levels() does.
    int64_t max_decomposition_depth(int64_t signal_length, int64_t max_levels) const;

private:
    Wavelet const* wavelet_;
    int64_t filter_length_;
    torch::Tensor dec_lo_;
    torch::Tensor dec_hi_;
    torch::Tensor rec_lo_;
    torch::Tensor rec_hi_;
};
