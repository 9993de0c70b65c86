#include "spectral.hpp"
#include "transform.hpp"
#include "wavelet.hpp"

#include <torch/extension.h>

#include <tuple>

namespace {

using CoeffsAndLengths = std::tuple<torch::Tensor, std::vector<int64_t>>;

CoeffsAndLengths to_tuple(CoefficientBuffer const& buffer) {
    return {buffer.coeffs, buffer.band_lengths};
}

DwtEngine engine_for(std::string const& wavelet_name) {
    return DwtEngine(parse_wavelet_family(wavelet_name));
}

CoeffsAndLengths decompose_wrapper(
    torch::Tensor const& signal,
    std::string const& wavelet_name) {
    return to_tuple(engine_for(wavelet_name).decompose(signal));
}

torch::Tensor reconstruct_wrapper(
    torch::Tensor const& coeffs,
    std::vector<int64_t> band_lengths,
    std::string const& wavelet_name) {
    return engine_for(wavelet_name).reconstruct(
        CoefficientBuffer{coeffs, std::move(band_lengths)});
}

CoeffsAndLengths decompose_levels_wrapper(
    torch::Tensor const& signal,
    std::string const& wavelet_name,
    int64_t levels) {
    return to_tuple(engine_for(wavelet_name).decompose_levels(signal, levels));
}

torch::Tensor reconstruct_levels_wrapper(
    torch::Tensor const& coeffs,
    std::vector<int64_t> band_lengths,
    std::string const& wavelet_name) {
    return engine_for(wavelet_name).reconstruct_levels(
        CoefficientBuffer{coeffs, std::move(band_lengths)});
}

int64_t max_depth_wrapper(
    int64_t signal_length,
    std::string const& wavelet_name,
    int64_t levels) {
    return engine_for(wavelet_name).max_decomposition_depth(signal_length, levels);
}

py::dict analyze_wrapper(
    torch::Tensor const& samples,
    std::string const& wavelet_name,
    int64_t levels) {
    SpectralAnalyzer const analyzer(parse_wavelet_family(wavelet_name));
    auto const analysis = analyzer.analyze(samples, levels);

    py::dict out;
    out["levels"] = analysis.levels;
    out["depth"] = analysis.depth();
    out["energy_distribution"] = analysis.energy_distribution;
    out["coefficients"] = analysis.coefficients.coeffs;
    out["band_lengths"] = analysis.coefficients.band_lengths;
    out["original_length"] = analysis.original_length;
    return out;
}

torch::Tensor denoise_wrapper(
    torch::Tensor const& samples,
    double threshold,
    std::string const& wavelet_name,
    int64_t levels) {
    SpectralAnalyzer const analyzer(parse_wavelet_family(wavelet_name));
    return analyzer.denoise(samples, threshold, levels);
}

}  // namespace

PYBIND11_MODULE(dwt_audio, m) {
    m.doc() = "Discrete wavelet transforms for audio analysis and denoising";

    std::string const default_wavelet = wavelet_family_name(default_wavelet_family);

    m.def("decompose", &decompose_wrapper,
          "Single-level forward DWT; returns (coeffs, band_lengths)",
          py::arg("signal"),
          py::arg("wavelet_name") = default_wavelet);

    m.def("reconstruct", &reconstruct_wrapper,
          "Single-level inverse DWT of a two-band buffer",
          py::arg("coeffs"),
          py::arg("band_lengths"),
          py::arg("wavelet_name") = default_wavelet);

    m.def("decompose_levels", &decompose_levels_wrapper,
          "Multi-level forward DWT; bands ordered coarse-to-fine",
          py::arg("signal"),
          py::arg("wavelet_name") = default_wavelet,
          py::arg("levels") = default_analysis_levels);

    m.def("reconstruct_levels", &reconstruct_levels_wrapper,
          "Multi-level inverse DWT (result is not truncated)",
          py::arg("coeffs"),
          py::arg("band_lengths"),
          py::arg("wavelet_name") = default_wavelet);

    m.def("max_decomposition_depth", &max_depth_wrapper,
          "Depth decompose_levels reaches for a signal length",
          py::arg("signal_length"),
          py::arg("wavelet_name") = default_wavelet,
          py::arg("levels") = default_analysis_levels);

    m.def("analyze", &analyze_wrapper,
          "Normalized per-band energy analysis",
          py::arg("samples"),
          py::arg("wavelet_name") = default_wavelet,
          py::arg("levels") = default_analysis_levels);

    m.def("denoise", &denoise_wrapper,
          "Soft-threshold denoising of every coefficient",
          py::arg("samples"),
          py::arg("threshold"),
          py::arg("wavelet_name") = default_wavelet,
          py::arg("levels") = default_denoise_levels);

    m.def("soft_threshold", &soft_threshold,
          "sign(x) * max(|x| - threshold, 0)",
          py::arg("coeffs"),
          py::arg("threshold"));

    m.def("band_energy", &band_energy,
          "Sum of squared samples",
          py::arg("band"));
}
