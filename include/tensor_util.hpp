#pragma once

#include <torch/torch.h>

#include <stdexcept>
#include <string>

/// TensorOptions for the float64 CPU tensors all transforms compute in.
inline torch::TensorOptions float64_opts() {
    return torch::TensorOptions().dtype(torch::kFloat64);
}

/// Validate that `t` is a 1-D sample sequence and return it as a contiguous
/// float64 tensor. `what` names the argument in the error message.
inline torch::Tensor as_float64_1d(torch::Tensor const& t, char const* what) {
    if (!t.defined()) {
        throw std::invalid_argument(std::string(what) + " is undefined");
    }
    if (t.dim() != 1) {
        throw std::invalid_argument(
            std::string(what) + " must be 1-D, got " + std::to_string(t.dim()) +
            " dimensions");
    }
    return t.to(torch::kFloat64).contiguous();
}
