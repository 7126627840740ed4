#pragma once

#include <torch/torch.h>

#include "errors.hpp"

#include <string>

/// Complex128 TensorOptions on the same device as the given tensor.
/// All transform arithmetic runs in double precision.
inline torch::TensorOptions complex_opts_like(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(torch::kComplex128).device(t.device());
}

/// Promote to complex128, leaving complex128 input untouched.
inline torch::Tensor to_complex(torch::Tensor const& t) {
    return t.scalar_type() == torch::kComplex128 ? t : t.to(torch::kComplex128);
}

/// Promote to the working precision: complex128 or float64.
inline torch::Tensor to_working(torch::Tensor const& t) {
    return t.is_complex() ? to_complex(t) : t.to(torch::kFloat64);
}

/// View a [L] or [L, K] tensor as [L, K] columns.
inline torch::Tensor as_columns(torch::Tensor const& t, char const* name) {
    if (t.dim() == 1) {
        return t.unsqueeze(1);
    }
    if (t.dim() != 2) {
        throw ShapeMismatchError(
            std::string(name) + " must be [L] or [L, K], got " + std::to_string(t.dim()) +
            " dimensions");
    }
    return t;
}
