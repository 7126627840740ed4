#pragma once

#include <torch/torch.h>

#include "wfac.hpp"

/// Forward DGT on a rectangular lattice using the Walnut factorization.
/// signal: [L, W], real or complex. window: factorization for (a, M).
/// Returns complex coefficients [M, N, R, W].
torch::Tensor dgt_fac(
    torch::Tensor const& signal,
    FactoredWindow const& window,
    int64_t a,
    int64_t M);

/// Inverse DGT on a rectangular lattice using the Walnut factorization.
/// coefficients: [M, N, R, W]; the R windows' contributions are summed.
/// Returns the complex signal [L, W].
torch::Tensor idgt_fac(
    torch::Tensor const& coefficients,
    FactoredWindow const& window,
    int64_t a,
    int64_t M);
