#pragma once

#include <torch/torch.h>

#include "wfac.hpp"

/// Forward DGT on the rectangular lattice (a, M).
/// signal: [L] or [L, W]. window: [L] or a window stack [L, R].
/// Returns [M, N], with an R axis if the window is a stack and a trailing
/// W axis if the signal has channels: [M, N(, R)(, W)].
torch::Tensor dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M);

/// Forward DGT with a window that was factored for (a, M) already.
torch::Tensor dgt(
    torch::Tensor const& signal,
    FactoredWindow const& window,
    int64_t a,
    int64_t M);

/// Inverse DGT on the rectangular lattice (a, M).
/// coefficients: [M, N(, R)(, W)] as returned by dgt; contributions of the R
/// windows are summed. Returns [L] or [L, W], complex.
torch::Tensor idgt(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    int64_t a,
    int64_t M);

/// Inverse DGT with a factored synthesis window.
torch::Tensor idgt(
    torch::Tensor const& coefficients,
    FactoredWindow const& window,
    int64_t a,
    int64_t M);

/// Forward DGT on the lattice (a, M, lt1, lt2) via the shear algorithm.
/// signal: [L] or [L, W]. window: [L]. Returns [M, N] or [M, N, W].
/// Shear plans are cached per lattice tuple.
torch::Tensor nonsep_dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2);

/// Inverse non-separable DGT. coefficients: [M, N] or [M, N, W].
/// window: [L] synthesis window. Returns [L] or [L, W], complex.
torch::Tensor nonsep_idgt(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2);
