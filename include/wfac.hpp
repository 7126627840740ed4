#pragma once

#include <torch/torch.h>

#include "lattice.hpp"

/// Walnut factorization of one or more windows for a rectangular lattice.
/// The block layout depends on (L, a, M), so the factorization records the
/// lattice it was built for.
struct FactoredWindow {
    torch::Tensor coeffs;    // [p*q*R, c*d], complex128
    int64_t signal_length;   // L
    int64_t a;
    int64_t M;
    int64_t num_windows;     // R
    bool stacked;            // window was passed as [L, R] rather than [L]
    bool real_window;        // all windows were real-valued
};

/// Sample index of every Walnut window block entry.
/// Returns int64 [c, d, p, q] holding r + c*((k*q - u*p + p*q*sigma) mod L/c).
torch::Tensor walnut_window_index(LatticeParams const& lat);

/// Sample index of every Walnut signal block entry.
/// Returns int64 [c, d, p, q] holding r + c*((k*q + l*h*p + p*q*sigma) mod L/c).
/// The h*p offset makes entry (k, l) fall in residue class l modulo q.
torch::Tensor walnut_signal_index(LatticeParams const& lat);

/// Factor a window [L] or a window stack [L, R] for the lattice (a, M).
/// coeffs(k + p*(u + q*rho), r + c*s) is the orthonormal length-d DFT over sigma
/// of window rho sampled at walnut_window_index.
FactoredWindow window_factorize(
    torch::Tensor const& window,
    int64_t a,
    int64_t M);

/// Rebuild the window stack [L, R] from factored coefficients [p*q*R, c*d].
torch::Tensor window_defactorize(
    torch::Tensor const& coeffs,
    int64_t L,
    int64_t a,
    int64_t M);

/// Rebuild the window from a factorization, with the rank it was passed in.
torch::Tensor window_defactorize(
    FactoredWindow const& factored,
    int64_t a,
    int64_t M);

/// Throws ShapeMismatchError unless the factorization was built for exactly
/// this lattice and its coefficients have the matching [p*q*R, c*d] shape.
void check_factored_window(FactoredWindow const& factored, LatticeParams const& lat);

/// Factored coefficients as a batch of p x qR block matrices: [c, d, p, q*R].
/// Callers check the factorization against lat first.
torch::Tensor window_blocks(FactoredWindow const& factored, LatticeParams const& lat);
