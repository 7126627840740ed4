#include "transform.hpp"

#include "dgt_fac.hpp"
#include "errors.hpp"
#include "shear.hpp"
#include "tensor_util.hpp"

#include <string>
#include <utility>
#include <vector>

// ========================== Helper functions ==========================

/// Drop the R and W axes of a [M, N, R, W] result that the caller did not pass.
static torch::Tensor squeeze_axes(
    torch::Tensor const& coeffs,
    bool keep_windows,
    bool keep_channels) {

    std::vector<int64_t> shape = {coeffs.size(0), coeffs.size(1)};
    if (keep_windows) {
        shape.push_back(coeffs.size(2));
    }
    if (keep_channels) {
        shape.push_back(coeffs.size(3));
    }
    return coeffs.reshape(shape);
}

/// Bring caller coefficients [M, N(, R)(, W)] to the kernel form [M, N, R, W].
/// Returns the expanded tensor and whether a W axis was present.
static std::pair<torch::Tensor, bool> expand_axes(
    torch::Tensor const& coeffs,
    FactoredWindow const& window) {

    int64_t const base = window.stacked ? 3 : 2;
    bool const has_channels = coeffs.dim() == base + 1;
    if (coeffs.dim() != base && !has_channels) {
        throw ShapeMismatchError(
            "coefficients must have " + std::to_string(base) + " or " +
            std::to_string(base + 1) + " dimensions for this window, got " +
            std::to_string(coeffs.dim()));
    }

    auto x = coeffs;
    if (!window.stacked) {
        x = x.unsqueeze(2);  // R = 1
    }
    if (!has_channels) {
        x = x.unsqueeze(3);  // W = 1
    }
    return {x, has_channels};
}

// ========================== Rectangular lattice ==========================

torch::Tensor dgt(
    torch::Tensor const& signal,
    FactoredWindow const& window,
    int64_t a,
    int64_t M) {

    auto f = as_columns(signal, "signal");
    auto coeffs = dgt_fac(f, window, a, M);
    return squeeze_axes(coeffs, window.stacked, signal.dim() == 2);
}

torch::Tensor dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {

    if (window.size(0) != signal.size(0)) {
        throw ShapeMismatchError(
            "window length " + std::to_string(window.size(0)) +
            " does not match signal length " + std::to_string(signal.size(0)));
    }
    return dgt(signal, window_factorize(window, a, M), a, M);
}

torch::Tensor idgt(
    torch::Tensor const& coefficients,
    FactoredWindow const& window,
    int64_t a,
    int64_t M) {

    auto [expanded, has_channels] = expand_axes(coefficients, window);
    auto signal = idgt_fac(expanded, window, a, M);  // [L, W]
    return has_channels ? signal : signal.squeeze(1);
}

torch::Tensor idgt(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {

    return idgt(coefficients, window_factorize(window, a, M), a, M);
}

// ========================== Non-separable lattice ==========================

torch::Tensor nonsep_dgt(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {

    auto f = as_columns(signal, "signal");
    int64_t const L = f.size(0);
    auto const plan = default_shear_plan_cache().get(L, a, M, lt1, lt2);

    auto coeffs = nonsep_dgt_shear(f, window, *plan);  // [M, N, W]
    return signal.dim() == 2 ? coeffs : coeffs.squeeze(2);
}

torch::Tensor nonsep_idgt(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {

    if (coefficients.dim() != 2 && coefficients.dim() != 3) {
        throw ShapeMismatchError(
            "coefficients must be [M, N] or [M, N, W], got " +
            std::to_string(coefficients.dim()) + " dimensions");
    }
    int64_t const L = window.size(0);
    auto const plan = default_shear_plan_cache().get(L, a, M, lt1, lt2);

    bool const has_channels = coefficients.dim() == 3;
    auto c = has_channels ? coefficients : coefficients.unsqueeze(2);
    auto signal = nonsep_idgt_shear(c, window, *plan);  // [L, W]
    return has_channels ? signal : signal.squeeze(1);
}
