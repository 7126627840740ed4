#include "wfac.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <optional>
#include <string>

// ========================== Index maps ==========================
//
// Restricted to the residue class r modulo c, the signal lives on Z_{L/c}
// with L/c = p*q*d. Block entry (k, u) of the window walks that class in
// steps of p*q as sigma runs over [0, d); the length-d DFT over sigma turns
// the per-frame correlations into pointwise products.

torch::Tensor walnut_window_index(LatticeParams const& lat) {
    auto const opts = torch::TensorOptions().dtype(torch::kLong);
    int64_t const subgroup = lat.L / lat.c;

    auto r = torch::arange(lat.c, opts).view({lat.c, 1, 1, 1});
    auto sigma = torch::arange(lat.d, opts).view({1, lat.d, 1, 1});
    auto k = torch::arange(lat.p, opts).view({1, 1, lat.p, 1});
    auto u = torch::arange(lat.q, opts).view({1, 1, 1, lat.q});

    auto pos = torch::remainder(k * lat.q - u * lat.p + sigma * (lat.p * lat.q), subgroup);
    return r + lat.c * pos;
}

torch::Tensor walnut_signal_index(LatticeParams const& lat) {
    auto const opts = torch::TensorOptions().dtype(torch::kLong);
    int64_t const subgroup = lat.L / lat.c;

    auto r = torch::arange(lat.c, opts).view({lat.c, 1, 1, 1});
    auto sigma = torch::arange(lat.d, opts).view({1, lat.d, 1, 1});
    auto k = torch::arange(lat.p, opts).view({1, 1, lat.p, 1});
    auto l = torch::arange(lat.q, opts).view({1, 1, 1, lat.q});

    auto pos = torch::remainder(
        k * lat.q + l * (lat.h * lat.p) + sigma * (lat.p * lat.q), subgroup);
    return r + lat.c * pos;
}

// ========================== Factorization ==========================

FactoredWindow window_factorize(
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {

    auto g = as_columns(window, "window");
    int64_t const L = g.size(0);
    int64_t const R = g.size(1);
    auto const lat = make_lattice(L, a, M);
    int64_t const c = lat.c, d = lat.d, p = lat.p, q = lat.q;

    auto index = walnut_window_index(lat).to(g.device()).reshape({-1});

    // Gather -> [c, d, p, q, R], then interleave windows as column u + q*rho.
    auto blocks = to_complex(g).index_select(0, index).reshape({c, d, p, q, R});
    blocks = blocks.permute({0, 1, 2, 4, 3}).reshape({c, d, p, R * q});
    blocks = torch::fft::fft(blocks, std::nullopt, /*dim=*/1, "ortho");

    // [c, d, p, qR] -> [qR, p, d, c] -> rows k + p*(u + q*rho), cols r + c*s.
    auto coeffs = blocks.permute({3, 2, 1, 0}).reshape({p * q * R, c * d}).contiguous();

    return FactoredWindow{
        .coeffs = coeffs,
        .signal_length = L,
        .a = a,
        .M = M,
        .num_windows = R,
        .stacked = window.dim() == 2,
        .real_window = !window.is_complex(),
    };
}

void check_factored_window(FactoredWindow const& factored, LatticeParams const& lat) {
    if (factored.signal_length != lat.L || factored.a != lat.a || factored.M != lat.M) {
        throw ShapeMismatchError(
            "Factored window was built for L = " + std::to_string(factored.signal_length) +
            ", a = " + std::to_string(factored.a) + ", M = " + std::to_string(factored.M) +
            ", but is used with L = " + std::to_string(lat.L) + ", a = " +
            std::to_string(lat.a) + ", M = " + std::to_string(lat.M));
    }
    auto const& coeffs = factored.coeffs;
    if (coeffs.dim() != 2 || coeffs.size(0) != lat.p * lat.q * factored.num_windows ||
        coeffs.size(1) != lat.c * lat.d) {
        throw ShapeMismatchError(
            "Factored window coefficients must be [" +
            std::to_string(lat.p * lat.q * factored.num_windows) + ", " +
            std::to_string(lat.c * lat.d) + "]");
    }
}

torch::Tensor window_blocks(FactoredWindow const& factored, LatticeParams const& lat) {
    int64_t const R = factored.num_windows;
    return factored.coeffs
        .reshape({lat.q * R, lat.p, lat.d, lat.c})
        .permute({3, 2, 1, 0});  // [c, d, p, qR]
}

torch::Tensor window_defactorize(
    torch::Tensor const& coeffs,
    int64_t L,
    int64_t a,
    int64_t M) {

    auto const lat = make_lattice(L, a, M);
    int64_t const c = lat.c, d = lat.d, p = lat.p, q = lat.q;

    if (coeffs.dim() != 2 || coeffs.size(1) != c * d || coeffs.size(0) % (p * q) != 0 ||
        coeffs.size(0) == 0) {
        throw ShapeMismatchError(
            "Factored window must be [p*q*R, c*d] = [" + std::to_string(p * q) + "*R, " +
            std::to_string(c * d) + "] for L = " + std::to_string(L) + ", a = " +
            std::to_string(a) + ", M = " + std::to_string(M));
    }
    int64_t const R = coeffs.size(0) / (p * q);

    auto blocks = to_complex(coeffs).reshape({q * R, p, d, c}).permute({3, 2, 1, 0});
    blocks = torch::fft::ifft(blocks, std::nullopt, /*dim=*/1, "ortho");
    blocks = blocks.reshape({c, d, p, R, q}).permute({0, 1, 2, 4, 3}).reshape({-1, R});

    // The index map is a bijection onto [0, L), so a plain scatter inverts it.
    auto index = walnut_window_index(lat).to(coeffs.device()).reshape({-1});
    auto window = torch::zeros({L, R}, complex_opts_like(coeffs));
    window.index_put_({index}, blocks);
    return window;
}

torch::Tensor window_defactorize(
    FactoredWindow const& factored,
    int64_t a,
    int64_t M) {

    check_factored_window(factored, make_lattice(factored.signal_length, a, M));
    auto window = window_defactorize(factored.coeffs, factored.signal_length, a, M);
    return factored.stacked ? window : window.squeeze(1);
}
