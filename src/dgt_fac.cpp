#include "dgt_fac.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <optional>
#include <string>

// ========================== Helper functions ==========================

/// Position of every block-correlation entry in the flattened [M, N, R, W]
/// array. The correlation C[r, sigma](u + q*rho, l + q*w) belongs to channel
/// sample j = r + c*l and frame n = (l*h + u + q*sigma) mod N.
/// Returns int64 [c, d, R, q, W, q] ordered like the correlation tensor.
static torch::Tensor coefficient_index(LatticeParams const& lat, int64_t R, int64_t W) {
    auto const opts = torch::TensorOptions().dtype(torch::kLong);
    int64_t const c = lat.c, d = lat.d, q = lat.q;

    auto r = torch::arange(c, opts).view({c, 1, 1, 1, 1, 1});
    auto sigma = torch::arange(d, opts).view({1, d, 1, 1, 1, 1});
    auto rho = torch::arange(R, opts).view({1, 1, R, 1, 1, 1});
    auto u = torch::arange(q, opts).view({1, 1, 1, q, 1, 1});
    auto w = torch::arange(W, opts).view({1, 1, 1, 1, W, 1});
    auto l = torch::arange(q, opts).view({1, 1, 1, 1, 1, q});

    auto j = r + c * l;
    auto n = torch::remainder(l * lat.h + u + q * sigma, lat.N);
    return ((j * lat.N + n) * R + rho) * W + w;
}

// ========================== Transforms ==========================

torch::Tensor dgt_fac(
    torch::Tensor const& signal,
    FactoredWindow const& window,
    int64_t a,
    int64_t M) {

    if (signal.dim() != 2) {
        throw ShapeMismatchError(
            "signal must be [L, W], got " + std::to_string(signal.dim()) + " dimensions");
    }
    int64_t const L = signal.size(0);
    int64_t const W = signal.size(1);
    auto const lat = make_lattice(L, a, M);
    check_factored_window(window, lat);

    int64_t const c = lat.c, d = lat.d, p = lat.p, q = lat.q;
    int64_t const R = window.num_windows;
    auto const device = signal.device();

    auto g_blocks = window_blocks(window, lat).to(device);  // [c, d, p, qR]
    auto index = walnut_signal_index(lat).to(device).reshape({-1});

    // Real signal and real window: the block correlations are real, so only
    // the d/2 + 1 non-redundant DFT bins are multiplied.
    bool const real_path = !signal.is_complex() && window.real_window;

    auto f = real_path ? signal.to(torch::kFloat64) : to_complex(signal);
    auto f_blocks = f.index_select(0, index)
        .reshape({c, d, p, q, W})
        .permute({0, 1, 2, 4, 3})
        .reshape({c, d, p, W * q});  // column l + q*w

    torch::Tensor correlation;  // [c, d, qR, qW]
    if (real_path) {
        int64_t const half = d / 2 + 1;
        auto f_hat = torch::fft::rfft(f_blocks, std::nullopt, /*dim=*/1, "ortho");
        auto g_hat = g_blocks.narrow(1, 0, half);
        auto product = torch::matmul(g_hat.conj().transpose(-2, -1), f_hat);
        correlation = torch::fft::irfft(product, d, /*dim=*/1, "forward");
    } else {
        auto f_hat = torch::fft::fft(f_blocks, std::nullopt, /*dim=*/1, "ortho");
        auto product = torch::matmul(g_blocks.conj().transpose(-2, -1), f_hat);
        correlation = torch::fft::ifft(product, std::nullopt, /*dim=*/1, "forward");
    }

    // Scatter the correlations into the per-frame channel samples, then take
    // the length-M DFT along the channel axis.
    auto destination = coefficient_index(lat, R, W).to(device).reshape({-1});
    auto frames = torch::zeros({M * lat.N * R * W}, correlation.options());
    frames.index_put_({destination}, correlation.reshape({c, d, R, q, W, q}).reshape({-1}));

    return torch::fft::fft(frames.reshape({M, lat.N, R, W}), std::nullopt, /*dim=*/0);
}

torch::Tensor idgt_fac(
    torch::Tensor const& coefficients,
    FactoredWindow const& window,
    int64_t a,
    int64_t M) {

    int64_t const L = window.signal_length;
    auto const lat = make_lattice(L, a, M);
    check_factored_window(window, lat);
    int64_t const c = lat.c, d = lat.d, p = lat.p, q = lat.q;
    int64_t const R = window.num_windows;

    if (coefficients.dim() != 4 || coefficients.size(0) != M ||
        coefficients.size(1) != lat.N || coefficients.size(2) != R) {
        throw ShapeMismatchError(
            "coefficients must be [M, N, R, W] = [" + std::to_string(M) + ", " +
            std::to_string(lat.N) + ", " + std::to_string(R) + ", W], got " +
            std::to_string(coefficients.dim()) + " dimensions");
    }
    int64_t const W = coefficients.size(3);
    auto const device = coefficients.device();

    // Unnormalized inverse DFT along channels gives the per-frame samples.
    auto frames = torch::fft::ifft(to_complex(coefficients), std::nullopt, /*dim=*/0, "forward");

    auto source = coefficient_index(lat, R, W).to(device).reshape({-1});
    auto psi = frames.reshape({-1}).index_select(0, source).reshape({c, d, R * q, W * q});
    auto psi_hat = torch::fft::fft(psi, std::nullopt, /*dim=*/1, "ortho");

    auto g_blocks = window_blocks(window, lat).to(device);  // [c, d, p, qR]
    auto f_hat = torch::matmul(g_blocks, psi_hat);           // [c, d, p, qW]
    auto f_blocks = torch::fft::ifft(f_hat, std::nullopt, /*dim=*/1, "forward");

    auto index = walnut_signal_index(lat).to(device).reshape({-1});
    auto signal = torch::zeros({L, W}, complex_opts_like(coefficients));
    signal.index_put_({index},
        f_blocks.reshape({c, d, p, W, q}).permute({0, 1, 2, 4, 3}).reshape({-1, W}));
    return signal;
}
