#include "errors.hpp"
#include "test_util.hpp"
#include "wfac.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static constexpr double TOL = 1e-12;

static void test_index_maps_are_permutations() {
    for (auto const& tc : rect_cases()) {
        auto const lat = make_lattice(tc.L, tc.a, tc.M);
        auto expected = torch::arange(tc.L, torch::kLong);

        auto window_index = walnut_window_index(lat);
        assert(window_index.sizes() == torch::IntArrayRef({lat.c, lat.d, lat.p, lat.q}));
        assert(torch::equal(std::get<0>(window_index.reshape({-1}).sort()), expected));

        auto signal_index = walnut_signal_index(lat);
        assert(torch::equal(std::get<0>(signal_index.reshape({-1}).sort()), expected));
    }
    std::cout << "  test_index_maps_are_permutations passed." << std::endl;
}

static void test_layout() {
    // L = 24, a = 4, M = 6: c = 2, d = 2, p = 2, q = 3.
    auto g = crand({24});
    auto fw = window_factorize(g, 4, 6);
    assert(fw.coeffs.sizes() == torch::IntArrayRef({6, 4}));
    assert(fw.signal_length == 24);
    assert(fw.a == 4);
    assert(fw.M == 6);
    assert(fw.num_windows == 1);
    assert(!fw.stacked);
    assert(!fw.real_window);

    // Row k + p*u = 1 + 2*2, column r + c*s = 1 + 2*1. The block entry walks
    // samples 1 + 2*((k*q - u*p + 6*sigma) mod 12) = 23, 11.
    auto expected = (g[23] - g[11]) / std::sqrt(2.0);
    assert((fw.coeffs[5][3] - expected).abs().item<double>() < TOL);

    auto stack = rrand({24, 3});
    auto fs = window_factorize(stack, 4, 6);
    assert(fs.coeffs.sizes() == torch::IntArrayRef({18, 4}));
    assert(fs.num_windows == 3);
    assert(fs.stacked);
    assert(fs.real_window);

    // Window rho occupies rows k + p*(u + q*rho).
    auto second = window_factorize(stack.select(1, 1), 4, 6);
    assert(max_error(fs.coeffs.narrow(0, 6, 6), second.coeffs) < TOL);
    std::cout << "  test_layout passed." << std::endl;
}

static void test_defactorize_inverts_factorize() {
    for (auto const& tc : rect_cases()) {
        for (int64_t R = 1; R <= 3; ++R) {
            auto g = crand({tc.L, R});
            auto fw = window_factorize(g, tc.a, tc.M);
            auto back = window_defactorize(fw.coeffs, tc.L, tc.a, tc.M);
            assert(back.sizes() == g.sizes());
            assert(max_error(back, g) < TOL);
        }

        auto g = rrand({tc.L});
        auto back = window_defactorize(window_factorize(g, tc.a, tc.M), tc.a, tc.M);
        assert(back.dim() == 1);
        assert(max_error(back, g.to(torch::kComplex128)) < TOL);
    }
    std::cout << "  test_defactorize_inverts_factorize passed." << std::endl;
}

static void test_shape_errors() {
    assert(throws<ShapeMismatchError>([] { window_defactorize(crand({5, 4}), 24, 4, 6); }));
    assert(throws<ShapeMismatchError>([] { window_defactorize(crand({6, 3}), 24, 4, 6); }));
    assert(throws<ShapeMismatchError>([] { window_defactorize(crand({6}), 24, 4, 6); }));
    assert(throws<ShapeMismatchError>([] { window_factorize(crand({24, 2, 2}), 4, 6); }));
    assert(throws<IncompatibleLatticeError>([] { window_factorize(crand({20}), 4, 6); }));
    std::cout << "  test_shape_errors passed." << std::endl;
}

int main() {
    torch::manual_seed(7);
    std::cout << "Running window factorization tests..." << std::endl;

    test_index_maps_are_permutations();
    test_layout();
    test_defactorize_inverts_factorize();
    test_shape_errors();

    std::cout << "All window factorization tests passed." << std::endl;
    return 0;
}
