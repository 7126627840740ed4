#include "lattice.hpp"
#include "shear.hpp"
#include "stream.hpp"
#include "transform.hpp"
#include "wfac.hpp"

#include <torch/extension.h>

#include <tuple>

namespace {

std::tuple<int64_t, int64_t, int64_t> find_shear_wrapper(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {
    auto const shear = find_shear(L, a, M, lt1, lt2);
    return {shear.s0, shear.s1, shear.X};
}

torch::Tensor factorize_wrapper(
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {
    return window_factorize(window, a, M).coeffs;
}

torch::Tensor defactorize_wrapper(
    torch::Tensor const& coeffs,
    int64_t L,
    int64_t a,
    int64_t M) {
    return window_defactorize(coeffs, L, a, M);
}

torch::Tensor stream_wrapper(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M,
    int64_t buffer_length,
    int64_t zero_padding,
    int64_t lt1,
    int64_t lt2) {
    StreamConfig const config{
        .a = a,
        .M = M,
        .lt1 = lt1,
        .lt2 = lt2,
        .buffer_length = buffer_length,
        .zero_padding = zero_padding,
    };
    return stream_dgt(signal, window, config);
}

torch::Tensor dgt_wrapper(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {
    return dgt(signal, window, a, M);
}

torch::Tensor idgt_wrapper(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    int64_t a,
    int64_t M) {
    return idgt(coefficients, window, a, M);
}

}  // namespace

PYBIND11_MODULE(fastdgt, m) {
    m.doc() = "Fast discrete Gabor transforms on rectangular and non-separable lattices";

    m.def("dgt", &dgt_wrapper,
          "Forward DGT on the rectangular lattice (a, M)",
          py::arg("signal"),
          py::arg("window"),
          py::arg("a"),
          py::arg("M"));

    m.def("idgt", &idgt_wrapper,
          "Inverse DGT on the rectangular lattice (a, M)",
          py::arg("coefficients"),
          py::arg("window"),
          py::arg("a"),
          py::arg("M"));

    m.def("nonsep_dgt", &nonsep_dgt,
          "Forward DGT on the non-separable lattice (a, M, lt1, lt2)",
          py::arg("signal"),
          py::arg("window"),
          py::arg("a"),
          py::arg("M"),
          py::arg("lt1"),
          py::arg("lt2"));

    m.def("nonsep_idgt", &nonsep_idgt,
          "Inverse DGT on the non-separable lattice (a, M, lt1, lt2)",
          py::arg("coefficients"),
          py::arg("window"),
          py::arg("a"),
          py::arg("M"),
          py::arg("lt1"),
          py::arg("lt2"));

    m.def("window_factorize", &factorize_wrapper,
          "Walnut factorization of a window [L] or window stack [L, R]",
          py::arg("window"),
          py::arg("a"),
          py::arg("M"));

    m.def("window_defactorize", &defactorize_wrapper,
          "Rebuild the window stack [L, R] from factored coefficients",
          py::arg("coeffs"),
          py::arg("L"),
          py::arg("a"),
          py::arg("M"));

    m.def("find_shear", &find_shear_wrapper,
          "Shear (s0, s1, X) mapping the lattice onto a rectangular one",
          py::arg("L"),
          py::arg("a"),
          py::arg("M"),
          py::arg("lt1") = 0,
          py::arg("lt2") = 1);

    m.def("minimal_length", &minimal_length,
          "Smallest signal length admissible for the lattice",
          py::arg("a"),
          py::arg("M"),
          py::arg("lt1") = 0,
          py::arg("lt2") = 1);

    m.def("dgt_length", &dgt_length,
          "Smallest admissible signal length >= Ls",
          py::arg("Ls"),
          py::arg("a"),
          py::arg("M"),
          py::arg("lt1") = 0,
          py::arg("lt2") = 1);

    m.def("stream_dgt", &stream_wrapper,
          "Blockwise overlap-add DGT of a signal, buffer by buffer",
          py::arg("signal"),
          py::arg("window"),
          py::arg("a"),
          py::arg("M"),
          py::arg("buffer_length"),
          py::arg("zero_padding"),
          py::arg("lt1") = 0,
          py::arg("lt2") = 1);
}
