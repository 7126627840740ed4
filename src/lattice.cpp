#include "lattice.hpp"

#include "errors.hpp"

#include <numeric>
#include <string>

/// Inverse of p modulo q via the extended Euclidean algorithm.
/// p and q are coprime by construction (p = a/c, q = M/c).
static int64_t inverse_mod(int64_t p, int64_t q) {
    if (q == 1) {
        return 0;
    }
    int64_t old_r = p % q;
    int64_t r = q;
    int64_t old_s = 1;
    int64_t s = 0;
    while (r != 0) {
        int64_t const quotient = old_r / r;
        int64_t const next_r = old_r - quotient * r;
        old_r = r;
        r = next_r;
        int64_t const next_s = old_s - quotient * s;
        old_s = s;
        s = next_s;
    }
    return ((old_s % q) + q) % q;
}

static void validate_positive(int64_t value, char const* name) {
    if (value <= 0) {
        throw IncompatibleLatticeError(
            std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

void validate_lattice_type(int64_t lt1, int64_t lt2) {
    if (lt2 <= 0 || lt1 < 0 || lt1 >= lt2) {
        throw IncompatibleLatticeError(
            "Lattice type (" + std::to_string(lt1) + ", " + std::to_string(lt2) +
            ") must satisfy 0 <= lt1 < lt2");
    }
}

int64_t minimal_length(int64_t a, int64_t M, int64_t lt1, int64_t lt2) {
    validate_positive(a, "Hop size a");
    validate_positive(M, "Number of channels M");
    validate_lattice_type(lt1, lt2);
    return std::lcm(a, M) * lt2;
}

int64_t dgt_length(int64_t Ls, int64_t a, int64_t M, int64_t lt1, int64_t lt2) {
    validate_positive(Ls, "Signal length");
    int64_t const smallest = minimal_length(a, M, lt1, lt2);
    return ((Ls + smallest - 1) / smallest) * smallest;
}

LatticeParams make_lattice(int64_t L, int64_t a, int64_t M, int64_t lt1, int64_t lt2) {
    validate_positive(L, "Signal length L");
    int64_t const smallest = minimal_length(a, M, lt1, lt2);

    if (L % a != 0) {
        throw IncompatibleLatticeError(
            "Signal length " + std::to_string(L) +
            " is not divisible by hop size a = " + std::to_string(a));
    }
    if (L % M != 0) {
        throw IncompatibleLatticeError(
            "Signal length " + std::to_string(L) +
            " is not divisible by number of channels M = " + std::to_string(M));
    }
    // Frame n and n + lt2 sit at the same frequency offset, so both the frame
    // count and the channel spacing must split into lt2 equal parts.
    if (L % smallest != 0) {
        throw IncompatibleLatticeError(
            "Signal length " + std::to_string(L) + " is not a multiple of the minimal length " +
            std::to_string(smallest) + " for a = " + std::to_string(a) +
            ", M = " + std::to_string(M) + ", lt = (" + std::to_string(lt1) + ", " +
            std::to_string(lt2) + ")");
    }

    LatticeParams lat{};
    lat.L = L;
    lat.a = a;
    lat.M = M;
    lat.b = L / M;
    lat.N = L / a;
    lat.c = std::gcd(a, M);
    lat.d = std::gcd(lat.b, lat.N);
    lat.p = a / lat.c;
    lat.q = M / lat.c;
    lat.h = inverse_mod(lat.p, lat.q);
    lat.lt1 = lt1;
    lat.lt2 = lt2;
    return lat;
}
