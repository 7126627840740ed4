#pragma once

#include <cstdint>

/// Integer structure of a time-frequency lattice on a length-L signal.
///
/// The rectangular lattice is (a, M). A non-separable lattice adds the
/// lattice type (lt1, lt2): frame n is shifted up in frequency by
/// (n*lt1 mod lt2)/lt2 channels. Rectangular lattices use lt = (0, 1).
struct LatticeParams {
    int64_t L;     // signal length
    int64_t a;     // time hop
    int64_t M;     // number of channels
    int64_t b;     // frequency hop, L/M
    int64_t N;     // number of frames, L/a
    int64_t c;     // gcd(a, M)
    int64_t d;     // gcd(b, N)
    int64_t p;     // a/c
    int64_t q;     // M/c
    int64_t h;     // inverse of p modulo q (0 when q == 1)
    int64_t lt1;
    int64_t lt2;

    bool is_rectangular() const { return lt1 == 0; }
};

/// Validate (L, a, M, lt1, lt2) and derive the Walnut factorization sizes.
/// Throws IncompatibleLatticeError if any divisibility rule fails.
LatticeParams make_lattice(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1 = 0,
    int64_t lt2 = 1);

/// Check that (lt1, lt2) describes a lattice type: 0 <= lt1 < lt2.
void validate_lattice_type(int64_t lt1, int64_t lt2);

/// Smallest L admissible for the lattice: lcm(a, M) * lt2.
int64_t minimal_length(int64_t a, int64_t M, int64_t lt1 = 0, int64_t lt2 = 1);

/// Smallest admissible L that is >= Ls.
int64_t dgt_length(int64_t Ls, int64_t a, int64_t M, int64_t lt1 = 0, int64_t lt2 = 1);
