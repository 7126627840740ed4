#pragma once

#include <torch/torch.h>

#include "lattice.hpp"

#include <array>
#include <deque>
#include <map>
#include <memory>
#include <mutex>

/// Shear taking a non-separable lattice to the rectangular lattice (ar, Mr).
/// The signal is chirped with s1 in time and with -s0 in frequency; the
/// rectangular lattice has frequency hop X, hop ar = a*b/X and Mr = L/X.
struct ShearParams {
    int64_t s0;
    int64_t s1;
    int64_t X;
};

/// Find the shear for (L, a, M, lt1, lt2). Rectangular lattices get the
/// identity shear (0, 0, b). Otherwise X runs over the divisors of b in
/// ascending order and the first admissible (s1, s0) is returned.
/// Throws IncompatibleLatticeError for invalid (L, a, M) and NoShearFoundError
/// when L does not close the non-separable lattice or the search fails.
ShearParams find_shear(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2);

/// Periodic chirp exp(i*pi*s*n^2*(L+1)/L), n in [0, L).
/// The phase numerator is reduced modulo 2L in integer arithmetic.
torch::Tensor pchirp(int64_t L, int64_t s);

/// Apply the shear to every column of x [L, K]: time chirp s1, then a
/// frequency-domain chirp -s0. Returns x unchanged for the identity shear.
torch::Tensor apply_shear(torch::Tensor const& x, ShearParams const& shear);

/// Inverse of apply_shear.
torch::Tensor undo_shear(torch::Tensor const& x, ShearParams const& shear);

/// Precomputed data for shear-based transforms of one lattice tuple.
struct ShearPlan {
    LatticeParams lattice;       // non-separable lattice on length L
    ShearParams shear;
    int64_t ar;                  // rectangular hop
    int64_t Mr;                  // rectangular channel count
    torch::Tensor phase;         // [Mr, L/ar] residual phase, complex128
    torch::Tensor target_row;    // [Mr, L/ar] channel m of each rectangular coefficient
    torch::Tensor target_col;    // [Mr, L/ar] frame n of each rectangular coefficient
    torch::Tensor target;        // [Mr * L/ar] flat index m*N + n
};

/// Build the plan for (L, a, M, lt1, lt2) with the shear from find_shear.
ShearPlan make_shear_plan(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2);

/// Build the plan for an explicit shear. Throws LatticeIndexingError if the
/// shear does not map the rectangular grid exactly onto the lattice.
ShearPlan make_shear_plan(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2,
    ShearParams const& shear);

/// Shear plans keyed by (L, a, M, lt1, lt2). Plans depend only on the
/// lattice, never on signal content. Safe to share between threads.
///
/// Plans are handed out as shared pointers, so a plan stays valid after it is
/// evicted or the cache is cleared. With a nonzero capacity the oldest plan is
/// evicted once the cache is full; capacity 0 keeps every plan.
class ShearPlanCache {
public:
    explicit ShearPlanCache(size_t capacity = 0) : capacity_(capacity) {}

    std::shared_ptr<ShearPlan const> get(int64_t L, int64_t a, int64_t M, int64_t lt1, int64_t lt2);
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    using Key = std::array<int64_t, 5>;

    size_t const capacity_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<ShearPlan const>> plans_;
    std::deque<Key> order_;  // insertion order, oldest first
};

/// Process-wide cache used by nonsep_dgt and nonsep_idgt. Holds at most
/// default_shear_plan_capacity plans.
inline constexpr size_t default_shear_plan_capacity = 64;
ShearPlanCache& default_shear_plan_cache();

/// Non-separable DGT through the shear plan.
/// signal: [L, W]. window: [L]. Returns complex coefficients [M, N, W].
torch::Tensor nonsep_dgt_shear(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    ShearPlan const& plan);

/// Inverse non-separable DGT through the shear plan.
/// coefficients: [M, N, W]. window: [L] synthesis window. Returns [L, W].
torch::Tensor nonsep_idgt_shear(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    ShearPlan const& plan);
