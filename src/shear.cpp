#include "shear.hpp"

#include "dgt_fac.hpp"
#include "errors.hpp"
#include "tensor_util.hpp"
#include "wfac.hpp"

#include <numbers>
#include <optional>
#include <string>

// ========================== Helper functions ==========================

/// Non-negative remainder of x modulo m.
static int64_t mod(int64_t x, int64_t m) {
    return ((x % m) + m) % m;
}

static std::string lattice_label(int64_t L, int64_t a, int64_t M, int64_t lt1, int64_t lt2) {
    return "L = " + std::to_string(L) + ", a = " + std::to_string(a) + ", M = " +
        std::to_string(M) + ", lt = (" + std::to_string(lt1) + ", " + std::to_string(lt2) + ")";
}

/// Broadcast a length-L sequence against x, which is [L] or [L, K].
static torch::Tensor along_rows(torch::Tensor const& sequence, torch::Tensor const& x) {
    auto seq = sequence.to(x.device());
    return x.dim() == 1 ? seq : seq.unsqueeze(1);
}

/// exp(i*pi*numerator/L) for an int64 tensor of numerators in [0, 2L).
static torch::Tensor phase_from_numerator(torch::Tensor const& numerator, int64_t L) {
    auto angle = numerator.to(torch::kFloat64) * (std::numbers::pi / static_cast<double>(L));
    return torch::polar(torch::ones_like(angle), angle);
}

// ========================== Shear search ==========================

ShearParams find_shear(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {

    validate_lattice_type(lt1, lt2);
    auto const rect = make_lattice(L, a, M);
    int64_t const b = rect.b;

    if (lt1 == 0) {
        return ShearParams{.s0 = 0, .s1 = 0, .X = b};
    }
    if (L % minimal_length(a, M, lt1, lt2) != 0) {
        throw NoShearFoundError(
            "No integer shear for " + lattice_label(L, a, M, lt1, lt2) +
            ": L must be a multiple of " + std::to_string(minimal_length(a, M, lt1, lt2)));
    }

    // Frequency offset of frame 1; the lattice is generated by (a, s) and (0, b).
    int64_t const s = b / lt2 * lt1;

    // After the shear the generators are (a + s0*s', s') and (s0*b, b) with
    // s' = s + s1*a. The image is the grid ar*Z x X*Z exactly when both lie
    // on it, because the shear preserves the number of lattice points.
    for (int64_t X = 1; X <= b; ++X) {
        if (b % X != 0) {
            continue;
        }
        int64_t const ar = a * b / X;
        if (L % ar != 0) {
            continue;
        }
        for (int64_t s1 = 0; s1 < b; ++s1) {
            int64_t const sheared = mod(s + s1 * a, L);
            if (sheared % X != 0) {
                continue;
            }
            for (int64_t s0 = 0; s0 < ar; ++s0) {
                if (mod(a + s0 * sheared, L) % ar == 0 && mod(s0 * b, L) % ar == 0) {
                    return ShearParams{.s0 = s0, .s1 = s1, .X = X};
                }
            }
        }
    }

    throw NoShearFoundError("No integer shear found for " + lattice_label(L, a, M, lt1, lt2));
}

// ========================== Chirps ==========================

torch::Tensor pchirp(int64_t L, int64_t s) {
    if (L <= 0) {
        throw std::invalid_argument("Chirp length must be positive, got " + std::to_string(L));
    }
    int64_t const period = 2 * L;
    auto n = torch::arange(L, torch::kLong);
    auto numerator = torch::remainder(torch::remainder(n * n, period) * mod(s, period), period);
    numerator = torch::remainder(numerator * (L + 1), period);
    return phase_from_numerator(numerator, L);
}

torch::Tensor apply_shear(torch::Tensor const& x, ShearParams const& shear) {
    int64_t const L = x.size(0);
    auto y = x;
    if (shear.s1 != 0) {
        y = y * along_rows(pchirp(L, shear.s1), y);
    }
    if (shear.s0 != 0) {
        auto spectrum = torch::fft::fft(y, std::nullopt, /*dim=*/0);
        y = torch::fft::ifft(spectrum * along_rows(pchirp(L, -shear.s0), y), std::nullopt, /*dim=*/0);
    }
    return y;
}

torch::Tensor undo_shear(torch::Tensor const& x, ShearParams const& shear) {
    int64_t const L = x.size(0);
    auto y = x;
    if (shear.s0 != 0) {
        auto spectrum = torch::fft::fft(y, std::nullopt, /*dim=*/0);
        y = torch::fft::ifft(spectrum * along_rows(pchirp(L, shear.s0), y), std::nullopt, /*dim=*/0);
    }
    if (shear.s1 != 0) {
        y = y * along_rows(pchirp(L, -shear.s1), y);
    }
    return y;
}

// ========================== Plans ==========================

ShearPlan make_shear_plan(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {

    auto const shear = find_shear(L, a, M, lt1, lt2);
    return make_shear_plan(L, a, M, lt1, lt2, shear);
}

ShearPlan make_shear_plan(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2,
    ShearParams const& shear) {

    auto const lat = make_lattice(L, a, M, lt1, lt2);
    int64_t const b = lat.b;
    int64_t const X = shear.X;

    if (X <= 0 || b % X != 0 || L % (a * b / X) != 0) {
        throw LatticeIndexingError(
            "Shear frequency hop X = " + std::to_string(X) +
            " does not give an integer rectangular lattice for " +
            lattice_label(L, a, M, lt1, lt2));
    }
    int64_t const ar = a * b / X;
    int64_t const Mr = L / X;
    int64_t const Nr = L / ar;
    int64_t const period = 2 * L;

    auto const opts = torch::TensorOptions().dtype(torch::kLong);
    auto t = (torch::arange(Nr, opts) * ar).view({1, Nr});   // rectangular time
    auto nu = (torch::arange(Mr, opts) * X).view({Mr, 1});   // rectangular frequency

    // Residual phase s1*(t - s0*nu)^2 + s0*nu^2, times (L + 1), modulo 2L.
    auto skew = torch::remainder(t - nu * mod(shear.s0, period), period);
    auto numerator = torch::remainder(
        torch::remainder(skew * skew, period) * mod(shear.s1, period) +
            torch::remainder(nu * nu, period) * mod(shear.s0, period),
        period);
    numerator = torch::remainder(numerator * (L + 1), period);

    // Lattice point reached by [1 0; -s1 1] * [1 -s0; 0 1] * (t, nu), modulo L.
    auto time = torch::remainder(t - nu * mod(shear.s0, L), L);
    auto freq = torch::remainder(
        nu * mod(1 + mod(shear.s0, L) * mod(shear.s1, L), L) - t * mod(shear.s1, L), L);

    if (torch::remainder(time, a).ne(0).any().item<bool>()) {
        throw LatticeIndexingError(
            "Sheared time positions are not multiples of a for " +
            lattice_label(L, a, M, lt1, lt2));
    }
    auto col = time.div(a, "floor");
    auto row = freq.div(b, "floor");

    // Frame n must land at channel offset (n*lt1 mod lt2)/lt2.
    auto offset = freq - row * b;
    auto expected = torch::remainder(col * lt1, lt2) * (b / lt2);
    if (offset.ne(expected).any().item<bool>()) {
        throw LatticeIndexingError(
            "Sheared frequencies leave the lattice for " + lattice_label(L, a, M, lt1, lt2));
    }

    auto target = (row * lat.N + col).reshape({-1});
    auto hits = torch::bincount(target, /*weights=*/{}, /*minlength=*/M * lat.N);
    if (target.numel() != M * lat.N || hits.ne(1).any().item<bool>()) {
        throw LatticeIndexingError(
            "Shear index map is not a bijection for " + lattice_label(L, a, M, lt1, lt2));
    }

    return ShearPlan{
        .lattice = lat,
        .shear = shear,
        .ar = ar,
        .Mr = Mr,
        .phase = phase_from_numerator(numerator, L),
        .target_row = row,
        .target_col = col,
        .target = target,
    };
}

std::shared_ptr<ShearPlan const> ShearPlanCache::get(
    int64_t L,
    int64_t a,
    int64_t M,
    int64_t lt1,
    int64_t lt2) {

    std::lock_guard<std::mutex> lock(mutex_);
    Key const key{L, a, M, lt1, lt2};
    auto it = plans_.find(key);
    if (it != plans_.end()) {
        return it->second;
    }

    auto plan = std::make_shared<ShearPlan const>(make_shear_plan(L, a, M, lt1, lt2));
    if (capacity_ > 0 && plans_.size() >= capacity_) {
        plans_.erase(order_.front());
        order_.pop_front();
    }
    plans_.emplace(key, plan);
    order_.push_back(key);
    return plan;
}

size_t ShearPlanCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plans_.size();
}

void ShearPlanCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    plans_.clear();
    order_.clear();
}

ShearPlanCache& default_shear_plan_cache() {
    static ShearPlanCache cache(default_shear_plan_capacity);
    return cache;
}

// ========================== Transforms ==========================

static void check_plan_window(torch::Tensor const& window, ShearPlan const& plan) {
    if (window.dim() != 1 || window.size(0) != plan.lattice.L) {
        throw ShapeMismatchError(
            "Non-separable window must be [L] with L = " + std::to_string(plan.lattice.L));
    }
}

torch::Tensor nonsep_dgt_shear(
    torch::Tensor const& signal,
    torch::Tensor const& window,
    ShearPlan const& plan) {

    auto const& lat = plan.lattice;
    if (signal.dim() != 2 || signal.size(0) != lat.L) {
        throw ShapeMismatchError(
            "signal must be [L, W] with L = " + std::to_string(lat.L));
    }
    check_plan_window(window, plan);
    int64_t const W = signal.size(1);
    auto const device = signal.device();

    auto f = apply_shear(to_working(signal), plan.shear);
    auto g = apply_shear(to_working(window).unsqueeze(1), plan.shear);

    auto rect = dgt_fac(f, window_factorize(g, plan.ar, plan.Mr), plan.ar, plan.Mr);
    auto phased = rect.reshape({-1, W}) * plan.phase.to(device).reshape({-1, 1});

    auto coefficients = torch::zeros({lat.M * lat.N, W}, phased.options());
    coefficients.index_put_({plan.target.to(device)}, phased);
    return coefficients.reshape({lat.M, lat.N, W});
}

torch::Tensor nonsep_idgt_shear(
    torch::Tensor const& coefficients,
    torch::Tensor const& window,
    ShearPlan const& plan) {

    auto const& lat = plan.lattice;
    if (coefficients.dim() != 3 || coefficients.size(0) != lat.M || coefficients.size(1) != lat.N) {
        throw ShapeMismatchError(
            "coefficients must be [M, N, W] = [" + std::to_string(lat.M) + ", " +
            std::to_string(lat.N) + ", W]");
    }
    check_plan_window(window, plan);
    int64_t const W = coefficients.size(2);
    int64_t const Nr = lat.L / plan.ar;
    auto const device = coefficients.device();

    auto rect = to_complex(coefficients).reshape({lat.M * lat.N, W})
        .index_select(0, plan.target.to(device));
    rect = rect * plan.phase.to(device).conj().reshape({-1, 1});
    rect = rect.reshape({plan.Mr, Nr, 1, W});

    auto g = apply_shear(to_working(window).unsqueeze(1), plan.shear);
    auto f = idgt_fac(rect, window_factorize(g, plan.ar, plan.Mr), plan.ar, plan.Mr);
    return undo_shear(f, plan.shear);
}
