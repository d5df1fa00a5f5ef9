// sweep.hpp — single-spin-flip Metropolis sweep at a fixed beta
#pragma once

#include <cmath>
#include <cstddef>
#include <numbers>

#include "core/perf.hpp"
#include "core/rng.hpp"
#include "sim/spin_state.hpp"

namespace sim {

// Above this value of beta*dE, exp(-beta*dE) < 2^-53, so only a zero draw
// would accept: the cutoff differs from the plain draw-and-compare rule with
// probability at most 2^-53 per trial. The flip is rejected without consuming
// a draw, so the stream (and every later decision) shifts relative to that rule.
inline constexpr double kMaxAcceptExponent = 53.0 * std::numbers::ln2;

/**
 * @brief Metropolis acceptance test for an energy change dE at inverse temperature beta.
 * @return true if the move is accepted. Consumes one draw only when 0 < beta*dE <= kMaxAcceptExponent.
 */
PERF_ALWAYS_INLINE bool metropolis_accept(double delta_e, double beta, core::SplitMix64& rng) noexcept {
    if (delta_e <= 0.0) return true;
    const double x = beta * delta_e;
    if (PERF_UNLIKELY(x > kMaxAcceptExponent)) return false;
    return rng.next_unit_double() < std::exp(-x);
}

/**
 * @brief One sweep: a flip trial at every variable, in index order 0..n-1.
 * @return Number of accepted flips.
 */
PERF_HOT inline std::size_t sweep(SpinState& state, double beta, core::SplitMix64& rng) noexcept {
    std::size_t accepted = 0;
    const std::size_t n = state.size();
    for (std::size_t v = 0; v < n; ++v) {
        const auto idx = static_cast<index_t>(v);
        if (metropolis_accept(state.flip_delta(idx), beta, rng)) {
            state.flip(idx);
            ++accepted;
        }
    }
    return accepted;
}

} // namespace sim
