// beta_schedule.hpp — beta range, sweep planning and schedule interpolation
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "model/ising_model.hpp"

namespace schedule {

enum class Kind { Linear, Geometric };

// "linear" | "geometric", case-insensitive.
std::optional<Kind> parse_kind(std::string_view s) noexcept;
const char* to_string(Kind k) noexcept;

struct BetaRange {
    double hot{0.1};   // first (smallest) beta
    double cold{1.0};  // end point of the interpolation
};

// Total sweeps are split into num_betas steps of sweeps_per_beta sweeps each,
// with at most about kBetaGranularity distinct beta values.
inline constexpr std::size_t kBetaGranularity = 1000;

struct SweepPlan {
    std::size_t sweeps_per_beta{1};
    std::size_t num_betas{1};
};

/**
 * @brief Default range from problem magnitude.
 *
 * hot = 0.1; cold = 2 * max_v (|h_v| + sum_u |J_vu|). An empty model or an
 * all-zero model gets cold = 1.0.
 */
BetaRange default_beta_range(const model::IsingModel& m);

// sweeps_per_beta = max(1, sweeps / kBetaGranularity),
// num_betas = ceil(sweeps / sweeps_per_beta). Throws core::ScheduleError if sweeps < 1.
SweepPlan plan_sweeps(long long sweeps);

// num_betas values hot + s*(cold-hot)/num_betas (linear) or
// hot * r^s with r = (cold/hot)^(1/num_betas) (geometric), s = 0..num_betas-1.
// Throws core::ScheduleError for num_betas == 0 or a non-positive/non-finite range.
std::vector<double> make_schedule(Kind kind, BetaRange range, std::size_t num_betas);

// Engine-side checks: non-empty, every beta finite and > 0, sweeps_per_beta >= 1.
void validate(std::span<const double> betas, std::size_t sweeps_per_beta);

} // namespace schedule
