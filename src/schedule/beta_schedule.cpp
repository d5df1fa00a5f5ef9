// beta_schedule.cpp — schedule construction and validation

#include "schedule/beta_schedule.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include "core/errors.hpp"

namespace schedule {

static bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

std::optional<Kind> parse_kind(std::string_view s) noexcept {
    if (iequals(s, "linear"))    return Kind::Linear;
    if (iequals(s, "geometric")) return Kind::Geometric;
    return std::nullopt;
}

const char* to_string(Kind k) noexcept {
    switch (k) {
        case Kind::Linear:    return "linear";
        case Kind::Geometric: return "geometric";
    }
    return "unknown";
}

BetaRange default_beta_range(const model::IsingModel& m) {
    BetaRange r{0.1, 1.0};
    const std::size_t n = m.num_variables();
    if (n == 0) return r;

    std::vector<double> sigma(n);
    for (std::size_t v = 0; v < n; ++v) sigma[v] = std::abs(m.linear(static_cast<model::index_t>(v)));
    for (const auto& c : m.couplers()) {
        sigma[c.u] += std::abs(c.weight);
        sigma[c.v] += std::abs(c.weight);
    }
    const double max_sigma = *std::max_element(sigma.begin(), sigma.end());
    if (max_sigma > 0.0) r.cold = 2.0 * max_sigma;
    return r;
}

SweepPlan plan_sweeps(long long sweeps) {
    if (sweeps < 1) throw core::ScheduleError("sweeps must be a positive integer, got " + std::to_string(sweeps));
    const auto total = static_cast<std::size_t>(sweeps);
    SweepPlan p;
    p.sweeps_per_beta = std::max<std::size_t>(1, total / kBetaGranularity);
    p.num_betas = (total + p.sweeps_per_beta - 1) / p.sweeps_per_beta;
    return p;
}

std::vector<double> make_schedule(Kind kind, BetaRange range, std::size_t num_betas) {
    if (num_betas == 0) throw core::ScheduleError("schedule must contain at least one beta");
    if (!(std::isfinite(range.hot) && std::isfinite(range.cold)) || range.hot <= 0.0 || range.cold <= 0.0) {
        throw core::ScheduleError("beta range endpoints must be positive and finite, got [" +
                                  std::to_string(range.hot) + ", " + std::to_string(range.cold) + "]");
    }

    std::vector<double> betas(num_betas);
    const double steps = static_cast<double>(num_betas);
    switch (kind) {
        case Kind::Linear: {
            const double step = (range.cold - range.hot) / steps;
            for (std::size_t s = 0; s < num_betas; ++s) betas[s] = range.hot + static_cast<double>(s) * step;
            break;
        }
        case Kind::Geometric: {
            const double ratio = std::pow(range.cold / range.hot, 1.0 / steps);
            for (std::size_t s = 0; s < num_betas; ++s) betas[s] = range.hot * std::pow(ratio, static_cast<double>(s));
            break;
        }
    }
    return betas;
}

void validate(std::span<const double> betas, std::size_t sweeps_per_beta) {
    if (betas.empty()) throw core::ScheduleError("beta schedule is empty");
    if (sweeps_per_beta == 0) throw core::ScheduleError("sweeps per beta must be at least 1");
    for (std::size_t i = 0; i < betas.size(); ++i) {
        if (!std::isfinite(betas[i]) || betas[i] <= 0.0) {
            throw core::ScheduleError("beta[" + std::to_string(i) + "] = " + std::to_string(betas[i]) +
                                      " is not a positive finite value");
        }
    }
}

} // namespace schedule
