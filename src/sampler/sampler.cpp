// sampler.cpp — adapter from labelled models to the annealing engine

#include "sampler/sampler.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>

#include "core/errors.hpp"

namespace sampler {

std::size_t SampleSet::lowest() const noexcept {
    return static_cast<std::size_t>(std::min_element(energies_.begin(), energies_.end()) - energies_.begin());
}

std::vector<std::size_t> SampleSet::order_by_energy() const {
    std::vector<std::size_t> idx(energies_.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t a, std::size_t b) { return energies_[a] < energies_[b]; });
    return idx;
}

void validate(const Params& p) {
    if (p.num_reads < 1) {
        throw core::RequestError("num_reads must be a positive integer, got " + std::to_string(p.num_reads));
    }
    if (p.sweeps < 1) {
        throw core::ScheduleError("sweeps must be a positive integer, got " + std::to_string(p.sweeps));
    }
    if (p.beta_range) {
        const auto& r = *p.beta_range;
        if (!(std::isfinite(r.hot) && std::isfinite(r.cold)) || r.hot <= 0.0 || r.cold <= 0.0) {
            throw core::ScheduleError("beta range endpoints must be positive and finite");
        }
    }
}

static std::uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

SampleSet sample(const model::BinaryQuadraticModel& bqm,
                 const Params& params,
                 const sim::RunControl* control) {
    validate(params);

    const model::FlatIsing flat = model::flatten(bqm);

    const schedule::BetaRange range = params.beta_range.value_or(schedule::default_beta_range(flat.model));
    const schedule::SweepPlan plan = schedule::plan_sweeps(params.sweeps);
    const std::vector<double> betas = schedule::make_schedule(params.schedule, range, plan.num_betas);

    sim::AnnealConfig cfg{
        .num_reads = static_cast<std::size_t>(params.num_reads),
        .sweeps_per_beta = plan.sweeps_per_beta,
        .seed = params.seed ? *params.seed : random_seed(),
        .threads = params.threads,
    };

    const sim::RunResult run = sim::anneal(flat.model, betas, cfg, control);

    SampleSet out(flat.labels.labels(), bqm.vartype());
    out.seed = cfg.seed;
    out.cancelled = run.cancelled();

    std::vector<int> row(run.num_variables());
    for (std::size_t r = 0; r < run.num_reads(); ++r) {
        if (!run.completed(r)) continue;
        const auto spins = run.sample(r);
        for (std::size_t v = 0; v < row.size(); ++v) row[v] = model::from_spin(spins[v], bqm.vartype());
        out.append(row, run.energy(r) + flat.offset);
    }
    return out;
}

} // namespace sampler
