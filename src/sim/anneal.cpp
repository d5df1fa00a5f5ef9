// anneal.cpp — annealing driver (schedule traversal + TBB fan-out over reads)

#include "sim/anneal.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "core/errors.hpp"
#include "schedule/beta_schedule.hpp"
#include "sim/sweep.hpp"

namespace sim {

void validate_request(const AnnealConfig& cfg) {
    if (cfg.num_reads == 0) throw core::RequestError("num_reads must be a positive integer");
}

std::uint64_t anneal_state(SpinState& state,
                           std::span<const double> betas,
                           std::size_t sweeps_per_beta,
                           core::SplitMix64& rng) noexcept {
    std::uint64_t accepted = 0;
    for (const double beta : betas) {
        for (std::size_t s = 0; s < sweeps_per_beta; ++s) {
            accepted += sweep(state, beta, rng);
        }
    }
    return accepted;
}

SpinState anneal_read(const model::IsingModel& m,
                      std::span<const double> betas,
                      std::size_t sweeps_per_beta,
                      core::SplitMix64& rng) {
    SpinState state(m, rng);
    anneal_state(state, betas, sweeps_per_beta, rng);
    return state;
}

RunResult anneal(const model::IsingModel& m,
                 std::span<const double> betas,
                 const AnnealConfig& cfg,
                 const RunControl* control) {
    validate_request(cfg);
    schedule::validate(betas, cfg.sweeps_per_beta);

    const std::size_t R = cfg.num_reads;
    const int NT = (cfg.threads > 0) ? cfg.threads : tbb::this_task_arena::max_concurrency();

    RunResult result(R, m.num_variables());
    std::atomic<std::size_t> done{0};
    std::atomic<bool> skipped{false};

    auto run_one = [&](std::size_t r) {
        if (control && control->cancel && control->cancel->load(std::memory_order_relaxed)) {
            skipped.store(true, std::memory_order_relaxed);
            return;
        }
        core::SplitMix64 rng = core::make_read_rng(cfg.seed, r);
        SpinState state = anneal_read(m, betas, cfg.sweeps_per_beta, rng);
        result.record(r, state);
        const std::size_t now = done.fetch_add(1, std::memory_order_relaxed) + 1;
        if (control && control->on_read_done) control->on_read_done(now, R);
    };

    if (NT == 1) {
        for (std::size_t r = 0; r < R; ++r) run_one(r);
    } else {
        tbb::task_arena arena(NT);
        arena.execute([&] {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, R, 1),
                              [&](const tbb::blocked_range<std::size_t>& range) {
                                  for (std::size_t r = range.begin(); r != range.end(); ++r) run_one(r);
                              });
        });
    }

    if (skipped.load()) result.mark_cancelled();
    return result;
}

} // namespace sim
