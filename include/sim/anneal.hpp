// anneal.hpp — annealing driver: schedule traversal and parallel reads
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "core/rng.hpp"
#include "model/ising_model.hpp"
#include "sim/result.hpp"
#include "sim/spin_state.hpp"

namespace sim {

// ---------- Config ----------
struct AnnealConfig {
    std::size_t   num_reads{1};       // must be >= 1
    std::size_t   sweeps_per_beta{1}; // must be >= 1
    std::uint64_t seed{0};
    int           threads{0};         // 0 -> tbb default
};

// Optional hooks. Both are consulted only between reads.
struct RunControl {
    const std::atomic<bool>* cancel{nullptr};
    // Called from worker threads after each completed read; callers synchronize.
    std::function<void(std::size_t done, std::size_t total)> on_read_done;
};

// Throws core::RequestError if num_reads == 0.
void validate_request(const AnnealConfig& cfg);

// Run one read to completion on an already-initialized state:
// for each beta in order, sweeps_per_beta sweeps. Returns accepted flips.
std::uint64_t anneal_state(SpinState& state,
                           std::span<const double> betas,
                           std::size_t sweeps_per_beta,
                           core::SplitMix64& rng) noexcept;

// One read from a fresh random state drawn from rng.
SpinState anneal_read(const model::IsingModel& m,
                      std::span<const double> betas,
                      std::size_t sweeps_per_beta,
                      core::SplitMix64& rng);

/**
 * @brief Run cfg.num_reads independent reads; read r uses core::make_read_rng(cfg.seed, r).
 *
 * Validates the request and the schedule before any read starts
 * (core::RequestError, core::ScheduleError). Reads are executed in parallel on
 * a task arena of cfg.threads workers; results are identical for any worker
 * count. If control->cancel becomes true, reads not yet started are skipped and
 * the result is marked cancelled.
 */
RunResult anneal(const model::IsingModel& m,
                 std::span<const double> betas,
                 const AnnealConfig& cfg,
                 const RunControl* control = nullptr);

} // namespace sim
