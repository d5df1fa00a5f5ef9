// result.hpp — per-read output slots (row-major spins + energies)
#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "sim/spin_state.hpp"

namespace sim {

/**
 * @brief num_reads x n spin matrix plus one energy per read.
 *
 * Each row is a write-once slot owned by one read, so workers record without
 * locks. Completion flags are bytes (not vector<bool>) so concurrent writes to
 * neighbouring reads never touch the same word.
 */
class RunResult {
public:
    RunResult() = default;
    // Throws std::length_error when num_reads * num_variables does not fit in size_t.
    RunResult(std::size_t num_reads, std::size_t num_variables)
        : num_reads_(num_reads), n_(num_variables),
          spins_(cells(num_reads, num_variables), core::spin_down),
          energies_(num_reads, 0.0),
          done_(num_reads, 0) {}

    // Copy the final state of read r into row r.
    void record(std::size_t r, const SpinState& state) {
        if (r >= num_reads_) throw std::out_of_range("RunResult::record: read " + std::to_string(r) + " out of range");
        if (state.size() != n_) throw std::logic_error("RunResult::record: state width does not match result");
        if (done_[r]) throw std::logic_error("RunResult::record: read " + std::to_string(r) + " recorded twice");
        const auto& s = state.spins();
        std::copy(s.begin(), s.end(), spins_.begin() + static_cast<std::ptrdiff_t>(r * n_));
        energies_[r] = state.energy();
        done_[r] = 1;
    }

    std::size_t num_reads() const noexcept { return num_reads_; }
    std::size_t num_variables() const noexcept { return n_; }

    std::span<const core::spin_t> sample(std::size_t r) const noexcept {
        return {spins_.data() + r * n_, n_};
    }
    double energy(std::size_t r) const noexcept { return energies_[r]; }

    const std::vector<core::spin_t>& spins() const noexcept { return spins_; }
    const std::vector<double>& energies() const noexcept { return energies_; }

    bool completed(std::size_t r) const noexcept { return done_[r] != 0; }
    std::size_t num_completed() const noexcept {
        std::size_t c = 0;
        for (auto d : done_) c += d;
        return c;
    }

    bool cancelled() const noexcept { return cancelled_; }
    void mark_cancelled() noexcept { cancelled_ = true; }

private:
    static std::size_t cells(std::size_t reads, std::size_t n) {
        if (n != 0 && reads > std::numeric_limits<std::size_t>::max() / n) {
            throw std::length_error("RunResult: " + std::to_string(reads) + " reads of " +
                                    std::to_string(n) + " variables overflow the sample matrix");
        }
        return reads * n;
    }

    std::size_t num_reads_{0};
    std::size_t n_{0};
    std::vector<core::spin_t> spins_;
    std::vector<double> energies_;
    std::vector<unsigned char> done_;
    bool cancelled_{false};
};

} // namespace sim
