// sampler.hpp — high-level sampling over labelled models
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "model/bqm.hpp"
#include "schedule/beta_schedule.hpp"
#include "sim/anneal.hpp"

namespace sampler {

struct Params {
    long long num_reads{10};
    long long sweeps{1000};
    std::optional<schedule::BetaRange> beta_range; // nullopt -> derived from the model
    schedule::Kind schedule{schedule::Kind::Linear};
    std::optional<std::uint64_t> seed;             // nullopt -> non-deterministic
    int threads{0};
};

/**
 * @brief Completed reads in the caller's labels and vartype.
 *
 * Row i holds values for variables() in order; energies include the model
 * offset. If the run was cancelled only completed reads are present.
 */
class SampleSet {
public:
    SampleSet() = default;
    SampleSet(std::vector<std::string> variables, model::Vartype vartype)
        : variables_(std::move(variables)), vartype_(vartype) {}

    void append(std::span<const int> values, double energy) {
        values_.insert(values_.end(), values.begin(), values.end());
        energies_.push_back(energy);
    }

    std::size_t size() const noexcept { return energies_.size(); }
    bool empty() const noexcept { return energies_.empty(); }
    std::size_t num_variables() const noexcept { return variables_.size(); }

    const std::vector<std::string>& variables() const noexcept { return variables_; }
    model::Vartype vartype() const noexcept { return vartype_; }

    std::span<const int> sample(std::size_t i) const noexcept {
        return {values_.data() + i * variables_.size(), variables_.size()};
    }
    double energy(std::size_t i) const noexcept { return energies_[i]; }
    const std::vector<double>& energies() const noexcept { return energies_; }

    // Index of the lowest-energy row (first one on ties). Requires !empty().
    std::size_t lowest() const noexcept;
    // Row indices in ascending energy, stable.
    std::vector<std::size_t> order_by_energy() const;

    std::uint64_t seed{0};
    bool cancelled{false};

private:
    std::vector<std::string> variables_;
    model::Vartype vartype_{model::Vartype::Spin};
    std::vector<int> values_;
    std::vector<double> energies_;
};

// Throws core::RequestError (num_reads < 1) or core::ScheduleError (sweeps < 1,
// bad beta range) before any read starts.
void validate(const Params& p);

SampleSet sample(const model::BinaryQuadraticModel& bqm,
                 const Params& params,
                 const sim::RunControl* control = nullptr);

} // namespace sampler
