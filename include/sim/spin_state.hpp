#pragma once
/*
spin_state.hpp — per-read spin array with an incremental local-field cache

STATE
- spins[v]  in {-1,+1}
- field[v]  = h[v] + sum_u J[v,u] * spins[u]   (own spin excluded: no self-loops)

INVARIANT
- field[] always equals the value recomputed from spins[]. It is maintained by
  flip() in O(degree(v)) and never rebuilt periodically.

ENERGY
- energy() is recomputed from spins[] and the coupler list (each coupler once),
  so a reported energy never inherits rounding drift from the cache.

OWNERSHIP
- One SpinState per read. The model is borrowed and must outlive the state.
*/

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/perf.hpp"
#include "core/rng.hpp"
#include "model/ising_model.hpp"

namespace sim {

using core::index_t;
using core::spin_t;

class SpinState {
public:
    // Independent fair coin per variable, drawn in index order from rng.
    SpinState(const model::IsingModel& m, core::SplitMix64& rng)
        : model_(&m), spins_(m.num_variables()), field_(m.num_variables()) {
        for (auto& s : spins_) s = rng.coin() ? core::spin_up : core::spin_down;
        init_fields();
    }

    // Explicit initial assignment; values are normalized to +-1.
    template <class T>
    SpinState(const model::IsingModel& m, std::span<const T> initial)
        : model_(&m), spins_(m.num_variables()), field_(m.num_variables()) {
        if (initial.size() != spins_.size()) {
            throw core::ShapeError("initial state has " + std::to_string(initial.size()) +
                                   " values, model has " + std::to_string(spins_.size()) + " variables");
        }
        for (std::size_t v = 0; v < spins_.size(); ++v) spins_[v] = core::to_spin(initial[v]);
        init_fields();
    }

    std::size_t size() const noexcept { return spins_.size(); }
    const model::IsingModel& model() const noexcept { return *model_; }

    spin_t spin(index_t v) const {
        CORE_ASSERT_H(v < spins_.size(), "SpinState::spin: index out of range");
        return spins_[v];
    }

    double field(index_t v) const {
        CORE_ASSERT_H(v < field_.size(), "SpinState::field: index out of range");
        return field_[v];
    }

    // Energy change caused by flipping v.
    double flip_delta(index_t v) const noexcept {
        return -2.0 * static_cast<double>(spins_[v]) * field_[v];
    }

    // Toggle v and move every neighbor's field by -2 * s_old[v] * J[v,u].
    // Throws under CORE_HARDENED for an out-of-range v.
    PERF_ALWAYS_INLINE void flip(index_t v) {
        CORE_ASSERT_H(v < spins_.size(), "SpinState::flip: index out of range");
        const double s_old = static_cast<double>(spins_[v]);
        spins_[v] = static_cast<spin_t>(-spins_[v]);

        const auto nbrs = model_->neighbors(v);
        const auto ws   = model_->neighbor_weights(v);
        double* PERF_RESTRICT f = field_.data();
        for (std::size_t k = 0; k < nbrs.size(); ++k) {
            f[nbrs[k]] -= 2.0 * s_old * ws[k];
        }
    }

    double energy() const { return model_->energy(spins_); }

    double recompute_field(index_t v) const { return model_->local_field(v, spins_); }

    const std::vector<spin_t>& spins() const noexcept { return spins_; }
    const std::vector<double>& fields() const noexcept { return field_; }

private:
    void init_fields() {
        for (std::size_t v = 0; v < spins_.size(); ++v) {
            field_[v] = model_->local_field(static_cast<index_t>(v), spins_);
        }
    }

    const model::IsingModel* model_;
    std::vector<spin_t> spins_;
    std::vector<double> field_;
};

} // namespace sim
