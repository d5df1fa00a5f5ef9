// ising_model.hpp — flat index-labelled Ising model with CSR adjacency
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "core/config.hpp"

namespace model {

using core::index_t;
using core::spin_t;

struct Coupler {
    index_t u;
    index_t v;
    double weight;
};

/**
 * @brief Read-only store of linear biases and couplers.
 *
 * Couplers are kept twice: once as the original list (each edge once, used for
 * energies) and once as a CSR adjacency where every edge appears in the rows
 * of both endpoints (used for O(degree) field updates).
 *
 * Construction validates the arrays and throws core::ShapeError on:
 * h length != n, coupler arrays of different lengths, an endpoint outside
 * [0, n), a self-loop, a repeated edge (either orientation), a non-finite bias.
 */
class IsingModel {
public:
    IsingModel() = default;

    IsingModel(std::size_t n,
               std::vector<double> h,
               const std::vector<index_t>& coupler_starts,
               const std::vector<index_t>& coupler_ends,
               const std::vector<double>& coupler_weights);

    IsingModel(std::size_t n, std::vector<double> h, std::vector<Coupler> couplers);

    std::size_t num_variables() const noexcept { return h_.size(); }
    std::size_t num_couplers() const noexcept { return couplers_.size(); }

    double linear(index_t v) const noexcept { return h_[v]; }
    const std::vector<double>& linear_biases() const noexcept { return h_; }
    const std::vector<Coupler>& couplers() const noexcept { return couplers_; }

    std::size_t degree(index_t v) const noexcept {
        return static_cast<std::size_t>(offsets_[v + 1] - offsets_[v]);
    }

    std::span<const index_t> neighbors(index_t v) const noexcept {
        return {adj_.data() + offsets_[v], degree(v)};
    }

    std::span<const double> neighbor_weights(index_t v) const noexcept {
        return {adj_w_.data() + offsets_[v], degree(v)};
    }

    template <class F>
    void for_each_neighbor(index_t v, F&& f) const {
        const std::size_t b = offsets_[v], e = offsets_[v + 1];
        for (std::size_t k = b; k < e; ++k) f(adj_[k], adj_w_[k]);
    }

    // h[v] + sum_u J[v,u] * spins[u], computed from scratch.
    // Throws under CORE_HARDENED for a bad v or a spins span of the wrong size.
    double local_field(index_t v, std::span<const spin_t> spins) const;

    // sum_v h[v] s[v] + sum_(u,v) J[u,v] s[u] s[v], each coupler once.
    // spins.size() must equal num_variables(); checked under CORE_HARDENED.
    double energy(std::span<const spin_t> spins) const;

private:
    void build();

    std::vector<double> h_;
    std::vector<Coupler> couplers_;

    std::vector<std::size_t> offsets_{0}; // n+1 row starts
    std::vector<index_t> adj_;            // 2 * num_couplers neighbor ids
    std::vector<double> adj_w_;           // parallel to adj_
};

} // namespace model
