// ising_model.cpp — validation and CSR build for the flat Ising model

#include "model/ising_model.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "core/errors.hpp"

namespace model {

namespace {

std::vector<Coupler> zip_couplers(const std::vector<index_t>& starts,
                                  const std::vector<index_t>& ends,
                                  const std::vector<double>& weights) {
    if (starts.size() != ends.size() || starts.size() != weights.size()) {
        throw core::ShapeError("coupler arrays differ in length: starts=" + std::to_string(starts.size()) +
                               " ends=" + std::to_string(ends.size()) +
                               " weights=" + std::to_string(weights.size()));
    }
    std::vector<Coupler> out(starts.size());
    for (std::size_t i = 0; i < starts.size(); ++i) out[i] = Coupler{starts[i], ends[i], weights[i]};
    return out;
}

} // namespace

IsingModel::IsingModel(std::size_t n,
                       std::vector<double> h,
                       const std::vector<index_t>& coupler_starts,
                       const std::vector<index_t>& coupler_ends,
                       const std::vector<double>& coupler_weights)
    : IsingModel(n, std::move(h), zip_couplers(coupler_starts, coupler_ends, coupler_weights)) {}

IsingModel::IsingModel(std::size_t n, std::vector<double> h, std::vector<Coupler> couplers)
    : h_(std::move(h)), couplers_(std::move(couplers)) {
    if (h_.size() != n) {
        throw core::ShapeError("linear bias count " + std::to_string(h_.size()) +
                               " does not match variable count " + std::to_string(n));
    }
    build();
}

void IsingModel::build() {
    const std::size_t n = h_.size();

    for (std::size_t v = 0; v < n; ++v) {
        if (!std::isfinite(h_[v])) {
            throw core::ShapeError("linear bias of variable " + std::to_string(v) + " is not finite");
        }
    }

    // Count degrees while validating endpoints.
    std::vector<std::size_t> deg(n, 0);
    for (std::size_t i = 0; i < couplers_.size(); ++i) {
        const Coupler& c = couplers_[i];
        if (c.u >= n || c.v >= n) {
            throw core::ShapeError("coupler " + std::to_string(i) + " (" + std::to_string(c.u) + ", " +
                                   std::to_string(c.v) + ") references a variable outside [0, " +
                                   std::to_string(n) + ")");
        }
        if (c.u == c.v) {
            throw core::ShapeError("coupler " + std::to_string(i) + " is a self-loop on variable " +
                                   std::to_string(c.u));
        }
        if (!std::isfinite(c.weight)) {
            throw core::ShapeError("coupler " + std::to_string(i) + " has a non-finite weight");
        }
        ++deg[c.u];
        ++deg[c.v];
    }

    offsets_.assign(n + 1, 0);
    for (std::size_t v = 0; v < n; ++v) offsets_[v + 1] = offsets_[v] + deg[v];

    adj_.assign(offsets_[n], 0);
    adj_w_.assign(offsets_[n], 0.0);
    std::vector<std::size_t> cursor(offsets_.begin(), offsets_.end() - 1);
    for (const Coupler& c : couplers_) {
        adj_[cursor[c.u]] = c.v; adj_w_[cursor[c.u]++] = c.weight;
        adj_[cursor[c.v]] = c.u; adj_w_[cursor[c.v]++] = c.weight;
    }

    // Rows sorted by neighbor id: keeps field updates cache-friendly and makes
    // repeated edges adjacent for the duplicate check.
    std::vector<std::pair<index_t, double>> row;
    for (std::size_t v = 0; v < n; ++v) {
        const std::size_t b = offsets_[v], e = offsets_[v + 1];
        row.clear();
        for (std::size_t k = b; k < e; ++k) row.emplace_back(adj_[k], adj_w_[k]);
        std::sort(row.begin(), row.end(),
                  [](const auto& a, const auto& b2) { return a.first < b2.first; });
        for (std::size_t k = 0; k < row.size(); ++k) {
            if (k > 0 && row[k].first == row[k - 1].first) {
                throw core::ShapeError("duplicate coupler between variables " + std::to_string(v) + " and " +
                                       std::to_string(row[k].first));
            }
            adj_[b + k] = row[k].first;
            adj_w_[b + k] = row[k].second;
        }
    }
}

double IsingModel::local_field(index_t v, std::span<const spin_t> spins) const {
    CORE_ASSERT_H(spins.size() == h_.size(), "IsingModel::local_field: spin count does not match model");
    CORE_ASSERT_H(v < h_.size(), "IsingModel::local_field: index out of range");
    double f = h_[v];
    for_each_neighbor(v, [&](index_t u, double w) { f += w * static_cast<double>(spins[u]); });
    return f;
}

double IsingModel::energy(std::span<const spin_t> spins) const {
    CORE_ASSERT_H(spins.size() == h_.size(), "IsingModel::energy: spin count does not match model");
    double e = 0.0;
    for (std::size_t v = 0; v < h_.size(); ++v) e += h_[v] * static_cast<double>(spins[v]);
    for (const Coupler& c : couplers_) {
        e += c.weight * static_cast<double>(spins[c.u]) * static_cast<double>(spins[c.v]);
    }
    return e;
}

} // namespace model
