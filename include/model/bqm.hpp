// bqm.hpp — labelled binary quadratic model and its flat Ising form
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "model/ising_model.hpp"

namespace model {

enum class Vartype { Spin, Binary };

// "spin" | "binary", case-insensitive.
std::optional<Vartype> parse_vartype(std::string_view s) noexcept;
const char* to_string(Vartype t) noexcept;

// Bidirectional label <-> index lookup, built once per invocation.
class LabelMap {
public:
    // Returns the index of `label`, appending it if new.
    index_t insert(const std::string& label);

    std::optional<index_t> find(const std::string& label) const noexcept;
    const std::string& label(index_t i) const noexcept { return labels_[i]; }
    const std::vector<std::string>& labels() const noexcept { return labels_; }
    std::size_t size() const noexcept { return labels_.size(); }

private:
    std::vector<std::string> labels_;
    std::unordered_map<std::string, index_t> index_;
};

/**
 * @brief Quadratic objective over string-labelled variables.
 *
 * E(x) = offset + sum_i a_i x_i + sum_(i<j) b_ij x_i x_j with x in {-1,+1}
 * (Vartype::Spin) or {0,1} (Vartype::Binary). Variables keep insertion order.
 */
class BinaryQuadraticModel {
public:
    explicit BinaryQuadraticModel(Vartype vartype = Vartype::Spin) : vartype_(vartype) {}

    Vartype vartype() const noexcept { return vartype_; }

    index_t add_variable(const std::string& v, double bias = 0.0);
    void add_linear(const std::string& v, double bias) { add_variable(v, bias); }
    // Accumulates onto an existing interaction; u == v throws core::ShapeError.
    void add_interaction(const std::string& u, const std::string& v, double bias);
    void add_offset(double c) noexcept { offset_ += c; }

    std::size_t num_variables() const noexcept { return labels_.size(); }
    std::size_t num_interactions() const noexcept { return quadratic_.size(); }
    double offset() const noexcept { return offset_; }

    const LabelMap& labels() const noexcept { return labels_; }
    const std::vector<std::string>& variables() const noexcept { return labels_.labels(); }

    // Throws std::out_of_range for an unknown label.
    double linear(const std::string& v) const;
    std::optional<double> quadratic(const std::string& u, const std::string& v) const;

    double linear_at(index_t i) const noexcept { return linear_[i]; }
    // Interactions keyed by (min index, max index).
    const std::map<std::pair<index_t, index_t>, double>& interactions() const noexcept { return quadratic_; }

    // Energy of `values` (variable order, in this model's vartype), offset included.
    double energy(std::span<const int> values) const;

    // Same objective expressed over spins.
    BinaryQuadraticModel spin() const;

private:
    static std::pair<index_t, index_t> key(index_t a, index_t b) noexcept {
        return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    }

    Vartype vartype_;
    LabelMap labels_;
    std::vector<double> linear_;
    std::map<std::pair<index_t, index_t>, double> quadratic_;
    double offset_{0.0};
};

struct FlatIsing {
    IsingModel model;
    double offset{0.0};
    LabelMap labels;
};

// Spin-form flat arrays for the engine; indices follow the model's variable order.
FlatIsing flatten(const BinaryQuadraticModel& bqm);

// Map a spin value to the given vartype: Spin -> s, Binary -> (s+1)/2.
constexpr int from_spin(spin_t s, Vartype t) noexcept {
    return t == Vartype::Spin ? static_cast<int>(s) : (s > 0 ? 1 : 0);
}

} // namespace model
