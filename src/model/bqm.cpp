// bqm.cpp — labelled model bookkeeping and spin/binary conversion

#include "model/bqm.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"

namespace model {

std::optional<Vartype> parse_vartype(std::string_view s) noexcept {
    auto is = [s](std::string_view name) {
        if (s.size() != name.size()) return false;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(s[i])) != name[i]) return false;
        }
        return true;
    };
    if (is("spin"))   return Vartype::Spin;
    if (is("binary")) return Vartype::Binary;
    return std::nullopt;
}

const char* to_string(Vartype t) noexcept {
    return t == Vartype::Spin ? "spin" : "binary";
}

// ---------------- LabelMap ----------------

index_t LabelMap::insert(const std::string& label) {
    auto it = index_.find(label);
    if (it != index_.end()) return it->second;
    const auto i = static_cast<index_t>(labels_.size());
    labels_.push_back(label);
    index_.emplace(label, i);
    return i;
}

std::optional<index_t> LabelMap::find(const std::string& label) const noexcept {
    auto it = index_.find(label);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

// ---------------- BinaryQuadraticModel ----------------

index_t BinaryQuadraticModel::add_variable(const std::string& v, double bias) {
    const index_t i = labels_.insert(v);
    if (i == linear_.size()) linear_.push_back(0.0);
    linear_[i] += bias;
    return i;
}

void BinaryQuadraticModel::add_interaction(const std::string& u, const std::string& v, double bias) {
    if (u == v) throw core::ShapeError("self-interaction on variable '" + u + "'");
    const index_t a = add_variable(u);
    const index_t b = add_variable(v);
    quadratic_[key(a, b)] += bias;
}

double BinaryQuadraticModel::linear(const std::string& v) const {
    auto i = labels_.find(v);
    if (!i) throw std::out_of_range("unknown variable '" + v + "'");
    return linear_[*i];
}

std::optional<double> BinaryQuadraticModel::quadratic(const std::string& u, const std::string& v) const {
    auto a = labels_.find(u), b = labels_.find(v);
    if (!a || !b) return std::nullopt;
    auto it = quadratic_.find(key(*a, *b));
    if (it == quadratic_.end()) return std::nullopt;
    return it->second;
}

double BinaryQuadraticModel::energy(std::span<const int> values) const {
    if (values.size() != linear_.size()) {
        throw core::ShapeError("sample has " + std::to_string(values.size()) + " values, model has " +
                               std::to_string(linear_.size()) + " variables");
    }
    double e = offset_;
    for (std::size_t i = 0; i < linear_.size(); ++i) e += linear_[i] * values[i];
    for (const auto& [uv, b] : quadratic_) e += b * values[uv.first] * values[uv.second];
    return e;
}

BinaryQuadraticModel BinaryQuadraticModel::spin() const {
    if (vartype_ == Vartype::Spin) return *this;

    // x = (s + 1) / 2
    //   a x_i        -> a/2 s_i + a/2
    //   b x_i x_j    -> b/4 s_i s_j + b/4 s_i + b/4 s_j + b/4
    BinaryQuadraticModel out(Vartype::Spin);
    out.offset_ = offset_;
    for (std::size_t i = 0; i < linear_.size(); ++i) {
        out.add_variable(labels_.label(static_cast<index_t>(i)), linear_[i] / 2.0);
        out.offset_ += linear_[i] / 2.0;
    }
    for (const auto& [uv, b] : quadratic_) {
        out.linear_[uv.first]  += b / 4.0;
        out.linear_[uv.second] += b / 4.0;
        out.quadratic_[uv] += b / 4.0;
        out.offset_ += b / 4.0;
    }
    return out;
}

FlatIsing flatten(const BinaryQuadraticModel& bqm) {
    const BinaryQuadraticModel s = bqm.spin();
    std::vector<double> h(s.num_variables());
    for (std::size_t i = 0; i < h.size(); ++i) h[i] = s.linear_at(static_cast<index_t>(i));

    std::vector<Coupler> couplers;
    couplers.reserve(s.num_interactions());
    for (const auto& [uv, b] : s.interactions()) couplers.push_back(Coupler{uv.first, uv.second, b});

    const std::size_t n = h.size();
    return FlatIsing{IsingModel(n, std::move(h), std::move(couplers)), s.offset(), s.labels()};
}

} // namespace model
