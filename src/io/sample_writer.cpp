// sample_writer.cpp — tabular text output of a SampleSet

#include "io/sample_writer.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <string>

namespace io {

void write_samples(std::ostream& os, const sampler::SampleSet& set) {
    // Column width: widest label, at least wide enough for "-1".
    std::size_t w = 2;
    for (const auto& v : set.variables()) w = std::max(w, v.size());
    const int cw = static_cast<int>(w);

    for (const auto& v : set.variables()) os << std::setw(cw) << v << ' ';
    os << "energy num_occ.\n";

    const auto flags = os.flags();
    const auto prec = os.precision();
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const std::size_t i : set.order_by_energy()) {
        for (const int x : set.sample(i)) os << std::setw(cw) << x << ' ';
        os << set.energy(i) << " 1\n";
    }
    os.flags(flags);
    os.precision(prec);
}

} // namespace io
