// sample_writer.hpp — tabular text output of a SampleSet
#pragma once

#include <ostream>

#include "sampler/sampler.hpp"

namespace io {

// Header "<labels...> energy num_occ." then one row per sample in ascending
// energy. Energies are printed with full double precision.
void write_samples(std::ostream& os, const sampler::SampleSet& set);

} // namespace io
