// problem_io.hpp — plain-text problem reader
#pragma once

#include <istream>

#include "model/bqm.hpp"

namespace model {

// One entry per line:
//   u v bias      quadratic bias (u == v adds a linear bias)
//   v bias        linear bias
//   offset c      constant term
// '#' starts a comment; blank lines are skipped. Repeated entries accumulate.
// Throws core::ParseError on a malformed line.
BinaryQuadraticModel read_problem(std::istream& in, Vartype vartype);

} // namespace model
