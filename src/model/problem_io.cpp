// problem_io.cpp — plain-text problem reader

#include "model/problem_io.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace model {

static bool parse_bias(const std::string& s, double& out) {
    char* endp = nullptr;
    out = std::strtod(s.c_str(), &endp);
    return endp && endp != s.c_str() && *endp == '\0' && std::isfinite(out);
}

BinaryQuadraticModel read_problem(std::istream& in, Vartype vartype) {
    BinaryQuadraticModel bqm(vartype);
    std::string line;
    std::size_t lineno = 0;
    std::vector<std::string> tok;

    while (std::getline(in, line)) {
        ++lineno;
        if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);

        tok.clear();
        std::istringstream ss(line);
        for (std::string t; ss >> t;) tok.push_back(std::move(t));
        if (tok.empty()) continue;

        double bias = 0.0;
        if (tok.size() == 2) {
            if (!parse_bias(tok[1], bias)) throw core::ParseError(lineno, "invalid bias '" + tok[1] + "'");
            if (tok[0] == "offset") bqm.add_offset(bias);
            else                    bqm.add_linear(tok[0], bias);
        } else if (tok.size() == 3) {
            if (!parse_bias(tok[2], bias)) throw core::ParseError(lineno, "invalid bias '" + tok[2] + "'");
            if (tok[0] == tok[1]) bqm.add_linear(tok[0], bias);
            else                  bqm.add_interaction(tok[0], tok[1], bias);
        } else {
            throw core::ParseError(lineno, "expected 'v bias' or 'u v bias', got " +
                                               std::to_string(tok.size()) + " fields");
        }
    }
    if (in.bad()) throw std::runtime_error("read error after line " + std::to_string(lineno));
    return bqm;
}

} // namespace model
