// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

#include "model/bqm.hpp"
#include "schedule/beta_schedule.hpp"


namespace cli {

struct Options {
    // Problem file; "-" reads stdin
    std::string input;
    model::Vartype vartype = model::Vartype::Spin;

    long long num_reads = 10;
    long long sweeps = 1000;

    // nullopt => derived from the problem's biases
    std::optional<schedule::BetaRange> beta_range;
    schedule::Kind schedule = schedule::Kind::Linear;

    // nullopt => SEED env var, else non-deterministic
    std::optional<std::uint64_t> seed;

    // Number of threads (0 => TBB default)
    int threads = 0;

    bool progress = false;
    bool quiet = false;
};

// Parse CLI arguments with cxxopts.
// On success, returns filled Options. --help sets want_help/help_text; an
// invalid value sets want_help and writes the reason to `error`.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text, std::string& error);

// "hot:cold" or "hot,cold" with both endpoints positive.
std::optional<schedule::BetaRange> parse_beta_range(const std::string& s);

} // namespace cli
