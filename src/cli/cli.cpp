// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <optional>

namespace cli {

static inline bool to_double(std::string_view x, double& out) {
    const std::string s(x);
    char* endp = nullptr;
    out = std::strtod(s.c_str(), &endp);
    return !s.empty() && endp && *endp == '\0' && std::isfinite(out);
}

static inline bool to_u64(std::string_view x, std::uint64_t& out) {
    const char* b = x.data();
    const char* e = b + x.size();
    auto res = std::from_chars(b, e, out);
    return !x.empty() && res.ec == std::errc{} && res.ptr == e;
}

std::optional<schedule::BetaRange> parse_beta_range(const std::string& s) {
    auto pos = s.find(':');
    if (pos == std::string::npos) pos = s.find(',');
    if (pos == std::string::npos) return std::nullopt;
    schedule::BetaRange r;
    if (!to_double(std::string_view(s).substr(0, pos), r.hot)) return std::nullopt;
    if (!to_double(std::string_view(s).substr(pos + 1), r.cold)) return std::nullopt;
    if (r.hot <= 0.0 || r.cold <= 0.0) return std::nullopt;
    return r;
}


Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text, std::string& error) {
    Options opt;
    want_help = false;
    error.clear();

    std::string vartype_s;   // spin | binary
    std::string range_s;     // hot:cold
    std::string schedule_s;  // linear | geometric
    std::string seed_s;      // decimal u64

    cxxopts::Options desc("isingsa", "Simulated annealing sampler for Ising / QUBO problems");
    desc.add_options()
        ("h,help", "Show this help")
        ("i,input", "Problem file ('u v bias' / 'v bias' / 'offset c' lines), '-' for stdin", cxxopts::value<std::string>(opt.input))
        ("vartype", "Variable type of the problem: spin | binary", cxxopts::value<std::string>(vartype_s)->default_value("spin"))
        ("r,num-reads", "Number of independent reads", cxxopts::value<long long>(opt.num_reads)->default_value("10"))
        ("s,sweeps", "Sweeps per read", cxxopts::value<long long>(opt.sweeps)->default_value("1000"))
        ("b,beta-range", "Beta range as hot:cold (default: from problem biases)", cxxopts::value<std::string>(range_s))
        ("schedule", "Beta interpolation: linear | geometric", cxxopts::value<std::string>(schedule_s)->default_value("linear"))
        ("seed", "PRNG seed (default: SEED env var, else random)", cxxopts::value<std::string>(seed_s))
        ("threads", "Number of threads (default: TBB max concurrency)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("progress", "Show a progress bar over reads", cxxopts::value<bool>(opt.progress))
        ("q,quiet", "Do not print the run header and timing summary", cxxopts::value<bool>(opt.quiet))
    ;
    help_text = desc.help();

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(desc.parse(argc, argv));
    } catch (const std::exception& e) {
        error = e.what();
        want_help = true;
        return opt;
    }
    const auto& result = *parsed;
    if (result.count("help")) { want_help = true; return opt; }

    if (opt.input.empty()) {
        error = "missing --input";
        want_help = true;
        return opt;
    }

    if (auto vt = model::parse_vartype(vartype_s)) {
        opt.vartype = *vt;
    } else {
        error = "invalid --vartype '" + vartype_s + "'; expected spin or binary";
        want_help = true;
        return opt;
    }

    if (auto k = schedule::parse_kind(schedule_s)) {
        opt.schedule = *k;
    } else {
        error = "invalid --schedule '" + schedule_s + "'; expected linear or geometric";
        want_help = true;
        return opt;
    }

    if (result.count("beta-range")) {
        opt.beta_range = parse_beta_range(range_s);
        if (!opt.beta_range) {
            error = "invalid --beta-range '" + range_s + "'; expected hot:cold with positive values";
            want_help = true;
            return opt;
        }
    }

    // Seed: --seed wins, then SEED from the environment.
    std::uint64_t seed = 0;
    if (result.count("seed")) {
        if (!to_u64(seed_s, seed)) {
            error = "invalid --seed '" + seed_s + "'; expected an unsigned 64-bit integer";
            want_help = true;
            return opt;
        }
        opt.seed = seed;
    } else if (const char* es = std::getenv("SEED")) {
        if (to_u64(es, seed)) opt.seed = seed;
    }

    return opt;
}

} // namespace cli
