// timing.hpp — wall-clock phase timer for the CLI run summary
#pragma once
#include <chrono>
#include <cstdio>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace util {

// Records consecutive phases ("load", "anneal", ...). lap() closes the current
// phase under `name` and starts the next one.
class PhaseTimer {
public:
    using clock = std::chrono::steady_clock;

    PhaseTimer() : start_(clock::now()), mark_(start_) {}

    double lap(std::string name) {
        const auto now = clock::now();
        const double s = std::chrono::duration<double>(now - mark_).count();
        phases_.emplace_back(std::move(name), s);
        mark_ = now;
        return s;
    }

    double total() const { return std::chrono::duration<double>(mark_ - start_).count(); }

    const std::vector<std::pair<std::string, double>>& phases() const noexcept { return phases_; }

    // "time: load=0.002s anneal=1.310s total=1.312s"
    void report(std::ostream& out) const {
        char buf[64];
        out << "time:";
        for (const auto& [name, s] : phases_) {
            std::snprintf(buf, sizeof buf, "=%.3fs", s);
            out << ' ' << name << buf;
        }
        std::snprintf(buf, sizeof buf, " total=%.3fs\n", total());
        out << buf;
    }

private:
    clock::time_point start_;
    clock::time_point mark_;
    std::vector<std::pair<std::string, double>> phases_;
};

} // namespace util
