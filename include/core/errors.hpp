// errors.hpp — exception taxonomy for setup-time input errors
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace core {

// Model arrays are inconsistent: coupler index out of range, length mismatch,
// self-loop or duplicate coupler, non-finite bias.
struct ShapeError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Beta schedule or sweep count is unusable.
struct ScheduleError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Run request is unusable (num_reads < 1).
struct RequestError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Malformed problem file.
class ParseError : public std::runtime_error {
public:
    ParseError(std::size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

    std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

} // namespace core
