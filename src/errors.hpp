#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace systop {

// Generic parse/error info surfaced from the sampler
struct ParseError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

// Thrown by a sampler that cannot produce a snapshot at all
class SamplingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by parse_options() for malformed command lines
class OptionsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace systop
