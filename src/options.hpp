#pragma once

#include <chrono>
#include <string>

namespace systop {

inline constexpr const char* kVersion = "0.1.0";

struct Options {
    std::chrono::milliseconds refresh_interval{1000};
    bool debug = false;
    std::string log_file;       // empty: logging disabled
    bool show_help = false;
    bool show_version = false;
};

// Throws OptionsError on unknown flags, missing values or a bad interval.
Options parse_options(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace systop
