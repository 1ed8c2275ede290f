#include "options.hpp"
#include "errors.hpp"
#include <charconv>
#include <cstdint>
#include <fmt/format.h>
#include <string_view>

namespace systop {

// Longer waits overflow the nanosecond deadline of a timed condition wait
static constexpr int64_t kMaxIntervalMs = 24 * 60 * 60 * 1000;

static std::chrono::milliseconds parse_interval(std::string_view text) {
    int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw OptionsError(fmt::format("invalid interval '{}': expected milliseconds", text));
    }
    if (ms <= 0) {
        throw OptionsError(fmt::format("invalid interval '{}': must be greater than zero", text));
    }
    if (ms > kMaxIntervalMs) {
        throw OptionsError(fmt::format("invalid interval '{}': must be at most {} (24 hours)", text, kMaxIntervalMs));
    }
    return std::chrono::milliseconds(ms);
}

Options parse_options(int argc, const char* const argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Accept --name=value as well as --name value
        std::string_view inline_value;
        bool has_inline_value = false;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline_value = true;
            }
        }

        const bool takes_value = arg == "-i" || arg == "--interval" || arg == "-l" || arg == "--log-file";
        if (has_inline_value && !takes_value) {
            throw OptionsError(fmt::format("option '{}' takes no value", arg));
        }

        auto take_value = [&]() -> std::string_view {
            if (has_inline_value) return inline_value;
            if (i + 1 >= argc) {
                throw OptionsError(fmt::format("option '{}' needs a value", arg));
            }
            return argv[++i];
        };

        if (arg == "-i" || arg == "--interval") {
            options.refresh_interval = parse_interval(take_value());
        } else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "-l" || arg == "--log-file") {
            options.log_file = std::string(take_value());
            if (options.log_file.empty()) {
                throw OptionsError("log file path is empty");
            }
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.show_version = true;
        } else {
            throw OptionsError(fmt::format("unknown option '{}'", arg));
        }
    }

    return options;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Live terminal view of CPU, memory and processes.\n"
        "\n"
        "Options:\n"
        "  -i, --interval <ms>    Refresh interval in milliseconds, 1 to 86400000 (default 1000)\n"
        "  -d, --debug            Debug mode: footer marker and debug-level logs\n"
        "  -l, --log-file <path>  Write logs to <path> (default: no logging)\n"
        "  -h, --help             Show this help\n"
        "  -V, --version          Show version\n",
        program);
}

} // namespace systop
