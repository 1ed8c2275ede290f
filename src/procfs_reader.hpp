#pragma once

#include "errors.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace systop {

// Fields taken from /proc/<pid>/stat and /proc/<pid>/statm
struct ProcfsProcess {
    uint32_t pid = 0;
    std::string name;

    // Cumulative CPU time in clock ticks, only deltas are meaningful
    uint64_t user_time = 0;
    uint64_t kernel_time = 0;

    uint64_t resident_bytes = 0;
};

class ProcfsReader {
public:
    std::vector<ProcfsProcess> get_all_processes();

    // Parse the contents of /proc/<pid>/stat. Returns nullopt when malformed.
    static std::optional<ProcfsProcess> parse_stat(uint32_t pid, const std::string& content);
    // Resident page count from the contents of /proc/<pid>/statm
    static std::optional<uint64_t> parse_statm_resident(const std::string& content);

    // Error reporting
    std::vector<ParseError> get_recent_errors();

private:
    std::optional<ProcfsProcess> get_process(uint32_t pid);
    static std::string read_file(const std::string& path);

    // Error tracking
    void add_error(const std::string& message);
    mutable std::mutex errors_mutex_;
    std::vector<ParseError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace systop
