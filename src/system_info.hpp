#pragma once

#include "process_info.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace systop {

struct CpuTimes {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    [[nodiscard]] uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }

    [[nodiscard]] uint64_t active() const {
        return user + nice + system + irq + softirq + steal;
    }
};

// Per-core counters keyed by the /proc/stat label ("cpu0", "cpu1", ...)
struct LabeledCpuTimes {
    std::string label;
    CpuTimes times;
};

struct MemoryInfo {
    uint64_t total = 0;
    uint64_t available = 0;
    uint64_t used = 0;
};

struct HostInfo {
    std::string hostname = "unknown";
    std::string kernel_version = "unknown";
    std::string os_version = "unknown";
    uint64_t uptime_seconds = 0;
};

struct CpuReading {
    std::string label;
    float usage = 0.0f;
};

// Everything a sampler returns in one call. Core order is stable
// between calls; process order is not.
struct RawSystemSample {
    std::vector<CpuReading> cpus;
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    HostInfo host;
    std::vector<RawProcessRecord> processes;
};

class SystemInfo {
public:
    static SystemInfo& instance();

    static CpuTimes get_cpu_times();
    static std::vector<LabeledCpuTimes> get_per_cpu_times();
    static void get_per_cpu_times(std::vector<LabeledCpuTimes>& out);
    static MemoryInfo get_memory_info();
    static uint64_t get_uptime_seconds();
    static HostInfo get_host_info();

    // Parsing helpers, exposed for tests
    static std::optional<LabeledCpuTimes> parse_cpu_line(const std::string& line);
    static MemoryInfo parse_meminfo(std::istream& in);
    static std::string parse_os_release(std::istream& in);

    [[nodiscard]] unsigned int get_processor_count() const;
    [[nodiscard]] long get_page_size() const;

private:
    SystemInfo();
    unsigned int processor_count_ = 1;
    long page_size_ = 4096;
};

} // namespace systop
