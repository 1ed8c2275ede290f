#include "system_info.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <sys/utsname.h>
#include <climits>

namespace systop {

SystemInfo& SystemInfo::instance() {
    static SystemInfo instance;
    return instance;
}

SystemInfo::SystemInfo() {
    processor_count_ = std::thread::hardware_concurrency();
    if (processor_count_ == 0) processor_count_ = 1;

    page_size_ = sysconf(_SC_PAGESIZE);
    if (page_size_ <= 0) page_size_ = 4096;
}

std::optional<LabeledCpuTimes> SystemInfo::parse_cpu_line(const std::string& line) {
    if (!line.starts_with("cpu")) return std::nullopt;

    LabeledCpuTimes result;
    auto& times = result.times;
    std::istringstream iss(line);
    iss >> result.label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;

    // Older kernels stop before steal; the first four fields are mandatory
    if (result.label.empty() || (iss.fail() && times.total() == 0)) {
        return std::nullopt;
    }
    return result;
}

CpuTimes SystemInfo::get_cpu_times() {
    std::ifstream stat("/proc/stat");
    std::string line;

    if (std::getline(stat, line) && line.starts_with("cpu ")) {
        if (auto parsed = parse_cpu_line(line)) {
            return parsed->times;
        }
    }
    return {};
}

std::vector<LabeledCpuTimes> SystemInfo::get_per_cpu_times() {
    std::vector<LabeledCpuTimes> result;
    get_per_cpu_times(result);
    return result;
}

void SystemInfo::get_per_cpu_times(std::vector<LabeledCpuTimes>& out) {
    std::ifstream stat("/proc/stat");
    std::string line;
    size_t index = 0;

    while (std::getline(stat, line)) {
        // Look for lines starting with "cpu" followed by a digit (cpu0, cpu1, etc.)
        if (line.size() <= 3 || !std::isdigit(static_cast<unsigned char>(line[3]))) continue;

        auto parsed = parse_cpu_line(line);
        if (!parsed) continue;

        if (index < out.size()) {
            out[index] = std::move(*parsed);
        } else {
            out.push_back(std::move(*parsed));
        }
        index++;
    }

    if (index < out.size()) {
        out.resize(index);
    }
}

MemoryInfo SystemInfo::parse_meminfo(std::istream& in) {
    MemoryInfo info;
    std::string line;

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;

        if (!(iss >> key >> value)) continue;

        if (key == "MemTotal:") {
            info.total = value * 1024; // Convert from KB to bytes
        } else if (key == "MemAvailable:") {
            info.available = value * 1024;
        }
    }

    info.used = info.total > info.available ? info.total - info.available : 0;
    return info;
}

MemoryInfo SystemInfo::get_memory_info() {
    std::ifstream meminfo("/proc/meminfo");
    return parse_meminfo(meminfo);
}

uint64_t SystemInfo::get_uptime_seconds() {
    std::ifstream uptime("/proc/uptime");
    double uptime_sec = 0.0;

    if (uptime && uptime >> uptime_sec && uptime_sec > 0.0) {
        return static_cast<uint64_t>(uptime_sec);
    }
    return 0;
}

std::string SystemInfo::parse_os_release(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("PRETTY_NAME=", 0) == 0) {
            std::string pretty_name = line.substr(12);
            // Remove quotes if present
            if (pretty_name.size() >= 2 && pretty_name.front() == '"' && pretty_name.back() == '"') {
                pretty_name = pretty_name.substr(1, pretty_name.size() - 2);
            }
            return pretty_name;
        }
    }
    return {};
}

HostInfo SystemInfo::get_host_info() {
    HostInfo host;

    char hostname[HOST_NAME_MAX + 1] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        host.hostname = hostname;
    }

    struct utsname uts {};
    if (uname(&uts) == 0) {
        host.kernel_version = uts.release;
    }

    std::ifstream os_release("/etc/os-release");
    if (!os_release) {
        os_release.open("/usr/lib/os-release");
    }
    if (os_release) {
        if (std::string pretty = parse_os_release(os_release); !pretty.empty()) {
            host.os_version = pretty;
        }
    }

    host.uptime_seconds = get_uptime_seconds();
    return host;
}

unsigned int SystemInfo::get_processor_count() const {
    return processor_count_;
}

long SystemInfo::get_page_size() const {
    return page_size_;
}

} // namespace systop
