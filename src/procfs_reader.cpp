#include "procfs_reader.hpp"
#include "system_info.hpp"
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace systop {

// Error tracking methods
void ProcfsReader::add_error(const std::string& message) {
    spdlog::debug("procfs: {}", message);

    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ParseError> ProcfsReader::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    // Return errors from the last 10 seconds
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<ParseError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<ProcfsProcess> ProcfsReader::get_all_processes() {
    std::vector<ProcfsProcess> processes;

    try {
        for (const auto& entry : fs::directory_iterator("/proc")) {
            std::error_code ec;
            if (!entry.is_directory(ec) || ec) continue;

            const auto& name = entry.path().filename().string();
            uint32_t pid = 0;
            if (auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
                err != std::errc{} || ptr != name.data() + name.size()) continue;

            // A process that exits between listing and reading simply yields nullopt
            if (auto info = get_process(pid)) {
                processes.push_back(std::move(*info));
            }
        }
    } catch (const fs::filesystem_error& e) {
        add_error(fmt::format("Failed to iterate /proc: {}", e.what()));
    }

    return processes;
}

std::optional<ProcfsProcess> ProcfsReader::parse_stat(uint32_t pid, const std::string& content) {
    // Format: pid (comm) state ppid ...
    // comm can contain spaces and parentheses, so find the last ')'
    size_t comm_start = content.find('(');
    size_t comm_end = content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        return std::nullopt;
    }
    if (comm_end + 2 >= content.size()) {
        return std::nullopt;
    }

    ProcfsProcess info;
    info.pid = pid;
    info.name = content.substr(comm_start + 1, comm_end - comm_start - 1);

    // Fields after comm: state ppid pgrp session tty_nr tpgid flags
    // minflt cminflt majflt cmajflt utime stime
    std::istringstream iss(content.substr(comm_end + 2));
    std::string state;
    int64_t ppid = 0, pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    uint64_t flags = 0, minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0;

    iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> info.user_time >> info.kernel_time;

    if (iss.fail()) {
        return std::nullopt;
    }
    return info;
}

std::optional<uint64_t> ProcfsReader::parse_statm_resident(const std::string& content) {
    std::istringstream iss(content);
    uint64_t size = 0, resident = 0;
    if (!(iss >> size >> resident)) {
        return std::nullopt;
    }
    return resident;
}

std::optional<ProcfsProcess> ProcfsReader::get_process(uint32_t pid) {
    std::string proc_path = "/proc/" + std::to_string(pid);

    std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    auto info = parse_stat(pid, stat_content);
    if (!info) {
        add_error(fmt::format("PID {}: malformed stat", pid));
        return std::nullopt;
    }

    // Kernel threads report zero resident pages, which is still valid
    if (std::string statm = read_file(proc_path + "/statm"); !statm.empty()) {
        if (auto resident = parse_statm_resident(statm)) {
            info->resident_bytes = *resident * static_cast<uint64_t>(SystemInfo::instance().get_page_size());
        } else {
            add_error(fmt::format("PID {}: malformed statm", pid));
        }
    }

    return info;
}

} // namespace systop
