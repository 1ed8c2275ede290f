#include "linux_sampler.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace systop {

LinuxSampler::LinuxSampler() {
    previous_system_cpu_times_ = SystemInfo::get_cpu_times();
    previous_per_cpu_times_ = SystemInfo::get_per_cpu_times();

    for (const auto& proc : reader_.get_all_processes()) {
        previous_process_times_[proc.pid] = {proc.user_time, proc.kernel_time};
    }

    spdlog::debug("LinuxSampler primed: {} cores, {} processes",
                  previous_per_cpu_times_.size(), previous_process_times_.size());
}

RawSystemSample LinuxSampler::sample() {
    RawSystemSample result;

    auto mem_info = SystemInfo::get_memory_info();
    if (mem_info.total == 0) {
        throw SamplingError("/proc/meminfo has no MemTotal");
    }
    result.total_memory = mem_info.total;
    result.used_memory = mem_info.used;

    auto current_cpu_times = SystemInfo::get_cpu_times();
    uint64_t total_cpu_delta = current_cpu_times.total() > previous_system_cpu_times_.total()
        ? current_cpu_times.total() - previous_system_cpu_times_.total() : 0;

    sample_cpus(result);
    // Advance the baseline only once per-core sampling cannot fail, so that
    // process deltas and the total delta always span the same cycles
    previous_system_cpu_times_ = current_cpu_times;
    sample_processes(result, total_cpu_delta);

    result.host = SystemInfo::get_host_info();
    return result;
}

void LinuxSampler::sample_cpus(RawSystemSample& out) {
    SystemInfo::get_per_cpu_times(current_per_cpu_times_);
    const size_t cpu_count = current_per_cpu_times_.size();
    if (cpu_count == 0) {
        throw SamplingError("/proc/stat has no per-CPU lines");
    }

    out.cpus.reserve(cpu_count);
    for (size_t i = 0; i < cpu_count; i++) {
        const auto& current = current_per_cpu_times_[i];
        CpuReading reading;
        reading.label = current.label;

        if (i < previous_per_cpu_times_.size()) {
            const auto& previous = previous_per_cpu_times_[i].times;
            if (current.times.total() > previous.total()) {
                uint64_t delta_total = current.times.total() - previous.total();
                uint64_t delta_active = current.times.active() >= previous.active()
                    ? current.times.active() - previous.active() : 0;
                // iowait can step backwards, which would push this past 100
                reading.usage = static_cast<float>(
                    std::min(static_cast<double>(delta_active) / delta_total * 100.0, 100.0));
            }
        }
        out.cpus.push_back(std::move(reading));
    }

    // Swap current to previous (reuses memory)
    std::swap(previous_per_cpu_times_, current_per_cpu_times_);
}

void LinuxSampler::sample_processes(RawSystemSample& out, uint64_t total_cpu_delta) {
    auto processes = reader_.get_all_processes();
    const unsigned int proc_count = SystemInfo::instance().get_processor_count();

    std::set<uint32_t> current_pids;
    out.processes.reserve(processes.size());

    for (auto& proc : processes) {
        current_pids.insert(proc.pid);

        RawProcessRecord record;
        record.pid = proc.pid;
        record.name = std::move(proc.name);
        record.memory_bytes = proc.resident_bytes;

        if (auto it = previous_process_times_.find(proc.pid); it != previous_process_times_.end() && total_cpu_delta > 0) {
            uint64_t previous_total = it->second.first + it->second.second;
            uint64_t current_total = proc.user_time + proc.kernel_time;
            // A reused pid can show counters lower than the old process had
            if (current_total >= previous_total) {
                record.cpu_usage = static_cast<float>(
                    static_cast<double>(current_total - previous_total) / total_cpu_delta * 100.0 * proc_count);
            }
        }
        previous_process_times_[proc.pid] = {proc.user_time, proc.kernel_time};
        out.processes.push_back(std::move(record));
    }

    // Prune stale entries for processes that no longer exist
    std::erase_if(previous_process_times_, [&current_pids](const auto& entry) {
        return !current_pids.contains(entry.first);
    });
}

std::vector<ParseError> LinuxSampler::get_recent_errors() {
    return reader_.get_recent_errors();
}

} // namespace systop
