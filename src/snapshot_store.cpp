#include "snapshot_store.hpp"
#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

namespace systop {

double SnapshotStore::percent_of(uint64_t part, uint64_t total) {
    if (total == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(total) * 100.0;
}

void SnapshotStore::refresh(const RawSystemSample& sample) {
    // Build the new process table before taking the lock
    std::vector<ProcessSample> processes;
    processes.reserve(sample.processes.size());
    for (const auto& record : sample.processes) {
        ProcessSample proc;
        proc.pid = record.pid;
        proc.name = record.name;
        proc.cpu_usage = record.cpu_usage;
        proc.memory_bytes = record.memory_bytes;
        proc.memory_percent = percent_of(record.memory_bytes, sample.total_memory);
        processes.push_back(std::move(proc));
    }

    std::unique_lock lock(mutex_);

    apply_cpu_readings(sample.cpus);

    host_ = sample.host;
    total_memory_ = sample.total_memory;
    used_memory_ = sample.used_memory;
    memory_.history.push(percent_of(used_memory_, total_memory_));
    processes_ = std::move(processes);
    ++generation_;
}

// Caller holds the write lock
void SnapshotStore::apply_cpu_readings(const std::vector<CpuReading>& cpus) {
    if (!initialized_) {
        cpus_.resize(cpus.size());
        for (size_t i = 0; i < cpus.size(); ++i) {
            cpus_[i].label = cpus[i].label;
        }
        initialized_ = true;
        spdlog::info("SnapshotStore tracking {} CPU series", cpus_.size());
    }

    if (cpus.size() != cpus_.size() && !core_mismatch_logged_) {
        spdlog::warn("CPU count changed from {} to {}; keeping the initial {} series",
                     cpus_.size(), cpus.size(), cpus_.size());
        core_mismatch_logged_ = true;
    }

    const size_t count = std::min(cpus.size(), cpus_.size());
    for (size_t i = 0; i < count; ++i) {
        cpus_[i].current_usage = cpus[i].usage;
        cpus_[i].history.push(cpus[i].usage);
    }
}

std::vector<ProcessSample> SnapshotStore::processes(SortKey key) const {
    std::vector<ProcessSample> result;
    {
        std::shared_lock lock(mutex_);
        result = processes_;
    }
    sort_processes(result, key);
    return result;
}

size_t SnapshotStore::process_count() const {
    std::shared_lock lock(mutex_);
    return processes_.size();
}

std::vector<CpuSeries> SnapshotStore::cpu_series() const {
    std::shared_lock lock(mutex_);
    return cpus_;
}

MemorySeries SnapshotStore::memory_series() const {
    std::shared_lock lock(mutex_);
    return memory_;
}

HostInfo SnapshotStore::host_info() const {
    std::shared_lock lock(mutex_);
    return host_;
}

uint64_t SnapshotStore::total_memory() const {
    std::shared_lock lock(mutex_);
    return total_memory_;
}

uint64_t SnapshotStore::used_memory() const {
    std::shared_lock lock(mutex_);
    return used_memory_;
}

double SnapshotStore::memory_percent() const {
    std::shared_lock lock(mutex_);
    return percent_of(used_memory_, total_memory_);
}

uint64_t SnapshotStore::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

StoreView SnapshotStore::view(SortKey key) const {
    StoreView result;
    {
        std::shared_lock lock(mutex_);
        result.host = host_;
        result.total_memory = total_memory_;
        result.used_memory = used_memory_;
        result.memory_percent = percent_of(used_memory_, total_memory_);
        result.cpus = cpus_;
        result.memory = memory_;
        result.processes = processes_;
        result.generation = generation_;
    }
    sort_processes(result.processes, key);
    return result;
}

} // namespace systop
