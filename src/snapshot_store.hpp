#pragma once

#include "history_ring_buffer.hpp"
#include "process_info.hpp"
#include "process_sort.hpp"
#include "system_info.hpp"
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace systop {

struct CpuSeries {
    std::string label;
    float current_usage = 0.0f;
    HistoryRingBuffer<float> history;
};

struct MemorySeries {
    HistoryRingBuffer<double> history;   // percent used
};

// Copy of the whole store taken under a single read lock
struct StoreView {
    HostInfo host;
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    double memory_percent = 0.0;
    std::vector<CpuSeries> cpus;
    MemorySeries memory;
    std::vector<ProcessSample> processes;   // sorted by the requested key
    uint64_t generation = 0;
};

// System of record shared by the refresher (sole writer) and the UI
// (reader). refresh() takes the lock exclusively; every accessor takes it
// shared and returns a copy, so nothing handed out can change underneath
// the caller.
class SnapshotStore {
public:
    SnapshotStore() = default;

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    // Apply one sample. The first call fixes the number of CPU series.
    void refresh(const RawSystemSample& sample);

    [[nodiscard]] std::vector<ProcessSample> processes(SortKey key) const;
    [[nodiscard]] size_t process_count() const;
    [[nodiscard]] std::vector<CpuSeries> cpu_series() const;
    [[nodiscard]] MemorySeries memory_series() const;
    [[nodiscard]] HostInfo host_info() const;
    [[nodiscard]] uint64_t total_memory() const;
    [[nodiscard]] uint64_t used_memory() const;
    [[nodiscard]] double memory_percent() const;

    // Number of refreshes applied so far
    [[nodiscard]] uint64_t generation() const;

    [[nodiscard]] StoreView view(SortKey key) const;

private:
    static double percent_of(uint64_t part, uint64_t total);
    void apply_cpu_readings(const std::vector<CpuReading>& cpus);

    mutable std::shared_mutex mutex_;

    bool initialized_ = false;
    bool core_mismatch_logged_ = false;
    uint64_t generation_ = 0;

    HostInfo host_;
    uint64_t total_memory_ = 0;
    uint64_t used_memory_ = 0;
    std::vector<CpuSeries> cpus_;
    MemorySeries memory_;
    std::vector<ProcessSample> processes_;
};

} // namespace systop
