#pragma once

#include <cstdint>
#include <string>

namespace systop {

// One row of the raw process table as produced by a sampler.
struct RawProcessRecord {
    uint32_t pid = 0;
    std::string name;

    // CPU usage per core (100% = 1 core)
    float cpu_usage = 0.0f;

    // Resident set size in bytes
    uint64_t memory_bytes = 0;
};

// Process row as exposed by SnapshotStore. Rebuilt on every refresh;
// only the pid links a row to the same process in a later snapshot.
struct ProcessSample {
    uint32_t pid = 0;
    std::string name;
    float cpu_usage = 0.0f;
    uint64_t memory_bytes = 0;
    double memory_percent = 0.0;     // Percentage of total system memory
};

} // namespace systop
