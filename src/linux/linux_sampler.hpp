#pragma once

#include "../interfaces/i_sampler.hpp"
#include "../procfs_reader.hpp"
#include <map>
#include <utility>
#include <vector>

namespace systop {

// Samples /proc. CPU percentages are deltas against the previous call,
// so the constructor takes an initial reading of every counter.
class LinuxSampler : public ISampler {
public:
    LinuxSampler();
    ~LinuxSampler() override = default;

    RawSystemSample sample() override;
    std::vector<ParseError> get_recent_errors() override;

private:
    void sample_cpus(RawSystemSample& out);
    void sample_processes(RawSystemSample& out, uint64_t total_cpu_delta);

    ProcfsReader reader_;

    // For CPU delta calculations (pre-allocated, reused each tick)
    CpuTimes previous_system_cpu_times_;
    std::vector<LabeledCpuTimes> previous_per_cpu_times_;
    std::vector<LabeledCpuTimes> current_per_cpu_times_;  // Reused buffer
    std::map<uint32_t, std::pair<uint64_t, uint64_t>> previous_process_times_;
};

} // namespace systop
