#pragma once

/// Shared fakes for the sampler and process killer interfaces.
///
/// MockSampler is safe to drive from the test thread while a Refresher
/// calls sample() from its background thread.

#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_sampler.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace test_mocks
{

inline systop::RawProcessRecord make_record(uint32_t pid, const std::string& name, float cpu, uint64_t memory)
{
    systop::RawProcessRecord record;
    record.pid = pid;
    record.name = name;
    record.cpu_usage = cpu;
    record.memory_bytes = memory;
    return record;
}

inline systop::RawSystemSample make_sample(const std::vector<float>& core_usage,
                                           uint64_t total_memory,
                                           uint64_t used_memory,
                                           std::vector<systop::RawProcessRecord> processes = {})
{
    systop::RawSystemSample sample;
    for (size_t i = 0; i < core_usage.size(); ++i) {
        sample.cpus.push_back({"cpu" + std::to_string(i), core_usage[i]});
    }
    sample.total_memory = total_memory;
    sample.used_memory = used_memory;
    sample.host.hostname = "testhost";
    sample.host.kernel_version = "6.1.0-test";
    sample.host.os_version = "Test Linux";
    sample.host.uptime_seconds = 3 * 3600 + 25 * 60;
    sample.processes = std::move(processes);
    return sample;
}

class MockSampler : public systop::ISampler
{
public:
    systop::RawSystemSample sample() override
    {
        std::lock_guard lock(mutex_);
        ++calls_;
        if (failing_) {
            throw systop::SamplingError("simulated /proc failure");
        }
        return sample_;
    }

    std::vector<systop::ParseError> get_recent_errors() override
    {
        std::lock_guard lock(mutex_);
        return errors_;
    }

    void set_sample(systop::RawSystemSample sample)
    {
        std::lock_guard lock(mutex_);
        sample_ = std::move(sample);
    }

    void set_failing(bool failing)
    {
        std::lock_guard lock(mutex_);
        failing_ = failing;
    }

    void add_error(const std::string& message)
    {
        std::lock_guard lock(mutex_);
        errors_.push_back({std::chrono::steady_clock::now(), message});
    }

    [[nodiscard]] int calls() const
    {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    systop::RawSystemSample sample_;
    std::vector<systop::ParseError> errors_;
    bool failing_ = false;
    int calls_ = 0;
};

class MockProcessKiller : public systop::IProcessKiller
{
public:
    struct Call
    {
        uint32_t pid;
        bool force;
    };

    systop::KillResult kill_process(uint32_t pid, bool force) override
    {
        calls_.push_back({pid, force});
        return result_;
    }

    void set_result(systop::KillResult result) { result_ = std::move(result); }

    [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }

private:
    std::vector<Call> calls_;
    systop::KillResult result_{true, false, ""};
};

} // namespace test_mocks
