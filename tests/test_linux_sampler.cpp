/// @file test_linux_sampler.cpp
/// @brief Smoke tests against the live /proc of the test host

#include "linux/linux_process_killer.hpp"
#include "linux/linux_sampler.hpp"
#include "platform_factory.hpp"
#include "snapshot_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <unistd.h>

using systop::LinuxProcessKiller;
using systop::LinuxSampler;

TEST(LinuxSamplerTest, SampleDescribesThisHost)
{
    LinuxSampler sampler;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto sample = sampler.sample();

    EXPECT_FALSE(sample.cpus.empty());
    EXPECT_GT(sample.total_memory, 0u);
    EXPECT_LE(sample.used_memory, sample.total_memory);
    EXPECT_FALSE(sample.host.kernel_version.empty());

    for (const auto& cpu : sample.cpus) {
        EXPECT_EQ(cpu.label.rfind("cpu", 0), 0u) << cpu.label;
        EXPECT_GE(cpu.usage, 0.0f);
        EXPECT_LE(cpu.usage, 100.0f);
    }

    const auto self = static_cast<uint32_t>(getpid());
    auto it = std::find_if(sample.processes.begin(), sample.processes.end(),
                           [self](const systop::RawProcessRecord& p) { return p.pid == self; });
    ASSERT_NE(it, sample.processes.end());
    EXPECT_FALSE(it->name.empty());
    EXPECT_GT(it->memory_bytes, 0u);
}

TEST(LinuxSamplerTest, CoreCountIsStableBetweenSamples)
{
    LinuxSampler sampler;

    auto first = sampler.sample();
    auto second = sampler.sample();

    ASSERT_EQ(first.cpus.size(), second.cpus.size());
    for (size_t i = 0; i < first.cpus.size(); ++i) {
        EXPECT_EQ(first.cpus[i].label, second.cpus[i].label);
    }
}

// Process and system deltas must cover the same interval, otherwise a busy
// process reads as more than every core together
TEST(LinuxSamplerTest, BusyProcessStaysWithinCoreBudget)
{
    LinuxSampler sampler;
    sampler.sample();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
    volatile uint64_t spin = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        spin = spin + 1;
    }

    auto sample = sampler.sample();
    ASSERT_FALSE(sample.cpus.empty());
    const float budget = 100.0f * static_cast<float>(sample.cpus.size());

    const auto self = static_cast<uint32_t>(getpid());
    auto it = std::find_if(sample.processes.begin(), sample.processes.end(),
                           [self](const systop::RawProcessRecord& p) { return p.pid == self; });
    ASSERT_NE(it, sample.processes.end());
    EXPECT_GT(it->cpu_usage, 0.0f);
    // Tick granularity allows a small overshoot
    EXPECT_LE(it->cpu_usage, budget * 1.25f);
}

TEST(LinuxSamplerTest, FeedsSnapshotStore)
{
    auto sampler = systop::make_sampler();
    systop::SnapshotStore store;

    store.refresh(sampler->sample());

    EXPECT_FALSE(store.cpu_series().empty());
    EXPECT_GT(store.process_count(), 0u);
    EXPECT_GT(store.memory_percent(), 0.0);
    EXPECT_LE(store.memory_percent(), 100.0);
}

TEST(LinuxProcessKillerTest, RejectsInvalidPids)
{
    LinuxProcessKiller killer;

    auto zero = killer.kill_process(0, true);
    EXPECT_FALSE(zero.success);
    EXPECT_EQ(zero.error_message, "Invalid PID");

    auto wrapped = killer.kill_process(0x80000000u, true);
    EXPECT_FALSE(wrapped.success);
}

TEST(LinuxProcessKillerTest, ReportsMissingProcess)
{
    LinuxProcessKiller killer;

    // Above the kernel's pid_max ceiling, so never a live process
    auto result = killer.kill_process(0x7ffffff0u, false);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.process_still_running);
    EXPECT_FALSE(result.error_message.empty());
}
