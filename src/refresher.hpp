#pragma once

#include "interfaces/i_sampler.hpp"
#include "snapshot_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace systop {

// Background thread that feeds the SnapshotStore from a sampler on a
// fixed interval.
class Refresher {
public:
    // Non-owning: sampler and store must outlive the Refresher.
    Refresher(ISampler* sampler, SnapshotStore* store, std::chrono::milliseconds interval);
    ~Refresher();

    Refresher(const Refresher&) = delete;
    Refresher& operator=(const Refresher&) = delete;

    // Takes the first sample on the calling thread and lets any exception
    // from it escape, then starts the background thread.
    void start();
    void stop();

    // Wake the background thread for an immediate cycle
    void refresh_now();

    [[nodiscard]] std::chrono::milliseconds refresh_interval() const { return interval_; }

    // True while the latest cycle failed and the store holds older data
    [[nodiscard]] bool is_stale() const { return stale_; }
    [[nodiscard]] uint64_t failed_cycles() const { return failed_cycles_; }
    [[nodiscard]] uint64_t completed_cycles() const { return completed_cycles_; }

private:
    void collection_thread_func();
    void run_cycle();

    ISampler* sampler_ = nullptr;
    SnapshotStore* store_ = nullptr;
    const std::chrono::milliseconds interval_;

    // Background thread
    std::thread collection_thread_;
    std::atomic<bool> running_{false};
    bool refresh_requested_ = false;     // guarded by cv_mutex_
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    std::atomic<bool> stale_{false};
    std::atomic<uint64_t> failed_cycles_{0};
    std::atomic<uint64_t> completed_cycles_{0};
};

} // namespace systop
