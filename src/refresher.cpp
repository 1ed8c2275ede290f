#include "refresher.hpp"
#include <cassert>
#include <exception>
#include <spdlog/spdlog.h>

namespace systop {

Refresher::Refresher(ISampler* sampler, SnapshotStore* store, std::chrono::milliseconds interval)
    : sampler_(sampler)
    , store_(store)
    , interval_(interval)
{
    assert(sampler_ != nullptr);
    assert(store_ != nullptr);
}

Refresher::~Refresher() {
    stop();
}

void Refresher::start() {
    if (running_) return;

    // Initial collection; a failure here means there is nothing to show
    store_->refresh(sampler_->sample());
    completed_cycles_++;
    spdlog::info("Initial sample applied, refreshing every {} ms", interval_.count());

    running_ = true;
    collection_thread_ = std::thread(&Refresher::collection_thread_func, this);
}

void Refresher::stop() {
    if (!running_) return;

    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (collection_thread_.joinable()) {
        collection_thread_.join();
    }
}

void Refresher::refresh_now() {
    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

void Refresher::collection_thread_func() {
    while (running_) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this] {
                return !running_ || refresh_requested_;
            });
            refresh_requested_ = false;
        }

        if (running_) {
            run_cycle();
        }
    }
}

void Refresher::run_cycle() {
    // Sample outside the store lock; readers only wait for the assignment
    RawSystemSample sample;
    try {
        sample = sampler_->sample();
    } catch (const std::exception& e) {
        failed_cycles_++;
        stale_ = true;
        spdlog::warn("Refresh skipped, keeping previous snapshot: {}", e.what());
        return;
    }

    store_->refresh(sample);
    stale_ = false;
    completed_cycles_++;
    spdlog::debug("Refresh {} applied: {} cpus, {} processes",
                  completed_cycles_.load(), sample.cpus.size(), sample.processes.size());
}

} // namespace systop
