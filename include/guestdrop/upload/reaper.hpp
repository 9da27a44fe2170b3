#pragma once

#include "guestdrop/upload/service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace guestdrop::upload {

/**
 * @brief Background thread that evicts idle upload sessions
 *
 * Calls UploadService::evict_stale() every `interval` until stop() or
 * destruction. stop() wakes the thread immediately instead of waiting out
 * the current interval.
 */
class StaleSessionReaper {
public:
    StaleSessionReaper(UploadService& service, std::chrono::milliseconds interval);
    ~StaleSessionReaper();

    StaleSessionReaper(const StaleSessionReaper&) = delete;
    StaleSessionReaper& operator=(const StaleSessionReaper&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_.load(); }

    /// Total sessions evicted by this reaper so far.
    std::size_t evicted_total() const { return evicted_total_.load(); }

private:
    void run();

    UploadService& service_;
    std::chrono::milliseconds interval_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> evicted_total_{0};
};

} // namespace guestdrop::upload
