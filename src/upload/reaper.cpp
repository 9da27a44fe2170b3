#include "guestdrop/upload/reaper.hpp"

#include <spdlog/spdlog.h>

namespace guestdrop::upload {

StaleSessionReaper::StaleSessionReaper(UploadService& service, std::chrono::milliseconds interval)
    : service_(service), interval_(interval) {}

StaleSessionReaper::~StaleSessionReaper() {
    stop();
}

void StaleSessionReaper::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this] { run(); });
    spdlog::debug("Stale session reaper running every {}ms", interval_.count());
}

void StaleSessionReaper::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

void StaleSessionReaper::run() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        const auto evicted = service_.evict_stale();
        if (evicted > 0) {
            evicted_total_ += evicted;
            spdlog::info("Evicted {} stale upload session(s)", evicted);
        }
        lock.lock();
    }
}

} // namespace guestdrop::upload
