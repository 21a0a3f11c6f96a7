#include "dlqueue/detail/periodic_timer.hpp"

#include <algorithm>
#include <utility>

namespace dlqueue::detail {

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start(std::chrono::milliseconds interval, std::function<void()> tick) {
    stop();

    interval = std::max(interval, std::chrono::milliseconds(1));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = true;
    }

    thread_ = std::thread([this, interval, tick = std::move(tick)]() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (active_) {
            if (cv_.wait_for(lock, interval, [this] { return !active_; })) {
                break;
            }
            lock.unlock();
            tick();
            lock.lock();
        }
    });
}

void PeriodicTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PeriodicTimer::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace dlqueue::detail
