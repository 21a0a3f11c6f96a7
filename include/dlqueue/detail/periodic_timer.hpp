#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace dlqueue::detail {

// Calls `tick` every `interval` on a background thread until stopped. `tick`
// must not block and must not stop the timer itself.
class PeriodicTimer {
public:
    PeriodicTimer() = default;
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    // Restarts the timer if it is already active.
    void start(std::chrono::milliseconds interval, std::function<void()> tick);
    void stop();

    [[nodiscard]] bool isActive() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool active_{false};
    std::thread thread_;
};

} // namespace dlqueue::detail
