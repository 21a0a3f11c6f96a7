#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace dlqueue {

// Rolling bytes/second figure: each sample divides the bytes received since the
// previous sample by the time since the previous sample. Arming the periodic
// timer that calls sample() is the owner's job.
class ThroughputEstimator {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using ByteSource = std::function<std::uint64_t()>;
    using RateSink = std::function<void(std::int64_t)>;

    ThroughputEstimator(ByteSource bytes, RateSink sink, TimeSource now = [] { return Clock::now(); });

    // Records the baseline. No-op when already started.
    void start();
    // Publishes the rate since the previous sample. Ignored while stopped and
    // skipped when the clock did not advance.
    void sample();
    // Publishes exactly one 0 when leaving the started state.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] std::int64_t lastRate() const { return last_rate_; }

private:
    void publish(std::int64_t rate);

    ByteSource bytes_;
    RateSink sink_;
    TimeSource now_;

    bool running_{false};
    Clock::time_point last_time_{};
    std::uint64_t last_bytes_{0};
    std::int64_t last_rate_{0};
};

} // namespace dlqueue
