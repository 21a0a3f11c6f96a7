#include "dlqueue/throughput_estimator.hpp"

#include <utility>

namespace dlqueue {

ThroughputEstimator::ThroughputEstimator(ByteSource bytes, RateSink sink, TimeSource now)
    : bytes_(std::move(bytes)), sink_(std::move(sink)), now_(std::move(now)) {}

void ThroughputEstimator::start() {
    if (running_) {
        return;
    }
    running_ = true;
    last_time_ = now_();
    last_bytes_ = bytes_();
}

void ThroughputEstimator::sample() {
    if (!running_) {
        return;
    }

    const auto now = now_();
    const auto bytes = bytes_();
    const auto elapsed = std::chrono::duration<double>(now - last_time_).count();
    if (elapsed <= 0.0) {
        return;
    }

    // Removing an item shrinks the aggregate; report that as no progress.
    const std::uint64_t delta = bytes > last_bytes_ ? bytes - last_bytes_ : 0;
    last_time_ = now;
    last_bytes_ = bytes;
    publish(static_cast<std::int64_t>(static_cast<double>(delta) / elapsed));
}

void ThroughputEstimator::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    publish(0);
}

void ThroughputEstimator::publish(std::int64_t rate) {
    last_rate_ = rate;
    if (sink_) {
        sink_(rate);
    }
}

} // namespace dlqueue
