#include "dlqueue/detail/serial_executor.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace dlqueue::detail {

SerialExecutor::SerialExecutor() {
    std::lock_guard<std::mutex> lock(mutex_);
    worker_ = std::thread([this]() { run(); });
    worker_id_ = worker_.get_id();
}

SerialExecutor::~SerialExecutor() { shutdown(); }

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable() && !isCurrentThread()) {
        worker_.join();
    }
}

void SerialExecutor::run() {
    {
        // Wait for the constructor to publish worker_id_.
        std::lock_guard<std::mutex> lock(mutex_);
    }

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& ex) {
            spdlog::error("executor task failed: {}", ex.what());
        }
    }
}

} // namespace dlqueue::detail
