#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace dlqueue::detail {

// One worker thread draining a FIFO of tasks. Everything posted here runs
// mutually exclusive with everything else posted here.
class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // Never blocks on the worker. Returns false once shut down.
    bool post(Task task);

    // Runs `f` on the worker and waits for its result; runs inline when already
    // on the worker. Exceptions propagate to the caller.
    template <typename F>
    auto sync(F&& f) -> std::invoke_result_t<F&>;

    // Runs what is already queued, then joins the worker.
    void shutdown();

    [[nodiscard]] bool isCurrentThread() const { return std::this_thread::get_id() == worker_id_; }

private:
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_{false};
    std::thread worker_;
    std::thread::id worker_id_;
};

template <typename F>
auto SerialExecutor::sync(F&& f) -> std::invoke_result_t<F&> {
    using Result = std::invoke_result_t<F&>;

    if (isCurrentThread()) {
        return f();
    }

    std::packaged_task<Result()> task(std::ref(f));
    auto future = task.get_future();
    if (!post([&task] { task(); })) {
        throw std::runtime_error("executor has been shut down");
    }
    return future.get();
}

} // namespace dlqueue::detail
