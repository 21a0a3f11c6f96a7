#pragma once

#include "detail/periodic_timer.hpp"
#include "detail/serial_executor.hpp"
#include "progress.hpp"
#include "throughput_estimator.hpp"
#include "transfer_item.hpp"
#include "transfer_observer.hpp"
#include "transfer_queue.hpp"
#include "transfer_status.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dlqueue {

struct TransferState {
    TransferStatus status;
    ProgressNodePtr progress;
};

// Queue of HTTP transfers running at most `maxConcurrent()` at a time.
//
// Every mutation (caller commands and transport callbacks alike) executes on one
// internal serialized context. Public calls block until their state transition
// has been applied and any handle creation or cancellation has been requested,
// never until network I/O completes. Observer callbacks run on that context and
// may call back into the manager.
class DownloadManager final : private QueueDelegate, private TransportListener {
public:
    struct Options {
        std::size_t max_concurrent{1};
        std::chrono::milliseconds throughput_interval{1000};
    };

    DownloadManager(std::shared_ptr<Transport> transport, TransferObserver* observer);
    DownloadManager(std::shared_ptr<Transport> transport, TransferObserver* observer, Options options);
    ~DownloadManager() override;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    void append(const std::vector<TransferItemPtr>& items);
    void append(const TransferItemPtr& item) { append(std::vector<TransferItemPtr>{item}); }

    // Cancels (with resume data), detaches and dequeues the batch; one
    // queue-changed event for all of it. Removed unfinished items are reset to
    // idle so they can be appended again.
    void remove(const std::vector<TransferItemPtr>& items);
    void remove(const TransferItemPtr& item) { remove(std::vector<TransferItemPtr>{item}); }

    void pause(const TransferItemPtr& item);
    void resume(const TransferItemPtr& item);
    // Replaces the request; the previous handle is dropped without resume data.
    void update(const TransferItemPtr& item, TransferRequest request);

    // Reattaches handles the transport kept from an earlier session. Returns how
    // many items were created for them.
    std::size_t attachOutstandingTransfers();

    void setMaxConcurrent(std::size_t max_concurrent);
    [[nodiscard]] std::size_t maxConcurrent() const;

    [[nodiscard]] TransferItemPtr find(TransferId id) const;
    [[nodiscard]] std::vector<TransferItemPtr> items() const;
    [[nodiscard]] TransferStatus status() const;
    [[nodiscard]] std::int64_t throughput() const;
    // Aggregate over the whole queue. Read it through state() or from observer
    // callbacks; it is mutated on the manager's context.
    [[nodiscard]] ProgressNodePtr progress() const { return progress_; }
    [[nodiscard]] TransferState state() const;

    // Waits until every transport callback received so far has been applied.
    void flush();

    [[nodiscard]] TransferStatus statusOf(const std::vector<TransferItemPtr>& items) const;
    // A live composite over the items' progress nodes. It is updated on the
    // manager's context and released there when the last reference goes away.
    [[nodiscard]] ProgressNodePtr progressOf(const std::vector<TransferItemPtr>& items) const;
    [[nodiscard]] TransferState stateOf(const std::vector<TransferItemPtr>& items) const;

private:
    struct Binding {
        TransferHandlePtr handle;
        bool tearing_down{false};
        // A new handle is wanted once the teardown is confirmed.
        bool rebind_pending{false};
    };

    struct ProgressUpdate {
        std::uint64_t received{0};
        std::uint64_t expected{0};
    };

    // QueueDelegate
    void queueDidChange(const std::vector<TransferItemPtr>& items) override;
    void itemShouldStart(const TransferItemPtr& item) override;

    // TransportListener; called on transport threads.
    void onProgress(TaskId task, std::uint64_t received, std::uint64_t expected) override;
    void onCompleted(TaskId task, TransferOutcome outcome) override;
    void onAllTransfersFinished() override;

    // The only places that touch bindings_ and task_index_.
    void bindHandle(const TransferItemPtr& item, TransferHandlePtr handle);
    void unbindHandle(TransferId id);

    void createHandle(const TransferItemPtr& item, bool use_resume_data);
    void requestHandle(const TransferItemPtr& item);
    void cancelHandle(const TransferItemPtr& item);
    void handleTeardown(const TransferItemPtr& item, TaskId task, std::optional<ResumeData> data);
    [[nodiscard]] TransferItemPtr itemForTask(TaskId task) const;

    void setStatus(const TransferItemPtr& item, TransferStatus status);
    void updateAggregateStatus();
    void startThroughputMonitoring();
    void stopThroughputMonitoring();
    void onThroughputTick();
    void flushProgressObservers();

    [[nodiscard]] ProgressNodePtr makeComposite(const std::vector<TransferItemPtr>& items) const;

    void drainProgress();
    void applyCompletion(TaskId task, const TransferOutcome& outcome);

    std::shared_ptr<Transport> transport_;
    TransferObserver& observer_;
    std::chrono::milliseconds throughput_interval_;

    TransferQueue queue_;
    ProgressNodePtr progress_;
    TransferStatus status_;
    ThroughputEstimator throughput_;
    detail::PeriodicTimer timer_;

    std::unordered_map<TransferId, Binding> bindings_;
    std::unordered_map<TaskId, TransferItemPtr> task_index_;

    std::mutex pending_mutex_;
    std::unordered_map<TaskId, ProgressUpdate> pending_progress_;
    bool drain_scheduled_{false};

    // Declared last: destroyed first, draining queued work while the members
    // above are still alive.
    std::shared_ptr<detail::SerialExecutor> executor_;
};

} // namespace dlqueue
