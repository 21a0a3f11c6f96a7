#pragma once

#include "dlqueue/transfer_observer.hpp"
#include "dlqueue/transport.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dlqueue::test {

class FakeTransport;

class FakeHandle final : public TransferHandle {
public:
    FakeHandle(FakeTransport& owner, TaskId task, TransferRequest request, std::optional<ResumeData> resume_data)
        : owner_(owner), task_(task), request_(std::move(request)), resume_data_(std::move(resume_data)) {}

    [[nodiscard]] TaskId taskId() const override { return task_; }
    [[nodiscard]] const TransferRequest& request() const override { return request_; }
    [[nodiscard]] std::uint64_t bytesReceived() const override { return received_.load(); }

    void start() override { ++start_count_; }
    void cancel() override { cancelled_ = true; }
    void cancelProducingResumeData(ResumeDataCallback done) override;

    // Delivers a held cancellation confirmation.
    void confirmCancel();

    [[nodiscard]] int startCount() const { return start_count_.load(); }
    [[nodiscard]] bool started() const { return start_count_.load() > 0; }
    [[nodiscard]] bool cancelled() const { return cancelled_.load(); }
    [[nodiscard]] const std::optional<ResumeData>& resumeData() const { return resume_data_; }

    void setReceived(std::uint64_t received) { received_ = received; }

private:
    FakeTransport& owner_;
    const TaskId task_;
    const TransferRequest request_;
    const std::optional<ResumeData> resume_data_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<int> start_count_{0};
    std::atomic<bool> cancelled_{false};

    std::mutex mutex_;
    ResumeDataCallback pending_done_;
};

using FakeHandlePtr = std::shared_ptr<FakeHandle>;

// Transport whose handles never touch the network. The test drives every
// callback explicitly and then flushes the manager.
class FakeTransport final : public Transport {
public:
    void setListener(TransportListener* listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = listener;
    }

    [[nodiscard]] TransferHandlePtr createHandle(const TransferRequest& request,
                                                 const std::optional<ResumeData>& resume_data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto handle = std::make_shared<FakeHandle>(*this, ++next_task_, request, resume_data);
        handles_.push_back(handle);
        return handle;
    }

    [[nodiscard]] std::vector<TransferHandlePtr> outstandingHandles() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    // Handles created so far, oldest first.
    [[nodiscard]] std::vector<FakeHandlePtr> handles() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_;
    }

    [[nodiscard]] std::size_t handleCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_.size();
    }

    // Newest handle created for `url`.
    [[nodiscard]] FakeHandlePtr handleFor(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
            if ((*it)->request().url == url) {
                return *it;
            }
        }
        return nullptr;
    }

    void addOutstanding(const TransferRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_.push_back(std::make_shared<FakeHandle>(*this, ++next_task_, request, std::nullopt));
    }

    // When false, cancellations wait for FakeHandle::confirmCancel().
    void setConfirmCancelImmediately(bool immediately) { confirm_immediately_ = immediately; }
    [[nodiscard]] bool confirmCancelImmediately() const { return confirm_immediately_.load(); }

    void emitProgress(const TransferHandlePtr& handle, std::uint64_t received, std::uint64_t expected) {
        if (auto fake = std::dynamic_pointer_cast<FakeHandle>(handle)) {
            fake->setReceived(received);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onProgress(handle->taskId(), received, expected);
        }
    }

    void complete(const TransferHandlePtr& handle, TransferOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onCompleted(handle->taskId(), std::move(outcome));
        }
    }

    void succeed(const TransferHandlePtr& handle, long http_status = 200) {
        complete(handle, TransferOutcome::completed(http_status, "/staging/" + std::to_string(handle->taskId())));
    }

    void finishAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onAllTransfersFinished();
        }
    }

    void reportCancelled(TaskId task) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listener_) {
            listener_->onCompleted(task, TransferOutcome::cancelled());
        }
    }

private:
    mutable std::mutex mutex_;
    TransportListener* listener_{nullptr};
    TaskId next_task_{0};
    std::vector<FakeHandlePtr> handles_;
    std::vector<TransferHandlePtr> outstanding_;
    std::atomic<bool> confirm_immediately_{true};
};

inline void FakeHandle::cancelProducingResumeData(ResumeDataCallback done) {
    cancelled_ = true;
    if (owner_.confirmCancelImmediately()) {
        const auto received = received_.load();
        done(received > 0 ? std::optional<ResumeData>("resume:" + request_.url + ":" + std::to_string(received))
                          : std::nullopt);
        owner_.reportCancelled(task_);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_done_ = std::move(done);
}

inline void FakeHandle::confirmCancel() {
    ResumeDataCallback done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done = std::move(pending_done_);
        pending_done_ = nullptr;
    }
    if (!done) {
        return;
    }
    const auto received = received_.load();
    done(received > 0 ? std::optional<ResumeData>("resume:" + request_.url + ":" + std::to_string(received))
                      : std::nullopt);
    owner_.reportCancelled(task_);
}

// Records everything the manager publishes. Stores resume data by URL and hands
// it back on handle creation.
class RecordingObserver final : public TransferObserver {
public:
    struct StatusEvent {
        TransferId id;
        TransferStatus status;
    };

    void onQueueChanged(const std::vector<TransferItemPtr>& items) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++queue_changes;
        last_queue_size = items.size();
    }

    void onItemStatusChanged(const TransferItemPtr& item) override {
        std::lock_guard<std::mutex> lock(mutex_);
        status_events.push_back({item->id(), item->status()});
    }

    void onAggregateStatusChanged(const TransferStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        aggregate_events.push_back(status);
    }

    void onThroughputChanged(std::int64_t bytes_per_second) override {
        std::lock_guard<std::mutex> lock(mutex_);
        throughput_events.push_back(bytes_per_second);
    }

    void onItemProgress(const TransferItemPtr& /*item*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++progress_events;
    }

    void onHandleCreated(const TransferItemPtr& /*item*/, const TransferHandlePtr& /*handle*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++handles_created;
    }

    void onHandleReconnected(const TransferItemPtr& /*item*/, const TransferHandlePtr& /*handle*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++handles_reconnected;
    }

    void onResumeDataAvailable(const TransferItemPtr& item, const std::optional<ResumeData>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++resume_events;
        if (data) {
            resume_data[item->url()] = *data;
        } else {
            resume_data.erase(item->url());
        }
    }

    std::optional<ResumeData> resumeDataFor(const TransferItemPtr& item) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = resume_data.find(item->url());
        if (it == resume_data.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void onPayloadReady(const TransferItemPtr& item, const std::string& location) override {
        std::lock_guard<std::mutex> lock(mutex_);
        payloads.emplace_back(item->id(), location);
    }

    void onBackgroundBatchFinished() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++batches_finished;
    }

    [[nodiscard]] std::vector<std::int64_t> throughput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return throughput_events;
    }

    mutable std::mutex mutex_;
    int queue_changes{0};
    std::size_t last_queue_size{0};
    std::vector<StatusEvent> status_events;
    std::vector<TransferStatus> aggregate_events;
    std::vector<std::int64_t> throughput_events;
    int progress_events{0};
    int handles_created{0};
    int handles_reconnected{0};
    int resume_events{0};
    std::map<std::string, ResumeData> resume_data;
    std::vector<std::pair<TransferId, std::string>> payloads;
    int batches_finished{0};
};

} // namespace dlqueue::test
