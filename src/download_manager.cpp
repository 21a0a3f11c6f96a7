#include "dlqueue/download_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace dlqueue {

namespace {

TransferObserver& nullObserver() {
    static TransferObserver observer;
    return observer;
}

std::vector<ProgressNodePtr> progressNodes(const std::vector<TransferItemPtr>& items) {
    std::vector<ProgressNodePtr> nodes;
    nodes.reserve(items.size());
    for (const auto& item : items) {
        nodes.push_back(item->progress());
    }
    return nodes;
}

} // namespace

DownloadManager::DownloadManager(std::shared_ptr<Transport> transport, TransferObserver* observer)
    : DownloadManager(std::move(transport), observer, Options{}) {}

DownloadManager::DownloadManager(std::shared_ptr<Transport> transport, TransferObserver* observer, Options options)
    : transport_(std::move(transport)),
      observer_(observer ? *observer : nullObserver()),
      throughput_interval_(options.throughput_interval),
      queue_(*this, options.max_concurrent),
      progress_(std::make_shared<ProgressNode>(std::vector<ProgressNodePtr>{})),
      throughput_([this] { return progress_->received(); },
                  [this](std::int64_t rate) { observer_.onThroughputChanged(rate); }),
      executor_(std::make_shared<detail::SerialExecutor>()) {
    if (!transport_) {
        throw std::invalid_argument("DownloadManager requires a transport");
    }
    transport_->setListener(this);
}

DownloadManager::~DownloadManager() {
    transport_->setListener(nullptr);
    timer_.stop();
    executor_->shutdown();
}

void DownloadManager::append(const std::vector<TransferItemPtr>& items) {
    executor_->sync([&] {
        std::vector<TransferItemPtr> batch;
        batch.reserve(items.size());
        for (const auto& item : items) {
            if (!item || queue_.contains(item->id()) ||
                std::find(batch.begin(), batch.end(), item) != batch.end()) {
                continue;
            }

            // Finished items are never reused for a matching URL; a duplicate
            // of an unfinished one is the caller's responsibility.
            for (const auto& queued : queue_.items()) {
                if (queued->url() == item->url() && !queued->status().is(StatusKind::Finished)) {
                    spdlog::warn("{} is already queued as transfer {}", item->url(), queued->id());
                    break;
                }
            }

            if (!item->status().is(StatusKind::Finished)) {
                requestHandle(item);
            }
            batch.push_back(item);
        }
        if (batch.empty()) {
            return;
        }

        progress_->addChildren(progressNodes(batch));
        queue_.append(batch);
    });
}

void DownloadManager::remove(const std::vector<TransferItemPtr>& items) {
    executor_->sync([&] {
        std::vector<TransferItemPtr> batch;
        batch.reserve(items.size());
        for (const auto& item : items) {
            if (item && queue_.contains(item->id()) &&
                std::find(batch.begin(), batch.end(), item) == batch.end()) {
                batch.push_back(item);
            }
        }
        if (batch.empty()) {
            return;
        }

        for (const auto& item : batch) {
            cancelHandle(item);
            const auto it = bindings_.find(item->id());
            if (it != bindings_.end()) {
                it->second.rebind_pending = false;
            }
        }
        progress_->removeChildren(progressNodes(batch));
        queue_.remove(batch);

        for (const auto& item : batch) {
            if (!item->status().is(StatusKind::Finished)) {
                setStatus(item, TransferStatus::idle());
            }
        }
    });
}

void DownloadManager::pause(const TransferItemPtr& item) {
    executor_->sync([&] {
        if (!item || !queue_.contains(item->id())) {
            spdlog::warn("pause: transfer is not queued");
            return;
        }
        if (item->status().is(StatusKind::Finished)) {
            return;
        }

        setStatus(item, TransferStatus::paused());
        cancelHandle(item);
        const auto it = bindings_.find(item->id());
        if (it != bindings_.end()) {
            it->second.rebind_pending = false;
        }
    });
}

void DownloadManager::resume(const TransferItemPtr& item) {
    executor_->sync([&] {
        if (!item || !queue_.contains(item->id())) {
            spdlog::warn("resume: transfer is not queued");
            return;
        }
        const auto& status = item->status();
        if (status.is(StatusKind::Finished) || status.is(StatusKind::Running)) {
            return;
        }

        requestHandle(item);
        setStatus(item, TransferStatus::idle());
    });
}

void DownloadManager::update(const TransferItemPtr& item, TransferRequest request) {
    executor_->sync([&] {
        if (!item) {
            return;
        }

        TransferHandlePtr previous;
        const auto it = bindings_.find(item->id());
        if (it != bindings_.end()) {
            previous = it->second.handle;
        }
        unbindHandle(item->id());
        if (previous) {
            previous->cancel();
        }

        item->setRequest(std::move(request));
        if (queue_.contains(item->id()) && !item->status().is(StatusKind::Finished)) {
            createHandle(item, false);
        }
    });
}

std::size_t DownloadManager::attachOutstandingTransfers() {
    return executor_->sync([&] {
        std::vector<TransferItemPtr> batch;
        for (auto& handle : transport_->outstandingHandles()) {
            if (!handle) {
                continue;
            }
            auto item = std::make_shared<TransferItem>(handle->request());
            observer_.onHandleReconnected(item, handle);
            bindHandle(item, handle);
            batch.push_back(std::move(item));
        }
        if (!batch.empty()) {
            spdlog::info("reattached {} outstanding transfer(s)", batch.size());
            progress_->addChildren(progressNodes(batch));
            queue_.append(batch);
        }
        return batch.size();
    });
}

void DownloadManager::setMaxConcurrent(std::size_t max_concurrent) {
    executor_->sync([&] { queue_.setMaxConcurrent(max_concurrent); });
}

std::size_t DownloadManager::maxConcurrent() const {
    return executor_->sync([&] { return queue_.maxConcurrent(); });
}

TransferItemPtr DownloadManager::find(TransferId id) const {
    return executor_->sync([&] { return queue_.find(id); });
}

std::vector<TransferItemPtr> DownloadManager::items() const {
    return executor_->sync([&] { return queue_.items(); });
}

TransferStatus DownloadManager::status() const {
    return executor_->sync([&] { return status_; });
}

std::int64_t DownloadManager::throughput() const {
    return executor_->sync([&] { return throughput_.lastRate(); });
}

TransferState DownloadManager::state() const {
    return executor_->sync([&] { return TransferState{status_, progress_}; });
}

void DownloadManager::flush() {
    executor_->sync([] {});
}

TransferStatus DownloadManager::statusOf(const std::vector<TransferItemPtr>& items) const {
    return executor_->sync([&] { return statusOfItems(items); });
}

ProgressNodePtr DownloadManager::progressOf(const std::vector<TransferItemPtr>& items) const {
    return executor_->sync([&] { return makeComposite(items); });
}

TransferState DownloadManager::stateOf(const std::vector<TransferItemPtr>& items) const {
    return executor_->sync([&] { return TransferState{statusOfItems(items), makeComposite(items)}; });
}

ProgressNodePtr DownloadManager::makeComposite(const std::vector<TransferItemPtr>& items) const {
    // The composite hooks into the items' nodes, so it has to go away on the
    // same context that updates them.
    std::weak_ptr<detail::SerialExecutor> weak_executor = executor_;
    return ProgressNodePtr(new ProgressNode(progressNodes(items)), [weak_executor](ProgressNode* node) {
        const auto executor = weak_executor.lock();
        if (executor && !executor->isCurrentThread() && executor->post([node] { delete node; })) {
            return;
        }
        delete node;
    });
}

// -- QueueDelegate --

void DownloadManager::queueDidChange(const std::vector<TransferItemPtr>& items) {
    updateAggregateStatus();
    observer_.onQueueChanged(items);
}

void DownloadManager::itemShouldStart(const TransferItemPtr& item) {
    requestHandle(item);

    // Without a live handle (teardown still in flight) the handle starts as soon
    // as it is bound, since the item is running by then.
    const auto it = bindings_.find(item->id());
    if (it != bindings_.end() && !it->second.tearing_down) {
        it->second.handle->start();
    }
    setStatus(item, TransferStatus::running());
}

// -- TransportListener --

void DownloadManager::onProgress(TaskId task, std::uint64_t received, std::uint64_t expected) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_progress_[task] = ProgressUpdate{received, expected};
        if (!drain_scheduled_) {
            drain_scheduled_ = true;
            schedule = true;
        }
    }
    if (schedule) {
        executor_->post([this] { drainProgress(); });
    }
}

void DownloadManager::onCompleted(TaskId task, TransferOutcome outcome) {
    executor_->post([this, task, outcome = std::move(outcome)] { applyCompletion(task, outcome); });
}

void DownloadManager::onAllTransfersFinished() {
    executor_->post([this] {
        for (const auto& entry : bindings_) {
            const auto item = queue_.find(entry.first);
            if (!item) {
                continue;
            }
            item->progress()->setReceived(entry.second.handle->bytesReceived());
        }
        observer_.onBackgroundBatchFinished();
    });
}

// -- Handle bookkeeping --

void DownloadManager::bindHandle(const TransferItemPtr& item, TransferHandlePtr handle) {
    unbindHandle(item->id());

    const TaskId task = handle->taskId();
    task_index_[task] = item;
    Binding binding;
    binding.handle = std::move(handle);
    bindings_[item->id()] = std::move(binding);
    spdlog::debug("bound transfer {} to task {}", item->id(), task);
}

void DownloadManager::unbindHandle(TransferId id) {
    const auto it = bindings_.find(id);
    if (it == bindings_.end()) {
        return;
    }
    const TaskId task = it->second.handle->taskId();
    task_index_.erase(task);
    bindings_.erase(it);
    spdlog::debug("unbound transfer {} from task {}", id, task);
}

void DownloadManager::createHandle(const TransferItemPtr& item, bool use_resume_data) {
    std::optional<ResumeData> resume_data;
    if (use_resume_data) {
        resume_data = observer_.resumeDataFor(item);
    }

    auto handle = transport_->createHandle(item->request(), resume_data);
    if (!handle) {
        throw std::runtime_error("transport returned no handle for " + item->url());
    }
    bindHandle(item, handle);
    observer_.onHandleCreated(item, handle);

    if (item->status().is(StatusKind::Running)) {
        handle->start();
    }
}

void DownloadManager::requestHandle(const TransferItemPtr& item) {
    const auto it = bindings_.find(item->id());
    if (it == bindings_.end()) {
        createHandle(item, true);
        return;
    }
    if (it->second.tearing_down) {
        it->second.rebind_pending = true;
    }
}

void DownloadManager::cancelHandle(const TransferItemPtr& item) {
    const auto it = bindings_.find(item->id());
    if (it == bindings_.end() || it->second.tearing_down) {
        return;
    }
    it->second.tearing_down = true;

    auto handle = it->second.handle;
    const TaskId task = handle->taskId();
    std::weak_ptr<detail::SerialExecutor> executor = executor_;
    handle->cancelProducingResumeData([this, executor, item, task](std::optional<ResumeData> data) {
        if (auto strong = executor.lock()) {
            strong->post([this, item, task, data = std::move(data)]() mutable {
                handleTeardown(item, task, std::move(data));
            });
        }
    });
}

void DownloadManager::handleTeardown(const TransferItemPtr& item, TaskId task, std::optional<ResumeData> data) {
    observer_.onResumeDataAvailable(item, data);

    const auto it = bindings_.find(item->id());
    if (it == bindings_.end() || it->second.handle->taskId() != task) {
        return;
    }
    const bool rebind = it->second.rebind_pending;
    unbindHandle(item->id());

    if (rebind && queue_.contains(item->id()) && !item->status().is(StatusKind::Finished)) {
        createHandle(item, true);
    }
}

TransferItemPtr DownloadManager::itemForTask(TaskId task) const {
    const auto it = task_index_.find(task);
    return it == task_index_.end() ? nullptr : it->second;
}

// -- Status --

void DownloadManager::setStatus(const TransferItemPtr& item, TransferStatus status) {
    if (!item->setStatus(std::move(status))) {
        return;
    }
    spdlog::debug("transfer {} is {}", item->id(), item->status().toString());

    observer_.onItemStatusChanged(item);
    queue_.rebalance();
    updateAggregateStatus();
}

void DownloadManager::updateAggregateStatus() {
    auto next = statusOfItems(queue_.items());
    if (next == status_) {
        return;
    }

    const bool was_running = status_.is(StatusKind::Running);
    status_ = std::move(next);
    if (status_.is(StatusKind::Running) && !was_running) {
        startThroughputMonitoring();
    } else if (!status_.is(StatusKind::Running) && was_running) {
        stopThroughputMonitoring();
    }
    observer_.onAggregateStatusChanged(status_);
}

void DownloadManager::startThroughputMonitoring() {
    throughput_.start();

    std::weak_ptr<detail::SerialExecutor> executor = executor_;
    timer_.start(throughput_interval_, [this, executor] {
        if (auto strong = executor.lock()) {
            strong->post([this] { onThroughputTick(); });
        }
    });
}

void DownloadManager::stopThroughputMonitoring() {
    timer_.stop();
    throughput_.stop();
    flushProgressObservers();
}

void DownloadManager::onThroughputTick() {
    throughput_.sample();
    flushProgressObservers();
}

void DownloadManager::flushProgressObservers() {
    progress_->flushPending();
    for (const auto& item : queue_.items()) {
        item->progress()->flushPending();
    }
}

// -- Transport results --

void DownloadManager::drainProgress() {
    std::unordered_map<TaskId, ProgressUpdate> updates;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        updates.swap(pending_progress_);
        drain_scheduled_ = false;
    }

    for (const auto& entry : updates) {
        const auto item = itemForTask(entry.first);
        if (!item) {
            spdlog::debug("dropping progress of unbound task {}", entry.first);
            continue;
        }
        const auto& node = item->progress();
        if (entry.second.expected > 0) {
            node->setExpected(entry.second.expected);
        }
        node->setReceived(entry.second.received);
        observer_.onItemProgress(item);
    }
}

void DownloadManager::applyCompletion(TaskId task, const TransferOutcome& outcome) {
    if (outcome.kind == TransferOutcome::Kind::Cancelled) {
        spdlog::debug("task {} cancelled", task);
        return;
    }

    const auto item = itemForTask(task);
    if (!item) {
        spdlog::debug("ignoring completion of unbound task {}", task);
        return;
    }
    if (bindings_.at(item->id()).tearing_down) {
        spdlog::debug("ignoring completion of task {} while it is being cancelled", task);
        return;
    }

    switch (outcome.kind) {
    case TransferOutcome::Kind::Completed: {
        if (!outcome.succeeded()) {
            spdlog::warn("transfer {} failed with HTTP {}", item->id(), outcome.http_status);
            unbindHandle(item->id());
            setStatus(item, TransferStatus::failed(TransferError::server(static_cast<int>(outcome.http_status))));
            return;
        }

        observer_.onPayloadReady(item, outcome.payload_location);
        unbindHandle(item->id());

        // The transport's total is authoritative once the body is complete.
        const auto& node = item->progress();
        if (node->received() > 0) {
            node->setExpected(node->received());
        }
        setStatus(item, TransferStatus::finished());
        return;
    }
    case TransferOutcome::Kind::TransportFailure:
        spdlog::warn("transfer {} failed: {}", item->id(), outcome.description);
        unbindHandle(item->id());
        setStatus(item, TransferStatus::failed(TransferError::transport(outcome.code, outcome.description)));
        return;
    case TransferOutcome::Kind::OtherFailure:
        spdlog::warn("transfer {} failed: {}", item->id(), outcome.description);
        unbindHandle(item->id());
        setStatus(item, TransferStatus::failed(TransferError::unknown(outcome.code, outcome.description)));
        return;
    case TransferOutcome::Kind::Cancelled:
        return;
    }
}

} // namespace dlqueue
