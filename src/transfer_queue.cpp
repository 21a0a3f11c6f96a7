#include "dlqueue/transfer_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace dlqueue {

TransferQueue::TransferQueue(QueueDelegate& delegate, std::size_t max_concurrent)
    : delegate_(delegate), max_concurrent_(std::max<std::size_t>(1, max_concurrent)) {}

void TransferQueue::append(const std::vector<TransferItemPtr>& items) {
    bool changed = false;
    for (const auto& item : items) {
        if (!item) {
            continue;
        }
        if (contains(item->id())) {
            spdlog::warn("transfer {} is already queued, ignoring", item->id());
            continue;
        }
        items_.push_back(item);
        index_.emplace(item->id(), item);
        changed = true;
    }
    if (!changed) {
        return;
    }

    rebalance();
    delegate_.queueDidChange(items_);
}

void TransferQueue::remove(const std::vector<TransferItemPtr>& items) {
    std::size_t removed = 0;
    for (const auto& item : items) {
        if (item && index_.erase(item->id()) > 0) {
            ++removed;
        }
    }
    if (removed == 0) {
        return;
    }

    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [this](const TransferItemPtr& item) { return !contains(item->id()); }),
                 items_.end());

    delegate_.queueDidChange(items_);
    rebalance();
}

void TransferQueue::rebalance() {
    // Promotion runs the delegate, which changes statuses, which asks for another
    // rebalance. Fold those nested requests into the running pass.
    if (rebalancing_) {
        rebalance_requested_ = true;
        return;
    }

    struct Guard {
        bool& flag;
        ~Guard() { flag = false; }
    } guard{rebalancing_};
    rebalancing_ = true;

    std::vector<TransferId> attempted;
    do {
        rebalance_requested_ = false;
        while (runningCount() < max_concurrent_) {
            auto item = nextIdle(attempted);
            if (!item) {
                break;
            }
            attempted.push_back(item->id());
            spdlog::debug("promoting transfer {} ({} running, limit {})",
                          item->id(), runningCount(), max_concurrent_);
            delegate_.itemShouldStart(item);
        }
    } while (rebalance_requested_);
}

void TransferQueue::setMaxConcurrent(std::size_t max_concurrent) {
    max_concurrent_ = std::max<std::size_t>(1, max_concurrent);
    rebalance();
}

TransferItemPtr TransferQueue::find(TransferId id) const {
    const auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

std::size_t TransferQueue::runningCount() const {
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const TransferItemPtr& item) {
        return item->status().is(StatusKind::Running);
    }));
}

TransferItemPtr TransferQueue::nextIdle(const std::vector<TransferId>& skip) const {
    for (const auto& item : items_) {
        if (!item->status().is(StatusKind::Idle)) {
            continue;
        }
        if (std::find(skip.begin(), skip.end(), item->id()) != skip.end()) {
            continue;
        }
        return item;
    }
    return nullptr;
}

} // namespace dlqueue
