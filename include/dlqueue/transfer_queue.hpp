#pragma once

#include "transfer_item.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace dlqueue {

class QueueDelegate {
public:
    virtual ~QueueDelegate() = default;

    // Called once per append/remove batch with the queue in order.
    virtual void queueDidChange(const std::vector<TransferItemPtr>& items) = 0;
    // The item holds a free slot and should transition to running.
    virtual void itemShouldStart(const TransferItemPtr& item) = 0;
};

// Ordered set of items plus the admission policy: at most `maxConcurrent()`
// items are running, and idle items are promoted oldest first. Running items are
// never preempted, not even when the limit is lowered.
class TransferQueue {
public:
    explicit TransferQueue(QueueDelegate& delegate, std::size_t max_concurrent = 1);

    // Appends in the given order, skipping items already queued.
    void append(const std::vector<TransferItemPtr>& items);
    void remove(const std::vector<TransferItemPtr>& items);

    // Promotes idle items into free slots.
    void rebalance();

    void setMaxConcurrent(std::size_t max_concurrent);
    [[nodiscard]] std::size_t maxConcurrent() const { return max_concurrent_; }

    [[nodiscard]] TransferItemPtr find(TransferId id) const;
    [[nodiscard]] bool contains(TransferId id) const { return index_.count(id) > 0; }
    [[nodiscard]] const std::vector<TransferItemPtr>& items() const { return items_; }
    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] std::size_t runningCount() const;

private:
    [[nodiscard]] TransferItemPtr nextIdle(const std::vector<TransferId>& skip) const;

    QueueDelegate& delegate_;
    std::size_t max_concurrent_;
    std::vector<TransferItemPtr> items_;
    std::unordered_map<TransferId, TransferItemPtr> index_;

    bool rebalancing_{false};
    bool rebalance_requested_{false};
};

} // namespace dlqueue
