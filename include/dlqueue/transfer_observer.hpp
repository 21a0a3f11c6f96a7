#pragma once

#include "transfer_item.hpp"
#include "transfer_status.hpp"
#include "transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

// Everything the DownloadManager publishes. All calls arrive on the manager's
// serialized context; implementations may call back into the manager.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void onQueueChanged(const std::vector<TransferItemPtr>& /*items*/) {}
    virtual void onItemStatusChanged(const TransferItemPtr& /*item*/) {}
    virtual void onAggregateStatusChanged(const TransferStatus& /*status*/) {}
    virtual void onThroughputChanged(std::int64_t /*bytes_per_second*/) {}
    virtual void onItemProgress(const TransferItemPtr& /*item*/) {}

    virtual void onHandleCreated(const TransferItemPtr& /*item*/, const TransferHandlePtr& /*handle*/) {}
    virtual void onHandleReconnected(const TransferItemPtr& /*item*/, const TransferHandlePtr& /*handle*/) {}

    // A cancelled handle stopped. Persist `data` if the item may be resumed later.
    virtual void onResumeDataAvailable(const TransferItemPtr& /*item*/,
                                       const std::optional<ResumeData>& /*data*/) {}
    // Queried whenever a handle is (re)created for the item.
    virtual std::optional<ResumeData> resumeDataFor(const TransferItemPtr& /*item*/) { return std::nullopt; }

    // The payload at `location` must be moved or consumed before returning.
    virtual void onPayloadReady(const TransferItemPtr& /*item*/, const std::string& /*location*/) {}
    virtual void onBackgroundBatchFinished() {}
};

} // namespace dlqueue
