#pragma once

#include "progress.hpp"
#include "transfer_status.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dlqueue {

using TransferId = std::uint64_t;

struct TransferRequest {
    std::string url;
    // Where the finished payload should end up; interpreted by the observer.
    std::string destination;
    // Extra request headers, "Name: value".
    std::vector<std::string> headers;
};

// Point-in-time copy of an item for rendering.
struct TransferSnapshot {
    TransferId id{0};
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    StatusKind status{StatusKind::Idle};
    std::string error_message;
};

// One queued download. The item never owns a transport handle; the
// DownloadManager keeps the id -> handle binding.
class TransferItem {
public:
    explicit TransferItem(TransferRequest request, std::uint64_t expected_bytes = 0);

    TransferItem(const TransferItem&) = delete;
    TransferItem& operator=(const TransferItem&) = delete;

    [[nodiscard]] TransferId id() const { return id_; }
    [[nodiscard]] const TransferRequest& request() const { return request_; }
    [[nodiscard]] const std::string& url() const { return request_.url; }
    [[nodiscard]] const TransferStatus& status() const { return status_; }
    [[nodiscard]] const ProgressNodePtr& progress() const { return progress_; }

    [[nodiscard]] TransferSnapshot snapshot() const;
    // "<id> | <status> | <received>/<expected> (<pct>%)"
    [[nodiscard]] std::string describe() const;

    // Raw state mutation. A DownloadManager owning the item performs these
    // itself and republishes the change; calling them directly on a queued item
    // bypasses scheduling.
    bool setStatus(TransferStatus status);
    void setRequest(TransferRequest request);

private:
    const TransferId id_;
    TransferRequest request_;
    TransferStatus status_;
    ProgressNodePtr progress_;
};

using TransferItemPtr = std::shared_ptr<TransferItem>;

[[nodiscard]] TransferItemPtr makeTransferItem(std::string url, std::string destination = {},
                                               std::uint64_t expected_bytes = 0);

// reduceStatus over the items' current statuses. Reads each item unguarded; call
// it where nothing else is mutating them.
[[nodiscard]] TransferStatus statusOfItems(const std::vector<TransferItemPtr>& items);

} // namespace dlqueue
