#include "dlqueue/transfer_item.hpp"

#include <atomic>
#include <utility>

#include <fmt/format.h>

namespace dlqueue {

namespace {

TransferId nextTransferId() {
    static std::atomic<TransferId> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

TransferItem::TransferItem(TransferRequest request, std::uint64_t expected_bytes)
    : id_(nextTransferId()),
      request_(std::move(request)),
      progress_(std::make_shared<ProgressNode>(expected_bytes)) {}

TransferSnapshot TransferItem::snapshot() const {
    TransferSnapshot snapshot;
    snapshot.id = id_;
    snapshot.url = request_.url;
    snapshot.filename = request_.destination;
    snapshot.total_bytes = progress_->expected();
    snapshot.downloaded_bytes = progress_->received();
    snapshot.status = status_.kind();
    if (status_.error()) {
        snapshot.error_message = status_.error()->message();
    }
    return snapshot;
}

std::string TransferItem::describe() const {
    return fmt::format("{} | {} | {}/{} ({:.1f}%)",
                       id_,
                       status_.toString(),
                       progress_->received(),
                       progress_->expected(),
                       progress_->fractionCompleted() * 100.0);
}

bool TransferItem::setStatus(TransferStatus status) {
    if (status_ == status) {
        return false;
    }
    status_ = std::move(status);
    return true;
}

void TransferItem::setRequest(TransferRequest request) {
    request_ = std::move(request);
}

TransferItemPtr makeTransferItem(std::string url, std::string destination, std::uint64_t expected_bytes) {
    TransferRequest request;
    request.url = std::move(url);
    request.destination = std::move(destination);
    return std::make_shared<TransferItem>(std::move(request), expected_bytes);
}

TransferStatus statusOfItems(const std::vector<TransferItemPtr>& items) {
    std::vector<TransferStatus> statuses;
    statuses.reserve(items.size());
    for (const auto& item : items) {
        statuses.push_back(item->status());
    }
    return reduceStatus(statuses);
}

} // namespace dlqueue
