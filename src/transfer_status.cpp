#include "dlqueue/transfer_status.hpp"

#include <algorithm>
#include <utility>

namespace dlqueue {

TransferStatus TransferStatus::failed(TransferError error) {
    TransferStatus status{StatusKind::Failed};
    status.error_ = std::move(error);
    return status;
}

std::string TransferStatus::toString() const {
    if (kind_ == StatusKind::Failed && error_) {
        return std::string{"failed: "} + error_->message();
    }
    return dlqueue::toString(kind_);
}

const char* toString(StatusKind kind) {
    switch (kind) {
    case StatusKind::Idle:
        return "idle";
    case StatusKind::Running:
        return "running";
    case StatusKind::Paused:
        return "paused";
    case StatusKind::Finished:
        return "finished";
    case StatusKind::Failed:
        return "failed";
    }
    return "unknown";
}

TransferStatus reduceStatus(const std::vector<TransferStatus>& statuses) {
    if (statuses.empty()) {
        return TransferStatus::idle();
    }

    const auto& first = statuses.front();
    const bool all_same = std::all_of(statuses.begin(), statuses.end(),
                                      [&first](const TransferStatus& s) { return s == first; });
    if (all_same) {
        return first;
    }

    const auto any_of_kind = [&statuses](StatusKind kind) {
        return std::any_of(statuses.begin(), statuses.end(),
                           [kind](const TransferStatus& s) { return s.is(kind); });
    };
    if (any_of_kind(StatusKind::Running)) {
        return TransferStatus::running();
    }
    if (any_of_kind(StatusKind::Paused)) {
        return TransferStatus::paused();
    }

    std::vector<TransferError> errors;
    for (const auto& status : statuses) {
        if (status.is(StatusKind::Finished)) {
            continue;
        }
        if (!status.is(StatusKind::Failed) || !status.error()) {
            return TransferStatus::idle();
        }
        errors.push_back(*status.error());
    }
    if (errors.empty()) {
        return TransferStatus::idle();
    }
    return TransferStatus::failed(TransferError::aggregate(std::move(errors)));
}

} // namespace dlqueue
