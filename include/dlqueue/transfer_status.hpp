#pragma once

#include "transfer_error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

enum class StatusKind {
    Idle,
    Running,
    Paused,
    Finished,
    Failed,
};

// Exactly one of idle, running, paused, finished or failed(error). The error is
// present if and only if the kind is Failed.
class TransferStatus {
public:
    TransferStatus() = default;

    [[nodiscard]] static TransferStatus idle() { return TransferStatus{StatusKind::Idle}; }
    [[nodiscard]] static TransferStatus running() { return TransferStatus{StatusKind::Running}; }
    [[nodiscard]] static TransferStatus paused() { return TransferStatus{StatusKind::Paused}; }
    [[nodiscard]] static TransferStatus finished() { return TransferStatus{StatusKind::Finished}; }
    [[nodiscard]] static TransferStatus failed(TransferError error);

    [[nodiscard]] StatusKind kind() const { return kind_; }
    [[nodiscard]] bool is(StatusKind kind) const { return kind_ == kind; }
    [[nodiscard]] const std::optional<TransferError>& error() const { return error_; }

    [[nodiscard]] std::string toString() const;

    friend bool operator==(const TransferStatus& lhs, const TransferStatus& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.error_ == rhs.error_;
    }
    friend bool operator!=(const TransferStatus& lhs, const TransferStatus& rhs) { return !(lhs == rhs); }

private:
    explicit TransferStatus(StatusKind kind) : kind_(kind) {}

    StatusKind kind_{StatusKind::Idle};
    std::optional<TransferError> error_;
};

[[nodiscard]] const char* toString(StatusKind kind);

// Reduces any number of statuses to one, independent of order:
//   empty -> idle; all equal -> that status; any running -> running;
//   any paused -> paused; every unfinished one failed -> failed(aggregate of the
//   distinct errors); otherwise idle.
[[nodiscard]] TransferStatus reduceStatus(const std::vector<TransferStatus>& statuses);

} // namespace dlqueue
