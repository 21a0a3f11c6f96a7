#pragma once

#include <string>
#include <vector>

namespace dlqueue {

enum class ErrorKind {
    Server,     // response outside the accepted status range
    Transport,  // connection level: DNS, TLS, reset, timeout
    Unknown,    // any other transport failure
    Aggregate,  // summary of several failed items
};

// Why a transfer failed. Value type; ordered and comparable so that aggregates
// can deduplicate by value.
class TransferError {
public:
    [[nodiscard]] static TransferError server(int status_code);
    [[nodiscard]] static TransferError transport(int code, std::string description);
    [[nodiscard]] static TransferError unknown(int code, std::string description);
    // Sorts and deduplicates `errors`.
    [[nodiscard]] static TransferError aggregate(std::vector<TransferError> errors);

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    // HTTP status for Server, transport code for Transport/Unknown, 0 for Aggregate.
    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::vector<TransferError>& causes() const { return causes_; }

    [[nodiscard]] std::string message() const;

    friend bool operator==(const TransferError& lhs, const TransferError& rhs);
    friend bool operator!=(const TransferError& lhs, const TransferError& rhs) { return !(lhs == rhs); }
    friend bool operator<(const TransferError& lhs, const TransferError& rhs);

private:
    TransferError(ErrorKind kind, int code, std::string description);

    ErrorKind kind_;
    int code_{0};
    std::string description_;
    std::vector<TransferError> causes_;
};

} // namespace dlqueue
