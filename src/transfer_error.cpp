#include "dlqueue/transfer_error.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

#include <fmt/format.h>

namespace dlqueue {

TransferError::TransferError(ErrorKind kind, int code, std::string description)
    : kind_(kind), code_(code), description_(std::move(description)) {}

TransferError TransferError::server(int status_code) {
    return TransferError{ErrorKind::Server, status_code, {}};
}

TransferError TransferError::transport(int code, std::string description) {
    return TransferError{ErrorKind::Transport, code, std::move(description)};
}

TransferError TransferError::unknown(int code, std::string description) {
    return TransferError{ErrorKind::Unknown, code, std::move(description)};
}

TransferError TransferError::aggregate(std::vector<TransferError> errors) {
    std::sort(errors.begin(), errors.end());
    errors.erase(std::unique(errors.begin(), errors.end()), errors.end());

    TransferError error{ErrorKind::Aggregate, 0, {}};
    error.causes_ = std::move(errors);
    return error;
}

std::string TransferError::message() const {
    switch (kind_) {
    case ErrorKind::Server:
        return fmt::format("server error (HTTP {})", code_);
    case ErrorKind::Transport:
        return fmt::format("transport error {}: {}", code_, description_);
    case ErrorKind::Unknown:
        return fmt::format("unknown error {}: {}", code_, description_);
    case ErrorKind::Aggregate: {
        std::string text = fmt::format("{} error(s)", causes_.size());
        const char* separator = ": ";
        for (const auto& cause : causes_) {
            text += separator;
            text += cause.message();
            separator = "; ";
        }
        return text;
    }
    }
    return "error";
}

bool operator==(const TransferError& lhs, const TransferError& rhs) {
    return lhs.kind_ == rhs.kind_ && lhs.code_ == rhs.code_ &&
           lhs.description_ == rhs.description_ && lhs.causes_ == rhs.causes_;
}

bool operator<(const TransferError& lhs, const TransferError& rhs) {
    return std::tie(lhs.kind_, lhs.code_, lhs.description_, lhs.causes_) <
           std::tie(rhs.kind_, rhs.code_, rhs.description_, rhs.causes_);
}

} // namespace dlqueue
