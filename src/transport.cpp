#include "dlqueue/transport.hpp"

#include <utility>

namespace dlqueue {

bool TransferOutcome::succeeded() const {
    return kind == Kind::Completed && (http_status == 0 || (http_status >= 200 && http_status < 300));
}

TransferOutcome TransferOutcome::completed(long http_status, std::string payload_location) {
    TransferOutcome outcome;
    outcome.kind = Kind::Completed;
    outcome.http_status = http_status;
    outcome.payload_location = std::move(payload_location);
    return outcome;
}

TransferOutcome TransferOutcome::transportFailure(int code, std::string description) {
    TransferOutcome outcome;
    outcome.kind = Kind::TransportFailure;
    outcome.code = code;
    outcome.description = std::move(description);
    return outcome;
}

TransferOutcome TransferOutcome::otherFailure(int code, std::string description) {
    TransferOutcome outcome;
    outcome.kind = Kind::OtherFailure;
    outcome.code = code;
    outcome.description = std::move(description);
    return outcome;
}

TransferOutcome TransferOutcome::cancelled() {
    return TransferOutcome{};
}

} // namespace dlqueue
