#pragma once

#include "transfer_item.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

// Transport-level identifier of one handle; callbacks are keyed by it.
using TaskId = std::uint64_t;
// Opaque transport state that lets a new handle continue a partial transfer.
using ResumeData = std::string;

struct TransferOutcome {
    enum class Kind {
        Completed,         // a response arrived; check http_status
        TransportFailure,  // DNS, connect, TLS, reset, timeout
        OtherFailure,
        Cancelled,
    };

    Kind kind{Kind::Cancelled};
    // 0 when the scheme has no status line (file://).
    long http_status{0};
    std::string payload_location;
    int code{0};
    std::string description;

    // Completed with a 2xx status, or 0 for schemes without one.
    [[nodiscard]] bool succeeded() const;

    [[nodiscard]] static TransferOutcome completed(long http_status, std::string payload_location);
    [[nodiscard]] static TransferOutcome transportFailure(int code, std::string description);
    [[nodiscard]] static TransferOutcome otherFailure(int code, std::string description);
    [[nodiscard]] static TransferOutcome cancelled();
};

// Receives handle callbacks. Implementations must not block: these arrive on
// transport threads.
class TransportListener {
public:
    virtual ~TransportListener() = default;

    virtual void onProgress(TaskId task, std::uint64_t received, std::uint64_t expected) = 0;
    virtual void onCompleted(TaskId task, TransferOutcome outcome) = 0;
    // Every handle the transport knows about has completed.
    virtual void onAllTransfersFinished() = 0;
};

// A live transfer owned by the transport. Created suspended.
class TransferHandle {
public:
    using ResumeDataCallback = std::function<void(std::optional<ResumeData>)>;

    virtual ~TransferHandle() = default;

    [[nodiscard]] virtual TaskId taskId() const = 0;
    [[nodiscard]] virtual const TransferRequest& request() const = 0;
    [[nodiscard]] virtual std::uint64_t bytesReceived() const = 0;

    virtual void start() = 0;
    virtual void cancel() = 0;
    // Asynchronous. `done` runs exactly once, possibly on another thread, after
    // the transfer has stopped; a Cancelled completion is reported as well.
    virtual void cancelProducingResumeData(ResumeDataCallback done) = 0;
};

using TransferHandlePtr = std::shared_ptr<TransferHandle>;

class Transport {
public:
    virtual ~Transport() = default;

    // Pass nullptr to detach; no callback is delivered once this returns.
    virtual void setListener(TransportListener* listener) = 0;

    [[nodiscard]] virtual TransferHandlePtr createHandle(const TransferRequest& request,
                                                         const std::optional<ResumeData>& resume_data) = 0;

    // Handles that survived from an earlier session.
    [[nodiscard]] virtual std::vector<TransferHandlePtr> outstandingHandles() { return {}; }
};

} // namespace dlqueue
