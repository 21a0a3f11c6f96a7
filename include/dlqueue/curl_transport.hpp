#pragma once

#include "transport.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dlqueue {

// libcurl-backed transport. Every started handle runs one easy transfer on its
// own worker thread, writing into a `.part` file under the staging directory.
// Cancelling with resume data keeps that file and hands out a token pointing at
// it; a handle created from the token continues with a range request.
class CurlTransport final : public Transport {
public:
    struct Options {
        std::string staging_dir;
        long connect_timeout_s{30};
        std::string user_agent{"dlqueue/1.0"};
    };

    struct ResumeToken {
        std::string url;
        std::string path;
        std::uint64_t offset{0};
    };

    // Creates the staging directory; throws std::runtime_error if it cannot.
    explicit CurlTransport(Options options);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    void setListener(TransportListener* listener) override;
    [[nodiscard]] TransferHandlePtr createHandle(const TransferRequest& request,
                                                 const std::optional<ResumeData>& resume_data) override;

    [[nodiscard]] static ResumeData encodeResumeData(const ResumeToken& token);
    [[nodiscard]] static std::optional<ResumeToken> decodeResumeData(const ResumeData& data);

private:
    class Impl;
    class Transfer;
    std::shared_ptr<Impl> impl_;
};

} // namespace dlqueue
