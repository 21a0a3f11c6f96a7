#include <gtest/gtest.h>
#include "dlqueue/curl_transport.hpp"
#include "dlqueue/download_manager.hpp"
#include "fake_transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dlqueue;
using dlqueue::test::RecordingObserver;

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Collects the outcome of a single handle driven without a manager.
class OutcomeListener final : public TransportListener {
public:
    void onProgress(TaskId, std::uint64_t, std::uint64_t) override {}

    void onCompleted(TaskId, TransferOutcome outcome) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome_ = std::move(outcome);
        }
        cv_.notify_all();
    }

    void onAllTransfersFinished() override {}

    std::optional<TransferOutcome> waitForOutcome() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(10), [this] { return outcome_.has_value(); });
        return outcome_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<TransferOutcome> outcome_;
};

// Answers one HTTP request on 127.0.0.1 with a canned response.
class CannedHttpServer {
public:
    explicit CannedHttpServer(std::string response) : response_(std::move(response)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 1) != 0 || ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            throw std::runtime_error("cannot open test server socket");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serveOnce(); });
    }

    ~CannedHttpServer() {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    void serveOnce() {
        const int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            const auto n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            request.append(buffer, static_cast<std::size_t>(n));
        }
        ::send(client, response_.data(), response_.size(), 0);
        ::close(client);
    }

    std::string response_;
    int fd_{-1};
    int port_{0};
    std::thread thread_;
};

class CurlTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              (std::string("dlqueue_curl_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    CurlTransport::Options options() const {
        CurlTransport::Options opts;
        opts.staging_dir = (dir / "staging").string();
        return opts;
    }

    fs::path writeSource(const std::string& name, const std::string& content) const {
        const fs::path path = dir / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static std::string fileUrl(const fs::path& path) { return "file://" + fs::absolute(path).string(); }

    // Polls the aggregate until the queue stops running.
    static bool waitForSettle(DownloadManager& manager) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline) {
            const auto status = manager.status();
            if (status.is(StatusKind::Finished) || status.is(StatusKind::Failed)) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    fs::path dir;
};

} // namespace

TEST(ResumeTokenTest, EncodeDecode) {
    const CurlTransport::ResumeToken token{"https://example.com/a", "/tmp/dlqueue-1.part", 4096};
    const auto decoded = CurlTransport::decodeResumeData(CurlTransport::encodeResumeData(token));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->url, token.url);
    EXPECT_EQ(decoded->path, token.path);
    EXPECT_EQ(decoded->offset, 4096u);
}

TEST(ResumeTokenTest, RejectsForeignData) {
    EXPECT_FALSE(CurlTransport::decodeResumeData("").has_value());
    EXPECT_FALSE(CurlTransport::decodeResumeData("not a token").has_value());
    EXPECT_FALSE(CurlTransport::decodeResumeData("dlqueue-resume-v1\nurl\npath\n-5\n").has_value());
    EXPECT_FALSE(CurlTransport::decodeResumeData("dlqueue-resume-v1\nurl\npath\n").has_value());
}

TEST_F(CurlTransportTest, CreatesStagingDirectory) {
    CurlTransport transport(options());
    EXPECT_TRUE(fs::is_directory(dir / "staging"));
}

TEST_F(CurlTransportTest, DownloadsFileUrl) {
    const std::string content(64 * 1024, 'x');
    const auto source = writeSource("source.bin", content);

    auto transport = std::make_shared<CurlTransport>(options());
    RecordingObserver observer;
    DownloadManager manager(transport, &observer);

    auto item = makeTransferItem(fileUrl(source));
    manager.append(item);
    ASSERT_TRUE(waitForSettle(manager));
    manager.flush();

    EXPECT_TRUE(item->status().is(StatusKind::Finished));
    EXPECT_EQ(manager.progress()->received(), content.size());
    ASSERT_EQ(observer.payloads.size(), 1u);
    EXPECT_EQ(readFile(observer.payloads[0].second), content);
}

TEST_F(CurlTransportTest, MissingFileFails) {
    auto transport = std::make_shared<CurlTransport>(options());
    RecordingObserver observer;
    DownloadManager manager(transport, &observer);

    auto item = makeTransferItem(fileUrl(dir / "does-not-exist"));
    manager.append(item);
    ASSERT_TRUE(waitForSettle(manager));
    manager.flush();

    EXPECT_TRUE(item->status().is(StatusKind::Failed));
    EXPECT_TRUE(observer.payloads.empty());
}

TEST_F(CurlTransportTest, ResumesFromPartialFile) {
    const std::string content = "0123456789abcdefghij";
    const auto source = writeSource("source.txt", content);
    const auto url = fileUrl(source);

    // A previous run left the first ten bytes behind.
    fs::create_directories(dir / "staging");
    const fs::path partial = dir / "staging" / "previous.part";
    {
        std::ofstream file(partial, std::ios::binary);
        file << content.substr(0, 10);
    }

    auto transport = std::make_shared<CurlTransport>(options());
    RecordingObserver observer;
    observer.resume_data[url] = CurlTransport::encodeResumeData({url, partial.string(), 10});
    DownloadManager manager(transport, &observer);

    auto item = makeTransferItem(url);
    manager.append(item);
    ASSERT_TRUE(waitForSettle(manager));
    manager.flush();

    ASSERT_TRUE(item->status().is(StatusKind::Finished));
    ASSERT_EQ(observer.payloads.size(), 1u);
    EXPECT_EQ(observer.payloads[0].second, partial.string());
    EXPECT_EQ(readFile(partial), content);
}

TEST_F(CurlTransportTest, MismatchedResumeDataStartsFresh) {
    const auto source = writeSource("source.txt", "fresh content");
    const auto url = fileUrl(source);

    auto transport = std::make_shared<CurlTransport>(options());
    const auto handle = transport->createHandle(
        TransferRequest{url, "", {}},
        CurlTransport::encodeResumeData({"https://elsewhere.example.com/", (dir / "other.part").string(), 5}));
    EXPECT_EQ(handle->bytesReceived(), 0u);
}

TEST_F(CurlTransportTest, CancellingUnstartedHandleReportsOnce) {
    auto transport = std::make_shared<CurlTransport>(options());
    auto handle = transport->createHandle(TransferRequest{"file:///nonexistent", "", {}}, std::nullopt);

    int calls = 0;
    std::optional<ResumeData> received;
    handle->cancelProducingResumeData([&](std::optional<ResumeData> data) {
        ++calls;
        received = std::move(data);
    });
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(received.has_value());

    handle->cancelProducingResumeData([&](std::optional<ResumeData>) { ++calls; });
    EXPECT_EQ(calls, 2);

    // Once cancelled a handle never runs.
    handle->start();
    EXPECT_EQ(handle->bytesReceived(), 0u);
}

TEST_F(CurlTransportTest, ErrorResponseBodyIsNotKept) {
    CannedHttpServer server(
        "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\nConnection: close\r\n\r\nnot found");

    auto transport = std::make_shared<CurlTransport>(options());
    OutcomeListener listener;
    transport->setListener(&listener);

    auto handle = transport->createHandle(TransferRequest{server.url("/missing"), "", {}}, std::nullopt);
    handle->start();
    const auto outcome = listener.waitForOutcome();
    transport->setListener(nullptr);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, TransferOutcome::Kind::Completed);
    EXPECT_EQ(outcome->http_status, 404);
    EXPECT_FALSE(outcome->succeeded());
    EXPECT_FALSE(fs::exists(outcome->payload_location));
}

TEST_F(CurlTransportTest, CancellingAfterCompletionDiscardsPayload) {
    const auto source = writeSource("source.txt", "complete body");

    auto transport = std::make_shared<CurlTransport>(options());
    OutcomeListener listener;
    transport->setListener(&listener);

    auto handle = transport->createHandle(TransferRequest{fileUrl(source), "", {}}, std::nullopt);
    handle->start();
    const auto outcome = listener.waitForOutcome();
    transport->setListener(nullptr);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->succeeded());
    ASSERT_TRUE(fs::exists(outcome->payload_location));

    // The completion raced a pause and was never consumed.
    int calls = 0;
    std::optional<ResumeData> resume_data;
    handle->cancelProducingResumeData([&](std::optional<ResumeData> data) {
        ++calls;
        resume_data = std::move(data);
    });
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(resume_data.has_value());
    EXPECT_FALSE(fs::exists(outcome->payload_location));
}
