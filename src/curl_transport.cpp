#include "dlqueue/curl_transport.hpp"

#include "dlqueue/detail/curl_utils.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlqueue {

namespace fs = std::filesystem;

namespace {

constexpr const char* kResumeMagic = "dlqueue-resume-v1";

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

std::uint64_t partialSize(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {}

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] TaskId nextTaskId() { return next_task_.fetch_add(1) + 1; }

    void setListener(TransportListener* listener) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_ = listener;
    }

    void notifyProgress(TaskId task, std::uint64_t received, std::uint64_t expected) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        if (listener_) {
            listener_->onProgress(task, received, expected);
        }
    }

    void notifyCompleted(TaskId task, TransferOutcome outcome) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        if (listener_) {
            listener_->onCompleted(task, std::move(outcome));
        }
    }

    void registerTransfer(TaskId task, const std::shared_ptr<Transfer>& transfer) {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers_[task] = transfer;
    }

    // Returns false once the transport is shutting down.
    bool launch(const std::shared_ptr<Transfer>& transfer, TaskId task);
    // Called on the worker thread as its last step.
    void workerDone(TaskId task);
    // A handle cancelled before it ever ran.
    void transferSettled(TaskId task);
    void shutdown();

private:
    void reapFinished();
    void notifyAllFinished() {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        if (listener_) {
            listener_->onAllTransfersFinished();
        }
    }

    const Options options_;
    std::atomic<TaskId> next_task_{0};

    std::mutex listener_mutex_;
    TransportListener* listener_{nullptr};

    std::mutex mutex_;
    std::unordered_map<TaskId, std::weak_ptr<Transfer>> transfers_;
    std::unordered_map<TaskId, std::thread> workers_;
    std::vector<TaskId> finished_workers_;
    std::size_t active_{0};
    bool shutting_down_{false};
};

class CurlTransport::Transfer final : public TransferHandle, public std::enable_shared_from_this<Transfer> {
public:
    Transfer(std::shared_ptr<Impl> owner, TaskId task, TransferRequest request,
                 std::string path, std::uint64_t offset)
        : owner_(std::move(owner)),
          task_(task),
          request_(std::move(request)),
          path_(std::move(path)),
          offset_(offset),
          received_(offset) {}

    [[nodiscard]] TaskId taskId() const override { return task_; }
    [[nodiscard]] const TransferRequest& request() const override { return request_; }
    [[nodiscard]] std::uint64_t bytesReceived() const override { return received_.load(); }

    void start() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Suspended) {
                return;
            }
            state_ = State::Running;
        }
        if (!owner_->launch(shared_from_this(), task_)) {
            finish(TransferOutcome::cancelled());
        }
    }

    void cancel() override { cancelWith(nullptr); }

    void cancelProducingResumeData(ResumeDataCallback done) override {
        cancelWith(done ? std::move(done) : ResumeDataCallback{[](std::optional<ResumeData>) {}});
    }

    // Stops the transfer without producing resume data or touching the file.
    void abort() { cancel_requested_ = true; }

    void run() {
        finish(perform());
    }

private:
    enum class State { Suspended, Running, Done };

    void cancelWith(ResumeDataCallback done) {
        bool never_started = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == State::Done) {
                // A bound handle is cancelled only before its completion was
                // applied, so a finished payload will never be picked up.
                if (payload_delivered_) {
                    std::error_code ec;
                    fs::remove(path_, ec);
                    spdlog::debug("Discarding payload of cancelled transfer {}", task_);
                }
                if (done) {
                    done(std::nullopt);
                }
                return;
            }
            wants_resume_data_ = static_cast<bool>(done);
            on_cancelled_ = std::move(done);
            if (state_ == State::Suspended) {
                state_ = State::Running;
                never_started = true;
            }
        }
        cancel_requested_ = true;
        if (never_started) {
            finish(TransferOutcome::cancelled());
            owner_->transferSettled(task_);
        }
    }

    TransferOutcome perform() {
        auto outcome = performOnce();
        if (restart_from_zero_) {
            spdlog::info("Server cannot resume {}, restarting from zero", request_.url);
            restart_from_zero_ = false;
            offset_ = 0;
            received_ = 0;
            last_expected_ = 0;
            outcome = performOnce();
        }
        return outcome;
    }

    TransferOutcome performOnce() {
        auto curl = detail::makeEasyHandle();
        if (!curl) {
            return TransferOutcome::otherFailure(CURLE_FAILED_INIT, "Failed to allocate curl handle");
        }

        file_.reset(std::fopen(path_.c_str(), offset_ > 0 ? "ab" : "wb"));
        if (!file_) {
            return TransferOutcome::otherFailure(CURLE_WRITE_ERROR, fmt::format("Cannot create staging file {}", path_));
        }

        curl_slist* list = nullptr;
        for (const auto& header : request_.headers) {
            curl_slist* appended = curl_slist_append(list, header.c_str());
            if (!appended) {
                curl_slist_free_all(list);
                return TransferOutcome::otherFailure(CURLE_OUT_OF_MEMORY, "Failed to build request headers");
            }
            list = appended;
        }
        detail::CurlHeaderList headers{list, &curl_slist_free_all};

        const auto& options = owner_->options();
        curl_easy_setopt(curl.get(), CURLOPT_URL, request_.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_s);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Transfer::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Transfer::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);
        if (headers) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        }
        if (offset_ > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset_));
        }

        const CURLcode res = curl_easy_perform(curl.get());

        if (file_) {
            std::fflush(file_.get());
            file_.reset();
        }

        if (cancel_requested_) {
            return TransferOutcome::cancelled();
        }
        if (res == CURLE_RANGE_ERROR && offset_ > 0) {
            restart_from_zero_ = true;
        }
        if (res != CURLE_OK) {
            std::string description = curl_easy_strerror(res);
            if (detail::isTransportError(res)) {
                return TransferOutcome::transportFailure(res, std::move(description));
            }
            return TransferOutcome::otherFailure(res, std::move(description));
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        return TransferOutcome::completed(code, path_);
    }

    void finish(TransferOutcome outcome) {
        ResumeDataCallback on_cancelled;
        bool wants_resume_data = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = State::Done;
            payload_delivered_ = outcome.succeeded();
            on_cancelled = std::move(on_cancelled_);
            wants_resume_data = wants_resume_data_;
        }

        std::optional<ResumeData> resume_data;
        const bool cancelled = outcome.kind == TransferOutcome::Kind::Cancelled;
        if (cancelled && wants_resume_data) {
            const auto size = partialSize(path_);
            if (size > 0) {
                resume_data = CurlTransport::encodeResumeData({request_.url, path_, size});
            }
        }
        // Error bodies are not payloads either.
        if (!resume_data && !outcome.succeeded()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }

        if (on_cancelled) {
            on_cancelled(std::move(resume_data));
        }
        if (outcome.succeeded()) {
            // The last write may not have been followed by a progress callback.
            const auto size = partialSize(path_);
            received_ = size;
            owner_->notifyProgress(task_, size, size);
        }
        spdlog::debug("Transfer {} finished: {}", task_, static_cast<int>(outcome.kind));
        owner_->notifyCompleted(task_, std::move(outcome));
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<Transfer*>(userdata);
        const size_t total = size * nmemb;
        if (!self || self->cancel_requested_ || !self->file_) {
            return 0;
        }
        return std::fwrite(ptr, 1, total, self->file_.get());
    }

    static int xferInfoCallback(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
        auto* self = static_cast<Transfer*>(userdata);
        if (!self || self->cancel_requested_) {
            return 1;
        }

        const std::uint64_t received = self->offset_ + static_cast<std::uint64_t>(dlnow);
        const std::uint64_t expected = dltotal > 0 ? self->offset_ + static_cast<std::uint64_t>(dltotal) : 0;
        if (received != self->received_.load() || expected != self->last_expected_) {
            self->received_ = received;
            self->last_expected_ = expected;
            self->owner_->notifyProgress(self->task_, received, expected);
        }
        return 0;
    }

    const std::shared_ptr<Impl> owner_;
    const TaskId task_;
    const TransferRequest request_;
    const std::string path_;

    // Worker-thread state.
    std::uint64_t offset_;
    std::uint64_t last_expected_{0};
    bool restart_from_zero_{false};
    std::unique_ptr<FILE, FileDeleter> file_{};

    std::atomic<std::uint64_t> received_;
    std::atomic<bool> cancel_requested_{false};

    std::mutex mutex_;
    State state_{State::Suspended};
    bool wants_resume_data_{false};
    bool payload_delivered_{false};
    ResumeDataCallback on_cancelled_;
};

bool CurlTransport::Impl::launch(const std::shared_ptr<Transfer>& transfer, TaskId task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        return false;
    }
    reapFinished();
    ++active_;
    workers_.emplace(task, std::thread([transfer, this, task] {
        transfer->run();
        workerDone(task);
    }));
    return true;
}

void CurlTransport::Impl::workerDone(TaskId task) {
    bool all_finished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers_.erase(task);
        finished_workers_.push_back(task);
        all_finished = --active_ == 0;
    }
    if (all_finished) {
        notifyAllFinished();
    }
}

void CurlTransport::Impl::transferSettled(TaskId task) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_.erase(task);
}

void CurlTransport::Impl::reapFinished() {
    for (const TaskId task : finished_workers_) {
        auto it = workers_.find(task);
        if (it == workers_.end()) {
            continue;
        }
        if (it->second.joinable()) {
            it->second.join();
        }
        workers_.erase(it);
    }
    finished_workers_.clear();
}

void CurlTransport::Impl::shutdown() {
    setListener(nullptr);

    std::unordered_map<TaskId, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto& entry : transfers_) {
            if (auto transfer = entry.second.lock()) {
                transfer->abort();
            }
        }
        workers.swap(workers_);
        finished_workers_.clear();
    }

    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

CurlTransport::CurlTransport(Options options) : impl_(std::make_shared<Impl>(std::move(options))) {
    detail::ensureCurlInitialized();

    std::error_code ec;
    fs::create_directories(impl_->options().staging_dir, ec);
    if (ec) {
        throw std::runtime_error(
            fmt::format("Cannot create staging directory {}: {}", impl_->options().staging_dir, ec.message()));
    }
}

CurlTransport::~CurlTransport() { impl_->shutdown(); }

void CurlTransport::setListener(TransportListener* listener) { impl_->setListener(listener); }

TransferHandlePtr CurlTransport::createHandle(const TransferRequest& request,
                                              const std::optional<ResumeData>& resume_data) {
    const TaskId task = impl_->nextTaskId();

    std::string path;
    std::uint64_t offset = 0;
    if (resume_data) {
        const auto token = decodeResumeData(*resume_data);
        if (token && token->url == request.url && fs::exists(token->path)) {
            path = token->path;
            offset = partialSize(path);
        } else {
            spdlog::warn("Ignoring resume data that does not match {}", request.url);
        }
    }
    if (path.empty()) {
        path = (fs::path(impl_->options().staging_dir) / fmt::format("dlqueue-{}.part", task)).string();
    }

    auto transfer = std::make_shared<Transfer>(impl_, task, request, std::move(path), offset);
    impl_->registerTransfer(task, transfer);
    spdlog::debug("Created transfer {} for {} at offset {}", task, request.url, offset);
    return transfer;
}

ResumeData CurlTransport::encodeResumeData(const ResumeToken& token) {
    return fmt::format("{}\n{}\n{}\n{}\n", kResumeMagic, token.url, token.path, token.offset);
}

std::optional<CurlTransport::ResumeToken> CurlTransport::decodeResumeData(const ResumeData& data) {
    std::istringstream in(data);
    std::string magic;
    std::string offset;
    ResumeToken token;
    if (!std::getline(in, magic) || magic != kResumeMagic || !std::getline(in, token.url) ||
        !std::getline(in, token.path) || !std::getline(in, offset)) {
        return std::nullopt;
    }
    if (token.url.empty() || token.path.empty() || offset.empty() ||
        offset.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        token.offset = std::stoull(offset);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return token;
}

} // namespace dlqueue
