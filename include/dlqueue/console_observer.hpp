#pragma once

#include "transfer_item.hpp"
#include "transfer_observer.hpp"
#include "transfer_status.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

// Observer used by the command line tool: draws a live progress panel, keeps
// resume tokens on disk and moves finished payloads to their destination.
class ConsoleObserver final : public TransferObserver {
public:
    struct Options {
        std::filesystem::path resume_dir;
        std::chrono::milliseconds redraw_interval{200};
        bool render{true};
        std::ostream* out{&std::cout};
    };

    explicit ConsoleObserver(Options options);

    void onQueueChanged(const std::vector<TransferItemPtr>& items) override;
    void onItemStatusChanged(const TransferItemPtr& item) override;
    void onAggregateStatusChanged(const TransferStatus& status) override;
    void onThroughputChanged(std::int64_t bytes_per_second) override;
    void onItemProgress(const TransferItemPtr& item) override;

    void onResumeDataAvailable(const TransferItemPtr& item, const std::optional<ResumeData>& data) override;
    std::optional<ResumeData> resumeDataFor(const TransferItemPtr& item) override;
    void onPayloadReady(const TransferItemPtr& item, const std::string& location) override;

    // True once every queued item has finished or failed. Waits at most `timeout`.
    bool waitUntilSettled(std::chrono::milliseconds timeout);
    [[nodiscard]] std::vector<TransferSnapshot> failedTransfers() const;
    // Items that are running or waiting for a slot; each holds a transport handle.
    [[nodiscard]] std::size_t unsettledCount() const;

    // Number of cancelled handles reported so far, with or without data.
    [[nodiscard]] std::size_t resumeDataEvents() const;
    bool waitForResumeDataEvents(std::size_t count, std::chrono::milliseconds timeout);

    // Draws the panel once more regardless of the redraw interval.
    void renderFinal();

    [[nodiscard]] static std::string formatTaskLine(const TransferSnapshot& snapshot);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    [[nodiscard]] std::filesystem::path resumeFileFor(const std::string& url) const;

private:
    void storeResumeData(const TransferItemPtr& item, const std::optional<ResumeData>& data);
    void refresh(bool force);
    void updateSettled();
    [[nodiscard]] std::string buildProgressPanel() const;
    void redrawPanel(const std::string& panel);

    const Options options_;

    mutable std::mutex mutex_;
    std::condition_variable settled_cv_;
    std::condition_variable resume_cv_;
    std::vector<TransferItemPtr> items_;
    std::vector<TransferSnapshot> snapshots_;
    std::int64_t throughput_{0};
    bool settled_{false};
    std::size_t resume_events_{0};

    std::chrono::steady_clock::time_point last_redraw_{};
    std::size_t previous_lines_{0};
};

} // namespace dlqueue
