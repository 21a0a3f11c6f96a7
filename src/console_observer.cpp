#include "dlqueue/console_observer.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlqueue {

namespace fs = std::filesystem;

ConsoleObserver::ConsoleObserver(Options options) : options_(std::move(options)) {
    if (!options_.resume_dir.empty()) {
        std::error_code ec;
        fs::create_directories(options_.resume_dir, ec);
        if (ec) {
            spdlog::warn("Cannot create resume directory {}: {}", options_.resume_dir.string(), ec.message());
        }
    }
}

void ConsoleObserver::onQueueChanged(const std::vector<TransferItemPtr>& items) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_ = items;
    }
    refresh(true);
}

void ConsoleObserver::onItemStatusChanged(const TransferItemPtr& item) {
    if (item->status().is(StatusKind::Failed)) {
        spdlog::warn("{} failed: {}", item->url(), item->status().error()->message());
    } else {
        spdlog::debug("{} is now {}", item->url(), item->status().toString());
    }
    refresh(true);
}

void ConsoleObserver::onAggregateStatusChanged(const TransferStatus& status) {
    spdlog::debug("Queue is {}", status.toString());
}

void ConsoleObserver::onThroughputChanged(std::int64_t bytes_per_second) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        throughput_ = bytes_per_second;
    }
    refresh(false);
}

void ConsoleObserver::onItemProgress(const TransferItemPtr& /*item*/) {
    refresh(false);
}

void ConsoleObserver::onResumeDataAvailable(const TransferItemPtr& item, const std::optional<ResumeData>& data) {
    storeResumeData(item, data);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++resume_events_;
    }
    resume_cv_.notify_all();
}

void ConsoleObserver::storeResumeData(const TransferItemPtr& item, const std::optional<ResumeData>& data) {
    if (options_.resume_dir.empty()) {
        return;
    }
    const auto path = resumeFileFor(item->url());
    std::error_code ec;
    if (!data) {
        fs::remove(path, ec);
        return;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << *data;
    if (!out) {
        spdlog::warn("Cannot write resume data to {}", path.string());
        return;
    }
    spdlog::debug("Saved resume data for {} to {}", item->url(), path.string());
}

std::optional<ResumeData> ConsoleObserver::resumeDataFor(const TransferItemPtr& item) {
    if (options_.resume_dir.empty()) {
        return std::nullopt;
    }
    const auto path = resumeFileFor(item->url());
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (data.empty()) {
        return std::nullopt;
    }
    spdlog::info("Resuming {} from saved state", item->url());
    return data;
}

void ConsoleObserver::onPayloadReady(const TransferItemPtr& item, const std::string& location) {
    const std::string& destination = item->request().destination;
    if (!options_.resume_dir.empty()) {
        std::error_code ec;
        fs::remove(resumeFileFor(item->url()), ec);
    }
    if (destination.empty()) {
        spdlog::info("{} finished, payload left at {}", item->url(), location);
        return;
    }

    const fs::path target{destination};
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    ec.clear();
    fs::rename(location, target, ec);
    if (ec) {
        // Staging and destination may live on different filesystems.
        ec.clear();
        fs::copy_file(location, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::error("Cannot move {} to {}: {}", location, target.string(), ec.message());
            return;
        }
        fs::remove(location, ec);
    }
    spdlog::debug("Moved {} to {}", location, target.string());
}

bool ConsoleObserver::waitUntilSettled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return settled_cv_.wait_for(lock, timeout, [this] { return settled_; });
}

std::vector<TransferSnapshot> ConsoleObserver::failedTransfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferSnapshot> failed;
    std::copy_if(snapshots_.begin(), snapshots_.end(), std::back_inserter(failed),
                 [](const TransferSnapshot& s) { return s.status == StatusKind::Failed; });
    return failed;
}

std::size_t ConsoleObserver::unsettledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(snapshots_.begin(), snapshots_.end(), [](const TransferSnapshot& s) {
        return s.status == StatusKind::Running || s.status == StatusKind::Idle;
    }));
}

std::size_t ConsoleObserver::resumeDataEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resume_events_;
}

bool ConsoleObserver::waitForResumeDataEvents(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return resume_cv_.wait_for(lock, timeout, [this, count] { return resume_events_ >= count; });
}

void ConsoleObserver::renderFinal() {
    if (!options_.render) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    redrawPanel(buildProgressPanel());
    *options_.out << std::flush;
}

void ConsoleObserver::refresh(bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.clear();
    snapshots_.reserve(items_.size());
    for (const auto& item : items_) {
        snapshots_.push_back(item->snapshot());
    }
    updateSettled();

    if (!options_.render) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - last_redraw_ < options_.redraw_interval) {
        return;
    }
    last_redraw_ = now;
    redrawPanel(buildProgressPanel());
}

void ConsoleObserver::updateSettled() {
    const bool settled = !snapshots_.empty() &&
                         std::all_of(snapshots_.begin(), snapshots_.end(), [](const TransferSnapshot& s) {
                             return s.status == StatusKind::Finished || s.status == StatusKind::Failed;
                         });
    if (settled != settled_) {
        settled_ = settled;
        if (settled_) {
            settled_cv_.notify_all();
        }
    }
}

std::string ConsoleObserver::buildProgressPanel() const {
    std::string panel;
    panel.reserve(snapshots_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("dlqueue ({} transfers)\n", snapshots_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& snapshot : snapshots_) {
        panel += formatTaskLine(snapshot);
        panel.push_back('\n');
        total_all += snapshot.total_bytes;
        downloaded_all += snapshot.downloaded_bytes;
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = std::min(1.0, static_cast<double>(downloaded_all) / static_cast<double>(total_all));
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel += fmt::format("  {}/s\n", formatSize(static_cast<std::uint64_t>(std::max<std::int64_t>(0, throughput_))));
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleObserver::formatTaskLine(const TransferSnapshot& snapshot) {
    std::string display_name = fs::path{snapshot.filename}.filename().string();
    if (display_name.empty()) {
        display_name = fs::path{snapshot.url}.filename().string();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    line.reserve(256);
    if (snapshot.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(snapshot.downloaded_bytes) /
                                               static_cast<double>(snapshot.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }
        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(snapshot.downloaded_bytes), formatSize(snapshot.total_bytes));
    } else if (snapshot.downloaded_bytes > 0) {
        line += fmt::format("{:<20} [{}]", display_name, formatSize(snapshot.downloaded_bytes));
    } else {
        line += fmt::format("{:<20} [Waiting...]", display_name);
    }

    switch (snapshot.status) {
    case StatusKind::Finished:
        line.append("  Done");
        break;
    case StatusKind::Failed:
        line += fmt::format("  Failed: {}", snapshot.error_message);
        break;
    case StatusKind::Paused:
        line.append("  Paused");
        break;
    default:
        break;
    }
    return line;
}

std::string ConsoleObserver::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

fs::path ConsoleObserver::resumeFileFor(const std::string& url) const {
    return options_.resume_dir / fmt::format("{:016x}.resume", std::hash<std::string>{}(url));
}

void ConsoleObserver::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        *options_.out << "\033[" << previous_lines_ << "F\033[J";
    }
    *options_.out << panel;
    previous_lines_ = current_lines;
}

} // namespace dlqueue
