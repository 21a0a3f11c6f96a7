#include "dlqueue/config.hpp"
#include "dlqueue/console_observer.hpp"
#include "dlqueue/curl_transport.hpp"
#include "dlqueue/download_manager.hpp"
#include "dlqueue/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr int kExitInterrupted = 130;

std::atomic<bool> g_interrupted{false};

void onSignal(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void installSignalHandler() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-c <config>] [-d <directory>] [-j <count>] [-v] <url1> <file1> [<url2> <file2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <config>      Read settings from this YAML file\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -j <count>       Number of transfers running at once (default: 1)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::optional<std::filesystem::path> config_path;
        dlqueue::Config overrides;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-v") {
                overrides.log_level = "debug";
                arg_index += 1;
            } else if (option == "-c" || option == "-d" || option == "-j") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];
                if (option == "-c") {
                    config_path = value;
                } else if (option == "-d") {
                    overrides.download_dir = value;
                } else {
                    try {
                        const long count = std::stol(value);
                        if (count <= 0) {
                            throw dlqueue::ConfigError("Concurrency limit must be at least 1");
                        }
                        overrides.max_concurrent = static_cast<std::size_t>(count);
                    } catch (const std::logic_error&) {
                        throw dlqueue::ConfigError("Invalid concurrency limit: " + value);
                    }
                }
                arg_index += 2;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        dlqueue::Config config = dlqueue::loadConfig(config_path);
        config.mergeWith(overrides);
        const dlqueue::Settings settings = config.resolve();

        dlqueue::initLogging(dlqueue::parseLogLevel(settings.log_level), settings.log_file);

        std::error_code ec;
        std::filesystem::create_directories(settings.download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: "
                + settings.download_dir.string() + " - " + ec.message());
        }

        dlqueue::CurlTransport::Options transport_options;
        transport_options.staging_dir = settings.staging_dir.string();
        transport_options.connect_timeout_s = settings.connect_timeout_s;
        transport_options.user_agent = settings.user_agent;
        auto transport = std::make_shared<dlqueue::CurlTransport>(std::move(transport_options));

        dlqueue::ConsoleObserver::Options observer_options;
        observer_options.resume_dir = settings.resume_dir;
        observer_options.redraw_interval = settings.progress_interval;
        dlqueue::ConsoleObserver observer(std::move(observer_options));

        dlqueue::DownloadManager::Options manager_options;
        manager_options.max_concurrent = settings.max_concurrent;
        manager_options.throughput_interval = settings.throughput_interval;
        dlqueue::DownloadManager manager(transport, &observer, manager_options);

        installSignalHandler();

        std::vector<dlqueue::TransferItemPtr> items;
        for (int i = arg_index; i < argc; i += 2) {
            const std::filesystem::path destination = settings.download_dir / argv[i + 1];
            items.push_back(dlqueue::makeTransferItem(argv[i], destination.string()));
        }
        manager.append(items);

        while (!observer.waitUntilSettled(std::chrono::milliseconds(100))) {
            if (!g_interrupted.load(std::memory_order_relaxed)) {
                continue;
            }

            spdlog::warn("Interrupted, pausing {} transfers", items.size());
            const std::size_t expected_events = observer.resumeDataEvents() + observer.unsettledCount();
            for (const auto& item : items) {
                manager.pause(item);
            }
            if (!observer.waitForResumeDataEvents(expected_events, std::chrono::seconds(5))) {
                spdlog::warn("Some transfers did not stop in time; their progress may be lost");
            }
            manager.flush();
            observer.renderFinal();
            return kExitInterrupted;
        }

        manager.flush();
        observer.renderFinal();

        const auto failed = observer.failedTransfers();
        for (const auto& snapshot : failed) {
            std::cerr << snapshot.url << ": " << snapshot.error_message << std::endl;
        }
        return failed.empty() ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
