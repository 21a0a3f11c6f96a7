#include "dlqueue/logging.hpp"

#include "dlqueue/config.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dlqueue {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

} // namespace

void initLogging(spdlog::level::level_enum level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, kMaxLogFileSize, kMaxLogFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("dlqueue", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

spdlog::level::level_enum parseLogLevel(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    throw ConfigError(fmt::format("Unknown log level '{}'", text));
}

} // namespace dlqueue
