#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dlqueue {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Concrete values after defaults have been applied.
struct Settings {
    std::size_t max_concurrent{1};
    std::filesystem::path download_dir;
    std::filesystem::path staging_dir;
    std::filesystem::path resume_dir;
    std::chrono::milliseconds throughput_interval{1000};
    std::chrono::milliseconds progress_interval{200};
    long connect_timeout_s{30};
    std::string user_agent{"dlqueue/1.0"};
    std::string log_level{"info"};
    std::string log_file;
};

// Everything optional so a file config and CLI flags can be layered.
struct Config {
    std::optional<std::size_t> max_concurrent;
    std::optional<std::string> download_dir;
    std::optional<std::string> staging_dir;
    std::optional<std::string> resume_dir;
    std::optional<std::size_t> throughput_interval_ms;
    std::optional<std::size_t> progress_interval_ms;
    std::optional<long> connect_timeout_s;
    std::optional<std::string> user_agent;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;

    // Fields set in `other` win.
    void mergeWith(const Config& other);

    // Throws ConfigError when a value is out of range.
    [[nodiscard]] Settings resolve() const;
};

// Parses one YAML file; throws ConfigError if it is unreadable or malformed.
[[nodiscard]] Config loadConfigFile(const std::filesystem::path& path);

// `./.dlqueue.yaml`, then `$XDG_CONFIG_HOME/dlqueue/config.yaml`, then
// `~/.config/dlqueue/config.yaml`.
[[nodiscard]] std::vector<std::filesystem::path> defaultConfigPaths();

// Loads `explicit_path` when given (it must exist), otherwise the first default
// path that exists. No file at all yields an empty Config.
[[nodiscard]] Config loadConfig(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

} // namespace dlqueue
