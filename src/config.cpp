#include "dlqueue/config.hpp"

#include <cstdlib>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace dlqueue {

namespace fs = std::filesystem;

namespace {

template <typename T>
void readKey(const YAML::Node& root, const char* key, std::optional<T>& out) {
    if (const auto node = root[key]) {
        out = node.as<T>();
    }
}

} // namespace

void Config::mergeWith(const Config& other) {
    if (other.max_concurrent) max_concurrent = other.max_concurrent;
    if (other.download_dir) download_dir = other.download_dir;
    if (other.staging_dir) staging_dir = other.staging_dir;
    if (other.resume_dir) resume_dir = other.resume_dir;
    if (other.throughput_interval_ms) throughput_interval_ms = other.throughput_interval_ms;
    if (other.progress_interval_ms) progress_interval_ms = other.progress_interval_ms;
    if (other.connect_timeout_s) connect_timeout_s = other.connect_timeout_s;
    if (other.user_agent) user_agent = other.user_agent;
    if (other.log_level) log_level = other.log_level;
    if (other.log_file) log_file = other.log_file;
}

Settings Config::resolve() const {
    Settings settings;

    if (max_concurrent) {
        if (*max_concurrent == 0) {
            throw ConfigError("max_concurrent must be at least 1");
        }
        settings.max_concurrent = *max_concurrent;
    }

    if (download_dir && !download_dir->empty()) {
        settings.download_dir = *download_dir;
    } else {
        std::error_code ec;
        settings.download_dir = fs::current_path(ec);
        if (ec) {
            settings.download_dir = ".";
        }
    }
    settings.staging_dir =
        staging_dir ? fs::path(*staging_dir) : settings.download_dir / ".dlqueue" / "staging";
    settings.resume_dir = resume_dir ? fs::path(*resume_dir) : settings.download_dir / ".dlqueue" / "resume";

    if (throughput_interval_ms) {
        if (*throughput_interval_ms == 0) {
            throw ConfigError("throughput_interval_ms must be positive");
        }
        settings.throughput_interval = std::chrono::milliseconds(*throughput_interval_ms);
    }
    if (progress_interval_ms) {
        settings.progress_interval = std::chrono::milliseconds(*progress_interval_ms);
    }
    if (connect_timeout_s) {
        if (*connect_timeout_s < 0) {
            throw ConfigError("connect_timeout_s must not be negative");
        }
        settings.connect_timeout_s = *connect_timeout_s;
    }
    if (user_agent) settings.user_agent = *user_agent;
    if (log_level) settings.log_level = *log_level;
    if (log_file) settings.log_file = *log_file;
    return settings;
}

Config loadConfigFile(const fs::path& path) {
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        Config cfg;
        if (!root || root.IsNull()) {
            return cfg;
        }
        if (!root.IsMap()) {
            throw ConfigError(fmt::format("Failed to parse {}: top level must be a mapping", path.string()));
        }

        readKey(root, "max_concurrent", cfg.max_concurrent);
        readKey(root, "download_dir", cfg.download_dir);
        readKey(root, "staging_dir", cfg.staging_dir);
        readKey(root, "resume_dir", cfg.resume_dir);
        readKey(root, "throughput_interval_ms", cfg.throughput_interval_ms);
        readKey(root, "progress_interval_ms", cfg.progress_interval_ms);
        readKey(root, "connect_timeout_s", cfg.connect_timeout_s);
        readKey(root, "user_agent", cfg.user_agent);
        readKey(root, "log_level", cfg.log_level);
        readKey(root, "log_file", cfg.log_file);

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

std::vector<fs::path> defaultConfigPaths() {
    std::vector<fs::path> paths;
    paths.emplace_back(".dlqueue.yaml");

    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home) {
        paths.push_back(fs::path(config_home) / "dlqueue" / "config.yaml");
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        paths.push_back(fs::path(home) / ".config" / "dlqueue" / "config.yaml");
    }
    return paths;
}

Config loadConfig(const std::optional<fs::path>& explicit_path) {
    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            throw ConfigError(fmt::format("Config file {} does not exist", explicit_path->string()));
        }
        return loadConfigFile(*explicit_path);
    }

    for (const auto& path : defaultConfigPaths()) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            return loadConfigFile(path);
        }
    }
    return Config{};
}

} // namespace dlqueue
