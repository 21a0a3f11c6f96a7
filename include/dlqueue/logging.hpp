#pragma once

#include <string>

#include <spdlog/common.h>

namespace dlqueue {

// Installs the `dlqueue` default logger: colored stdout, plus a rotating file
// when `file` is non-empty.
void initLogging(spdlog::level::level_enum level, const std::string& file = {});

// trace|debug|info|warn|error|critical|off, any case. Throws ConfigError.
[[nodiscard]] spdlog::level::level_enum parseLogLevel(const std::string& text);

} // namespace dlqueue
