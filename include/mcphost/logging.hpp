#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace mcphost::logging {

struct LoggingOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::optional<std::string> file;              // rotating file sink when set
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    bool read_env = true;                          // honour SPDLOG_LEVEL
};

/// Replace the default spdlog logger. Output goes to stderr, never stdout,
/// so the library can run inside processes that speak on stdout.
void init(const LoggingOptions& opts = {});

} // namespace mcphost::logging
