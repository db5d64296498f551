#include "mcphost/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace mcphost::logging {

void init(const LoggingOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (opts.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *opts.file, opts.max_file_size, opts.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("mcphost", sinks.begin(), sinks.end());
    logger->set_pattern(opts.pattern);
    logger->set_level(opts.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (opts.read_env) {
        spdlog::cfg::load_env_levels();
    }
}

} // namespace mcphost::logging
