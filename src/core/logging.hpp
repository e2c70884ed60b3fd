#pragma once

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "config.hpp"

namespace trade_analytics {

// Console sink always; rotating file sink when logging.file is set.
inline void init_logging(const LoggingConfig& cfg) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file, cfg.max_file_bytes, cfg.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", cfg.file, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("trade_analytics", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace trade_analytics
