#include <nimbus/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace nimbus {

void applyLogLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

void initLogging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (cfg.fileLogging && !cfg.logFile.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.logFile.parent_path(), ec);
        if (ec) {
            spdlog::warn("[Logging] cannot create log directory {}: {}",
                         cfg.logFile.parent_path().string(), ec.message());
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logFile.string(), cfg.maxFileBytes, cfg.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("[Logging] file logging disabled ({}): {}", cfg.logFile.string(),
                         e.what());
        }
    }

    if (!sinks.empty()) {
        auto logger = std::make_shared<spdlog::logger>("nimbus", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);
    }

    applyLogLevel(cfg.level);

    if (cfg.fileLogging) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", cfg.logFile.string(),
                     cfg.maxFileBytes / (1024 * 1024), cfg.maxFiles);
    }
}

} // namespace nimbus
