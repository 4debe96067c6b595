#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace nimbus {

struct LoggingConfig {
    std::string level{"info"}; // trace, debug, info, warn, error
    bool console{true};
    bool fileLogging{false};
    std::filesystem::path logFile{};
    std::size_t maxFileBytes{10 * 1024 * 1024};
    std::size_t maxFiles{5};
};

// Installs the process-wide default spdlog logger ("nimbus") with a stderr
// sink and, when enabled, a rotating file sink. Falls back to the existing
// default logger if sink creation fails.
void initLogging(const LoggingConfig& cfg);

// Maps "trace".."error" (and "off") to the spdlog level; unknown strings map to info.
void applyLogLevel(const std::string& level);

} // namespace nimbus
