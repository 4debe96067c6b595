#pragma once

#include <nimbus/autofix/AutoFixOrchestrator.h>
#include <nimbus/config/config_helpers.h>
#include <nimbus/core/logging.h>
#include <nimbus/core/types.h>
#include <nimbus/diagnostics/DiagnosticEngine.h>
#include <nimbus/diagnostics/PreventiveCheckOrchestrator.h>
#include <nimbus/resource/ResourceGovernor.h>
#include <nimbus/session/HealthMonitor.h>
#include <nimbus/session/SessionManager.h>
#include <nimbus/session/reconnection_policy.h>

#include <filesystem>
#include <string>

namespace nimbus::config {

// Complete runtime configuration. Each member maps to one [section] of
// config.toml; key names are listed in nimbus_config.cpp.
struct NimbusConfig {
    session::SessionLimits session;
    session::ReconnectionPolicy reconnection;
    session::MonitorConfig monitor;
    resource::GovernorConfig resources;
    diagnostics::EngineConfig diagnostics;
    bool preventiveCheck{true};
    diagnostics::PreventiveOptions preventive;
    autofix::AutoFixOptions autofix;
    LoggingConfig logging;

    Result<void> validate() const;
};

// Sets one key. Unknown keys and malformed values yield InvalidArgument
// naming "section.key".
Result<void> applyConfigValue(NimbusConfig& cfg, const std::string& section,
                              const std::string& key, const std::string& value);

// Applies every key of a parsed file on top of `cfg`.
Result<void> applyConfigTable(NimbusConfig& cfg, const ConfigTable& table);

// NIMBUS_<SECTION>_<KEY> variables, e.g. NIMBUS_RECONNECTION_MAX_ATTEMPTS=8.
Result<void> applyEnvOverrides(NimbusConfig& cfg);

// Defaults, then the config file (when it exists), then environment
// overrides, then validate().
Result<NimbusConfig> loadConfig(const std::string& override_path = "");

} // namespace nimbus::config
