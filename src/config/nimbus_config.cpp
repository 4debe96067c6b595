#include <nimbus/config/nimbus_config.h>

#include <array>
#include <cstdlib>
#include <limits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::config {

namespace {

using Setter = Result<void> (*)(NimbusConfig&, const std::string& name, const std::string& value);

struct KeySpec {
    const char* section;
    const char* key;
    Setter set;
};

Error badValue(const std::string& name, const std::string& value, std::string_view expected) {
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("{}: invalid value '{}' (expected {})", name, value, expected)};
}

Result<void> setMs(Duration& out, const std::string& name, const std::string& value) {
    auto v = parse_int(value);
    if (!v || *v < 0) {
        return badValue(name, value, "non-negative milliseconds");
    }
    out = Duration{*v};
    return {};
}

Result<void> setU32(std::uint32_t& out, const std::string& name, const std::string& value) {
    auto v = parse_int(value);
    if (!v || *v < 0 || *v > std::numeric_limits<std::uint32_t>::max()) {
        return badValue(name, value, "non-negative integer");
    }
    out = static_cast<std::uint32_t>(*v);
    return {};
}

Result<void> setSize(std::size_t& out, const std::string& name, const std::string& value) {
    auto v = parse_int(value);
    if (!v || *v < 0) {
        return badValue(name, value, "non-negative integer");
    }
    out = static_cast<std::size_t>(*v);
    return {};
}

Result<void> setBool(bool& out, const std::string& name, const std::string& value) {
    auto v = parse_bool(value);
    if (!v) {
        return badValue(name, value, "true or false");
    }
    out = *v;
    return {};
}

Result<void> setDouble(double& out, const std::string& name, const std::string& value) {
    auto v = parse_double(value);
    if (!v || *v < 0) {
        return badValue(name, value, "non-negative number");
    }
    out = *v;
    return {};
}

const std::array<KeySpec, 43>& keyTable() {
    static const std::array<KeySpec, 43> table{{
        // [session]
        {"session", "max_per_target",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setSize(c.session.maxSessionsPerTarget, n, v);
         }},
        {"session", "max_global",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setSize(c.session.maxSessionsGlobal, n, v);
         }},
        // [reconnection]
        {"reconnection", "enabled",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.reconnection.enabled, n, v);
         }},
        {"reconnection", "max_attempts",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.reconnection.maxAttempts, n, v);
         }},
        {"reconnection", "base_delay_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.reconnection.baseDelay, n, v);
         }},
        {"reconnection", "max_delay_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.reconnection.maxDelay, n, v);
         }},
        {"reconnection", "aggressive",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.reconnection.aggressiveMode, n, v);
         }},
        {"reconnection", "aggressive_attempts",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.reconnection.aggressiveAttempts, n, v);
         }},
        {"reconnection", "aggressive_interval_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.reconnection.aggressiveInterval, n, v);
         }},
        {"reconnection", "preemptive_threshold_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.reconnection.preemptiveThreshold, n, v);
         }},
        // [monitor]
        {"monitor", "heartbeat_interval_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.heartbeatInterval, n, v);
         }},
        {"monitor", "failure_threshold",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.monitor.failureThreshold, n, v);
         }},
        {"monitor", "degraded_latency_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.degradedLatency, n, v);
         }},
        {"monitor", "connection_idle_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.connectionIdleWindow, n, v);
         }},
        {"monitor", "transfer_idle_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.transferIdleWindow, n, v);
         }},
        {"monitor", "probe_response_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.probeResponseWindow, n, v);
         }},
        {"monitor", "session_lifetime_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.sessionLifetime, n, v);
         }},
        {"monitor", "timeout_horizon_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.monitor.timeoutHorizon, n, v);
         }},
        {"monitor", "metrics_every_n_polls",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.monitor.metricsEveryNPolls, n, v);
         }},
        // [resources]
        {"resources", "memory_limit_mb",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setDouble(c.resources.memoryLimitMb, n, v);
         }},
        {"resources", "cpu_limit_percent",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setDouble(c.resources.cpuLimitPercent, n, v);
         }},
        {"resources", "sample_interval_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.resources.sampleInterval, n, v);
         }},
        {"resources", "stability_window",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.resources.stabilityWindow, n, v);
         }},
        {"resources", "low_power_multiplier",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setU32(c.resources.lowPowerMultiplier, n, v);
         }},
        // [diagnostics]
        {"diagnostics", "parallelism",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setSize(c.diagnostics.parallelism, n, v);
         }},
        {"diagnostics", "timeout_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.diagnostics.overallTimeout, n, v);
         }},
        {"diagnostics", "stale_agent_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.diagnostics.checks.staleAgentThreshold, n, v);
         }},
        {"diagnostics", "region",
         [](NimbusConfig& c, const std::string&, const std::string& v) -> Result<void> {
             c.diagnostics.checks.region = v;
             return {};
         }},
        {"diagnostics", "required_actions",
         [](NimbusConfig& c, const std::string&, const std::string& v) -> Result<void> {
             c.diagnostics.checks.requiredActions = parse_string_list(v);
             return {};
         }},
        {"diagnostics", "port_search_range",
         [](NimbusConfig& c, const std::string& n, const std::string& v) -> Result<void> {
             auto range = parse_int(v);
             if (!range || *range < 1 || *range > 1000) {
                 return badValue(n, v, "1..1000");
             }
             c.diagnostics.checks.portSearchRange = static_cast<std::uint16_t>(*range);
             return {};
         }},
        {"diagnostics", "preventive_check",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.preventiveCheck, n, v);
         }},
        {"diagnostics", "abort_on_critical",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.preventive.abortOnCritical, n, v);
         }},
        {"diagnostics", "preventive_timeout_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.preventive.timeout, n, v);
         }},
        // [autofix]
        {"autofix", "require_approval",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.autofix.requireApproval, n, v);
         }},
        {"autofix", "registration_poll_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.autofix.registrationPollInterval, n, v);
         }},
        {"autofix", "registration_timeout_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.autofix.registrationTimeout, n, v);
         }},
        {"autofix", "agent_settle_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.autofix.agentSettleDelay, n, v);
         }},
        {"autofix", "agent_verify_interval_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.autofix.agentVerifyInterval, n, v);
         }},
        {"autofix", "agent_verify_timeout_ms",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setMs(c.autofix.agentVerifyTimeout, n, v);
         }},
        // [logging]
        {"logging", "level",
         [](NimbusConfig& c, const std::string&, const std::string& v) -> Result<void> {
             c.logging.level = v;
             return {};
         }},
        {"logging", "console",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.logging.console, n, v);
         }},
        {"logging", "file",
         [](NimbusConfig& c, const std::string& n, const std::string& v) {
             return setBool(c.logging.fileLogging, n, v);
         }},
        {"logging", "path",
         [](NimbusConfig& c, const std::string&, const std::string& v) -> Result<void> {
             c.logging.logFile = expand_tilde(v);
             return {};
         }},
    }};
    return table;
}

std::string envName(std::string_view section, std::string_view key) {
    std::string out = "NIMBUS_";
    for (char c : section) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    out.push_back('_');
    for (char c : key) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

} // namespace

Result<void> applyConfigValue(NimbusConfig& cfg, const std::string& section,
                              const std::string& key, const std::string& value) {
    for (const auto& spec : keyTable()) {
        if (section == spec.section && key == spec.key) {
            return spec.set(cfg, fmt::format("{}.{}", section, key), value);
        }
    }
    return invalid(fmt::format("{}.{}: unknown configuration key", section, key));
}

Result<void> applyConfigTable(NimbusConfig& cfg, const ConfigTable& table) {
    for (const auto& [section, entries] : table) {
        for (const auto& [key, value] : entries) {
            if (auto r = applyConfigValue(cfg, section, key, value); !r) {
                return r;
            }
        }
    }
    return {};
}

Result<void> applyEnvOverrides(NimbusConfig& cfg) {
    for (const auto& spec : keyTable()) {
        const auto name = envName(spec.section, spec.key);
        if (const char* env = std::getenv(name.c_str()); env && *env) {
            if (auto r = spec.set(cfg, name, env); !r) {
                return r;
            }
        }
    }
    if (const char* env = std::getenv("NIMBUS_LOG_LEVEL"); env && *env) {
        cfg.logging.level = env;
    }
    return {};
}

Result<void> NimbusConfig::validate() const {
    if (session.maxSessionsPerTarget == 0) {
        return invalid("session.max_per_target must be at least 1");
    }
    if (session.maxSessionsGlobal == 0) {
        return invalid("session.max_global must be at least 1");
    }
    if (auto r = session::validatePolicy(reconnection); !r) {
        return r;
    }
    if (monitor.heartbeatInterval.count() <= 0) {
        return invalid("monitor.heartbeat_interval_ms must be positive");
    }
    if (monitor.failureThreshold == 0) {
        return invalid("monitor.failure_threshold must be at least 1");
    }
    if (monitor.timeoutHorizon > monitor.sessionLifetime) {
        return invalid("monitor.timeout_horizon_ms exceeds monitor.session_lifetime_ms");
    }
    if (resources.memoryLimitMb <= 0.0) {
        return invalid("resources.memory_limit_mb must be positive");
    }
    if (resources.cpuLimitPercent <= 0.0) {
        return invalid("resources.cpu_limit_percent must be positive");
    }
    if (resources.sampleInterval.count() <= 0) {
        return invalid("resources.sample_interval_ms must be positive");
    }
    if (resources.stabilityWindow == 0) {
        return invalid("resources.stability_window must be at least 1");
    }
    if (resources.lowPowerMultiplier == 0) {
        return invalid("resources.low_power_multiplier must be at least 1");
    }
    if (diagnostics.parallelism == 0) {
        return invalid("diagnostics.parallelism must be at least 1");
    }
    if (diagnostics.overallTimeout.count() <= 0) {
        return invalid("diagnostics.timeout_ms must be positive");
    }
    if (preventive.timeout.count() <= 0) {
        return invalid("diagnostics.preventive_timeout_ms must be positive");
    }
    if (autofix.registrationPollInterval.count() <= 0) {
        return invalid("autofix.registration_poll_ms must be positive");
    }
    if (autofix.registrationTimeout < autofix.registrationPollInterval) {
        return invalid("autofix.registration_timeout_ms is shorter than one poll interval");
    }
    if (autofix.agentVerifyInterval.count() <= 0) {
        return invalid("autofix.agent_verify_interval_ms must be positive");
    }
    static constexpr std::array<std::string_view, 6> kLevels{"trace", "debug", "info",
                                                             "warn",  "error", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), logging.level) == kLevels.end()) {
        return invalid(fmt::format("logging.level: unknown level '{}'", logging.level));
    }
    if (logging.fileLogging && logging.logFile.empty()) {
        return invalid("logging.path is required when logging.file is enabled");
    }
    return {};
}

Result<NimbusConfig> loadConfig(const std::string& override_path) {
    NimbusConfig cfg;
    const auto path = get_config_path(override_path);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto table = parse_config_file(path);
        if (!table) {
            return table.error();
        }
        if (auto r = applyConfigTable(cfg, table.value()); !r) {
            return r.error();
        }
        spdlog::debug("[Config] loaded {}", path.string());
    } else if (!override_path.empty()) {
        return Error{ErrorCode::NotFound, fmt::format("config file {} not found", path.string())};
    } else {
        spdlog::debug("[Config] no config file at {}, using defaults", path.string());
    }

    if (auto r = applyEnvOverrides(cfg); !r) {
        return r.error();
    }
    if (auto r = cfg.validate(); !r) {
        return r.error();
    }
    return cfg;
}

} // namespace nimbus::config
