#pragma once

#include <nimbus/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nimbus::diagnostics {

enum class Severity : std::uint8_t { Info = 0, Warning = 1, Error = 2, Critical = 3 };

constexpr std::string_view severityName(Severity s) noexcept {
    switch (s) {
        case Severity::Info:
            return "Info";
        case Severity::Warning:
            return "Warning";
        case Severity::Error:
            return "Error";
        case Severity::Critical:
            return "Critical";
    }
    return "Unknown";
}

enum class NetworkStep : std::uint8_t {
    EndpointExistence,
    EndpointPolicy,
    RouteTable,
    SecurityRules,
    NameResolution
};

constexpr std::string_view networkStepName(NetworkStep step) noexcept {
    switch (step) {
        case NetworkStep::EndpointExistence:
            return "endpoint_existence";
        case NetworkStep::EndpointPolicy:
            return "endpoint_policy";
        case NetworkStep::RouteTable:
            return "route_table";
        case NetworkStep::SecurityRules:
            return "security_rules";
        case NetworkStep::NameResolution:
            return "name_resolution";
    }
    return "unknown";
}

inline constexpr NetworkStep kNetworkSteps[] = {
    NetworkStep::EndpointExistence, NetworkStep::EndpointPolicy, NetworkStep::RouteTable,
    NetworkStep::SecurityRules, NetworkStep::NameResolution};

// Closed set of check kinds.
struct InstanceStateCheck {};
struct AgentRegistrationCheck {};
struct PermissionCheck {
    std::string action;
};
struct NetworkStepCheck {
    NetworkStep step{NetworkStep::EndpointExistence};
};
// Whether the local end of a port forward can be bound.
struct LocalPortCheck {
    std::uint16_t port{0};
};

using CheckKind = std::variant<InstanceStateCheck, AgentRegistrationCheck, PermissionCheck,
                               NetworkStepCheck, LocalPortCheck>;

enum class CheckCategory : std::uint8_t { Instance, Agent, Permissions, Network };

constexpr std::string_view categoryName(CheckCategory c) noexcept {
    switch (c) {
        case CheckCategory::Instance:
            return "instance";
        case CheckCategory::Agent:
            return "agent";
        case CheckCategory::Permissions:
            return "permissions";
        case CheckCategory::Network:
            return "network";
    }
    return "unknown";
}

/// Stable name: "instance_state", "agent_registration", "permission:<action>",
/// "network:<step>", "local_port_availability".
std::string checkName(const CheckKind& kind);
CheckCategory checkCategory(const CheckKind& kind);

struct DiagnosticFinding {
    std::string checkName;
    CheckKind kind;
    Severity severity{Severity::Info};
    std::string message;
    std::optional<std::string> recommendation;
    bool autoFixable{false};
};

enum class CheckStatus : std::uint8_t { Completed, Skipped };

struct CheckReport {
    std::string name;
    CheckKind kind;
    CheckStatus status{CheckStatus::Completed};
    std::vector<DiagnosticFinding> findings;
};

std::vector<DiagnosticFinding> flattenFindings(const std::vector<CheckReport>& reports);

} // namespace nimbus::diagnostics
