#pragma once

#include <nimbus/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::diagnostics {

using TargetId = std::string;

enum class InstanceState : std::uint8_t {
    Pending,
    Running,
    Stopping,
    Stopped,
    ShuttingDown,
    Terminated,
    Unknown
};

constexpr std::string_view instanceStateName(InstanceState state) noexcept {
    switch (state) {
        case InstanceState::Pending:
            return "pending";
        case InstanceState::Running:
            return "running";
        case InstanceState::Stopping:
            return "stopping";
        case InstanceState::Stopped:
            return "stopped";
        case InstanceState::ShuttingDown:
            return "shutting-down";
        case InstanceState::Terminated:
            return "terminated";
        case InstanceState::Unknown:
            return "unknown";
    }
    return "unknown";
}

struct InstanceFacts {
    InstanceState state{InstanceState::Unknown};
    std::string instanceType;
    std::optional<std::string> platform;
};

struct AgentRegistration {
    bool registered{false};
    std::optional<std::string> pingStatus; // "Online", "ConnectionLost", "Inactive"
    std::optional<Duration> lastPingAge;
    std::optional<std::string> agentVersion;
};

struct PermissionFacts {
    std::vector<std::string> granted;
    std::vector<std::string> denied;
};

// One flag per network-path step. A missing value means the step could not
// be evaluated.
struct NetworkFacts {
    std::optional<std::string> vpcId;
    // Interface endpoints present (ssm, ssmmessages, ec2messages). When the
    // subnet has a route to the internet the endpoints are optional.
    std::vector<std::string> endpoints;
    bool hasInternetRoute{false};
    std::optional<bool> endpointPolicyAllows;
    std::optional<bool> routeTableAssociated;
    std::optional<bool> httpsEgressAllowed;
    std::optional<bool> privateDnsResolves;
};

// Point-in-time facts about a target. Synchronous; may fail with
// TransientNetworkError, AuthorizationError or NotFound.
class ICloudFactsClient {
public:
    virtual ~ICloudFactsClient() = default;

    virtual Result<InstanceFacts> describeInstanceState(const TargetId& id) = 0;
    virtual Result<AgentRegistration> describeAgentRegistration(const TargetId& id) = 0;
    virtual Result<PermissionFacts>
    describePermissions(const TargetId& id, const std::vector<std::string>& requiredActions) = 0;
    virtual Result<NetworkFacts> describeNetworkConfig(const TargetId& id) = 0;
};

// Remediation actions issued by the auto-fix orchestrator.
class ICloudActionsClient {
public:
    virtual ~ICloudActionsClient() = default;

    virtual Result<void> startInstance(const TargetId& id) = 0;
    virtual Result<void> restartAgent(const TargetId& id) = 0;
};

} // namespace nimbus::diagnostics
