#include <nimbus/diagnostics/checks.h>

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nimbus::diagnostics {

namespace {

DiagnosticFinding makeFinding(const CheckKind& kind, Severity severity, std::string message,
                              std::optional<std::string> recommendation = std::nullopt,
                              bool autoFixable = false) {
    return DiagnosticFinding{checkName(kind), kind,
                             severity,        std::move(message),
                             std::move(recommendation), autoFixable};
}

// Maps a facts-client error to a finding for `kind`.
DiagnosticFinding factsFailure(const CheckKind& kind, std::string_view subject,
                               const Error& error) {
    switch (error.code) {
        case ErrorCode::AuthorizationError:
            return makeFinding(kind, Severity::Error,
                               fmt::format("not authorized to describe {}: {}", subject,
                                           error.message),
                               "Grant the caller read access (ec2:Describe*, ssm:Describe*) and "
                               "retry");
        case ErrorCode::NotFound:
            if (std::holds_alternative<InstanceStateCheck>(kind)) {
                return makeFinding(kind, Severity::Critical,
                                   fmt::format("instance not found: {}", error.message),
                                   "Check the instance id, region and profile");
            }
            return makeFinding(kind, Severity::Warning,
                               fmt::format("{} not found: {}", subject, error.message));
        default:
            return makeFinding(kind, Severity::Warning,
                               fmt::format("could not determine {}: {}", subject, error.message),
                               "Retry the diagnostics once connectivity to the cloud API is "
                               "restored");
    }
}

std::vector<DiagnosticFinding> checkInstanceState(const CheckKind& kind, const TargetId& target,
                                                  ICloudFactsClient& facts) {
    auto res = facts.describeInstanceState(target);
    if (!res) {
        return {factsFailure(kind, "instance state", res.error())};
    }
    const auto state = res.value().state;
    const auto name = instanceStateName(state);
    switch (state) {
        case InstanceState::Running:
            return {makeFinding(kind, Severity::Info, "instance is running")};
        case InstanceState::Stopped:
            return {makeFinding(kind, Severity::Error, "instance is stopped",
                                fmt::format("aws ec2 start-instances --instance-ids {}", target),
                                true)};
        case InstanceState::Pending:
        case InstanceState::Stopping:
            return {makeFinding(kind, Severity::Warning, fmt::format("instance is {}", name),
                                "Wait for the instance to settle and retry")};
        case InstanceState::ShuttingDown:
        case InstanceState::Terminated:
            return {makeFinding(kind, Severity::Critical, fmt::format("instance is {}", name),
                                "Launch a replacement instance with an SSM instance profile")};
        case InstanceState::Unknown:
            break;
    }
    return {makeFinding(kind, Severity::Warning, "instance state is unknown")};
}

std::vector<DiagnosticFinding> checkAgentRegistration(const CheckKind& kind,
                                                      const TargetId& target,
                                                      ICloudFactsClient& facts,
                                                      const CheckOptions& options) {
    auto res = facts.describeAgentRegistration(target);
    if (!res) {
        return {factsFailure(kind, "agent registration", res.error())};
    }
    const auto& reg = res.value();
    if (!reg.registered) {
        return {makeFinding(kind, Severity::Critical, "agent is not registered with the broker",
                            "Attach an instance profile with AmazonSSMManagedInstanceCore and "
                            "restart the agent",
                            true)};
    }
    if (reg.pingStatus && *reg.pingStatus != "Online") {
        return {makeFinding(kind, Severity::Warning,
                            fmt::format("agent ping status is {}", *reg.pingStatus),
                            "Restart the agent: sudo systemctl restart amazon-ssm-agent", true)};
    }
    if (reg.lastPingAge && *reg.lastPingAge > options.staleAgentThreshold) {
        return {makeFinding(kind, Severity::Warning,
                            fmt::format("last agent ping was {}s ago", reg.lastPingAge->count() / 1000),
                            "Restart the agent: sudo systemctl restart amazon-ssm-agent", true)};
    }
    return {makeFinding(kind, Severity::Info,
                        reg.agentVersion ? fmt::format("agent online ({})", *reg.agentVersion)
                                         : std::string("agent online"))};
}

std::vector<DiagnosticFinding> checkPermission(const CheckKind& kind, const TargetId& target,
                                               ICloudFactsClient& facts,
                                               const PermissionCheck& check) {
    auto res = facts.describePermissions(target, {check.action});
    if (!res) {
        return {factsFailure(kind, fmt::format("permission {}", check.action), res.error())};
    }
    const auto& p = res.value();
    const bool denied = std::find(p.denied.begin(), p.denied.end(), check.action) != p.denied.end();
    const bool granted =
        std::find(p.granted.begin(), p.granted.end(), check.action) != p.granted.end();
    if (denied || !granted) {
        return {makeFinding(kind, Severity::Error,
                            fmt::format("missing permission {}", check.action),
                            fmt::format("Grant {} to the caller's IAM identity", check.action))};
    }
    return {makeFinding(kind, Severity::Info, fmt::format("permission {} granted", check.action))};
}

std::vector<DiagnosticFinding> checkNetworkStep(const CheckKind& kind, const TargetId& target,
                                                ICloudFactsClient& facts,
                                                const CheckOptions& options,
                                                const NetworkStepCheck& check) {
    auto res = facts.describeNetworkConfig(target);
    if (!res) {
        return {factsFailure(kind, "network configuration", res.error())};
    }
    const auto& net = res.value();
    const std::string vpc = net.vpcId.value_or("<vpc>");

    auto flagged = [&](const std::optional<bool>& ok, Severity failSeverity, std::string okMsg,
                       std::string failMsg, std::string rec) -> std::vector<DiagnosticFinding> {
        if (!ok) {
            return {makeFinding(kind, Severity::Warning,
                                fmt::format("could not evaluate {}", networkStepName(check.step)))};
        }
        if (*ok) {
            return {makeFinding(kind, Severity::Info, std::move(okMsg))};
        }
        return {makeFinding(kind, failSeverity, std::move(failMsg), std::move(rec))};
    };

    switch (check.step) {
        case NetworkStep::EndpointExistence: {
            if (net.hasInternetRoute) {
                return {makeFinding(kind, Severity::Info,
                                    "internet route present; interface endpoints not required")};
            }
            std::vector<std::string> missing;
            for (const auto& svc : options.requiredEndpoints) {
                if (std::find(net.endpoints.begin(), net.endpoints.end(), svc) ==
                    net.endpoints.end()) {
                    missing.push_back(svc);
                }
            }
            if (missing.empty()) {
                return {makeFinding(kind, Severity::Info, "required interface endpoints present")};
            }
            return {makeFinding(
                kind, Severity::Error,
                fmt::format("missing interface endpoints: {}", fmt::join(missing, ", ")),
                fmt::format("aws ec2 create-vpc-endpoint --vpc-id {} --service-name "
                            "com.amazonaws.{}.{} --vpc-endpoint-type Interface",
                            vpc, options.region, missing.front()))};
        }
        case NetworkStep::EndpointPolicy:
            if (net.hasInternetRoute && net.endpoints.empty()) {
                return {makeFinding(kind, Severity::Info, "no endpoint policies in use")};
            }
            return flagged(net.endpointPolicyAllows, Severity::Error,
                           "endpoint policies allow session traffic",
                           "an endpoint policy denies session traffic",
                           "Allow ssm:*, ssmmessages:* and ec2messages:* in the endpoint policy");
        case NetworkStep::RouteTable:
            return flagged(net.routeTableAssociated, Severity::Error,
                           "subnet route table is associated",
                           "subnet has no usable route table association",
                           "Associate the subnet with a route table that reaches the endpoints "
                           "or an internet/NAT gateway");
        case NetworkStep::SecurityRules:
            return flagged(net.httpsEgressAllowed, Severity::Error,
                           "outbound HTTPS (443) allowed", "outbound HTTPS (443) is blocked",
                           "Allow outbound TCP 443 in the instance security group");
        case NetworkStep::NameResolution:
            return flagged(net.privateDnsResolves, Severity::Warning,
                           "broker endpoints resolve", "broker endpoint names do not resolve",
                           "Enable DNS hostnames and private DNS on the VPC endpoints");
    }
    return {};
}

// Never worse than Warning.
std::vector<DiagnosticFinding> checkLocalPort(const CheckKind& kind, const CheckOptions& options,
                                              const LocalPortCheck& check) {
    if (!options.ports) {
        return {makeFinding(kind, Severity::Warning,
                            fmt::format("local port {} could not be checked", check.port))};
    }
    auto res = options.ports->inspect(check.port);
    if (!res) {
        return {makeFinding(kind, Severity::Warning,
                            fmt::format("could not check local port {}: {}", check.port,
                                        res.error().message),
                            "Pick a different local port for the forward")};
    }
    const auto& status = res.value();
    if (status.available) {
        return {makeFinding(kind, Severity::Info,
                            fmt::format("local port {} is available", check.port))};
    }

    std::string holder = "another process";
    if (status.occupant) {
        const auto& o = *status.occupant;
        holder = o.pid ? fmt::format("{} (pid {})", o.processName, *o.pid) : o.processName;
        if (o.systemCritical) {
            holder += ", a system process";
        }
    }
    const auto alternatives = suggestAlternativePorts(*options.ports, check.port,
                                                      options.portSearchRange,
                                                      options.maxPortSuggestions);
    const int low = std::max(1, check.port - options.portSearchRange);
    const int high = std::min(65535, check.port + options.portSearchRange);
    std::string recommendation;
    if (!alternatives.empty()) {
        recommendation = fmt::format("Use a free local port instead: {}",
                                     fmt::join(alternatives, ", "));
    } else if (status.occupant && status.occupant->pid && !status.occupant->systemCritical) {
        recommendation =
            fmt::format("Stop {} (kill {}) or pick a port outside {}-{}",
                        status.occupant->processName, *status.occupant->pid, low, high);
    } else {
        recommendation = fmt::format("Pick a local port outside {}-{}", low, high);
    }
    return {makeFinding(kind, Severity::Warning,
                        fmt::format("local port {} is in use by {}", check.port, holder),
                        std::move(recommendation))};
}

// Dispatch table over the closed set of check kinds.
struct CheckDispatch {
    const CheckKind& kind;
    const TargetId& target;
    ICloudFactsClient& facts;
    const CheckOptions& options;

    std::vector<DiagnosticFinding> operator()(const InstanceStateCheck&) const {
        return checkInstanceState(kind, target, facts);
    }
    std::vector<DiagnosticFinding> operator()(const AgentRegistrationCheck&) const {
        return checkAgentRegistration(kind, target, facts, options);
    }
    std::vector<DiagnosticFinding> operator()(const PermissionCheck& c) const {
        return checkPermission(kind, target, facts, c);
    }
    std::vector<DiagnosticFinding> operator()(const NetworkStepCheck& c) const {
        return checkNetworkStep(kind, target, facts, options, c);
    }
    std::vector<DiagnosticFinding> operator()(const LocalPortCheck& c) const {
        return checkLocalPort(kind, options, c);
    }
};

} // namespace

std::vector<CheckKind> checksFor(CheckCategory category, const CheckOptions& options) {
    std::vector<CheckKind> out;
    switch (category) {
        case CheckCategory::Instance:
            out.emplace_back(InstanceStateCheck{});
            break;
        case CheckCategory::Agent:
            out.emplace_back(AgentRegistrationCheck{});
            break;
        case CheckCategory::Permissions:
            for (const auto& action : options.requiredActions) {
                out.emplace_back(PermissionCheck{action});
            }
            break;
        case CheckCategory::Network:
            for (auto step : kNetworkSteps) {
                out.emplace_back(NetworkStepCheck{step});
            }
            break;
    }
    return out;
}

std::vector<CheckKind> defaultCheckSet(const CheckOptions& options) {
    std::vector<CheckKind> out;
    for (auto category : {CheckCategory::Instance, CheckCategory::Agent,
                          CheckCategory::Permissions, CheckCategory::Network}) {
        auto part = checksFor(category, options);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<DiagnosticFinding> runCheck(const CheckKind& kind, const TargetId& target,
                                        ICloudFactsClient& facts, const CheckOptions& options) {
    return std::visit(CheckDispatch{kind, target, facts, options}, kind);
}

} // namespace nimbus::diagnostics
