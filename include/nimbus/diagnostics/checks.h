#pragma once

#include <nimbus/diagnostics/cloud_facts.h>
#include <nimbus/diagnostics/finding.h>
#include <nimbus/diagnostics/local_port.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nimbus::diagnostics {

struct CheckOptions {
    // Agent pings older than this are reported as stale.
    Duration staleAgentThreshold{300000};
    std::vector<std::string> requiredActions{"ssm:StartSession", "ssm:TerminateSession",
                                             "ssm:DescribeInstanceInformation",
                                             "ec2:DescribeInstances"};
    // Interface endpoints needed when the subnet has no internet route.
    std::vector<std::string> requiredEndpoints{"ssm", "ssmmessages", "ec2messages"};
    std::string region{"us-east-1"};
    // Used by LocalPortCheck; DiagnosticEngine installs a SystemPortInspector
    // when left empty.
    std::shared_ptr<ILocalPortInspector> ports;
    // Alternatives to a busy local port are searched within this distance.
    std::uint16_t portSearchRange{10};
    std::size_t maxPortSuggestions{5};
};

/// Instance state, agent registration, one check per required action, one
/// per network step. LocalPortCheck is added by callers that know the port.
std::vector<CheckKind> defaultCheckSet(const CheckOptions& options);

/// Checks of one category, in pipeline order.
std::vector<CheckKind> checksFor(CheckCategory category, const CheckOptions& options);

/// Runs one check. Facts-client failures become findings; never throws for
/// collaborator errors.
std::vector<DiagnosticFinding> runCheck(const CheckKind& kind, const TargetId& target,
                                        ICloudFactsClient& facts, const CheckOptions& options);

} // namespace nimbus::diagnostics
