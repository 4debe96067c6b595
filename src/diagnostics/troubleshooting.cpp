#include <nimbus/diagnostics/troubleshooting.h>

#include <type_traits>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nimbus::diagnostics {

std::vector<std::string> registrationTroubleshooting(const TargetId& target) {
    return {
        "Verify the instance has an IAM role with AmazonSSMManagedInstanceCore attached",
        "Verify outbound HTTPS (TCP/443) is allowed by the security group, NACL and any proxy",
        "In a private subnet, verify interface endpoints exist for ssm, ssmmessages and "
        "ec2messages",
        "Verify the agent is installed and running: sudo systemctl status amazon-ssm-agent "
        "(restart with sudo systemctl restart amazon-ssm-agent)",
        fmt::format("Verify registration: aws ssm describe-instance-information --filters "
                    "Key=InstanceIds,Values={}",
                    target),
        "Check instance time sync and DNS resolution",
        "Review the amazon-ssm-agent logs for errors"};
}

std::string troubleshootingFor(CheckCategory category, const TargetId& target,
                               const CheckOptions& options) {
    switch (category) {
        case CheckCategory::Instance:
            return fmt::format(
                "Instance {} is not ready. Start it (aws ec2 start-instances --instance-ids {}) "
                "and wait until the state is 'running'. A terminated instance cannot be "
                "recovered; launch a replacement with an SSM instance profile.",
                target, target);
        case CheckCategory::Agent: {
            std::string text =
                fmt::format("The session agent on {} is not reachable by the broker:", target);
            int n = 1;
            for (const auto& step : registrationTroubleshooting(target)) {
                text += fmt::format("\n{}) {}", n++, step);
            }
            return text;
        }
        case CheckCategory::Permissions:
            return fmt::format(
                "The caller lacks one or more of the permissions needed to open a session "
                "({}). Attach a policy granting them to the user or role of the active profile; "
                "permission changes are never applied automatically.",
                fmt::join(options.requiredActions, ", "));
        case CheckCategory::Network:
            return fmt::format(
                "The network path from {} to the broker is incomplete. The instance needs "
                "outbound HTTPS (443) and either a route to the internet or interface endpoints "
                "for {} in region {} with private DNS enabled. Security group and endpoint "
                "changes must be applied manually.",
                target, fmt::join(options.requiredEndpoints, ", "), options.region);
    }
    return {};
}

std::vector<std::string> detailedCommandsFor(const DiagnosticFinding& finding,
                                             const TargetId& target,
                                             const CheckOptions& options) {
    return std::visit(
        [&](const auto& k) -> std::vector<std::string> {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, InstanceStateCheck>) {
                return {fmt::format("aws ec2 describe-instances --instance-ids {} --query "
                                    "'Reservations[0].Instances[0].State.Name'",
                                    target)};
            } else if constexpr (std::is_same_v<T, AgentRegistrationCheck>) {
                return {fmt::format("aws ssm describe-instance-information --filters "
                                    "Key=InstanceIds,Values={}",
                                    target)};
            } else if constexpr (std::is_same_v<T, PermissionCheck>) {
                return {fmt::format("aws iam simulate-principal-policy --policy-source-arn "
                                    "<caller-arn> --action-names {}",
                                    k.action)};
            } else if constexpr (std::is_same_v<T, LocalPortCheck>) {
                return {fmt::format("ss -ltnp 'sport = :{}'", k.port)};
            } else {
                switch (k.step) {
                    case NetworkStep::EndpointExistence:
                    case NetworkStep::EndpointPolicy:
                        return {fmt::format("aws ec2 describe-vpc-endpoints --region {}",
                                            options.region)};
                    case NetworkStep::RouteTable:
                        return {fmt::format("aws ec2 describe-route-tables --region {}",
                                            options.region)};
                    case NetworkStep::SecurityRules:
                        return {fmt::format("aws ec2 describe-instances --instance-ids {} --query "
                                            "'Reservations[0].Instances[0].SecurityGroups'",
                                            target)};
                    case NetworkStep::NameResolution:
                        return {fmt::format("nslookup ssm.{}.amazonaws.com", options.region)};
                }
                return {};
            }
        },
        finding.kind);
}

} // namespace nimbus::diagnostics
