#include <nimbus/diagnostics/finding.h>

#include <type_traits>

namespace nimbus::diagnostics {

std::string checkName(const CheckKind& kind) {
    return std::visit(
        [](const auto& k) -> std::string {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, InstanceStateCheck>) {
                return "instance_state";
            } else if constexpr (std::is_same_v<T, AgentRegistrationCheck>) {
                return "agent_registration";
            } else if constexpr (std::is_same_v<T, PermissionCheck>) {
                return "permission:" + k.action;
            } else if constexpr (std::is_same_v<T, NetworkStepCheck>) {
                return "network:" + std::string(networkStepName(k.step));
            } else {
                return "local_port_availability";
            }
        },
        kind);
}

CheckCategory checkCategory(const CheckKind& kind) {
    switch (kind.index()) {
        case 0:
            return CheckCategory::Instance;
        case 1:
            return CheckCategory::Agent;
        case 2:
            return CheckCategory::Permissions;
        default:
            return CheckCategory::Network;
    }
}

std::vector<DiagnosticFinding> flattenFindings(const std::vector<CheckReport>& reports) {
    std::vector<DiagnosticFinding> out;
    for (const auto& r : reports) {
        out.insert(out.end(), r.findings.begin(), r.findings.end());
    }
    return out;
}

} // namespace nimbus::diagnostics
