#pragma once

#include <nimbus/diagnostics/checks.h>
#include <nimbus/diagnostics/finding.h>

#include <string>
#include <vector>

namespace nimbus::diagnostics {

// Human-readable troubleshooting text for one category of failed checks.
std::string troubleshootingFor(CheckCategory category, const TargetId& target,
                               const CheckOptions& options);

// Ordered steps for an agent that never registers with the broker.
std::vector<std::string> registrationTroubleshooting(const TargetId& target);

// CLI commands for a detailed follow-up analysis of a failed check.
std::vector<std::string> detailedCommandsFor(const DiagnosticFinding& finding,
                                             const TargetId& target,
                                             const CheckOptions& options);

} // namespace nimbus::diagnostics
