#pragma once

#include <nimbus/core/event_hub.h>
#include <nimbus/core/types.h>
#include <nimbus/diagnostics/DiagnosticEngine.h>
#include <nimbus/diagnostics/finding.h>
#include <nimbus/diagnostics/likelihood.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::diagnostics {

enum class PreventiveStatus : std::uint8_t { Ready, Warning, Critical, Aborted };

constexpr std::string_view preventiveStatusName(PreventiveStatus s) noexcept {
    switch (s) {
        case PreventiveStatus::Ready:
            return "Ready";
        case PreventiveStatus::Warning:
            return "Warning";
        case PreventiveStatus::Critical:
            return "Critical";
        case PreventiveStatus::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

struct PreventiveOptions {
    bool abortOnCritical{true};
    Duration timeout{30000};
    // When set, the network stage also checks that this port can be bound.
    std::optional<std::uint16_t> localPort;
};

struct PreventiveCheckProgress {
    TargetId target;
    std::string stage;
    std::size_t index{0}; // 1-based
    std::size_t total{0};
    std::vector<DiagnosticFinding> findings; // interim, all stages so far
};

struct StageReport {
    std::string name;
    CheckCategory category{CheckCategory::Instance};
    CheckStatus status{CheckStatus::Completed};
    std::vector<CheckReport> checks;
};

struct PreventiveCheckResult {
    TargetId target;
    PreventiveStatus status{PreventiveStatus::Ready};
    std::vector<DiagnosticFinding> findings; // stage order
    std::vector<StageReport> stages;
    ConnectionLikelihood likelihood;
    // False when the pipeline halted early or stages were skipped.
    bool authoritative{true};
    bool shouldAbortConnection{false};
    std::vector<std::string> suggestedCommands;
    std::map<CheckCategory, std::string> troubleshooting;
    std::vector<std::string> recommendations;
    Duration duration{0};
};

// Runs the check set as a fixed pipeline: instance state, agent registration,
// permissions, network (with the local port when one is given). Blocking;
// callers off the io thread run it on a pool.
class PreventiveCheckOrchestrator {
public:
    explicit PreventiveCheckOrchestrator(DiagnosticEngine& engine) : engine_(engine) {}

    PreventiveCheckResult run(const TargetId& target, const PreventiveOptions& options = {});

    EventHub<PreventiveCheckProgress>& progress() noexcept { return progress_; }

    static constexpr CheckCategory kStages[] = {CheckCategory::Instance, CheckCategory::Agent,
                                                CheckCategory::Permissions,
                                                CheckCategory::Network};

private:
    DiagnosticEngine& engine_;
    EventHub<PreventiveCheckProgress> progress_;
};

} // namespace nimbus::diagnostics
