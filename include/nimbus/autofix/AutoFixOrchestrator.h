#pragma once

#include <nimbus/autofix/fix_attempt.h>
#include <nimbus/core/clock.h>
#include <nimbus/core/event_hub.h>
#include <nimbus/core/notice.h>
#include <nimbus/core/types.h>
#include <nimbus/diagnostics/DiagnosticEngine.h>
#include <nimbus/diagnostics/cloud_facts.h>
#include <nimbus/diagnostics/finding.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

namespace nimbus::autofix {

using diagnostics::TargetId;

enum class FixActionType : std::uint8_t {
    StartInstance,
    RestartAgent,
    SuggestIamFix,
    SuggestNetworkFix
};

constexpr std::string_view fixActionName(FixActionType t) noexcept {
    switch (t) {
        case FixActionType::StartInstance:
            return "StartInstance";
        case FixActionType::RestartAgent:
            return "RestartAgent";
        case FixActionType::SuggestIamFix:
            return "SuggestIamFix";
        case FixActionType::SuggestNetworkFix:
            return "SuggestNetworkFix";
    }
    return "Unknown";
}

enum class RiskLevel : std::uint8_t { Safe, Low, Medium, High };

struct FixAction {
    FixActionType type{FixActionType::StartInstance};
    std::string description;
    TargetId target;
    std::optional<std::string> command;
    bool requiresConfirmation{false};
    RiskLevel risk{RiskLevel::Safe};
    Duration estimatedDuration{0};

    bool isSafeToAutoExecute() const noexcept {
        return (risk == RiskLevel::Safe || risk == RiskLevel::Low) && !requiresConfirmation;
    }
};

// Builds an action with the risk, confirmation flag and estimate of its type.
FixAction makeFixAction(FixActionType type, TargetId target, std::string description);

struct WaitProgress {
    TargetId target;
    std::uint32_t elapsedSeconds{0}; // never above maxSeconds
    std::uint32_t maxSeconds{0};
    std::string status;
    std::uint32_t checkCount{0};
};

struct AutoFixOptions {
    // When set, StartInstance and RestartAgent ask the approval callback first.
    bool requireApproval{false};
    Duration registrationPollInterval{3000};
    Duration registrationTimeout{300000};
    Duration agentSettleDelay{10000};
    Duration agentVerifyInterval{5000};
    Duration agentVerifyTimeout{60000};
};

// Maps findings to remediation actions and runs the safe ones. Identity and
// network policy changes are only ever suggested. At most one fix runs per
// target; a concurrent request fails with OperationInProgress.
class AutoFixOrchestrator {
public:
    using ApprovalCallback = std::function<bool(const FixAction&)>;

    AutoFixOrchestrator(diagnostics::DiagnosticEngine& engine,
                        std::shared_ptr<diagnostics::ICloudFactsClient> facts,
                        std::shared_ptr<diagnostics::ICloudActionsClient> actions,
                        std::shared_ptr<Clock> clock, AutoFixOptions options = {});

    AutoFixOrchestrator(const AutoFixOrchestrator&) = delete;
    AutoFixOrchestrator& operator=(const AutoFixOrchestrator&) = delete;

    std::vector<FixAction> planFixes(const std::vector<diagnostics::DiagnosticFinding>& findings,
                                     const TargetId& target) const;

    boost::asio::awaitable<FixOutcome> fixInstanceState(TargetId target);
    boost::asio::awaitable<FixOutcome> fixAgent(TargetId target);

    FixOutcome suggestIamFixes(const TargetId& target,
                               const std::vector<diagnostics::DiagnosticFinding>& findings) const;
    FixOutcome
    suggestSecurityGroupFixes(const TargetId& target,
                              const std::vector<diagnostics::DiagnosticFinding>& findings) const;

    // Re-runs the originating check; true only if the worst new severity is
    // strictly lower than the finding's.
    bool verifyFix(const TargetId& target, const diagnostics::DiagnosticFinding& finding);

    // Runs actions that are low risk and need no confirmation; others are skipped.
    boost::asio::awaitable<std::vector<FixOutcome>>
    executeSafeFixes(TargetId target, std::vector<FixAction> actions);

    void setApprovalCallback(ApprovalCallback cb);
    [[nodiscard]] bool isFixing(const TargetId& target) const;

    EventHub<WaitProgress>& waitProgress() noexcept { return progress_; }
    EventHub<TerminalNotice>& notices() noexcept { return notices_; }

    const AutoFixOptions& options() const noexcept { return options_; }

private:
    class TargetGuard;

    bool tryBegin(const TargetId& target);
    void end(const TargetId& target);
    bool approved(const FixAction& action);
    FixOutcome finish(FixAttempt& attempt, FixOutcome outcome, TimePoint started) const;
    void notifyFailure(const FixOutcome& outcome, NoticeKind kind);

    diagnostics::DiagnosticEngine& engine_;
    std::shared_ptr<diagnostics::ICloudFactsClient> facts_;
    std::shared_ptr<diagnostics::ICloudActionsClient> actions_;
    std::shared_ptr<Clock> clock_;
    const AutoFixOptions options_;

    mutable std::mutex mu_;
    std::set<TargetId> inFlight_;
    ApprovalCallback approval_;

    EventHub<WaitProgress> progress_;
    EventHub<TerminalNotice> notices_;
};

} // namespace nimbus::autofix
