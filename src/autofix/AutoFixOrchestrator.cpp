#include <nimbus/autofix/AutoFixOrchestrator.h>

#include <nimbus/diagnostics/troubleshooting.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace nimbus::autofix {

using diagnostics::CheckCategory;
using diagnostics::DiagnosticFinding;
using diagnostics::InstanceState;
using diagnostics::Severity;

namespace {

std::uint32_t wholeSeconds(SteadyClock::duration d) {
    return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

Severity worstSeverity(const std::vector<DiagnosticFinding>& findings) {
    auto worst = Severity::Info;
    for (const auto& f : findings) {
        worst = std::max(worst, f.severity);
    }
    return worst;
}

void appendUnique(std::vector<std::string>& out, std::string value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

FixOutcome busy(const TargetId& target) {
    FixOutcome out;
    out.target = target;
    out.result = FixResult::Failed;
    out.message = fmt::format("a fix is already running for {}", target);
    out.code = ErrorCode::OperationInProgress;
    return out;
}

} // namespace

FixAction makeFixAction(FixActionType type, TargetId target, std::string description) {
    FixAction action;
    action.type = type;
    action.target = std::move(target);
    action.description = std::move(description);
    switch (type) {
        case FixActionType::StartInstance:
            action.requiresConfirmation = false;
            action.risk = RiskLevel::Low;
            action.estimatedDuration = Duration{300000};
            action.command = fmt::format("aws ec2 start-instances --instance-ids {}", action.target);
            break;
        case FixActionType::RestartAgent:
            action.requiresConfirmation = true;
            action.risk = RiskLevel::Medium;
            action.estimatedDuration = Duration{30000};
            action.command = "sudo systemctl restart amazon-ssm-agent";
            break;
        case FixActionType::SuggestIamFix:
        case FixActionType::SuggestNetworkFix:
            action.requiresConfirmation = true;
            action.risk = RiskLevel::High;
            action.estimatedDuration = Duration{0};
            break;
    }
    return action;
}

class AutoFixOrchestrator::TargetGuard {
public:
    TargetGuard(AutoFixOrchestrator& owner, TargetId target)
        : owner_(owner), target_(std::move(target)) {}
    ~TargetGuard() { owner_.end(target_); }
    TargetGuard(const TargetGuard&) = delete;
    TargetGuard& operator=(const TargetGuard&) = delete;

private:
    AutoFixOrchestrator& owner_;
    TargetId target_;
};

AutoFixOrchestrator::AutoFixOrchestrator(diagnostics::DiagnosticEngine& engine,
                                         std::shared_ptr<diagnostics::ICloudFactsClient> facts,
                                         std::shared_ptr<diagnostics::ICloudActionsClient> actions,
                                         std::shared_ptr<Clock> clock, AutoFixOptions options)
    : engine_(engine), facts_(std::move(facts)), actions_(std::move(actions)),
      clock_(std::move(clock)), options_(options) {
    if (!facts_ || !actions_ || !clock_) {
        throw std::invalid_argument("AutoFixOrchestrator requires facts, actions and clock");
    }
}

bool AutoFixOrchestrator::tryBegin(const TargetId& target) {
    std::lock_guard<std::mutex> lk(mu_);
    return inFlight_.insert(target).second;
}

void AutoFixOrchestrator::end(const TargetId& target) {
    std::lock_guard<std::mutex> lk(mu_);
    inFlight_.erase(target);
}

bool AutoFixOrchestrator::isFixing(const TargetId& target) const {
    std::lock_guard<std::mutex> lk(mu_);
    return inFlight_.count(target) > 0;
}

void AutoFixOrchestrator::setApprovalCallback(ApprovalCallback cb) {
    std::lock_guard<std::mutex> lk(mu_);
    approval_ = std::move(cb);
}

bool AutoFixOrchestrator::approved(const FixAction& action) {
    if (!options_.requireApproval && !action.requiresConfirmation) {
        return true;
    }
    ApprovalCallback cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = approval_;
    }
    if (!cb) {
        spdlog::info("[AutoFix] {} on {} needs approval but no approver is set",
                     fixActionName(action.type), action.target);
        return false;
    }
    return cb(action);
}

FixOutcome AutoFixOrchestrator::finish(FixAttempt& attempt, FixOutcome outcome,
                                       TimePoint started) const {
    attempt.finish(outcome.result);
    outcome.elapsed = std::chrono::duration_cast<Duration>(clock_->now() - started);
    spdlog::info("[AutoFix] {}: {} ({}) after {}ms", outcome.target,
                 fixResultName(outcome.result), outcome.message, outcome.elapsed.count());
    return outcome;
}

void AutoFixOrchestrator::notifyFailure(const FixOutcome& outcome, NoticeKind kind) {
    spdlog::warn("[AutoFix] {}: giving up: {}", outcome.target, outcome.message);
    notices_.publish(TerminalNotice{kind, outcome.target, outcome.code.value_or(ErrorCode::Unknown),
                                    outcome.message, outcome.steps});
}

std::vector<FixAction>
AutoFixOrchestrator::planFixes(const std::vector<DiagnosticFinding>& findings,
                               const TargetId& target) const {
    std::vector<FixAction> plan;
    auto has = [&plan](FixActionType type) {
        return std::any_of(plan.begin(), plan.end(),
                           [type](const FixAction& a) { return a.type == type; });
    };
    for (const auto& f : findings) {
        if (f.severity == Severity::Info) {
            continue;
        }
        switch (diagnostics::checkCategory(f.kind)) {
            case CheckCategory::Instance:
                if (f.autoFixable && !has(FixActionType::StartInstance)) {
                    plan.push_back(makeFixAction(FixActionType::StartInstance, target,
                                                 fmt::format("Start instance {}", target)));
                }
                break;
            case CheckCategory::Agent:
                if (f.autoFixable && !has(FixActionType::RestartAgent)) {
                    plan.push_back(makeFixAction(FixActionType::RestartAgent, target,
                                                 fmt::format("Restart the agent on {}", target)));
                }
                break;
            case CheckCategory::Permissions: {
                auto action = makeFixAction(FixActionType::SuggestIamFix, target, f.message);
                action.command = f.recommendation;
                plan.push_back(std::move(action));
                break;
            }
            case CheckCategory::Network: {
                auto action = makeFixAction(FixActionType::SuggestNetworkFix, target, f.message);
                action.command = f.recommendation;
                plan.push_back(std::move(action));
                break;
            }
        }
    }
    return plan;
}

boost::asio::awaitable<FixOutcome> AutoFixOrchestrator::fixInstanceState(TargetId target) {
    if (!tryBegin(target)) {
        co_return busy(target);
    }
    TargetGuard guard(*this, target);
    const auto started = clock_->now();
    FixAttempt attempt;
    attempt.start();

    FixOutcome out;
    out.target = target;

    auto state = facts_->describeInstanceState(target);
    if (!state) {
        out.message = fmt::format("could not read instance state: {}", state.error().message);
        out.code = state.error().code;
        out = finish(attempt, std::move(out), started);
        notifyFailure(out, NoticeKind::AutoFixFailed);
        co_return out;
    }

    switch (state.value().state) {
        case InstanceState::Running:
            out.steps.push_back("Instance already running");
            break;
        case InstanceState::Pending:
            out.steps.push_back("Instance already starting");
            break;
        case InstanceState::Stopped: {
            auto action = makeFixAction(FixActionType::StartInstance, target,
                                        fmt::format("Start instance {}", target));
            if (!approved(action)) {
                out.result = FixResult::RequiresUserApproval;
                out.message = fmt::format("starting {} was not approved", target);
                out.steps.push_back(*action.command);
                co_return finish(attempt, std::move(out), started);
            }
            spdlog::info("[AutoFix] starting instance {}", target);
            auto res = actions_->startInstance(target);
            if (!res) {
                out.message = fmt::format("start request failed: {}", res.error().message);
                out.code = res.error().code;
                out.steps.push_back(*action.command);
                out = finish(attempt, std::move(out), started);
                notifyFailure(out, NoticeKind::AutoFixFailed);
                co_return out;
            }
            out.steps.push_back("Start requested");
            break;
        }
        default: {
            out.message = fmt::format("instance is {} and cannot be started automatically",
                                      diagnostics::instanceStateName(state.value().state));
            out.code = ErrorCode::InvalidState;
            out.steps.push_back("Launch a replacement instance with an SSM instance profile");
            out = finish(attempt, std::move(out), started);
            notifyFailure(out, NoticeKind::AutoFixFailed);
            co_return out;
        }
    }

    // Poll registration; the final tick lands exactly on the limit.
    const auto limit = std::chrono::duration_cast<SteadyClock::duration>(options_.registrationTimeout);
    const auto interval =
        std::chrono::duration_cast<SteadyClock::duration>(options_.registrationPollInterval);
    const auto maxSeconds = wholeSeconds(limit);
    const auto waitStart = clock_->now();
    std::uint32_t checks = 0;
    bool registered = false;
    for (;;) {
        auto waited = clock_->now() - waitStart;
        if (waited >= limit) {
            break;
        }
        co_await clock_->sleepFor(std::min(interval, limit - waited));
        waited = std::min(clock_->now() - waitStart, limit);
        ++checks;

        std::string status;
        auto reg = facts_->describeAgentRegistration(target);
        if (!reg) {
            status = fmt::format("registration check failed: {}", reg.error().message);
        } else if (reg.value().registered) {
            registered = true;
            status = "agent registered";
        } else {
            status = "waiting for agent registration";
        }
        progress_.publish(WaitProgress{target, wholeSeconds(waited), maxSeconds, status, checks});
        if (registered) {
            break;
        }
    }

    if (!registered) {
        out.message = fmt::format("agent on {} did not register within {}s", target, maxSeconds);
        out.code = ErrorCode::RegistrationTimeout;
        auto steps = diagnostics::registrationTroubleshooting(target);
        out.steps.insert(out.steps.end(), steps.begin(), steps.end());
        out = finish(attempt, std::move(out), started);
        notifyFailure(out, NoticeKind::RegistrationTimeout);
        co_return out;
    }
    out.steps.push_back(fmt::format("Agent registered after {} checks", checks));

    // Connectivity re-check.
    auto findings = engine_.runSingle(diagnostics::InstanceStateCheck{}, target);
    auto agent = engine_.runSingle(diagnostics::AgentRegistrationCheck{}, target);
    findings.insert(findings.end(), agent.begin(), agent.end());
    for (const auto& f : findings) {
        if (f.severity >= Severity::Error) {
            out.message = fmt::format("connectivity re-check failed: {}", f.message);
            out.code = ErrorCode::InvalidState;
            out = finish(attempt, std::move(out), started);
            notifyFailure(out, NoticeKind::AutoFixFailed);
            co_return out;
        }
    }
    out.result = FixResult::Success;
    out.message = fmt::format("instance {} is running and its agent is registered", target);
    co_return finish(attempt, std::move(out), started);
}

boost::asio::awaitable<FixOutcome> AutoFixOrchestrator::fixAgent(TargetId target) {
    if (!tryBegin(target)) {
        co_return busy(target);
    }
    TargetGuard guard(*this, target);
    const auto started = clock_->now();
    FixAttempt attempt;
    attempt.start();

    FixOutcome out;
    out.target = target;

    auto reg = facts_->describeAgentRegistration(target);
    if (!reg) {
        out.message = fmt::format("could not read agent state: {}", reg.error().message);
        out.code = reg.error().code;
        out = finish(attempt, std::move(out), started);
        notifyFailure(out, NoticeKind::AutoFixFailed);
        co_return out;
    }
    if (!reg.value().registered) {
        // A remote restart needs a registered agent.
        out.message = fmt::format("agent on {} is not registered; it cannot be restarted remotely",
                                  target);
        out.code = ErrorCode::PreconditionFailed;
        out.steps = diagnostics::registrationTroubleshooting(target);
        out = finish(attempt, std::move(out), started);
        notifyFailure(out, NoticeKind::AutoFixFailed);
        co_return out;
    }

    auto action = makeFixAction(FixActionType::RestartAgent, target,
                                fmt::format("Restart the agent on {}", target));
    if (!approved(action)) {
        out.result = FixResult::RequiresUserApproval;
        out.message = fmt::format("restarting the agent on {} was not approved", target);
        out.steps.push_back(*action.command);
        co_return finish(attempt, std::move(out), started);
    }

    spdlog::info("[AutoFix] restarting agent on {}", target);
    if (auto res = actions_->restartAgent(target); !res) {
        out.message = fmt::format("restart command failed: {}", res.error().message);
        out.code = res.error().code;
        out.steps.push_back(*action.command);
        out = finish(attempt, std::move(out), started);
        notifyFailure(out, NoticeKind::AutoFixFailed);
        co_return out;
    }
    out.steps.push_back("Restart command sent");
    co_await clock_->sleepFor(options_.agentSettleDelay);

    const auto limit = std::chrono::duration_cast<SteadyClock::duration>(options_.agentVerifyTimeout);
    const auto interval =
        std::chrono::duration_cast<SteadyClock::duration>(options_.agentVerifyInterval);
    const auto stale = engine_.config().checks.staleAgentThreshold;
    const auto verifyStart = clock_->now();
    std::uint32_t checks = 0;
    for (;;) {
        const auto waited = std::min(clock_->now() - verifyStart, limit);
        ++checks;
        auto now = facts_->describeAgentRegistration(target);
        bool online = false;
        std::string status = "waiting for agent to report Online";
        if (!now) {
            status = fmt::format("agent check failed: {}", now.error().message);
        } else {
            const auto& r = now.value();
            online = r.registered && r.pingStatus.value_or("Online") == "Online" &&
                     (!r.lastPingAge || *r.lastPingAge <= stale);
            if (online) {
                status = "agent online";
            }
        }
        progress_.publish(WaitProgress{target, wholeSeconds(waited), wholeSeconds(limit), status,
                                       checks});
        if (online) {
            out.result = FixResult::Success;
            out.message = fmt::format("agent on {} is online after restart", target);
            co_return finish(attempt, std::move(out), started);
        }
        if (waited >= limit) {
            break;
        }
        co_await clock_->sleepFor(std::min(interval, limit - waited));
    }

    out.message = fmt::format("agent on {} did not report Online within {}s of the restart",
                              target, wholeSeconds(limit));
    out.code = ErrorCode::Timeout;
    auto steps = diagnostics::registrationTroubleshooting(target);
    out.steps.insert(out.steps.end(), steps.begin(), steps.end());
    out = finish(attempt, std::move(out), started);
    notifyFailure(out, NoticeKind::AutoFixFailed);
    co_return out;
}

FixOutcome
AutoFixOrchestrator::suggestIamFixes(const TargetId& target,
                                     const std::vector<DiagnosticFinding>& findings) const {
    FixOutcome out;
    out.target = target;
    std::vector<std::string> missing;
    for (const auto& f : findings) {
        if (f.severity < Severity::Error) {
            continue;
        }
        if (const auto* p = std::get_if<diagnostics::PermissionCheck>(&f.kind)) {
            appendUnique(missing, p->action);
        }
    }
    if (missing.empty()) {
        out.result = FixResult::Success;
        out.message = "no permission issues found";
        return out;
    }
    out.result = FixResult::RequiresUserApproval;
    out.message = fmt::format("{} permission(s) missing; policy changes need your approval",
                              missing.size());
    out.steps.push_back("Identify the identity of the active profile: aws sts get-caller-identity");
    for (const auto& action : missing) {
        out.steps.push_back(fmt::format("Grant {} to that user or role", action));
    }
    out.steps.push_back(fmt::format("Confirm with: aws iam simulate-principal-policy "
                                    "--policy-source-arn <caller-arn> --action-names {}",
                                    fmt::join(missing, " ")));
    out.steps.push_back("Retry the connection");
    return out;
}

FixOutcome AutoFixOrchestrator::suggestSecurityGroupFixes(
    const TargetId& target, const std::vector<DiagnosticFinding>& findings) const {
    FixOutcome out;
    out.target = target;
    const auto& checkOptions = engine_.config().checks;
    std::size_t issues = 0;
    for (const auto& f : findings) {
        if (f.severity == Severity::Info ||
            diagnostics::checkCategory(f.kind) != CheckCategory::Network) {
            continue;
        }
        ++issues;
        if (f.recommendation) {
            appendUnique(out.steps, *f.recommendation);
        }
        for (auto& cmd : diagnostics::detailedCommandsFor(f, target, checkOptions)) {
            appendUnique(out.steps, fmt::format("Inspect: {}", cmd));
        }
    }
    if (issues == 0) {
        out.result = FixResult::Success;
        out.message = "no network issues found";
        return out;
    }
    out.result = FixResult::RequiresManualIntervention;
    out.message = fmt::format("{} network issue(s) need manual changes", issues);
    out.steps.push_back("Re-run diagnostics after applying the changes");
    return out;
}

bool AutoFixOrchestrator::verifyFix(const TargetId& target, const DiagnosticFinding& finding) {
    const auto now = engine_.runSingle(finding.kind, target);
    const auto worst = worstSeverity(now);
    const bool fixed = worst < finding.severity;
    spdlog::debug("[AutoFix] verify {} on {}: {} -> {} ({})", finding.checkName, target,
                  diagnostics::severityName(finding.severity), diagnostics::severityName(worst),
                  fixed ? "fixed" : "not fixed");
    return fixed;
}

boost::asio::awaitable<std::vector<FixOutcome>>
AutoFixOrchestrator::executeSafeFixes(TargetId target, std::vector<FixAction> actions) {
    std::vector<FixOutcome> outcomes;
    for (const auto& action : actions) {
        if (!action.isSafeToAutoExecute()) {
            spdlog::debug("[AutoFix] skipping {} on {}: needs confirmation",
                          fixActionName(action.type), target);
            continue;
        }
        const auto& subject = action.target.empty() ? target : action.target;
        switch (action.type) {
            case FixActionType::StartInstance:
                outcomes.push_back(co_await fixInstanceState(subject));
                break;
            case FixActionType::RestartAgent:
                outcomes.push_back(co_await fixAgent(subject));
                break;
            case FixActionType::SuggestIamFix:
            case FixActionType::SuggestNetworkFix:
                break;
        }
    }
    co_return outcomes;
}

} // namespace nimbus::autofix
