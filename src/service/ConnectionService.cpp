#include <nimbus/service/ConnectionService.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::service {

using diagnostics::CheckCategory;
using diagnostics::Severity;

namespace {

template <typename T, typename F> boost::asio::awaitable<T> callBlocking(F fn) {
    co_return fn();
}

// Runs a blocking call on `pool` and resumes the caller on its own executor
// when it is done. `fn` is a parameter of a named coroutine so it lives in
// that coroutine's frame.
template <typename T, typename F>
boost::asio::awaitable<T> offload(boost::asio::thread_pool& pool, F fn) {
    return boost::asio::co_spawn(pool.get_executor(), callBlocking<T>(std::move(fn)),
                                 boost::asio::use_awaitable);
}

bool planHas(const std::vector<autofix::FixAction>& plan, autofix::FixActionType type) {
    return std::any_of(plan.begin(), plan.end(),
                       [type](const autofix::FixAction& a) { return a.type == type; });
}

} // namespace

ConnectionService::ConnectionService(config::NimbusConfig config, ServiceDependencies deps,
                                     boost::asio::any_io_executor executor)
    : config_(std::move(config)), executor_(std::move(executor)), deps_(std::move(deps)) {
    if (!deps_.broker || !deps_.probe || !deps_.facts || !deps_.actions) {
        throw std::invalid_argument(
            "ConnectionService requires broker, probe, facts and actions clients");
    }
    if (auto valid = config_.validate(); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
    if (!deps_.store) {
        deps_.store = std::make_shared<session::InMemorySessionStore>();
    }
    if (!deps_.sampler) {
        deps_.sampler = std::make_shared<resource::ProcResourceSampler>();
    }
    if (!deps_.clock) {
        deps_.clock = std::make_shared<SystemClock>();
    }

    governor_ =
        std::make_unique<resource::ResourceGovernor>(deps_.sampler, deps_.clock, config_.resources);
    sessions_ = std::make_unique<session::SessionManager>(deps_.broker, deps_.store, deps_.clock,
                                                          config_.session);
    engine_ = std::make_unique<diagnostics::DiagnosticEngine>(deps_.facts, config_.diagnostics);
    preventive_ = std::make_unique<diagnostics::PreventiveCheckOrchestrator>(*engine_);
    autofix_ = std::make_unique<autofix::AutoFixOrchestrator>(*engine_, deps_.facts, deps_.actions,
                                                              deps_.clock, config_.autofix);
    monitor_ = std::make_unique<session::HealthMonitor>(*sessions_, deps_.probe, deps_.clock,
                                                        executor_, config_.monitor);
    reconnector_ = std::make_unique<session::AutoReconnector>(*sessions_, deps_.clock, executor_,
                                                              config_.reconnection);

    auto* sessions = sessions_.get();
    governor_->setActiveSessionSource([sessions] { return sessions->occupiedSlots(); });
    sessions_->setGovernor(governor_.get());
    engine_->setGovernor(governor_.get());
    monitor_->setGovernor(governor_.get());

    reconnector_->notices().subscribe([this](const TerminalNotice& n) { notices_.publish(n); });
    autofix_->notices().subscribe([this](const TerminalNotice& n) { notices_.publish(n); });
}

ConnectionService::~ConnectionService() {
    stop();
    blockingPool_.join();
}

void ConnectionService::start() {
    if (started_) {
        return;
    }
    started_ = true;
    governor_->start(executor_);
    reconnector_->attach();
    spdlog::info("[ConnectionService] started (caps {}/target, {} global)",
                 config_.session.maxSessionsPerTarget, config_.session.maxSessionsGlobal);
}

void ConnectionService::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    reconnector_->detach();
    monitor_->stopAll();
    governor_->stop();
    spdlog::info("[ConnectionService] stopped");
}

boost::asio::awaitable<Result<session::Session>>
ConnectionService::connect(session::SessionConfig config, ConnectOptions options) {
    if (config.targetId.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "target id is required"};
    }

    if (options.reuseExisting) {
        auto existing = sessions_->findExistingSessions(config.targetId, config.remotePort);
        auto reuse = session::SessionManager::suggestReuse(existing);
        if (reuse && reuse->status == session::SessionStatus::Active) {
            spdlog::info("[ConnectionService] reusing session {} for {}", reuse->id,
                         config.targetId);
            co_return *reuse;
        }
    }

    if (options.preventiveCheck.value_or(config_.preventiveCheck)) {
        std::optional<std::uint16_t> localPort;
        if (config.localPort != 0) {
            localPort = config.localPort;
        }
        auto check = co_await runPreventiveCheck(config.targetId, localPort);
        if (check.shouldAbortConnection) {
            const bool permissionBlocked =
                std::any_of(check.findings.begin(), check.findings.end(), [](const auto& f) {
                    return f.severity >= Severity::Error &&
                           diagnostics::checkCategory(f.kind) == CheckCategory::Permissions;
                });
            const auto code =
                permissionBlocked ? ErrorCode::AuthorizationError : ErrorCode::InvalidState;
            const auto& blocking = check.likelihood.blockingIssues;
            auto message = fmt::format("connection to {} aborted: {}", config.targetId,
                                       blocking.empty() ? std::string("critical finding")
                                                        : blocking.front());
            spdlog::warn("[ConnectionService] {}", message);
            notices_.publish(TerminalNotice{NoticeKind::ConnectionAborted, config.targetId, code,
                                            message, check.recommendations});
            co_return Error{code, std::move(message), check.recommendations};
        }
        if (check.status != diagnostics::PreventiveStatus::Ready) {
            spdlog::warn("[ConnectionService] {}: proceeding with {} findings (likelihood {}%)",
                         config.targetId, diagnostics::preventiveStatusName(check.status),
                         check.likelihood.percentage);
        }
    }

    auto created = sessions_->createSession(config);
    if (!created) {
        co_return created.error();
    }
    auto session = std::move(created).value();
    if (options.monitor) {
        if (auto m = monitor_->startMonitoring(session.id); !m) {
            spdlog::warn("[ConnectionService] monitoring {} not started: {}", session.id,
                         m.error().message);
        }
    }
    co_return session;
}

Result<void> ConnectionService::disconnect(const session::SessionId& id) {
    return sessions_->terminateSession(id, "disconnect requested");
}

void ConnectionService::disconnectAll() {
    sessions_->terminateAll("disconnect requested");
}

std::vector<session::Session> ConnectionService::listSessions() const {
    return sessions_->listSessions();
}

Result<session::HealthSnapshot>
ConnectionService::healthSnapshot(const session::SessionId& id) const {
    return monitor_->checkHealth(id);
}

resource::ResourceUsage ConnectionService::resourceUsage() const {
    return sessions_->monitorResourceUsage();
}

boost::asio::awaitable<diagnostics::DiagnosticReport>
ConnectionService::runDiagnostics(diagnostics::TargetId target) {
    auto* engine = engine_.get();
    co_return co_await offload<diagnostics::DiagnosticReport>(
        blockingPool_, [engine, target] { return engine->runFullDiagnostics(target); });
}

boost::asio::awaitable<diagnostics::PreventiveCheckResult>
ConnectionService::runPreventiveCheck(diagnostics::TargetId target,
                                      std::optional<std::uint16_t> localPort) {
    auto* preventive = preventive_.get();
    auto options = config_.preventive;
    options.localPort = localPort;
    co_return co_await offload<diagnostics::PreventiveCheckResult>(
        blockingPool_, [preventive, target, options] { return preventive->run(target, options); });
}

boost::asio::awaitable<AutoFixReport> ConnectionService::autoFix(diagnostics::TargetId target) {
    AutoFixReport report;
    report.target = target;
    report.diagnostics = co_await runDiagnostics(target);
    report.plan = autofix_->planFixes(report.diagnostics.findings, target);

    report.outcomes = co_await autofix_->executeSafeFixes(target, report.plan);

    using autofix::FixActionType;
    // A started instance re-registers its agent; no separate restart.
    if (planHas(report.plan, FixActionType::RestartAgent) &&
        !planHas(report.plan, FixActionType::StartInstance)) {
        report.outcomes.push_back(co_await autofix_->fixAgent(target));
    }
    if (planHas(report.plan, FixActionType::SuggestIamFix)) {
        report.outcomes.push_back(autofix_->suggestIamFixes(target, report.diagnostics.findings));
    }
    if (planHas(report.plan, FixActionType::SuggestNetworkFix)) {
        report.outcomes.push_back(
            autofix_->suggestSecurityGroupFixes(target, report.diagnostics.findings));
    }
    spdlog::info("[ConnectionService] auto-fix for {}: {} actions planned, {} outcomes", target,
                 report.plan.size(), report.outcomes.size());
    co_return report;
}

} // namespace nimbus::service
