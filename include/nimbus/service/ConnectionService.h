#pragma once

#include <nimbus/autofix/AutoFixOrchestrator.h>
#include <nimbus/config/nimbus_config.h>
#include <nimbus/core/clock.h>
#include <nimbus/core/event_hub.h>
#include <nimbus/core/notice.h>
#include <nimbus/core/types.h>
#include <nimbus/diagnostics/DiagnosticEngine.h>
#include <nimbus/diagnostics/PreventiveCheckOrchestrator.h>
#include <nimbus/diagnostics/cloud_facts.h>
#include <nimbus/resource/ResourceGovernor.h>
#include <nimbus/resource/resource_sampler.h>
#include <nimbus/session/AutoReconnector.h>
#include <nimbus/session/HealthMonitor.h>
#include <nimbus/session/SessionManager.h>
#include <nimbus/session/broker.h>
#include <nimbus/session/probe.h>
#include <nimbus/session/session_store.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

namespace nimbus::service {

// External collaborators. broker, probe, facts and actions are required;
// the rest default to InMemorySessionStore, ProcResourceSampler and SystemClock.
struct ServiceDependencies {
    std::shared_ptr<session::ISessionBroker> broker;
    std::shared_ptr<session::ISessionProbe> probe;
    std::shared_ptr<diagnostics::ICloudFactsClient> facts;
    std::shared_ptr<diagnostics::ICloudActionsClient> actions;
    std::shared_ptr<session::ISessionStore> store;
    std::shared_ptr<resource::IResourceSampler> sampler;
    std::shared_ptr<Clock> clock;
};

struct ConnectOptions {
    // Overrides NimbusConfig::preventiveCheck when set.
    std::optional<bool> preventiveCheck;
    // Return a live session to the same target and port instead of creating one.
    bool reuseExisting{false};
    bool monitor{true};
};

struct AutoFixReport {
    diagnostics::TargetId target;
    diagnostics::DiagnosticReport diagnostics;
    std::vector<autofix::FixAction> plan;
    std::vector<autofix::FixOutcome> outcomes;
};

// Facade over the session lifecycle core. Owns every component and wires
// them: governor -> monitor/engine cadence, monitor events -> reconnector,
// termination -> monitor/reconnector cancellation.
class ConnectionService {
public:
    ConnectionService(config::NimbusConfig config, ServiceDependencies deps,
                      boost::asio::any_io_executor executor);
    ~ConnectionService();

    ConnectionService(const ConnectionService&) = delete;
    ConnectionService& operator=(const ConnectionService&) = delete;

    // Starts resource sampling and reconnection handling.
    void start();
    // Stops background work; sessions stay registered.
    void stop();

    // Optional preventive check, then createSession and monitoring. A
    // Critical finding aborts before the broker is called; the error carries
    // the recommendations and a ConnectionAborted notice is published.
    boost::asio::awaitable<Result<session::Session>> connect(session::SessionConfig config,
                                                             ConnectOptions options = {});
    Result<void> disconnect(const session::SessionId& id);
    void disconnectAll();

    std::vector<session::Session> listSessions() const;
    Result<session::HealthSnapshot> healthSnapshot(const session::SessionId& id) const;
    resource::ResourceUsage resourceUsage() const;

    boost::asio::awaitable<diagnostics::DiagnosticReport>
    runDiagnostics(diagnostics::TargetId target);
    // `localPort` adds the local port check to the network stage.
    boost::asio::awaitable<diagnostics::PreventiveCheckResult>
    runPreventiveCheck(diagnostics::TargetId target,
                       std::optional<std::uint16_t> localPort = std::nullopt);
    // Diagnoses, runs safe fixes, asks for approval-gated ones, and returns
    // suggestions for the rest.
    boost::asio::awaitable<AutoFixReport> autoFix(diagnostics::TargetId target);

    EventHub<session::SessionEvent>& sessionEvents() noexcept { return sessions_->events(); }
    EventHub<autofix::WaitProgress>& waitProgress() noexcept { return autofix_->waitProgress(); }
    EventHub<diagnostics::PreventiveCheckProgress>& preventiveProgress() noexcept {
        return preventive_->progress();
    }
    EventHub<resource::PowerModeChange>& powerModeChanges() noexcept {
        return governor_->modeChanges();
    }
    // Notices from the reconnector, auto-fix and aborted connects.
    EventHub<TerminalNotice>& notices() noexcept { return notices_; }

    session::SessionManager& sessions() noexcept { return *sessions_; }
    session::HealthMonitor& monitor() noexcept { return *monitor_; }
    session::AutoReconnector& reconnector() noexcept { return *reconnector_; }
    autofix::AutoFixOrchestrator& autoFixer() noexcept { return *autofix_; }
    const config::NimbusConfig& config() const noexcept { return config_; }

private:
    const config::NimbusConfig config_;
    boost::asio::any_io_executor executor_;
    ServiceDependencies deps_;

    EventHub<TerminalNotice> notices_;
    // Runs blocking diagnostics off the io thread.
    boost::asio::thread_pool blockingPool_{1};

    std::unique_ptr<resource::ResourceGovernor> governor_;
    std::unique_ptr<session::SessionManager> sessions_;
    std::unique_ptr<diagnostics::DiagnosticEngine> engine_;
    std::unique_ptr<diagnostics::PreventiveCheckOrchestrator> preventive_;
    std::unique_ptr<autofix::AutoFixOrchestrator> autofix_;
    std::unique_ptr<session::HealthMonitor> monitor_;
    std::unique_ptr<session::AutoReconnector> reconnector_;

    bool started_{false};
};

} // namespace nimbus::service
