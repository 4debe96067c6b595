#include <nimbus/diagnostics/DiagnosticEngine.h>

#include <nimbus/resource/ResourceGovernor.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

#include <utility>
#include <boost/asio/post.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::diagnostics {

namespace {

std::vector<DiagnosticFinding> runGuarded(const CheckKind& kind, const TargetId& target,
                                          ICloudFactsClient& facts, const CheckOptions& options) {
    try {
        return runCheck(kind, target, facts, options);
    } catch (const std::exception& e) {
        spdlog::warn("[DiagnosticEngine] check {} threw: {}", checkName(kind), e.what());
        return {DiagnosticFinding{checkName(kind), kind, Severity::Warning,
                                  fmt::format("check failed unexpectedly: {}", e.what()),
                                  std::nullopt, false}};
    }
}

EngineConfig withDefaultPorts(EngineConfig config) {
    if (!config.checks.ports) {
        config.checks.ports = std::make_shared<SystemPortInspector>();
    }
    return config;
}

} // namespace

DiagnosticEngine::DiagnosticEngine(std::shared_ptr<ICloudFactsClient> facts, EngineConfig config)
    : facts_(std::move(facts)), config_(withDefaultPorts(std::move(config))) {
    if (!facts_) {
        throw std::invalid_argument("DiagnosticEngine requires a facts client");
    }
    if (config_.parallelism > 1) {
        pool_ = std::make_unique<boost::asio::thread_pool>(config_.parallelism);
    }
}

DiagnosticEngine::~DiagnosticEngine() {
    if (pool_) {
        pool_->join();
    }
}

std::size_t DiagnosticEngine::effectiveParallelism() const noexcept {
    const auto* gov = governor_.load();
    if (!pool_ || (gov && gov->isLowPower())) {
        return 1;
    }
    return config_.parallelism;
}

void DiagnosticEngine::setGovernor(const resource::ResourceGovernor* governor) {
    governor_.store(governor);
}

DiagnosticReport DiagnosticEngine::runFullDiagnostics(const TargetId& target) {
    return runChecks(target, defaultCheckSet(config_.checks));
}

std::vector<DiagnosticFinding> DiagnosticEngine::runSingle(const CheckKind& kind,
                                                           const TargetId& target) {
    return runGuarded(kind, target, *facts_, config_.checks);
}

DiagnosticReport DiagnosticEngine::runChecks(const TargetId& target,
                                             const std::vector<CheckKind>& kinds,
                                             std::optional<Duration> timeout) {
    using std::chrono::steady_clock;
    const auto budget = timeout.value_or(config_.overallTimeout);
    const auto started = steady_clock::now();
    const auto deadline = started + budget;
    const auto parallelism = effectiveParallelism();

    DiagnosticReport report;
    report.target = target;
    report.checks.reserve(kinds.size());

    if (parallelism <= 1) {
        for (const auto& kind : kinds) {
            CheckReport r{checkName(kind), kind, CheckStatus::Completed, {}};
            if (steady_clock::now() >= deadline) {
                r.status = CheckStatus::Skipped;
            } else {
                r.findings = runGuarded(kind, target, *facts_, config_.checks);
            }
            report.checks.push_back(std::move(r));
        }
    } else {
        std::vector<std::future<std::vector<DiagnosticFinding>>> pending;
        pending.reserve(kinds.size());
        for (const auto& kind : kinds) {
            auto promise = std::make_shared<std::promise<std::vector<DiagnosticFinding>>>();
            pending.push_back(promise->get_future());
            boost::asio::post(*pool_, [facts = facts_, options = config_.checks, kind, target,
                                       promise]() {
                promise->set_value(runGuarded(kind, target, *facts, options));
            });
        }
        for (std::size_t i = 0; i < kinds.size(); ++i) {
            CheckReport r{checkName(kinds[i]), kinds[i], CheckStatus::Completed, {}};
            if (pending[i].wait_until(deadline) == std::future_status::ready) {
                r.findings = pending[i].get();
            } else {
                r.status = CheckStatus::Skipped;
            }
            report.checks.push_back(std::move(r));
        }
    }

    std::stable_sort(report.checks.begin(), report.checks.end(),
                     [](const CheckReport& a, const CheckReport& b) { return a.name < b.name; });
    for (const auto& r : report.checks) {
        if (r.status == CheckStatus::Skipped) {
            ++report.skipped;
        }
    }
    report.timedOut = report.skipped > 0;
    report.findings = flattenFindings(report.checks);
    report.likelihood = diagnostics::evaluateConnectionLikelihood(report.findings);
    report.elapsed = std::chrono::duration_cast<Duration>(steady_clock::now() - started);

    if (report.timedOut) {
        spdlog::warn("[DiagnosticEngine] {}: {} of {} checks skipped after {}ms timeout", target,
                     report.skipped, report.checks.size(), budget.count());
    }
    spdlog::info("[DiagnosticEngine] {}: {} findings, likelihood {}% ({}) in {}ms", target,
                 report.findings.size(), report.likelihood.percentage,
                 bandName(report.likelihood.band), report.elapsed.count());
    return report;
}

} // namespace nimbus::diagnostics
