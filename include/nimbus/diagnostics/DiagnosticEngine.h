#pragma once

#include <nimbus/core/types.h>
#include <nimbus/diagnostics/checks.h>
#include <nimbus/diagnostics/cloud_facts.h>
#include <nimbus/diagnostics/finding.h>
#include <nimbus/diagnostics/likelihood.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <utility>
#include <boost/asio/thread_pool.hpp>

namespace nimbus::resource {
class ResourceGovernor;
}

namespace nimbus::diagnostics {

struct EngineConfig {
    // 1 runs checks sequentially on the calling thread.
    std::size_t parallelism{4};
    Duration overallTimeout{30000};
    CheckOptions checks;
};

struct DiagnosticReport {
    TargetId target;
    std::vector<CheckReport> checks;         // sorted by check name
    std::vector<DiagnosticFinding> findings; // completed checks only, same order
    ConnectionLikelihood likelihood;
    std::size_t skipped{0};
    bool timedOut{false};
    Duration elapsed{0};
};

// Runs checks against the facts client. Facts calls block, so checks run on
// a bounded thread pool; the caller waits until every check finished or the
// overall timeout passed. Checks still running at the deadline are reported
// as Skipped and their late results are dropped.
//
// In low-power mode checks run sequentially regardless of `parallelism`.
class DiagnosticEngine {
public:
    explicit DiagnosticEngine(std::shared_ptr<ICloudFactsClient> facts, EngineConfig config = {});
    ~DiagnosticEngine();

    DiagnosticEngine(const DiagnosticEngine&) = delete;
    DiagnosticEngine& operator=(const DiagnosticEngine&) = delete;

    DiagnosticReport runFullDiagnostics(const TargetId& target);
    // `timeout` overrides the configured overall timeout for this run.
    DiagnosticReport runChecks(const TargetId& target, const std::vector<CheckKind>& kinds,
                               std::optional<Duration> timeout = std::nullopt);

    // One check on the calling thread, no timeout.
    std::vector<DiagnosticFinding> runSingle(const CheckKind& kind, const TargetId& target);

    static ConnectionLikelihood
    evaluateConnectionLikelihood(const std::vector<DiagnosticFinding>& findings) {
        return diagnostics::evaluateConnectionLikelihood(findings);
    }

    [[nodiscard]] std::size_t effectiveParallelism() const noexcept;
    void setGovernor(const resource::ResourceGovernor* governor);

    const EngineConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<ICloudFactsClient> facts_;
    const EngineConfig config_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<const resource::ResourceGovernor*> governor_{nullptr};
};

} // namespace nimbus::diagnostics
