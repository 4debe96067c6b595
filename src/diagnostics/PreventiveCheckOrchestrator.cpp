#include <nimbus/diagnostics/PreventiveCheckOrchestrator.h>

#include <nimbus/diagnostics/checks.h>
#include <nimbus/diagnostics/troubleshooting.h>

#include <algorithm>
#include <chrono>
#include <iterator>

#include <spdlog/spdlog.h>

namespace nimbus::diagnostics {

namespace {

std::string stageName(CheckCategory category) {
    switch (category) {
        case CheckCategory::Instance:
            return "instance_state";
        case CheckCategory::Agent:
            return "agent_registration";
        case CheckCategory::Permissions:
            return "permissions";
        case CheckCategory::Network:
            return "network";
    }
    return "unknown";
}

bool hasSeverity(const std::vector<DiagnosticFinding>& findings, Severity s) {
    return std::any_of(findings.begin(), findings.end(),
                       [s](const DiagnosticFinding& f) { return f.severity == s; });
}

void appendUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

} // namespace

PreventiveCheckResult PreventiveCheckOrchestrator::run(const TargetId& target,
                                                       const PreventiveOptions& options) {
    using std::chrono::steady_clock;
    const auto started = steady_clock::now();
    const auto deadline = started + options.timeout;
    const auto& checkOptions = engine_.config().checks;
    constexpr std::size_t total = std::size(kStages);

    PreventiveCheckResult result;
    result.target = target;
    bool aborted = false;
    bool skippedAny = false;

    for (std::size_t i = 0; i < total; ++i) {
        const auto category = kStages[i];
        StageReport stage{stageName(category), category, CheckStatus::Completed, {}};
        auto kinds = checksFor(category, checkOptions);
        if (category == CheckCategory::Network && options.localPort) {
            kinds.emplace_back(LocalPortCheck{*options.localPort});
        }

        const auto now = steady_clock::now();
        if (aborted || now >= deadline) {
            stage.status = CheckStatus::Skipped;
            for (const auto& kind : kinds) {
                stage.checks.push_back(CheckReport{checkName(kind), kind, CheckStatus::Skipped, {}});
            }
            skippedAny = true;
            result.stages.push_back(std::move(stage));
            continue;
        }

        auto report = engine_.runChecks(target, kinds,
                                        std::chrono::duration_cast<Duration>(deadline - now));
        if (report.skipped > 0) {
            skippedAny = true;
        }
        stage.checks = std::move(report.checks);
        result.findings.insert(result.findings.end(), report.findings.begin(),
                               report.findings.end());
        result.stages.push_back(std::move(stage));

        progress_.publish(PreventiveCheckProgress{target, stageName(category), i + 1, total,
                                                  result.findings});
        spdlog::debug("[PreventiveCheck] {}: stage {}/{} {} done, {} findings so far", target,
                      i + 1, total, stageName(category), result.findings.size());

        if (options.abortOnCritical && hasSeverity(report.findings, Severity::Critical)) {
            spdlog::warn("[PreventiveCheck] {}: critical finding in stage {}, aborting", target,
                         stageName(category));
            aborted = true;
        }
    }

    result.likelihood = evaluateConnectionLikelihood(result.findings);
    result.authoritative = !aborted && !skippedAny;
    result.shouldAbortConnection = hasSeverity(result.findings, Severity::Critical);

    if (aborted) {
        result.status = PreventiveStatus::Aborted;
    } else if (result.shouldAbortConnection) {
        result.status = PreventiveStatus::Critical;
    } else if (skippedAny || hasSeverity(result.findings, Severity::Error) ||
               hasSeverity(result.findings, Severity::Warning)) {
        result.status = PreventiveStatus::Warning;
    } else {
        result.status = PreventiveStatus::Ready;
    }

    for (const auto& f : result.findings) {
        if (f.severity == Severity::Info) {
            continue;
        }
        for (const auto& cmd : detailedCommandsFor(f, target, checkOptions)) {
            appendUnique(result.suggestedCommands, cmd);
        }
        const auto category = checkCategory(f.kind);
        if (result.troubleshooting.find(category) == result.troubleshooting.end()) {
            result.troubleshooting.emplace(category,
                                           troubleshootingFor(category, target, checkOptions));
        }
        if (f.recommendation) {
            appendUnique(result.recommendations, *f.recommendation);
        }
    }
    if (result.recommendations.empty() && result.status == PreventiveStatus::Ready) {
        result.recommendations.emplace_back(
            "All prerequisites are met; the connection can proceed");
    }

    result.duration =
        std::chrono::duration_cast<Duration>(steady_clock::now() - started);
    spdlog::info("[PreventiveCheck] {}: {} (likelihood {}%{}) in {}ms", target,
                 preventiveStatusName(result.status), result.likelihood.percentage,
                 result.authoritative ? "" : ", partial", result.duration.count());
    return result;
}

} // namespace nimbus::diagnostics
