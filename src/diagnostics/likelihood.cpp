#include <nimbus/diagnostics/likelihood.h>

#include <algorithm>

namespace nimbus::diagnostics {

ConnectionLikelihood evaluateConnectionLikelihood(const std::vector<DiagnosticFinding>& findings) {
    int score = kLikelihoodBase;
    ConnectionLikelihood out;
    for (const auto& f : findings) {
        score -= severityPenalty(f.severity);
        if (f.severity == Severity::Critical || f.severity == Severity::Error) {
            out.blockingIssues.push_back(f.message);
        }
    }
    score = std::clamp(score, 0, 100);
    out.percentage = static_cast<std::uint8_t>(score);
    out.band = bandFor(score);
    return out;
}

} // namespace nimbus::diagnostics
