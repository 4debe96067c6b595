#pragma once

#include <nimbus/diagnostics/finding.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::diagnostics {

enum class LikelihoodBand : std::uint8_t { VeryHigh, High, Medium, Low, VeryLow };

constexpr std::string_view bandName(LikelihoodBand band) noexcept {
    switch (band) {
        case LikelihoodBand::VeryHigh:
            return "VeryHigh";
        case LikelihoodBand::High:
            return "High";
        case LikelihoodBand::Medium:
            return "Medium";
        case LikelihoodBand::Low:
            return "Low";
        case LikelihoodBand::VeryLow:
            return "VeryLow";
    }
    return "Unknown";
}

inline constexpr int kLikelihoodBase = 95;

constexpr int severityPenalty(Severity s) noexcept {
    switch (s) {
        case Severity::Critical:
            return 85;
        case Severity::Error:
            return 55;
        case Severity::Warning:
            return 25;
        case Severity::Info:
            return 0;
    }
    return 0;
}

// Preset thresholds: 90 / 70 / 40 / 10.
constexpr LikelihoodBand bandFor(int percentage) noexcept {
    if (percentage >= 90) {
        return LikelihoodBand::VeryHigh;
    }
    if (percentage >= 70) {
        return LikelihoodBand::High;
    }
    if (percentage >= 40) {
        return LikelihoodBand::Medium;
    }
    if (percentage >= 10) {
        return LikelihoodBand::Low;
    }
    return LikelihoodBand::VeryLow;
}

struct ConnectionLikelihood {
    std::uint8_t percentage{0};
    LikelihoodBand band{LikelihoodBand::VeryLow};
    // Messages of Critical and Error findings, in input order.
    std::vector<std::string> blockingIssues;
};

// Pure: depends only on the multiset of severities (plus messages for the
// blocking list). Skipped checks contribute no findings.
ConnectionLikelihood evaluateConnectionLikelihood(const std::vector<DiagnosticFinding>& findings);

} // namespace nimbus::diagnostics
