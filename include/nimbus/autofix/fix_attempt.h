#pragma once

#include <nimbus/core/types.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nimbus::autofix {

enum class FixResult : std::uint8_t {
    Success,
    Failed,
    RequiresUserApproval,
    RequiresManualIntervention
};

constexpr std::string_view fixResultName(FixResult r) noexcept {
    switch (r) {
        case FixResult::Success:
            return "Success";
        case FixResult::Failed:
            return "Failed";
        case FixResult::RequiresUserApproval:
            return "RequiresUserApproval";
        case FixResult::RequiresManualIntervention:
            return "RequiresManualIntervention";
    }
    return "Unknown";
}

struct FixOutcome {
    std::string target;
    FixResult result{FixResult::Failed};
    std::string message;
    std::vector<std::string> steps; // ordered, human-actionable
    std::optional<ErrorCode> code;  // set when Failed
    Duration elapsed{0};
};

// Lifecycle of one remediation attempt: Pending -> InProgress -> terminal.
// Terminal states are absorbing; a retry is a new FixAttempt.
class FixAttempt {
public:
    enum class State {
        Pending,
        InProgress,
        Success,
        Failed,
        RequiresUserApproval,
        RequiresManualIntervention
    };

    using Callback = std::function<void(State)>;

    State state() const noexcept { return state_; }
    bool terminal() const noexcept {
        return state_ != State::Pending && state_ != State::InProgress;
    }

    std::optional<FixResult> result() const noexcept {
        switch (state_) {
            case State::Success:
                return FixResult::Success;
            case State::Failed:
                return FixResult::Failed;
            case State::RequiresUserApproval:
                return FixResult::RequiresUserApproval;
            case State::RequiresManualIntervention:
                return FixResult::RequiresManualIntervention;
            default:
                return std::nullopt;
        }
    }

    bool start() noexcept { return transition(State::Pending, State::InProgress); }
    bool finish(FixResult r) noexcept { return transition(State::InProgress, terminalFor(r)); }

    void set_on_state_change(Callback cb) { on_state_change_ = std::move(cb); }

    static const char* to_string(State s) noexcept {
        switch (s) {
            case State::Pending:
                return "Pending";
            case State::InProgress:
                return "InProgress";
            case State::Success:
                return "Success";
            case State::Failed:
                return "Failed";
            case State::RequiresUserApproval:
                return "RequiresUserApproval";
            case State::RequiresManualIntervention:
                return "RequiresManualIntervention";
        }
        return "Unknown";
    }

private:
    static State terminalFor(FixResult r) noexcept {
        switch (r) {
            case FixResult::Success:
                return State::Success;
            case FixResult::Failed:
                return State::Failed;
            case FixResult::RequiresUserApproval:
                return State::RequiresUserApproval;
            case FixResult::RequiresManualIntervention:
                return State::RequiresManualIntervention;
        }
        return State::Failed;
    }

    bool transition(State expect, State next) noexcept {
        if (state_ != expect)
            return false;
        state_ = next;
        if (on_state_change_)
            on_state_change_(state_);
        return true;
    }

    State state_{State::Pending};
    Callback on_state_change_{};
};

} // namespace nimbus::autofix
