#include "loop_policy.hpp"

static LoopDecision exit_with(int code) {
    LoopDecision d;
    d.action = LoopAction::Exit;
    d.exit_code = code;
    return d;
}

LoopDecision decide_after_session(const SessionOutcome& outcome,
                                  const MonitorSettings& settings,
                                  int& consecutive_failures) {
    if (outcome.error == ErrorCode::EmptyCommand) {
        if (settings.on_empty_command == EmptyCommandPolicy::Exit) {
            return exit_with(exit_code_for(outcome.error));
        }
        return LoopDecision{};
    }

    if (outcome.stop == StopReason::Interrupted) return exit_with(EXIT_INTERRUPTED);
    if (outcome.stop == StopReason::InputClosed) return exit_with(EXIT_OK);
    if (outcome.error == ErrorCode::TerminalMode) return exit_with(exit_code_for(outcome.error));

    // A lost log ends the Session but is not a protocol failure
    if (outcome.ok() || outcome.error == ErrorCode::LogLost) {
        consecutive_failures = 0;
        LoopDecision d;
        d.clear_screen = outcome.ok() && settings.clear_screen;
        return d;
    }

    // Failures stay on screen above the next prompt
    consecutive_failures++;
    if (settings.on_error == ErrorPolicy::Exit) {
        return exit_with(exit_code_for(outcome.error));
    }
    if (settings.max_consecutive_failures > 0 &&
        consecutive_failures >= settings.max_consecutive_failures) {
        LoopDecision d = exit_with(exit_code_for(outcome.error));
        d.gave_up = true;
        return d;
    }
    return LoopDecision{};
}

int send_exit_code(const SessionOutcome& outcome) {
    if (outcome.stop == StopReason::Interrupted) return EXIT_INTERRUPTED;
    if (outcome.error == ErrorCode::LogLost) return EXIT_OK;
    return exit_code_for(outcome.error);
}
