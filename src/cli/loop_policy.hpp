#pragma once

#include <core/types.hpp>
#include "monitor.hpp"

// What the interactive loop does once a Session has returned to Idle.
enum class LoopAction {
    Reprompt,
    Exit,
};

struct LoopDecision {
    LoopAction action = LoopAction::Reprompt;
    int exit_code = EXIT_OK;      // meaningful when action == Exit
    bool clear_screen = false;    // wipe the finished Session before the next prompt
    bool gave_up = false;         // max_consecutive_failures reached
};

// Apply the empty-command, error and restart-bound policies to one outcome.
// `consecutive_failures` carries the failure streak across Sessions.
LoopDecision decide_after_session(const SessionOutcome& outcome,
                                  const MonitorSettings& settings,
                                  int& consecutive_failures);

// Exit code for a one-shot `hpsmon send`. A lost log still ends cleanly.
int send_exit_code(const SessionOutcome& outcome);
