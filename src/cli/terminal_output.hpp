#pragma once

#include <string>

// Terminal output processing for streamed log text.
//
// Log bytes are passed through verbatim except for sequences that would wipe
// or take over the operator's screen while the monitor is following: alt
// screen enter/exit, clear screen, clear scrollback, cursor home and full
// reset. Nothing else is altered.
namespace TerminalOutput {

// Strip destructive sequences (clear, home, alt screen) from a complete text.
std::string filter_for_display(const std::string& text);

// Streaming form of filter_for_display for text that arrives in chunks.
// A chunk ending in the first bytes of a destructive sequence holds those
// bytes back until the next chunk shows whether the sequence completes.
class DisplayFilter {
public:
    std::string feed(const std::string& chunk);

    // Release held-back bytes (end of stream).
    std::string flush();

private:
    std::string pending_;
};

// Write all bytes to stdout, retrying on short writes.
void write_stdout(const std::string& text);

} // namespace TerminalOutput
