#pragma once

#include <ostream>

namespace platform {

// Get terminal width (columns). Falls back to 80 when stdout is not a terminal.
int term_width();

// True if stdout is attached to a terminal.
bool stdout_is_tty();

// True if colour/cursor escapes should be emitted: stdout is a terminal,
// TERM is not "dumb", and NO_COLOR is unset.
bool ansi_enabled();

// RAII guard that hides the cursor on the given stream.
// Destructor shows it again.
struct HiddenCursorGuard {
    explicit HiddenCursorGuard(std::ostream& out, bool active = true);
    ~HiddenCursorGuard();

    HiddenCursorGuard(const HiddenCursorGuard&) = delete;
    HiddenCursorGuard& operator=(const HiddenCursorGuard&) = delete;

private:
    std::ostream& out_;
    bool active_;
};

} // namespace platform
