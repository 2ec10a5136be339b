#include "terminal.hpp"
#include <cstdlib>
#include <cstring>
#include <cstdio>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <sys/ioctl.h>
#  include <unistd.h>
#endif

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
#endif
}

// ── Capabilities ─────────────────────────────────────────────

bool stdout_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool ansi_enabled() {
    if (!stdout_is_tty()) return false;
    if (std::getenv("NO_COLOR")) return false;
    const char* term = std::getenv("TERM");
    if (term && std::strcmp(term, "dumb") == 0) return false;
    return true;
}

// ── HiddenCursorGuard ────────────────────────────────────────

HiddenCursorGuard::HiddenCursorGuard(std::ostream& out, bool active)
    : out_(out), active_(active) {
    if (active_) out_ << "\033[?25l" << std::flush;
}

HiddenCursorGuard::~HiddenCursorGuard() {
    if (active_) out_ << "\033[?25h" << std::flush;
}

} // namespace platform
