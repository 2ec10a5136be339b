#include "live_display.hpp"
#include <core/markup.hpp>
#include <sstream>

LiveDisplay::LiveDisplay(StepTracker& tracker, std::ostream& out, bool ansi,
                         int refresh_ms, int width)
    : tracker_(tracker),
      out_(out),
      ansi_(ansi),
      min_interval_(refresh_ms),
      width_(width > 0 ? width : platform::term_width()) {
    if (ansi_) {
        cursor_ = std::make_unique<platform::HiddenCursorGuard>(out_);
    }
    tracker_.attach_refresh([this]() { refresh(); });
    refresh();
}

LiveDisplay::~LiveDisplay() {
    tracker_.detach_refresh();
    finish();
}

std::vector<StepStatus> LiveDisplay::status_signature() const {
    std::vector<StepStatus> sig;
    sig.reserve(tracker_.steps().size());
    for (const auto& s : tracker_.steps()) sig.push_back(s.status);
    return sig;
}

void LiveDisplay::refresh() {
    if (finished_ || !ansi_) return;

    std::string rendered = tracker_.render();
    if (rendered == last_rendered_ && redraws_ > 0) return;

    auto sig = status_signature();
    auto now = std::chrono::steady_clock::now();
    bool structural = (sig != last_signature_);
    if (!structural && redraws_ > 0 && now - last_draw_ < min_interval_) {
        return;  // detail-only change inside the window; finish() catches up
    }

    last_signature_ = std::move(sig);
    draw(rendered);
}

void LiveDisplay::finish() {
    if (finished_) return;
    finished_ = true;

    std::string rendered = tracker_.render();
    if (ansi_) {
        if (rendered != last_rendered_ || redraws_ == 0) draw(rendered);
        cursor_.reset();
    } else {
        out_ << markup::strip(rendered) << std::flush;
        redraws_++;
    }
}

// Terminal rows the text occupies, counting soft wraps at width_
int LiveDisplay::rows_for(const std::string& rendered) const {
    int rows = 0;
    std::istringstream ss(markup::strip(rendered));
    std::string line;
    while (std::getline(ss, line)) {
        int cols = 0;
        for (unsigned char c : line) {
            if ((c & 0xC0) != 0x80) cols++;  // count UTF-8 lead bytes only
        }
        rows += cols == 0 ? 1 : (cols + width_ - 1) / width_;
    }
    return rows;
}

void LiveDisplay::draw(const std::string& rendered) {
    if (rows_drawn_ > 0) {
        // Back to the first row of the previous frame, clear to end of screen
        out_ << "\033[" << rows_drawn_ << "F\033[J";
    }
    out_ << markup::to_ansi(rendered) << std::flush;

    rows_drawn_ = rows_for(rendered);
    last_rendered_ = rendered;
    last_draw_ = std::chrono::steady_clock::now();
    redraws_++;
}
