#pragma once

#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <platform/terminal.hpp>
#include "step_tracker.hpp"

// Keeps a StepTracker's tree current on a terminal.
//
// Attaches itself as the tracker's refresh callback on construction and
// detaches on destruction. With ANSI enabled the tree is redrawn in place;
// a redraw happens at once when any step's status changes or a step is
// added, while detail-only updates (download progress) are coalesced to at
// most one redraw per refresh interval. Without ANSI nothing is drawn until
// finish(), which prints the final tree once with markup stripped.
class LiveDisplay {
public:
    LiveDisplay(StepTracker& tracker, std::ostream& out, bool ansi,
                int refresh_ms, int width = 0);
    ~LiveDisplay();

    LiveDisplay(const LiveDisplay&) = delete;
    LiveDisplay& operator=(const LiveDisplay&) = delete;

    // Refresh callback bound to the tracker
    void refresh();

    // Final redraw (always, bypasses coalescing); restores the cursor.
    // Safe to call more than once.
    void finish();

    int redraw_count() const { return redraws_; }

private:
    void draw(const std::string& rendered);
    std::vector<StepStatus> status_signature() const;
    int rows_for(const std::string& rendered) const;

    StepTracker& tracker_;
    std::ostream& out_;
    bool ansi_;
    std::chrono::milliseconds min_interval_;
    int width_;

    std::unique_ptr<platform::HiddenCursorGuard> cursor_;
    std::chrono::steady_clock::time_point last_draw_{};
    std::string last_rendered_;
    std::vector<StepStatus> last_signature_;
    int rows_drawn_ = 0;
    int redraws_ = 0;
    bool finished_ = false;
};
