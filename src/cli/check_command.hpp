#pragma once

#include <ostream>
#include <core/config.hpp>
#include <progress/step_tracker.hpp>

// `forgeloop check`: report which of git and the CLI-based agents are on PATH.
// Missing tools are informational, so the exit code is always 0.
class CheckCommand {
public:
    CheckCommand(const Config& config, std::ostream& out, bool ansi);

    int run();

    const StepTracker& tracker() const { return tracker_; }

private:
    const Config& config_;
    std::ostream& out_;
    bool ansi_;
    StepTracker tracker_;
};
