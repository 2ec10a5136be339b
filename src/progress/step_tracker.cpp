#include "step_tracker.hpp"
#include <core/log.hpp>
#include <core/markup.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <exception>

const char* step_status_name(StepStatus status) {
    switch (status) {
        case StepStatus::Pending: return "pending";
        case StepStatus::Running: return "running";
        case StepStatus::Done:    return "done";
        case StepStatus::Error:   return "error";
        case StepStatus::Skipped: return "skipped";
    }
    return "unknown";
}

StepTracker::StepTracker(std::string title) : title_(std::move(title)) {}

void StepTracker::attach_refresh(RefreshCallback cb) {
    refresh_cb_ = std::move(cb);
}

void StepTracker::detach_refresh() {
    refresh_cb_ = nullptr;
}

void StepTracker::add(const std::string& key, const std::string& label) {
    if (index_.count(key)) return;

    index_[key] = steps_.size();
    steps_.push_back({key, label, StepStatus::Pending, ""});
    notify_best_effort();
}

void StepTracker::start(const std::string& key, const std::string& detail) {
    update(key, StepStatus::Running, detail);
}

void StepTracker::complete(const std::string& key, const std::string& detail) {
    update(key, StepStatus::Done, detail);
}

void StepTracker::error(const std::string& key, const std::string& detail) {
    update(key, StepStatus::Error, detail);
}

void StepTracker::skip(const std::string& key, const std::string& detail) {
    update(key, StepStatus::Skipped, detail);
}

const Step* StepTracker::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &steps_[it->second];
}

void StepTracker::update(const std::string& key, StepStatus status, const std::string& detail) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        Step& s = steps_[it->second];
        s.status = status;
        if (!detail.empty()) s.detail = detail;
    } else {
        // Upsert: a transition on an unregistered key creates it. Traced
        // separately since it usually means the caller skipped add().
        forgeloop_logf("tracker '{}': auto-created step '{}' as {}",
                       title_, key, step_status_name(status));
        index_[key] = steps_.size();
        steps_.push_back({key, key, status, detail});
    }
    notify_best_effort();
}

void StepTracker::notify_best_effort() noexcept {
    if (!refresh_cb_) return;
    try {
        refresh_cb_();
    } catch (const std::exception&) {
        // display failures are not the tracker's concern
    } catch (...) {
    }
}

// ── Rendering ───────────────────────────────────────────────

static const char* status_symbol(StepStatus status) {
    switch (status) {
        case StepStatus::Done:    return "[green]\xe2\x97\x8f[/green]";          // ●
        case StepStatus::Pending: return "[green dim]\xe2\x97\x8b[/green dim]";  // ○
        case StepStatus::Running: return "[cyan]\xe2\x97\x8b[/cyan]";
        case StepStatus::Error:   return "[red]\xe2\x97\x8f[/red]";
        case StepStatus::Skipped: return "[yellow]\xe2\x97\x8b[/yellow]";
    }
    return " ";
}

std::string StepTracker::render() const {
    std::string out = fmt::format("[cyan]{}[/cyan]\n", markup::escape(title_));

    for (size_t i = 0; i < steps_.size(); i++) {
        const Step& step = steps_[i];
        bool last = (i + 1 == steps_.size());
        // ├── / └──
        const char* guide = last ? "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 "
                                 : "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 ";

        std::string label = markup::escape(step.label);
        std::string detail = markup::escape(trimmed(step.detail));
        const char* symbol = status_symbol(step.status);

        std::string line;
        if (step.status == StepStatus::Pending) {
            line = detail.empty()
                ? fmt::format("{} [bright_black]{}[/bright_black]", symbol, label)
                : fmt::format("{} [bright_black]{} ({})[/bright_black]", symbol, label, detail);
        } else {
            line = detail.empty()
                ? fmt::format("{} [white]{}[/white]", symbol, label)
                : fmt::format("{} [white]{}[/white] [bright_black]({})[/bright_black]",
                              symbol, label, detail);
        }

        out += fmt::format("[grey50]{}[/grey50]{}\n", guide, line);
    }
    return out;
}
