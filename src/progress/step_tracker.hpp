#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>

enum class StepStatus {
    Pending,
    Running,
    Done,
    Error,
    Skipped,
};

const char* step_status_name(StepStatus status);

struct Step {
    std::string key;            // unique within a tracker
    std::string label;          // display name
    StepStatus status = StepStatus::Pending;
    std::string detail;         // free text shown in parentheses
};

// Ordered set of named steps rendered as a tree.
//
// The tracker is a passive state holder: any transition is accepted at any
// time, and a transition on an unknown key creates the step (label = key).
// Ordering of the real work is the caller's business.
//
// A display can attach a refresh callback that runs after every mutation.
// The tracker does not own the display; the display must detach before it
// goes away. Not thread-safe: one workflow thread owns the tracker.
class StepTracker {
public:
    using RefreshCallback = std::function<void()>;

    explicit StepTracker(std::string title);

    void attach_refresh(RefreshCallback cb);
    void detach_refresh();

    // Register a pending step. Re-adding an existing key does nothing.
    void add(const std::string& key, const std::string& label);

    // Status transitions. A non-empty detail replaces the stored one.
    void start(const std::string& key, const std::string& detail = "");
    void complete(const std::string& key, const std::string& detail = "");
    void error(const std::string& key, const std::string& detail = "");
    void skip(const std::string& key, const std::string& detail = "");

    // Tree projection with light markup (see core/markup.hpp). No side effects.
    std::string render() const;

    const std::string& title() const { return title_; }
    const std::vector<Step>& steps() const { return steps_; }

    // nullptr if no step has this key
    const Step* find(const std::string& key) const;

private:
    void update(const std::string& key, StepStatus status, const std::string& detail);

    // Run the refresh callback; whatever it throws is discarded here so a
    // broken display can never corrupt tracker state or abort the workflow.
    void notify_best_effort() noexcept;

    std::string title_;
    std::vector<Step> steps_;
    std::unordered_map<std::string, size_t> index_;  // key -> position in steps_
    RefreshCallback refresh_cb_;
};
