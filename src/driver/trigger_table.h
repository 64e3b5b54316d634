#pragma once

#include "core/config.h"

#include <functional>
#include <string>
#include <vector>

namespace easel {

enum class TriggerAction {
    SendEnter,
    SendShiftTab,
    InjectPrompt,
    SignalEndOfInput,
    Wait
};

const char* trigger_action_name(TriggerAction action);

// What a trigger predicate sees: the visible window plus the run's progress.
struct ScreenSnapshot {
    std::vector<std::string> lines;
    std::string text;
    bool prompt_injected = false;
    bool prompt_submitted = false;
    bool processing_seen = false;

    static ScreenSnapshot from_lines(std::vector<std::string> lines);
    bool contains(const std::string& needle) const;
};

struct Trigger {
    std::string name;
    std::function<bool(const ScreenSnapshot&)> predicate;
    TriggerAction action;
};

// Prioritized (predicate, action) rules; the first match wins.
class TriggerTable {
public:
    TriggerTable() = default;
    explicit TriggerTable(std::vector<Trigger> triggers);

    // Rules for the Claude Code text UI, built from the configured cues.
    static TriggerTable claude_code(const DriverCues& cues);

    const Trigger* evaluate(const ScreenSnapshot& snapshot) const;

    void add(Trigger trigger);
    const std::vector<Trigger>& triggers() const { return triggers_; }

private:
    std::vector<Trigger> triggers_;
};

// Secondary idle heuristic: a completion keyword in the last five lines while
// a shell prompt is showing. Only ever used as a diagnostic hint.
bool looks_done(const std::vector<std::string>& lines);

}
