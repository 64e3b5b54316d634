#include "driver/trigger_table.h"

#include <algorithm>
#include <cctype>

namespace easel {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_right(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

}

const char* trigger_action_name(TriggerAction action) {
    switch (action) {
        case TriggerAction::SendEnter: return "send_enter";
        case TriggerAction::SendShiftTab: return "send_shift_tab";
        case TriggerAction::InjectPrompt: return "inject_prompt";
        case TriggerAction::SignalEndOfInput: return "signal_end_of_input";
        case TriggerAction::Wait: return "wait";
    }
    return "wait";
}

ScreenSnapshot ScreenSnapshot::from_lines(std::vector<std::string> lines) {
    ScreenSnapshot snapshot;
    for (const auto& line : lines) {
        snapshot.text += line;
        snapshot.text += '\n';
    }
    snapshot.lines = std::move(lines);
    return snapshot;
}

bool ScreenSnapshot::contains(const std::string& needle) const {
    return !needle.empty() && text.find(needle) != std::string::npos;
}

TriggerTable::TriggerTable(std::vector<Trigger> triggers)
    : triggers_(std::move(triggers))
{
}

TriggerTable TriggerTable::claude_code(const DriverCues& cues) {
    std::vector<Trigger> triggers;

    triggers.push_back({
        "trust_folder",
        [cues](const ScreenSnapshot& s) {
            return s.contains(cues.confirm) && s.contains(cues.trust_question);
        },
        TriggerAction::SendEnter
    });

    triggers.push_back({
        "dont_ask_again",
        [cues](const ScreenSnapshot& s) { return s.contains(cues.dont_ask_again); },
        TriggerAction::SendShiftTab
    });

    triggers.push_back({
        "inject_prompt",
        [cues](const ScreenSnapshot& s) {
            return !s.prompt_injected && s.contains(cues.empty_prompt);
        },
        TriggerAction::InjectPrompt
    });

    // The tool went back to its input box after working on the prompt.
    triggers.push_back({
        "idle_after_task",
        [cues](const ScreenSnapshot& s) {
            return s.prompt_injected && s.prompt_submitted && s.processing_seen &&
                   s.contains(cues.prompt_marker) && !s.contains(cues.try_hint) &&
                   !s.contains(cues.processing);
        },
        TriggerAction::SignalEndOfInput
    });

    triggers.push_back({
        "processing",
        [cues](const ScreenSnapshot& s) { return s.contains(cues.processing); },
        TriggerAction::Wait
    });

    return TriggerTable(std::move(triggers));
}

const Trigger* TriggerTable::evaluate(const ScreenSnapshot& snapshot) const {
    for (const auto& trigger : triggers_) {
        if (trigger.predicate && trigger.predicate(snapshot)) {
            return &trigger;
        }
    }
    return nullptr;
}

void TriggerTable::add(Trigger trigger) {
    triggers_.push_back(std::move(trigger));
}

bool looks_done(const std::vector<std::string>& lines) {
    static const char* keywords[] = {"task completed", "done", "finished", "completed", "✓"};

    size_t start = lines.size() > 5 ? lines.size() - 5 : 0;
    bool keyword = false;
    for (size_t i = start; i < lines.size(); ++i) {
        std::string lower = to_lower(lines[i]);
        for (const char* k : keywords) {
            if (lower.find(k) != std::string::npos) {
                keyword = true;
            }
        }
    }
    if (!keyword) {
        return false;
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = trim_right(*it);
        if (line.empty()) continue;
        return line.back() == '$' || line.back() == '#' || line.back() == '%';
    }
    return false;
}

}
