#pragma once

#include "core/types.h"
#include "process/process_registry.h"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace easel {

struct TaskStarted {};

struct ScreenUpdated {
    std::vector<std::string> lines;
};

struct TaskCompleted {};

struct TaskFailed {
    std::string message;
};

struct SessionReady {};

using DriverEvent = std::variant<TaskStarted, ScreenUpdated, TaskCompleted, TaskFailed, SessionReady>;

using DriverListener = std::function<void(const DriverEvent& event)>;
using TerminalReadyCallback = std::function<void(const std::string& terminal_id)>;

// Steers one interactive CLI tool inside one terminal.
class AutomationDriver : public ManagedProcess {
public:
    using ListenerId = size_t;

    // Throws AlreadyRunningError when a task is active on this instance.
    virtual void start_task(const WorkspaceSession& session, const std::string& prompt,
                            TerminalReadyCallback on_terminal_ready) = 0;
    // Interrupts the tool and keeps the terminal for reuse.
    virtual void stop_task() = 0;
    // Kills the terminal, clears all state and leaves the process registry.
    virtual void cleanup(bool force) = 0;

    virtual bool is_session_ready() const = 0;
    virtual bool is_task_running() const = 0;
    virtual std::string terminal_id() const = 0;

    virtual ListenerId add_listener(DriverListener listener) = 0;
    virtual void remove_listener(ListenerId id) = 0;
};

}
