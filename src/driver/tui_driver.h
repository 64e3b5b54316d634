#pragma once

#include "core/config.h"
#include "core/event_loop.h"
#include "driver/automation_driver.h"
#include "driver/trigger_table.h"
#include "terminal/screen_buffer.h"
#include "terminal/terminal_transport.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace easel {

namespace keys {
inline constexpr const char* ENTER = "\r";
inline constexpr const char* TAB = "\t";
inline constexpr const char* SHIFT_TAB = "\x1b[Z";
inline constexpr const char* ESCAPE = "\x1b";
inline constexpr const char* CTRL_C = "\x03";
inline constexpr const char* CTRL_D = "\x04";
}

// Drives the Claude Code CLI through its text UI: opens a terminal, launches
// the tool, then reacts to every screen change through the trigger table.
// Terminal callbacks and timers run on the event loop thread; the public
// methods may be called from any thread.
class TuiAutomationDriver : public AutomationDriver,
                            public std::enable_shared_from_this<TuiAutomationDriver> {
public:
    TuiAutomationDriver(TerminalTransport& transport, EventLoop& loop, DriverConfig config,
                        ProcessRegistry* registry = nullptr);
    TuiAutomationDriver(TerminalTransport& transport, EventLoop& loop, DriverConfig config,
                        TriggerTable triggers, ProcessRegistry* registry = nullptr);
    ~TuiAutomationDriver() override;

    void start_task(const WorkspaceSession& session, const std::string& prompt,
                    TerminalReadyCallback on_terminal_ready) override;
    void stop_task() override;
    // Without force a running tool is interrupted before its terminal is killed.
    void cleanup(bool force) override;

    bool is_session_ready() const override;
    bool is_task_running() const override;
    std::string terminal_id() const override;
    std::optional<bool> liveness() const override;

    ListenerId add_listener(DriverListener listener) override;
    void remove_listener(ListenerId id) override;

    // Last `lines` lines of the screen; the full terminal height when 0.
    std::vector<std::string> current_screen(size_t lines = 0) const;
    bool send_input(const std::string& bytes);

private:
    enum class Phase { Idle, Probing, Running, Finishing, Stopped };
    using Step = void (TuiAutomationDriver::*)(uint64_t run);

    void schedule(std::chrono::milliseconds delay, uint64_t run, Step step);
    void probe_tool(uint64_t run);
    void probe_working_directory(uint64_t run);
    void launch_tool(uint64_t run);
    void submit_prompt(uint64_t run);
    void confirm_completion(uint64_t run);

    void handle_terminal_events(const std::vector<TerminalEvent>& events);
    void handle_disconnect(const std::string& terminal_id);
    void evaluate_triggers_locked(const std::vector<std::string>& lines);
    bool send_locked(const std::string& bytes);
    void reset_run_locked();
    void emit(const DriverEvent& event);

    TerminalTransport& transport_;
    EventLoop& loop_;
    DriverConfig config_;
    TriggerTable triggers_;
    ProcessRegistry* registry_;

    mutable std::mutex mutex_;
    std::string terminal_id_;
    ScreenBuffer buffer_;
    Phase phase_ = Phase::Idle;
    uint64_t run_ = 0;
    bool task_active_ = false;
    bool session_ready_ = false;
    std::string prompt_;
    bool prompt_injected_ = false;
    bool prompt_submitted_ = false;
    bool processing_seen_ = false;
    bool done_hint_logged_ = false;
    std::string last_trigger_;
    std::string last_trigger_text_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, DriverListener> listeners_;
    ListenerId next_listener_id_ = 1;
};

}
