#include "driver/tui_driver.h"
#include "core/error.h"
#include "core/logging.h"

#include <algorithm>

namespace easel {

namespace {

constexpr int MIN_ROWS = 24;
constexpr int MIN_COLS = 80;

std::string join_lines(const std::vector<std::string>& lines, size_t tail) {
    std::string out;
    size_t start = lines.size() > tail ? lines.size() - tail : 0;
    for (size_t i = start; i < lines.size(); ++i) {
        if (!out.empty()) out += " | ";
        out += lines[i];
    }
    return out;
}

}

TuiAutomationDriver::TuiAutomationDriver(TerminalTransport& transport, EventLoop& loop, DriverConfig config,
                                         ProcessRegistry* registry)
    : TuiAutomationDriver(transport, loop, config, TriggerTable::claude_code(config.cues), registry)
{
}

TuiAutomationDriver::TuiAutomationDriver(TerminalTransport& transport, EventLoop& loop, DriverConfig config,
                                         TriggerTable triggers, ProcessRegistry* registry)
    : transport_(transport)
    , loop_(loop)
    , config_(std::move(config))
    , triggers_(std::move(triggers))
    , registry_(registry)
{
    config_.rows = std::max(MIN_ROWS, config_.rows);
    config_.cols = std::max(MIN_COLS, config_.cols);
}

TuiAutomationDriver::~TuiAutomationDriver() {
    if (!terminal_id_.empty()) {
        transport_.kill(terminal_id_);
    }
}

void TuiAutomationDriver::start_task(const WorkspaceSession& session, const std::string& prompt,
                                     TerminalReadyCallback on_terminal_ready) {
    bool reuse = false;
    uint64_t run = 0;
    std::string stale_terminal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (task_active_) {
            throw AlreadyRunningError("A task is already running on this driver");
        }
        reuse = session_ready_ && !terminal_id_.empty() && transport_.is_alive(terminal_id_);
        if (!reuse && !terminal_id_.empty()) {
            stale_terminal = terminal_id_;
            terminal_id_.clear();
        }
        task_active_ = true;
        session_ready_ = false;
        reset_run_locked();
        run = run_;
        prompt_ = prompt;
        phase_ = Phase::Probing;
    }

    if (!stale_terminal.empty()) {
        transport_.kill(stale_terminal);
    }

    std::string terminal;
    if (reuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal = terminal_id_;
        log::get("driver")->info("Reusing terminal {} for new task", terminal);
    } else {
        TerminalSpec spec;
        spec.lines = config_.rows;
        spec.cols = config_.cols;
        spec.session = session;

        try {
            terminal = transport_.connect(spec);
        } catch (const TransportError& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                task_active_ = false;
                phase_ = Phase::Idle;
            }
            log::get("driver")->error("Failed to open terminal: {}", e.what());
            emit(TaskFailed{e.what()});
            throw;
        }

        {
            // The transport may deliver the first full screen as soon as a
            // listener is attached.
            std::lock_guard<std::mutex> lock(mutex_);
            terminal_id_ = terminal;
            buffer_.clear();
        }

        std::weak_ptr<TuiAutomationDriver> weak = weak_from_this();
        transport_.on_event(terminal, [weak](const std::vector<TerminalEvent>& events) {
            if (auto self = weak.lock()) {
                self->handle_terminal_events(events);
            }
        });
        transport_.on_disconnect(terminal, [weak, terminal]() {
            if (auto self = weak.lock()) {
                self->handle_disconnect(terminal);
            }
        });
    }

    if (on_terminal_ready) {
        on_terminal_ready(terminal);
    }

    if (reuse) {
        schedule(std::chrono::milliseconds(0), run, &TuiAutomationDriver::launch_tool);
    } else {
        schedule(std::chrono::milliseconds(config_.warmup_ms), run, &TuiAutomationDriver::probe_tool);
    }
}

void TuiAutomationDriver::stop_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_id_.empty()) {
        return;
    }
    send_locked(keys::CTRL_C);
    task_active_ = false;
    session_ready_ = false;
    phase_ = Phase::Stopped;
    ++run_;
    log::get("driver")->info("Stopped task on terminal {}", terminal_id_);
}

void TuiAutomationDriver::cleanup(bool force) {
    std::string terminal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && task_active_ && !terminal_id_.empty()) {
            send_locked(keys::CTRL_C);
        }
        terminal.swap(terminal_id_);
        task_active_ = false;
        session_ready_ = false;
        phase_ = Phase::Idle;
        reset_run_locked();
        prompt_.clear();
        buffer_.clear();
    }

    if (!terminal.empty()) {
        transport_.kill(terminal);
    }
    if (registry_) {
        registry_->unregister_instance(this);
    }
    log::get("driver")->debug("Cleaned up driver (force={})", force);
}

bool TuiAutomationDriver::is_session_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ready_ && !terminal_id_.empty();
}

bool TuiAutomationDriver::is_task_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_active_;
}

std::string TuiAutomationDriver::terminal_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_id_;
}

std::optional<bool> TuiAutomationDriver::liveness() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !terminal_id_.empty() && transport_.is_alive(terminal_id_);
}

AutomationDriver::ListenerId TuiAutomationDriver::add_listener(DriverListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void TuiAutomationDriver::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

std::vector<std::string> TuiAutomationDriver::current_screen(size_t lines) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.visible_text(lines == 0 ? static_cast<size_t>(config_.rows) : lines);
}

bool TuiAutomationDriver::send_input(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    return send_locked(bytes);
}

void TuiAutomationDriver::schedule(std::chrono::milliseconds delay, uint64_t run, Step step) {
    std::weak_ptr<TuiAutomationDriver> weak = weak_from_this();
    loop_.post_delayed(delay, [weak, run, step]() {
        if (auto self = weak.lock()) {
            ((*self).*step)(run);
        }
    });
}

void TuiAutomationDriver::probe_tool(uint64_t run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run != run_ || phase_ != Phase::Probing) return;
    send_locked("command -v " + config_.executable + "\r");
    schedule(std::chrono::milliseconds(config_.probe_delay_ms), run, &TuiAutomationDriver::probe_working_directory);
}

void TuiAutomationDriver::probe_working_directory(uint64_t run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run != run_ || phase_ != Phase::Probing) return;
    log::get("driver")->debug("Tool probe: {}", join_lines(buffer_.visible_text(config_.rows), 3));
    send_locked("pwd\r");
    schedule(std::chrono::milliseconds(config_.pwd_delay_ms), run, &TuiAutomationDriver::launch_tool);
}

void TuiAutomationDriver::launch_tool(uint64_t run) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (run != run_ || phase_ != Phase::Probing) return;
        log::get("driver")->debug("Working directory probe: {}", join_lines(buffer_.visible_text(config_.rows), 2));
        // Clearing first keeps a previous run's input box out of the trigger window.
        if (!send_locked("clear; " + config_.executable + "\r")) {
            log::get("driver")->warn("Could not write launch command to terminal {}", terminal_id_);
        }
        phase_ = Phase::Running;
        log::get("driver")->info("Launched {} on terminal {}", config_.executable, terminal_id_);
    }
    emit(TaskStarted{});
}

void TuiAutomationDriver::submit_prompt(uint64_t run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (run != run_ || phase_ != Phase::Running) return;
    send_locked(keys::ENTER);
    prompt_submitted_ = true;
    log::get("driver")->debug("Submitted prompt");
}

void TuiAutomationDriver::confirm_completion(uint64_t run) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (run != run_ || phase_ != Phase::Finishing) return;
        send_locked(keys::CTRL_D);
        send_locked(keys::CTRL_D);
        phase_ = Phase::Idle;
        task_active_ = false;
        session_ready_ = true;
        log::get("driver")->info("Task completed on terminal {}", terminal_id_);
    }
    emit(TaskCompleted{});
    emit(SessionReady{});
}

void TuiAutomationDriver::handle_terminal_events(const std::vector<TerminalEvent>& events) {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.apply_all(events);
        lines = buffer_.visible_text(static_cast<size_t>(config_.rows));
        if (phase_ == Phase::Running || phase_ == Phase::Finishing) {
            evaluate_triggers_locked(lines);
        }
    }
    emit(ScreenUpdated{std::move(lines)});
}

void TuiAutomationDriver::handle_disconnect(const std::string& terminal_id) {
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_id != terminal_id_) return;
        was_active = task_active_;
        terminal_id_.clear();
        task_active_ = false;
        session_ready_ = false;
        phase_ = Phase::Idle;
        ++run_;
    }
    log::get("driver")->warn("Terminal {} disconnected", terminal_id);
    if (was_active) {
        emit(TaskFailed{"terminal disconnected"});
    }
}

void TuiAutomationDriver::evaluate_triggers_locked(const std::vector<std::string>& lines) {
    const auto& cues = config_.cues;
    ScreenSnapshot snapshot = ScreenSnapshot::from_lines(lines);

    if (prompt_submitted_ && snapshot.contains(cues.processing)) {
        processing_seen_ = true;
    }
    snapshot.prompt_injected = prompt_injected_;
    snapshot.prompt_submitted = prompt_submitted_;
    snapshot.processing_seen = processing_seen_;

    if (phase_ == Phase::Finishing && snapshot.contains(cues.processing)) {
        log::get("driver")->debug("Tool is busy again, completion withdrawn");
        phase_ = Phase::Running;
    }

    if (!done_hint_logged_ && prompt_submitted_ && looks_done(lines)) {
        done_hint_logged_ = true;
        log::get("driver")->debug("Screen looks done: {}", join_lines(lines, 5));
    }

    const Trigger* trigger = triggers_.evaluate(snapshot);
    if (!trigger) {
        return;
    }
    if (trigger->name == last_trigger_ && snapshot.text == last_trigger_text_) {
        return;
    }
    last_trigger_ = trigger->name;
    last_trigger_text_ = snapshot.text;

    log::get("driver")->debug("Trigger {} -> {}", trigger->name, trigger_action_name(trigger->action));

    switch (trigger->action) {
        case TriggerAction::SendEnter:
            send_locked(keys::ENTER);
            break;
        case TriggerAction::SendShiftTab:
            send_locked(keys::SHIFT_TAB);
            break;
        case TriggerAction::InjectPrompt:
            prompt_injected_ = true;
            send_locked(prompt_);
            schedule(std::chrono::milliseconds(config_.settle_ms), run_, &TuiAutomationDriver::submit_prompt);
            break;
        case TriggerAction::SignalEndOfInput:
            if (phase_ != Phase::Finishing) {
                phase_ = Phase::Finishing;
                schedule(std::chrono::milliseconds(config_.completion_grace_ms), run_,
                         &TuiAutomationDriver::confirm_completion);
            }
            break;
        case TriggerAction::Wait:
            break;
    }
}

bool TuiAutomationDriver::send_locked(const std::string& bytes) {
    if (terminal_id_.empty()) {
        return false;
    }
    return transport_.send_raw_input(terminal_id_, bytes);
}

void TuiAutomationDriver::reset_run_locked() {
    ++run_;
    prompt_injected_ = false;
    prompt_submitted_ = false;
    processing_seen_ = false;
    done_hint_logged_ = false;
    last_trigger_.clear();
    last_trigger_text_.clear();
}

void TuiAutomationDriver::emit(const DriverEvent& event) {
    std::vector<DriverListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener(event);
    }
}

}
