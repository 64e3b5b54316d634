#include "terminal/pty_transport.h"
#include "core/error.h"
#include "core/logging.h"

#include <algorithm>
#include <cstdlib>
#include <type_traits>

namespace easel {

namespace {

constexpr int MIN_LINES = 24;
constexpr int MIN_COLS = 80;

std::string login_shell() {
    const char* shell = std::getenv("SHELL");
    return (shell && *shell) ? shell : "/bin/bash";
}

}

PtyTransport::PtyTransport() = default;

PtyTransport::~PtyTransport() {
    std::unordered_map<std::string, std::unique_ptr<Terminal>> terminals;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminals.swap(terminals_);
    }
    // Detach first so io threads stop touching the queue.
    for (auto& [id, terminal] : terminals) {
        terminal->runner->detach();
    }
}

ProcessConfig PtyTransport::build_config(const TerminalSpec& spec) const {
    ProcessConfig config;
    config.rows = std::max(MIN_LINES, spec.lines);
    config.cols = std::max(MIN_COLS, spec.cols);
    config.env = spec.environment;

    std::vector<std::string> command = spec.command.value_or(std::vector<std::string>{login_shell(), "-l"});

    if (const auto* wsl = std::get_if<WslSession>(&spec.session)) {
        config.argv = {"wsl", "-d", wsl->distribution, "--cd", wsl->path, "--"};
        config.argv.insert(config.argv.end(), command.begin(), command.end());
    } else {
        config.argv = std::move(command);
        config.working_dir = working_directory(spec.session);
    }
    return config;
}

std::string PtyTransport::connect(const TerminalSpec& spec) {
    ProcessConfig config = build_config(spec);
    std::string terminal_id = generate_id();

    auto terminal = std::make_unique<Terminal>();
    terminal->vterm = std::make_unique<VTerminal>(config.rows, config.cols);
    terminal->runner = std::make_unique<ProcessRunner>();

    auto* raw = terminal.get();
    terminal->vterm->on_scroll([raw](Line line) {
        raw->scrolled.push_back(std::move(line));
    });

    ProcessCallbacks callbacks;
    callbacks.on_output = [this, terminal_id](const std::string& data) {
        event_queue_.push(OutputEvent{terminal_id, data});
    };
    callbacks.on_exit = [this, terminal_id](int exit_code) {
        event_queue_.push(ExitEvent{terminal_id, exit_code});
    };

    if (config.argv.empty() || !terminal->runner->start(config, std::move(callbacks))) {
        throw TransportError("Failed to start terminal process " +
                             (config.argv.empty() ? std::string("(none)") : config.argv.front()));
    }

    log::get("transport")->info("Opened terminal {} ({}x{}) in {}", terminal_id, config.rows, config.cols,
                                working_directory(spec.session));

    std::lock_guard<std::mutex> lock(mutex_);
    terminals_[terminal_id] = std::move(terminal);
    return terminal_id;
}

bool PtyTransport::send_raw_input(const std::string& terminal_id, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(terminal_id);
    if (it == terminals_.end() || it->second->exited) {
        return false;
    }
    return it->second->runner->write(bytes);
}

void PtyTransport::resize(const std::string& terminal_id, int lines, int cols) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(terminal_id);
    if (it == terminals_.end()) {
        return;
    }
    lines = std::max(MIN_LINES, lines);
    cols = std::max(MIN_COLS, cols);
    it->second->runner->resize(lines, cols);
    it->second->vterm->resize(lines, cols);
    it->second->needs_full_update = true;
}

void PtyTransport::kill(const std::string& terminal_id) {
    std::unique_ptr<Terminal> terminal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = terminals_.find(terminal_id);
        if (it == terminals_.end()) {
            return;
        }
        terminal = std::move(it->second);
        terminals_.erase(it);
    }
    terminal->runner->detach();
    terminal->runner->kill();
    log::get("transport")->info("Killed terminal {}", terminal_id);
}

void PtyTransport::on_event(const std::string& terminal_id, TerminalEventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(terminal_id);
    if (it != terminals_.end()) {
        it->second->event_callback = std::move(callback);
        it->second->needs_full_update = true;
    }
}

void PtyTransport::on_disconnect(const std::string& terminal_id, DisconnectCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(terminal_id);
    if (it != terminals_.end()) {
        it->second->disconnect_callback = std::move(callback);
    }
}

bool PtyTransport::is_alive(const std::string& terminal_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(terminal_id);
    return it != terminals_.end() && !it->second->exited;
}

std::vector<TerminalEvent> PtyTransport::collect_events(Terminal& terminal) {
    std::vector<TerminalEvent> events;
    VTerminal& vt = *terminal.vterm;
    const size_t rows = static_cast<size_t>(vt.rows());

    std::vector<Line> current;
    current.reserve(rows);
    for (int r = 0; r < vt.rows(); ++r) {
        current.push_back(vt.row_line(r));
    }


    if (terminal.needs_full_update) {
        terminal.needs_full_update = false;
        terminal.scrolled.clear();
        terminal.base = 0;
        terminal.emitted_lines = rows;
        terminal.rows = current;
        terminal.cursor = vt.cursor();
        events.push_back(ScreenUpdate{current, terminal.cursor});
        return events;
    }

    // Lines that scrolled off the top settle at their final index.
    for (auto& line : terminal.scrolled) {
        events.push_back(Patch{terminal.base, std::move(line)});
        terminal.base++;
        terminal.emitted_lines = std::max(terminal.emitted_lines, terminal.base);
    }
    size_t shifted = terminal.scrolled.size();
    terminal.scrolled.clear();

    if (shifted > 0) {
        size_t drop = std::min(shifted, terminal.rows.size());
        terminal.rows.erase(terminal.rows.begin(), terminal.rows.begin() + static_cast<std::ptrdiff_t>(drop));
        terminal.rows.resize(rows);
    }

    size_t required = terminal.base + rows;
    size_t fresh = required > terminal.emitted_lines ? required - terminal.emitted_lines : 0;
    size_t first_fresh = rows - std::min(fresh, rows);

    for (size_t r = 0; r < first_fresh; ++r) {
        if (r >= terminal.rows.size() || terminal.rows[r] != current[r]) {
            events.push_back(Patch{terminal.base + r, current[r]});
        }
    }

    if (fresh > 0) {
        NewLines appended;
        appended.lines.assign(current.begin() + static_cast<std::ptrdiff_t>(first_fresh), current.end());
        events.push_back(std::move(appended));
        terminal.emitted_lines = required;
    }

    terminal.rows = current;

    CursorPosition cursor{terminal.base + vt.cursor().line, vt.cursor().col};
    if (!(cursor == terminal.cursor)) {
        terminal.cursor = cursor;
        events.push_back(CursorMove{cursor});
    }

    return events;
}

void PtyTransport::poll() {
    struct Delivery {
        TerminalEventCallback callback;
        std::vector<TerminalEvent> events;
    };
    std::vector<Delivery> deliveries;
    std::vector<DisconnectCallback> disconnects;

    auto pending = event_queue_.drain();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Terminal*> touched;

        for (auto& event : pending) {
            std::visit([&](auto&& evt) {
                using T = std::decay_t<decltype(evt)>;
                auto it = terminals_.find(evt.terminal_id);
                if (it == terminals_.end()) {
                    return;
                }
                Terminal& terminal = *it->second;
                if constexpr (std::is_same_v<T, OutputEvent>) {
                    terminal.vterm->feed(evt.data);
                    std::string reply = terminal.vterm->take_reply();
                    if (!reply.empty()) {
                        terminal.runner->write(reply);
                    }
                    if (std::find(touched.begin(), touched.end(), &terminal) == touched.end()) {
                        touched.push_back(&terminal);
                    }
                } else if constexpr (std::is_same_v<T, ExitEvent>) {
                    terminal.exited = true;
                    log::get("transport")->info("Terminal {} exited with code {}", evt.terminal_id, evt.exit_code);
                    if (terminal.disconnect_callback) {
                        disconnects.push_back(terminal.disconnect_callback);
                    }
                }
            }, event);
        }

        for (auto& [id, terminal] : terminals_) {
            if (terminal->needs_full_update && terminal->event_callback &&
                std::find(touched.begin(), touched.end(), terminal.get()) == touched.end()) {
                touched.push_back(terminal.get());
            }
        }

        for (auto* terminal : touched) {
            if (!terminal->event_callback) {
                continue;
            }
            auto events = collect_events(*terminal);
            if (!events.empty()) {
                deliveries.push_back({terminal->event_callback, std::move(events)});
            }
        }
    }

    for (auto& delivery : deliveries) {
        delivery.callback(delivery.events);
    }
    for (auto& callback : disconnects) {
        callback();
    }
}

}
