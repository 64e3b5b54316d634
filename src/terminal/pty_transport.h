#pragma once

#include "core/event_queue.h"
#include "core/session_events.h"
#include "process/process_runner.h"
#include "terminal/terminal_transport.h"
#include "terminal/vterminal.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace easel {

// Local terminals: one forkpty child per terminal, replayed into libvterm,
// with screen changes diffed into TerminalEvent batches on poll().
class PtyTransport : public TerminalTransport {
public:
    PtyTransport();
    ~PtyTransport() override;

    PtyTransport(const PtyTransport&) = delete;
    PtyTransport& operator=(const PtyTransport&) = delete;

    std::string connect(const TerminalSpec& spec) override;
    bool send_raw_input(const std::string& terminal_id, const std::string& bytes) override;
    void resize(const std::string& terminal_id, int lines, int cols) override;
    void kill(const std::string& terminal_id) override;
    void on_event(const std::string& terminal_id, TerminalEventCallback callback) override;
    void on_disconnect(const std::string& terminal_id, DisconnectCallback callback) override;
    bool is_alive(const std::string& terminal_id) const override;
    void poll() override;

private:
    struct Terminal {
        std::unique_ptr<ProcessRunner> runner;
        std::unique_ptr<VTerminal> vterm;
        std::vector<Line> rows;
        CursorPosition cursor;
        // Buffer index of the first visible row as the consumer sees it.
        size_t base = 0;
        size_t emitted_lines = 0;
        bool needs_full_update = true;
        std::vector<Line> scrolled;
        bool exited = false;
        TerminalEventCallback event_callback;
        DisconnectCallback disconnect_callback;
    };

    ProcessConfig build_config(const TerminalSpec& spec) const;
    std::vector<TerminalEvent> collect_events(Terminal& terminal);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Terminal>> terminals_;
    EventQueue<SessionEvent> event_queue_;
};

}
