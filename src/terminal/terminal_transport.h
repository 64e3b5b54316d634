#pragma once

#include "core/types.h"
#include "terminal/screen_buffer.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace easel {

struct TerminalSpec {
    int lines = 24;
    int cols = 80;
    WorkspaceSession session = LocalSession{};
    // Program run inside the pty; the login shell when unset.
    std::optional<std::vector<std::string>> command;
    std::map<std::string, std::string> environment;
};

using TerminalEventCallback = std::function<void(const std::vector<TerminalEvent>& events)>;
using DisconnectCallback = std::function<void()>;

// Opens terminals and reports their screens as TerminalEvent batches.
// Callbacks are invoked from poll() on the polling thread, never while the
// transport holds its own lock.
class TerminalTransport {
public:
    virtual ~TerminalTransport() = default;

    // Throws TransportError when the terminal cannot be started.
    virtual std::string connect(const TerminalSpec& spec) = 0;
    virtual bool send_raw_input(const std::string& terminal_id, const std::string& bytes) = 0;
    virtual void resize(const std::string& terminal_id, int lines, int cols) = 0;
    virtual void kill(const std::string& terminal_id) = 0;
    virtual void on_event(const std::string& terminal_id, TerminalEventCallback callback) = 0;
    virtual void on_disconnect(const std::string& terminal_id, DisconnectCallback callback) = 0;
    virtual bool is_alive(const std::string& terminal_id) const = 0;
    virtual void poll() = 0;
};

}
