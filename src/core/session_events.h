#pragma once

#include <string>
#include <variant>

namespace easel {

// Raw pty traffic handed from a ProcessRunner io thread to the transport's poll().
struct OutputEvent {
    std::string terminal_id;
    std::string data;
};

struct ExitEvent {
    std::string terminal_id;
    int exit_code;
};

using SessionEvent = std::variant<OutputEvent, ExitEvent>;

}
