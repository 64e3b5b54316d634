#pragma once

#include <string>
#include <toml++/toml.hpp>

namespace easel {

// Text fragments the trigger table looks for in the driven tool's screen.
struct DriverCues {
    std::string confirm = "Enter to confirm";
    std::string trust_question = "Do you trust the files in this folder?";
    std::string dont_ask_again = "don't ask again this session";
    std::string empty_prompt = "> Try \"";
    std::string try_hint = "Try \"";
    std::string prompt_marker = "│ >";
    std::string processing = "esc to interrupt";
};

struct DriverConfig {
    std::string executable = "claude";
    int rows = 24;
    int cols = 80;
    int warmup_ms = 1000;
    int probe_delay_ms = 1000;
    int pwd_delay_ms = 500;
    int settle_ms = 500;
    int completion_grace_ms = 2000;
    DriverCues cues;
};

struct AgentConfig {
    int max_attempts = 3;
    int attempt_timeout_minutes = 30;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct EaselConfig {
    DriverConfig driver;
    AgentConfig agent;
    LoggingConfig logging;

    static EaselConfig from_toml(const toml::table& tbl);
    toml::table to_toml() const;

    // A missing file yields defaults; a malformed one yields defaults and a warning.
    static EaselConfig load(const std::string& path);

    static std::string default_path();
};

}
