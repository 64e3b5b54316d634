#include "os/command_runner.h"
#include "core/logging.h"

#include <cstdio>
#include <sys/wait.h>

namespace easel {

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

CommandResult CommandRunner::run(const std::vector<std::string>& argv, const std::string& directory,
                                 const WorkspaceSession& session) {
    std::string command;
    if (const auto* wsl = std::get_if<WslSession>(&session)) {
        command = "wsl -d " + shell_quote(wsl->distribution);
        if (!directory.empty()) {
            command += " --cd " + shell_quote(directory);
        }
        command += " --";
    } else if (!directory.empty()) {
        command = "cd " + shell_quote(directory) + " &&";
    }
    for (const auto& arg : argv) {
        command += " " + shell_quote(arg);
    }
    command += " 2>&1";

    log::get("command")->debug("Running: {}", command);

    CommandResult result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        result.output = "failed to spawn shell";
        return result;
    }

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    int status = pclose(pipe);
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

}
