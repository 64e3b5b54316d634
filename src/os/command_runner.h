#pragma once

#include "core/types.h"

#include <string>
#include <vector>

namespace easel {

struct CommandResult {
    int exit_code = -1;
    // stdout and stderr interleaved.
    std::string output;

    bool ok() const { return exit_code == 0; }
};

// Runs a program to completion in a workspace session. WSL sessions go
// through `wsl -d <distribution> --cd <dir>`.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv, const std::string& directory,
                              const WorkspaceSession& session);
};

std::string shell_quote(const std::string& value);

}
