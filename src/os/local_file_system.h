#pragma once

#include "os/command_runner.h"
#include "os/file_system.h"

namespace easel {

// std::filesystem for local sessions, coreutils through wsl for WSL ones.
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(CommandRunner& runner);

    void copy_directory(const std::string& src, const std::string& dst,
                        const WorkspaceSession& session) override;
    void copy_files(const std::string& src, const std::string& dst,
                    const WorkspaceSession& session, bool exclude_git) override;
    bool path_exists(const std::string& path, const WorkspaceSession& session) override;
    void delete_path(const std::string& path, const WorkspaceSession& session) override;

private:
    void run_or_throw(const std::vector<std::string>& argv, const WorkspaceSession& session);

    CommandRunner& runner_;
};

}
