#pragma once

#include "os/command_runner.h"
#include "os/git_client.h"

namespace easel {

// GitClient backed by the git command line.
class ShellGitClient : public GitClient {
public:
    explicit ShellGitClient(CommandRunner& runner);

    std::optional<std::string> current_branch(const std::string& directory,
                                              const WorkspaceSession& session) override;
    CommitResult commit(const std::string& directory, const std::string& message,
                        const WorkspaceSession& session) override;
    void add_files(const std::string& directory, const std::vector<std::string>& files,
                   const WorkspaceSession& session) override;
    void discard_file_changes(const std::string& directory, const std::vector<std::string>& files,
                              const WorkspaceSession& session) override;
    void revert_to_commit(const std::string& directory, const std::string& commit,
                          const WorkspaceSession& session) override;
    void create_branch(const std::string& directory, const std::string& branch,
                       const WorkspaceSession& session) override;
    void checkout(const std::string& directory, const std::string& branch,
                  const WorkspaceSession& session) override;
    MergeOutcome merge_branch(const std::string& directory, const std::string& source,
                              const std::string& target, const WorkspaceSession& session) override;
    std::vector<std::string> conflict_files(const std::string& directory,
                                            const WorkspaceSession& session) override;

private:
    CommandResult git(const std::vector<std::string>& args, const std::string& directory,
                      const WorkspaceSession& session);
    CommandResult git_or_throw(const std::vector<std::string>& args, const std::string& directory,
                               const WorkspaceSession& session);

    CommandRunner& runner_;
};

}
