#pragma once

#include "core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace easel {

enum class CommitOutcome {
    Committed,
    NothingToCommit
};

struct CommitResult {
    CommitOutcome outcome = CommitOutcome::Committed;
    std::string hash;
};

struct MergeOutcome {
    bool success = false;
    std::string output;
};

// Git operations against a working directory. Failures other than the
// distinct results below throw GitError.
class GitClient {
public:
    virtual ~GitClient() = default;

    virtual std::optional<std::string> current_branch(const std::string& directory,
                                                      const WorkspaceSession& session) = 0;
    // Stages everything and commits.
    virtual CommitResult commit(const std::string& directory, const std::string& message,
                                const WorkspaceSession& session) = 0;
    virtual void add_files(const std::string& directory, const std::vector<std::string>& files,
                           const WorkspaceSession& session) = 0;
    virtual void discard_file_changes(const std::string& directory, const std::vector<std::string>& files,
                                      const WorkspaceSession& session) = 0;
    // Hard reset of the working tree to the commit.
    virtual void revert_to_commit(const std::string& directory, const std::string& commit,
                                  const WorkspaceSession& session) = 0;
    // Creates the branch and switches to it.
    virtual void create_branch(const std::string& directory, const std::string& branch,
                               const WorkspaceSession& session) = 0;
    virtual void checkout(const std::string& directory, const std::string& branch,
                          const WorkspaceSession& session) = 0;
    // Checks out target and merges source into it. A failed merge is reported,
    // not thrown; conflict_files() tells conflicts apart from other failures.
    virtual MergeOutcome merge_branch(const std::string& directory, const std::string& source,
                                      const std::string& target, const WorkspaceSession& session) = 0;
    virtual std::vector<std::string> conflict_files(const std::string& directory,
                                                    const WorkspaceSession& session) = 0;
};

}
