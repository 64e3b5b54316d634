#pragma once

#include "agents/background_agent.h"

#include <functional>
#include <optional>
#include <string>

namespace easel {

class FileSystem;
class GitClient;

// Branch that carries the canvas contents inside the merge working copy.
inline constexpr const char* CANVAS_CHANGES_BRANCH = "canvas-changes";

struct CompletionCheck {
    bool complete = false;
    // Context for the next attempt: conflict files and the bumped attempt count.
    std::optional<MergeAgentContext> new_context;
    std::string instructions;
};

// Merges one canvas back into the project root inside a scratch copy of the
// root. Every status change is reported to the status listener.
class MergeAgent {
public:
    using StatusListener = std::function<void(const BackgroundAgent& agent)>;

    MergeAgent(BackgroundAgent agent, GitClient& git, FileSystem& fs);

    void set_status_listener(StatusListener listener);

    // Copies the root, commits the canvas contents on a side branch and
    // returns to the root branch. Throws FileSystemError or GitError.
    void setup();
    // Tries the merge. Throws GitError when it fails without conflicts.
    CompletionCheck check_completion();
    std::string generate_prompt(const std::string& retry_instructions = {}) const;
    // Commits resolutions and copies the merged tree back to the root.
    void finalize();

    void apply_context(MergeAgentContext context);
    void update_status(AgentStatus status, std::optional<std::string> progress = std::nullopt,
                       std::optional<std::string> error = std::nullopt);
    void set_driver_process(std::optional<std::string> process_id);

    const BackgroundAgent& state() const { return agent_; }
    const MergeAgentContext& context() const { return std::get<MergeAgentContext>(agent_.context); }
    const std::string& id() const { return agent_.id; }
    const std::string& working_dir() const { return working_directory(agent_.session); }

private:
    MergeAgentContext& mutable_context() { return std::get<MergeAgentContext>(agent_.context); }
    void publish();

    BackgroundAgent agent_;
    GitClient& git_;
    FileSystem& fs_;
    StatusListener listener_;
};

}
