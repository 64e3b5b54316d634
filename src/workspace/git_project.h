#pragma once

#include "agents/background_agent.h"
#include "core/types.h"
#include "workspace/canvas.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace easel {

class BackgroundAgentManager;
class FileSystem;
class GitClient;
class ProcessRegistry;

enum class ProjectTopic {
    Canvases,
    CurrentCanvasIndex,
    BackgroundAgents
};

struct MergeResult {
    bool success = false;
    std::string agent_id;
    std::string error;
};

// Aggregate root for one repository: its canvases, their ledgers and locks,
// and the background agents working on them. All mutation goes through these
// methods, which notify subscribers after the project lock is released.
// Readers receive copies.
class GitProject {
public:
    using Listener = std::function<void()>;
    using Unsubscribe = std::function<void()>;

    explicit GitProject(WorkspaceSession root, std::string name = {});

    GitProject(const GitProject&) = delete;
    GitProject& operator=(const GitProject&) = delete;

    std::string id() const;
    std::string name() const;
    WorkspaceSession root() const;
    int64_t created_at() const;
    int64_t last_modified() const;

    std::vector<Canvas> canvases() const;
    std::optional<Canvas> canvas(const std::string& canvas_id) const;
    std::optional<Canvas> current_canvas() const;
    int current_canvas_index() const;
    bool set_current_canvas_index(int index);

    // The first canvas added becomes current.
    std::string add_canvas(Canvas canvas);
    // Creates the root canvas when the project has none; returns the current canvas id.
    std::string ensure_default_canvas();
    // Copies the root to <root>-<random>, branches it and adds it as a canvas.
    // Throws FileSystemError or GitError.
    std::string add_canvas_copy(GitClient& git, FileSystem& fs);
    // The last remaining canvas cannot be removed.
    bool remove_canvas(const std::string& canvas_id);
    bool rename_canvas(const std::string& canvas_id, const std::string& name);
    bool update_canvas_elements(const std::string& canvas_id, std::vector<std::string> elements);

    // Task edits are refused unless the canvas lock is Normal.
    std::optional<std::string> create_task(const std::string& canvas_id, const std::string& prompt);
    bool update_task_prompt(const std::string& canvas_id, const std::string& task_id, const std::string& prompt);
    bool start_task(const std::string& canvas_id, const std::string& task_id,
                    std::optional<std::string> process_id = std::nullopt);
    bool complete_task(const std::string& canvas_id, const std::string& task_id, const std::string& commit_hash);
    bool revert_task(const std::string& canvas_id, const std::string& task_id);
    bool restore_task(const std::string& canvas_id, const std::string& task_id);

    // Prompts of the canvas followed by those of every completed merge agent.
    std::vector<std::string> historical_prompts(const std::string& canvas_id) const;

    bool lock_canvas(const std::string& canvas_id, CanvasLockState state,
                     std::optional<std::string> agent_id = std::nullopt);
    // Without an agent id this is a force unlock.
    bool unlock_canvas(const std::string& canvas_id, std::optional<std::string> agent_id = std::nullopt);
    std::optional<CanvasLockState> lock_state(const std::string& canvas_id) const;
    bool is_canvas_locked(const std::string& canvas_id) const;
    bool can_edit_canvas(const std::string& canvas_id) const;

    bool add_process(const std::string& canvas_id, ProcessState process);
    bool update_process_status(const std::string& canvas_id, const std::string& process_id, ProcessStatus status);
    bool remove_process(const std::string& canvas_id, const std::string& process_id);
    std::vector<ProcessState> canvas_processes(const std::string& canvas_id) const;
    std::optional<ProcessState> process_by_element(const std::string& canvas_id, const std::string& element_id) const;

    // Marks running process records without a live driver as finished and
    // force-completes their in-progress task with an empty hash. Returns the
    // ids of the processes recovered this way.
    std::vector<std::string> recover_processes(const ProcessRegistry& registry);

    void add_background_agent(BackgroundAgent agent);
    bool update_background_agent(const BackgroundAgent& agent);
    bool remove_background_agent(const std::string& agent_id);
    std::vector<BackgroundAgent> background_agents() const;
    std::optional<BackgroundAgent> background_agent(const std::string& agent_id) const;

    // Validates the canvas and hands it to a new merge agent.
    MergeResult merge_canvas_to_root(const std::string& canvas_id, BackgroundAgentManager& agents);

    Unsubscribe subscribe(ProjectTopic topic, Listener listener);

    nlohmann::json to_json() const;
    static std::unique_ptr<GitProject> from_json(const nlohmann::json& j);

private:
    struct Listeners {
        std::mutex mutex;
        std::map<ProjectTopic, std::map<size_t, Listener>> by_topic;
        size_t next_id = 1;
    };

    Canvas* find_canvas_locked(const std::string& canvas_id);
    const Canvas* find_canvas_locked(const std::string& canvas_id) const;
    void touch_locked(Canvas* canvas = nullptr);
    Canvas make_canvas_locked(std::string name, WorkspaceSession session) const;
    bool mutate_canvas(const std::string& canvas_id, const std::function<bool(Canvas&)>& fn);
    void notify(ProjectTopic topic);

    mutable std::mutex mutex_;
    std::string id_;
    std::string name_;
    WorkspaceSession root_;
    std::vector<Canvas> canvases_;
    int current_canvas_index_ = -1;
    std::vector<BackgroundAgent> agents_;
    int64_t created_at_ = 0;
    int64_t last_modified_ = 0;

    std::shared_ptr<Listeners> listeners_ = std::make_shared<Listeners>();
};

}
