#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace easel {

// Commit hash recorded when a task finished without touching any file.
inline constexpr const char* NO_CHANGES = "NO_CHANGES";
// Revert target when no earlier task left a real commit. Callers resolve it
// against the oldest tracked commit rather than the current HEAD.
inline constexpr const char* BEFORE_FIRST_COMMIT = "HEAD~1";

struct PromptingTask {
    std::string id;
    std::string prompt;
    int64_t created_at = 0;
};

struct InProgressTask {
    std::string id;
    std::string prompt;
    int64_t created_at = 0;
    int64_t started_at = 0;
    std::optional<std::string> process_id;
};

struct CompletedTask {
    std::string id;
    std::string prompt;
    int64_t created_at = 0;
    int64_t started_at = 0;
    int64_t completed_at = 0;
    // Empty when the commit failed or the run was lost, NO_CHANGES, or a hash.
    std::string commit_hash;
    bool is_reverted = false;
    std::vector<std::string> depends_on;
};

using Task = std::variant<PromptingTask, InProgressTask, CompletedTask>;

const std::string& task_id(const Task& task);
const std::string& task_prompt(const Task& task);
const char* task_status_name(const Task& task);

bool is_real_commit(const std::string& hash);

void to_json(nlohmann::json& j, const Task& task);
void from_json(const nlohmann::json& j, Task& task);

// Per-canvas history of prompts. Tasks only move forward:
// Prompting -> InProgress -> Completed. is_reverted toggles on completed tasks.
class TaskLedger {
public:
    std::string create_prompting_task(const std::string& prompt);
    bool start_task(const std::string& id, std::optional<std::string> process_id = std::nullopt);
    bool complete_task(const std::string& id, const std::string& commit_hash,
                       std::vector<std::string> depends_on = {});
    bool update_task_prompt(const std::string& id, const std::string& prompt);

    const std::vector<Task>& tasks() const { return tasks_; }
    const Task* task(const std::string& id) const;

    std::vector<PromptingTask> prompting_tasks() const;
    std::vector<InProgressTask> in_progress_tasks() const;
    std::vector<CompletedTask> completed_tasks() const;

    // Most recently created task in the given state.
    std::optional<PromptingTask> current_prompting_task() const;
    std::optional<InProgressTask> current_in_progress_task() const;

    std::vector<CompletedTask> revertable_commits() const;
    std::vector<CompletedTask> restorable_commits() const;

    // Marks the task and every later completed task reverted.
    bool revert_task(const std::string& id);
    // Clears the reverted flag from the first completed task through this one.
    bool restore_task(const std::string& id);

    // Nearest real commit among completed tasks before this one, or
    // BEFORE_FIRST_COMMIT. Nothing when the id is not a completed task.
    std::optional<std::string> revert_target_commit(const std::string& id) const;

    std::vector<std::string> prompts() const;

    nlohmann::json to_json() const;
    static TaskLedger from_json(const nlohmann::json& j);

private:
    Task* find(const std::string& id);
    std::optional<size_t> completed_position(const std::string& id) const;

    std::vector<Task> tasks_;
};

}
