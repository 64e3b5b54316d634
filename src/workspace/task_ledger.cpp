#include "workspace/task_ledger.h"
#include "core/types.h"

#include <type_traits>

namespace easel {

const std::string& task_id(const Task& task) {
    return std::visit([](const auto& t) -> const std::string& { return t.id; }, task);
}

const std::string& task_prompt(const Task& task) {
    return std::visit([](const auto& t) -> const std::string& { return t.prompt; }, task);
}

const char* task_status_name(const Task& task) {
    return std::visit([](const auto& t) -> const char* {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, PromptingTask>) {
            return "prompting";
        } else if constexpr (std::is_same_v<T, InProgressTask>) {
            return "in_progress";
        } else {
            return "completed";
        }
    }, task);
}

bool is_real_commit(const std::string& hash) {
    return !hash.empty() && hash != NO_CHANGES;
}

void to_json(nlohmann::json& j, const Task& task) {
    j = nlohmann::json::object();
    std::visit([&j](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        j["id"] = t.id;
        j["prompt"] = t.prompt;
        j["createdAt"] = t.created_at;
        if constexpr (std::is_same_v<T, PromptingTask>) {
            j["status"] = "prompting";
        } else if constexpr (std::is_same_v<T, InProgressTask>) {
            j["status"] = "in_progress";
            j["startedAt"] = t.started_at;
            if (t.process_id) j["processId"] = *t.process_id;
        } else {
            j["status"] = "completed";
            j["startedAt"] = t.started_at;
            j["completedAt"] = t.completed_at;
            j["commitHash"] = t.commit_hash;
            j["isReverted"] = t.is_reverted;
            if (!t.depends_on.empty()) j["dependsOn"] = t.depends_on;
        }
    }, task);
}

void from_json(const nlohmann::json& j, Task& task) {
    std::string id = j.value("id", std::string{});
    std::string prompt = j.value("prompt", std::string{});
    int64_t created_at = j.value("createdAt", int64_t{0});
    std::string status = j.value("status", std::string{"prompting"});

    if (status == "completed") {
        CompletedTask t;
        t.id = id;
        t.prompt = prompt;
        t.created_at = created_at;
        t.started_at = j.value("startedAt", created_at);
        t.completed_at = j.value("completedAt", t.started_at);
        t.commit_hash = j.value("commitHash", std::string{});
        t.is_reverted = j.value("isReverted", false);
        if (j.contains("dependsOn") && j["dependsOn"].is_array()) {
            t.depends_on = j["dependsOn"].get<std::vector<std::string>>();
        }
        task = std::move(t);
    } else if (status == "in_progress") {
        InProgressTask t;
        t.id = id;
        t.prompt = prompt;
        t.created_at = created_at;
        t.started_at = j.value("startedAt", created_at);
        if (j.contains("processId") && j["processId"].is_string()) {
            t.process_id = j["processId"].get<std::string>();
        }
        task = std::move(t);
    } else {
        task = PromptingTask{id, prompt, created_at};
    }
}

std::string TaskLedger::create_prompting_task(const std::string& prompt) {
    PromptingTask task{generate_id(), prompt, now_millis()};
    std::string id = task.id;
    tasks_.push_back(std::move(task));
    return id;
}

bool TaskLedger::start_task(const std::string& id, std::optional<std::string> process_id) {
    Task* task = find(id);
    if (!task) return false;

    auto* prompting = std::get_if<PromptingTask>(task);
    if (!prompting) return false;

    InProgressTask next;
    next.id = prompting->id;
    next.prompt = prompting->prompt;
    next.created_at = prompting->created_at;
    next.started_at = now_millis();
    next.process_id = std::move(process_id);
    *task = std::move(next);
    return true;
}

bool TaskLedger::complete_task(const std::string& id, const std::string& commit_hash,
                               std::vector<std::string> depends_on) {
    Task* task = find(id);
    if (!task) return false;

    auto* running = std::get_if<InProgressTask>(task);
    if (!running) return false;

    CompletedTask next;
    next.id = running->id;
    next.prompt = running->prompt;
    next.created_at = running->created_at;
    next.started_at = running->started_at;
    next.completed_at = now_millis();
    next.commit_hash = commit_hash;
    next.is_reverted = false;
    next.depends_on = std::move(depends_on);
    *task = std::move(next);
    return true;
}

bool TaskLedger::update_task_prompt(const std::string& id, const std::string& prompt) {
    Task* task = find(id);
    if (!task) return false;

    auto* prompting = std::get_if<PromptingTask>(task);
    if (!prompting) return false;

    prompting->prompt = prompt;
    return true;
}

const Task* TaskLedger::task(const std::string& id) const {
    for (const auto& t : tasks_) {
        if (task_id(t) == id) return &t;
    }
    return nullptr;
}

Task* TaskLedger::find(const std::string& id) {
    for (auto& t : tasks_) {
        if (task_id(t) == id) return &t;
    }
    return nullptr;
}

std::vector<PromptingTask> TaskLedger::prompting_tasks() const {
    std::vector<PromptingTask> out;
    for (const auto& t : tasks_) {
        if (auto* p = std::get_if<PromptingTask>(&t)) out.push_back(*p);
    }
    return out;
}

std::vector<InProgressTask> TaskLedger::in_progress_tasks() const {
    std::vector<InProgressTask> out;
    for (const auto& t : tasks_) {
        if (auto* p = std::get_if<InProgressTask>(&t)) out.push_back(*p);
    }
    return out;
}

std::vector<CompletedTask> TaskLedger::completed_tasks() const {
    std::vector<CompletedTask> out;
    for (const auto& t : tasks_) {
        if (auto* p = std::get_if<CompletedTask>(&t)) out.push_back(*p);
    }
    return out;
}

std::optional<PromptingTask> TaskLedger::current_prompting_task() const {
    for (auto it = tasks_.rbegin(); it != tasks_.rend(); ++it) {
        if (auto* p = std::get_if<PromptingTask>(&*it)) return *p;
    }
    return std::nullopt;
}

std::optional<InProgressTask> TaskLedger::current_in_progress_task() const {
    for (auto it = tasks_.rbegin(); it != tasks_.rend(); ++it) {
        if (auto* p = std::get_if<InProgressTask>(&*it)) return *p;
    }
    return std::nullopt;
}

std::vector<CompletedTask> TaskLedger::revertable_commits() const {
    std::vector<CompletedTask> out;
    for (const auto& t : completed_tasks()) {
        if (is_real_commit(t.commit_hash) && !t.is_reverted) out.push_back(t);
    }
    return out;
}

std::vector<CompletedTask> TaskLedger::restorable_commits() const {
    std::vector<CompletedTask> out;
    for (const auto& t : completed_tasks()) {
        if (is_real_commit(t.commit_hash) && t.is_reverted) out.push_back(t);
    }
    return out;
}

std::optional<size_t> TaskLedger::completed_position(const std::string& id) const {
    size_t position = 0;
    for (const auto& t : tasks_) {
        if (auto* c = std::get_if<CompletedTask>(&t)) {
            if (c->id == id) return position;
            ++position;
        }
    }
    return std::nullopt;
}

bool TaskLedger::revert_task(const std::string& id) {
    auto k = completed_position(id);
    if (!k) return false;

    size_t position = 0;
    for (auto& t : tasks_) {
        if (auto* c = std::get_if<CompletedTask>(&t)) {
            if (position >= *k) c->is_reverted = true;
            ++position;
        }
    }
    return true;
}

bool TaskLedger::restore_task(const std::string& id) {
    auto k = completed_position(id);
    if (!k) return false;

    size_t position = 0;
    for (auto& t : tasks_) {
        if (auto* c = std::get_if<CompletedTask>(&t)) {
            if (position <= *k) c->is_reverted = false;
            ++position;
        }
    }
    return true;
}

std::optional<std::string> TaskLedger::revert_target_commit(const std::string& id) const {
    auto completed = completed_tasks();
    auto k = completed_position(id);
    if (!k) return std::nullopt;

    for (size_t i = *k; i-- > 0;) {
        if (is_real_commit(completed[i].commit_hash)) {
            return completed[i].commit_hash;
        }
    }
    return std::string(BEFORE_FIRST_COMMIT);
}

std::vector<std::string> TaskLedger::prompts() const {
    std::vector<std::string> out;
    for (const auto& t : tasks_) {
        const auto& prompt = task_prompt(t);
        if (!prompt.empty()) out.push_back(prompt);
    }
    return out;
}

nlohmann::json TaskLedger::to_json() const {
    nlohmann::json j;
    j["tasks"] = nlohmann::json::array();
    for (const auto& t : tasks_) {
        nlohmann::json tj;
        easel::to_json(tj, t);
        j["tasks"].push_back(tj);
    }
    return j;
}

TaskLedger TaskLedger::from_json(const nlohmann::json& j) {
    TaskLedger ledger;
    if (j.contains("tasks") && j["tasks"].is_array()) {
        for (const auto& tj : j["tasks"]) {
            Task task;
            easel::from_json(tj, task);
            ledger.tasks_.push_back(std::move(task));
        }
    }
    return ledger;
}

}
