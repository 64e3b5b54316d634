#include "workspace/task_runner.h"
#include "core/logging.h"
#include "os/git_client.h"
#include "process/process_registry.h"
#include "workspace/git_project.h"

#include <type_traits>

namespace easel {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}

TaskRunner::TaskRunner(GitProject& project, GitClient& git, ProcessRegistry& registry, DriverFactory factory)
    : project_(project)
    , git_(git)
    , registry_(registry)
    , factory_(std::move(factory))
{
}

TaskRunner::~TaskRunner() {
    std::map<std::string, Slot> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.swap(slots_);
    }
    for (auto& [key, slot] : slots) {
        slot.driver->remove_listener(slot.listener);
    }
}

std::string TaskRunner::slot_key(const std::string& canvas_id, const std::string& element_id) {
    return canvas_id + "/" + element_id;
}

SubmitResult TaskRunner::submit(const std::string& canvas_id, const std::string& element_id,
                                const std::string& prompt) {
    auto canvas = project_.canvas(canvas_id);
    if (!canvas) {
        return {false, "Canvas not found"};
    }
    std::string text = trim(prompt);
    if (text.empty()) {
        return {false, "Prompt is empty"};
    }
    if (canvas->is_locked()) {
        return {false, std::string("Canvas is currently ") + lock_state_name(canvas->lock_state)};
    }
    if (canvas->ledger.current_in_progress_task()) {
        return {false, "A task is already in progress on this canvas"};
    }

    std::string task_id;
    if (auto prompting = canvas->ledger.current_prompting_task()) {
        project_.update_task_prompt(canvas_id, prompting->id, text);
        task_id = prompting->id;
    } else if (auto created = project_.create_task(canvas_id, text)) {
        task_id = *created;
    } else {
        return {false, "Failed to create task"};
    }

    std::string key = slot_key(canvas_id, element_id);
    std::shared_ptr<AutomationDriver> driver;
    AutomationDriver::ListenerId listener = 0;
    std::string previous_process;
    std::optional<Slot> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second.driver->is_session_ready()) {
            driver = it->second.driver;
            listener = it->second.listener;
            previous_process = it->second.process_id;
        } else if (it != slots_.end()) {
            stale = it->second;
            slots_.erase(it);
        }
    }
    if (stale) {
        release_slot(*stale);
    }

    if (driver) {
        log::get("project")->info("Reusing driver session for element {}", element_id);
    } else {
        driver = factory_();
        listener = driver->add_listener([this, key](const DriverEvent& event) {
            on_driver_event(key, event);
        });
    }

    std::string process_id = generate_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot& slot = slots_[key];
        slot.canvas_id = canvas_id;
        slot.element_id = element_id;
        slot.driver = driver;
        slot.listener = listener;
        slot.process_id = process_id;
        slot.task_id = task_id;
        slot.task_started = false;
    }

    registry_.register_process(process_id, driver);
    if (!previous_process.empty()) {
        registry_.unregister(previous_process);
    }

    auto on_terminal_ready = [&](const std::string& terminal_id) {
        registry_.associate_terminal(element_id, terminal_id);

        ProcessState process;
        process.process_id = process_id;
        process.terminal_id = terminal_id;
        process.kind = ProcessKind::ClaudeCode;
        process.status = ProcessStatus::Running;
        process.start_time = now_millis();
        process.element_id = element_id;
        process.prompt = text;
        project_.add_process(canvas_id, process);
        project_.start_task(canvas_id, task_id, process_id);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second.process_id == process_id) {
            it->second.task_started = true;
        }
    };

    try {
        driver->start_task(canvas->session, text, on_terminal_ready);
    } catch (const Error& e) {
        registry_.unregister(process_id);
        log::get("project")->error("Failed to start task on element {}: {}", element_id, e.what());
        return {false, e.what(), task_id};
    }

    log::get("project")->info("Started task {} as process {}", task_id, process_id);
    return {true, {}, task_id, process_id};
}

bool TaskRunner::stop(const std::string& canvas_id, const std::string& element_id) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(slot_key(canvas_id, element_id));
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        it->second.task_started = false;
    }

    slot.driver->stop_task();
    project_.update_process_status(canvas_id, slot.process_id, ProcessStatus::Finished);
    // A stopped task never reports completion; close it without a commit.
    if (slot.task_started) {
        project_.complete_task(canvas_id, slot.task_id, "");
    }
    return true;
}

bool TaskRunner::cleanup(const std::string& canvas_id, const std::string& element_id) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(slot_key(canvas_id, element_id));
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        slots_.erase(it);
    }

    release_slot(slot);
    if (slot.task_started) {
        project_.complete_task(canvas_id, slot.task_id, "");
    }
    project_.remove_process(canvas_id, slot.process_id);
    registry_.unregister(slot.process_id);
    registry_.remove_terminal(element_id);
    return true;
}

OperationResult TaskRunner::revert(const std::string& canvas_id, const std::string& task_id) {
    auto canvas = project_.canvas(canvas_id);
    if (!canvas) {
        return {false, "Canvas not found"};
    }
    if (canvas->is_locked()) {
        return {false, std::string("Canvas is currently ") + lock_state_name(canvas->lock_state)};
    }
    if (canvas->ledger.current_in_progress_task()) {
        return {false, "Cannot revert while a task is in progress"};
    }
    const Task* task = canvas->ledger.task(task_id);
    auto* completed = task ? std::get_if<CompletedTask>(task) : nullptr;
    if (!completed || !is_real_commit(completed->commit_hash)) {
        return {false, "Task has no commit to revert"};
    }
    auto target = canvas->ledger.revert_target_commit(task_id);
    if (!target) {
        return {false, "Task has no commit to revert"};
    }
    if (*target == BEFORE_FIRST_COMMIT) {
        // HEAD~1 would resolve from the current HEAD, not from the oldest
        // tracked commit, which is this task's own commit.
        target = completed->commit_hash + "~1";
    }

    try {
        git_.revert_to_commit(working_directory(canvas->session), *target, canvas->session);
    } catch (const GitError& e) {
        log::get("git")->error("Revert of task {} failed: {}", task_id, e.what());
        return {false, e.what()};
    }
    project_.revert_task(canvas_id, task_id);
    log::get("project")->info("Reverted task {} to {}", task_id, *target);
    return {true, {}};
}

OperationResult TaskRunner::restore(const std::string& canvas_id, const std::string& task_id) {
    auto canvas = project_.canvas(canvas_id);
    if (!canvas) {
        return {false, "Canvas not found"};
    }
    if (canvas->is_locked()) {
        return {false, std::string("Canvas is currently ") + lock_state_name(canvas->lock_state)};
    }
    if (canvas->ledger.current_in_progress_task()) {
        return {false, "Cannot restore while a task is in progress"};
    }
    const Task* task = canvas->ledger.task(task_id);
    auto* completed = task ? std::get_if<CompletedTask>(task) : nullptr;
    if (!completed || !is_real_commit(completed->commit_hash)) {
        return {false, "Task has no commit to restore"};
    }

    try {
        git_.revert_to_commit(working_directory(canvas->session), completed->commit_hash, canvas->session);
    } catch (const GitError& e) {
        log::get("git")->error("Restore of task {} failed: {}", task_id, e.what());
        return {false, e.what()};
    }
    project_.restore_task(canvas_id, task_id);
    log::get("project")->info("Restored task {} at {}", task_id, completed->commit_hash);
    return {true, {}};
}

std::shared_ptr<AutomationDriver> TaskRunner::driver(const std::string& canvas_id,
                                                     const std::string& element_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(slot_key(canvas_id, element_id));
    return it == slots_.end() ? nullptr : it->second.driver;
}

bool TaskRunner::has_active_task() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, slot] : slots_) {
        if (slot.task_started) {
            return true;
        }
    }
    return false;
}

void TaskRunner::on_driver_event(const std::string& key, const DriverEvent& event) {
    std::visit([&](auto&& evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, TaskCompleted>) {
            finish_task(key);
        } else if constexpr (std::is_same_v<T, TaskFailed>) {
            fail_task(key, evt.message);
        } else if constexpr (std::is_same_v<T, SessionReady>) {
            log::get("project")->debug("Session for {} ready for the next prompt", key);
        }
    }, event);
}

void TaskRunner::finish_task(const std::string& key) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end() || !it->second.task_started) {
            return;
        }
        slot = it->second;
        it->second.task_started = false;
    }

    auto canvas = project_.canvas(slot.canvas_id);
    if (!canvas) {
        return;
    }
    const Task* task = canvas->ledger.task(slot.task_id);
    std::string message = task ? task_prompt(*task) : std::string{};

    std::string hash;
    try {
        auto result = git_.commit(working_directory(canvas->session), message, canvas->session);
        hash = result.outcome == CommitOutcome::NothingToCommit ? std::string(NO_CHANGES) : result.hash;
    } catch (const GitError& e) {
        log::get("git")->error("Commit for task {} failed: {}", slot.task_id, e.what());
    }

    project_.complete_task(slot.canvas_id, slot.task_id, hash);
    project_.update_process_status(slot.canvas_id, slot.process_id, ProcessStatus::Finished);
    log::get("project")->info("Task {} completed with commit '{}'", slot.task_id, hash);
}

void TaskRunner::fail_task(const std::string& key, const std::string& message) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
    }

    log::get("project")->warn("Task {} failed: {}", slot.task_id, message);
    project_.update_process_status(slot.canvas_id, slot.process_id, ProcessStatus::Error);
    registry_.unregister(slot.process_id);
    if (slot.task_started) {
        project_.complete_task(slot.canvas_id, slot.task_id, "");
    }
    release_slot(slot);
}

void TaskRunner::release_slot(Slot& slot) {
    slot.driver->remove_listener(slot.listener);
    slot.driver->cleanup(true);
}

}
