#pragma once

#include "core/error.h"
#include "driver/automation_driver.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace easel {

class GitClient;
class GitProject;
class ProcessRegistry;

struct SubmitResult {
    bool success = false;
    std::string error;
    std::string task_id;
    std::string process_id;
};

// Runs prompts typed on a canvas element: one driver per element, a commit per
// finished task, and git-backed revert and restore of completed tasks.
class TaskRunner {
public:
    using DriverFactory = std::function<std::shared_ptr<AutomationDriver>()>;

    TaskRunner(GitProject& project, GitClient& git, ProcessRegistry& registry, DriverFactory factory);
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // Refused while the canvas is locked or already has a task in progress.
    SubmitResult submit(const std::string& canvas_id, const std::string& element_id, const std::string& prompt);
    // Interrupts the element's task; its terminal stays open.
    bool stop(const std::string& canvas_id, const std::string& element_id);
    // Kills the element's terminal and forgets its process.
    bool cleanup(const std::string& canvas_id, const std::string& element_id);

    OperationResult revert(const std::string& canvas_id, const std::string& task_id);
    OperationResult restore(const std::string& canvas_id, const std::string& task_id);

    std::shared_ptr<AutomationDriver> driver(const std::string& canvas_id, const std::string& element_id) const;
    bool has_active_task() const;

private:
    struct Slot {
        std::string canvas_id;
        std::string element_id;
        std::shared_ptr<AutomationDriver> driver;
        AutomationDriver::ListenerId listener = 0;
        std::string process_id;
        std::string task_id;
        bool task_started = false;
    };

    static std::string slot_key(const std::string& canvas_id, const std::string& element_id);

    void on_driver_event(const std::string& key, const DriverEvent& event);
    void finish_task(const std::string& key);
    void fail_task(const std::string& key, const std::string& message);
    void release_slot(Slot& slot);

    GitProject& project_;
    GitClient& git_;
    ProcessRegistry& registry_;
    DriverFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
};

}
