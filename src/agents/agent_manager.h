#pragma once

#include "core/config.h"
#include "core/event_queue.h"
#include "driver/automation_driver.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace easel {

class FileSystem;
class GitClient;
class GitProject;
class MergeAgent;
class ProcessRegistry;

struct AgentManagerOptions {
    int max_attempts = 3;
    std::chrono::milliseconds attempt_timeout = std::chrono::minutes(30);

    static AgentManagerOptions from_config(const AgentConfig& config);
};

// Starts background agents and runs each one's state machine on a worker
// thread. Projects handed to create_merge_agent must outlive the manager.
class BackgroundAgentManager {
public:
    using DriverFactory = std::function<std::shared_ptr<AutomationDriver>()>;

    BackgroundAgentManager(GitClient& git, FileSystem& fs, ProcessRegistry& registry, DriverFactory factory,
                           AgentManagerOptions options = {});
    ~BackgroundAgentManager();

    BackgroundAgentManager(const BackgroundAgentManager&) = delete;
    BackgroundAgentManager& operator=(const BackgroundAgentManager&) = delete;

    // Adds the agent to the project and locks the canvas to Merging before
    // the worker starts. Throws Error when the canvas cannot be locked.
    std::string create_merge_agent(GitProject& project, const std::string& canvas_id,
                                   std::vector<std::string> historical_prompts);

    // Stops the agent's driver, releases its canvas, deletes its working copy
    // and removes it from the project. Removal happens even if cleanup fails.
    void force_remove_agent(GitProject& project, const std::string& agent_id);

    // Reaps finished workers; returns how many are still running.
    size_t poll();
    void wait_all();
    size_t running() const;

    FileSystem& file_system() { return fs_; }

private:
    struct Run {
        EventQueue<DriverEvent> events;
        std::atomic<bool> cancelled{false};
    };

    struct Worker {
        std::string agent_id;
        std::future<void> future;
    };

    void run_merge(GitProject& project, std::string canvas_id, std::shared_ptr<MergeAgent> agent,
                   std::shared_ptr<Run> run);
    void run_attempt(MergeAgent& agent, const std::shared_ptr<Run>& run, const std::string& prompt);

    GitClient& git_;
    FileSystem& fs_;
    ProcessRegistry& registry_;
    DriverFactory factory_;
    AgentManagerOptions options_;

    mutable std::mutex mutex_;
    std::vector<Worker> workers_;
    std::map<std::string, std::shared_ptr<Run>> runs_;
};

}
