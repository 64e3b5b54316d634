#include "agents/agent_manager.h"
#include "agents/merge_agent.h"
#include "core/error.h"
#include "core/logging.h"
#include "os/file_system.h"
#include "os/git_client.h"
#include "process/process_registry.h"
#include "workspace/git_project.h"

#include <algorithm>
#include <fmt/format.h>

namespace easel {

namespace {

// <parent>/<name>-merge-<suffix> next to the root directory.
std::string merge_directory(const WorkspaceSession& root) {
    const std::string& root_dir = working_directory(root);
    char separator = '/';
    if (!is_wsl(root) && root_dir.find('/') == std::string::npos) {
        separator = '\\';
    }
    auto pos = root_dir.find_last_of(separator);
    std::string parent = pos == std::string::npos ? std::string(".") : root_dir.substr(0, pos);
    std::string name = pos == std::string::npos ? root_dir : root_dir.substr(pos + 1);
    return parent + separator + name + "-merge-" + random_suffix();
}

}

AgentManagerOptions AgentManagerOptions::from_config(const AgentConfig& config) {
    AgentManagerOptions options;
    options.max_attempts = std::max(1, config.max_attempts);
    options.attempt_timeout = std::chrono::minutes(std::max(1, config.attempt_timeout_minutes));
    return options;
}

BackgroundAgentManager::BackgroundAgentManager(GitClient& git, FileSystem& fs, ProcessRegistry& registry,
                                               DriverFactory factory, AgentManagerOptions options)
    : git_(git)
    , fs_(fs)
    , registry_(registry)
    , factory_(std::move(factory))
    , options_(options)
{
}

BackgroundAgentManager::~BackgroundAgentManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, run] : runs_) {
            run->cancelled = true;
            run->events.push(TaskFailed{"agent manager shutting down"});
        }
    }
    wait_all();
}

std::string BackgroundAgentManager::create_merge_agent(GitProject& project, const std::string& canvas_id,
                                                       std::vector<std::string> historical_prompts) {
    auto canvas = project.canvas(canvas_id);
    if (!canvas) {
        throw Error("Canvas not found");
    }
    auto logger = log::get("agent");

    WorkspaceSession root = project.root();
    std::string work_dir = merge_directory(root);

    auto root_branch = git_.current_branch(working_directory(root), root);
    if (!root_branch) {
        logger->warn("Failed to detect root branch in {}, using main", working_directory(root));
    }
    auto canvas_branch = git_.current_branch(working_directory(canvas->session), canvas->session);

    MergeAgentContext context;
    context.root_session = root;
    context.canvas_session = canvas->session;
    context.historical_prompts = std::move(historical_prompts);
    context.merge_attempts = 0;
    context.max_attempts = options_.max_attempts;
    context.root_branch = root_branch.value_or("main");
    context.canvas_branch = canvas_branch.value_or(context.root_branch);

    BackgroundAgent agent;
    agent.id = generate_id();
    agent.status = AgentStatus::Initializing;
    agent.created_at = now_millis();
    agent.last_updated = agent.created_at;
    agent.session = with_path(root, work_dir);
    agent.context = context;

    project.add_background_agent(agent);
    if (!project.lock_canvas(canvas_id, CanvasLockState::Merging, agent.id)) {
        project.remove_background_agent(agent.id);
        throw Error("Failed to lock canvas " + canvas_id + " for merging");
    }

    auto merge = std::make_shared<MergeAgent>(agent, git_, fs_);
    merge->set_status_listener([&project](const BackgroundAgent& state) {
        project.update_background_agent(state);
    });

    auto run = std::make_shared<Run>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_[agent.id] = run;
        workers_.push_back({agent.id, std::async(std::launch::async, &BackgroundAgentManager::run_merge, this,
                                                 std::ref(project), canvas_id, merge, run)});
    }

    logger->info("Merge agent {} started for canvas {} in {}", agent.id, canvas->name, work_dir);
    return agent.id;
}

void BackgroundAgentManager::force_remove_agent(GitProject& project, const std::string& agent_id) {
    auto agent = project.background_agent(agent_id);
    if (!agent) {
        return;
    }
    auto logger = log::get("agent");

    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(agent_id);
        if (it != runs_.end()) {
            run = it->second;
        }
    }
    if (run) {
        run->cancelled = true;
        run->events.push(TaskFailed{"agent removed"});
    }

    try {
        if (agent->driver_process_id) {
            if (auto driver = registry_.get_as<AutomationDriver>(*agent->driver_process_id)) {
                driver->stop_task();
            }
            registry_.unregister(*agent->driver_process_id);
        }

        for (const auto& canvas : project.canvases()) {
            if (canvas.locking_agent_id == agent_id) {
                project.unlock_canvas(canvas.id, agent_id);
            }
        }

        const std::string& work_dir = working_directory(agent->session);
        fs_.delete_path(work_dir, agent->session);
        logger->info("Force removed agent {} and deleted {}", agent_id, work_dir);
    } catch (const Error& e) {
        logger->error("Error cleaning up agent {}: {}", agent_id, e.what());
    }

    project.remove_background_agent(agent_id);
}

size_t BackgroundAgentManager::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.erase(
        std::remove_if(workers_.begin(), workers_.end(),
            [this](Worker& worker) {
                bool done = !worker.future.valid() ||
                            worker.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
                if (done) {
                    runs_.erase(worker.agent_id);
                }
                return done;
            }),
        workers_.end()
    );
    return workers_.size();
}

void BackgroundAgentManager::wait_all() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.future.valid()) {
            worker.future.wait();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& worker : workers) {
        runs_.erase(worker.agent_id);
    }
}

size_t BackgroundAgentManager::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(workers_.begin(), workers_.end(), [](const Worker& worker) {
        return worker.future.valid() &&
               worker.future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready;
    });
}

void BackgroundAgentManager::run_merge(GitProject& project, std::string canvas_id,
                                       std::shared_ptr<MergeAgent> agent, std::shared_ptr<Run> run) {
    auto logger = log::get("agent");
    const std::string agent_id = agent->id();

    try {
        agent->setup();
        auto check = agent->check_completion();

        while (!check.complete && agent->context().merge_attempts < agent->context().max_attempts) {
            if (run->cancelled) {
                throw Error("Agent was removed");
            }
            if (check.new_context) {
                agent->apply_context(*check.new_context);
            }

            int attempt = agent->context().merge_attempts;
            int max_attempts = agent->context().max_attempts;
            std::string prompt = agent->generate_prompt(check.instructions);
            agent->update_status(AgentStatus::Running,
                                 fmt::format("Running Claude Code (attempt {}/{})...", attempt, max_attempts));

            run_attempt(*agent, run, prompt);

            try {
                auto result = git_.commit(agent->working_dir(),
                                          fmt::format("Resolved merge conflicts - attempt {}", attempt),
                                          agent->state().session);
                if (result.outcome == CommitOutcome::NothingToCommit) {
                    logger->info("Agent {}: nothing to commit after attempt {}", agent_id, attempt);
                }
            } catch (const GitError& e) {
                logger->info("Agent {}: commit after attempt {} failed: {}", agent_id, attempt, e.what());
            }

            agent->update_status(AgentStatus::Checking, "Checking merge status...");
            check = agent->check_completion();
        }

        if (check.complete) {
            agent->finalize();
            if (!project.lock_canvas(canvas_id, CanvasLockState::Merged, agent_id)) {
                logger->warn("Agent {}: canvas {} could not be marked merged", agent_id, canvas_id);
            }
            logger->info("Agent {} completed; canvas {} merged", agent_id, canvas_id);
        } else {
            agent->update_status(AgentStatus::Failed, std::nullopt,
                                 fmt::format("Failed to complete merge after {} attempts",
                                             agent->context().max_attempts));
            project.unlock_canvas(canvas_id, agent_id);
            logger->warn("Agent {} failed; canvas {} unlocked", agent_id, canvas_id);
        }
    } catch (const std::exception& e) {
        logger->error("Agent {}: {}", agent_id, e.what());
        agent->update_status(AgentStatus::Failed, std::nullopt, e.what());
        project.unlock_canvas(canvas_id, agent_id);
    }
}

void BackgroundAgentManager::run_attempt(MergeAgent& agent, const std::shared_ptr<Run>& run,
                                         const std::string& prompt) {
    run->events.drain();
    if (run->cancelled) {
        throw Error("Agent was removed");
    }

    auto driver = factory_();
    std::string process_id = generate_id();
    std::shared_ptr<Run> sink = run;
    auto listener = driver->add_listener([sink](const DriverEvent& event) {
        sink->events.push(event);
    });

    registry_.register_process(process_id, driver);
    agent.set_driver_process(process_id);

    auto release = [&]() {
        driver->remove_listener(listener);
        driver->cleanup(true);
        registry_.unregister(process_id);
        agent.set_driver_process(std::nullopt);
    };

    try {
        driver->start_task(agent.state().session, prompt, nullptr);

        auto deadline = std::chrono::steady_clock::now() + options_.attempt_timeout;
        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                throw TimeoutError("Claude Code process timed out");
            }
            auto event = run->events.wait_pop_for(deadline - now);
            if (!event) {
                continue;
            }
            if (std::holds_alternative<TaskCompleted>(*event)) {
                break;
            }
            if (auto* failed = std::get_if<TaskFailed>(&*event)) {
                throw Error("Claude Code task failed: " + failed->message);
            }
        }
    } catch (const std::exception&) {
        release();
        throw;
    }
    release();
}

}
