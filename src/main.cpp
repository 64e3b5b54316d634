#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "agents/agent_manager.h"
#include "core/config.h"
#include "core/event_loop.h"
#include "core/logging.h"
#include "driver/tui_driver.h"
#include "os/command_runner.h"
#include "os/local_file_system.h"
#include "os/shell_git_client.h"
#include "process/process_registry.h"
#include "store/project_store.h"
#include "terminal/pty_transport.h"
#include "workspace/git_project.h"
#include "workspace/task_runner.h"

namespace fs = std::filesystem;

namespace {

struct Options {
    std::string command;
    std::string root;
    std::vector<std::string> args;
    std::optional<std::string> wsl_distribution;
    std::optional<std::string> config_path;
};

void print_usage() {
    fprintf(stderr,
            "usage: easel [--wsl <distribution>] [--config <file>] <command> <root> [args]\n"
            "\n"
            "commands:\n"
            "  status  <root>               list canvases, tasks and background agents\n"
            "  canvas  <root>               copy the root into a new canvas\n"
            "  run     <root> <prompt>      run a prompt on the current canvas\n"
            "  merge   <root> <canvas-id>   merge a canvas back into the root\n"
            "  revert  <root> <task-id>     reset the canvas to before the task\n"
            "  restore <root> <task-id>     reset the canvas to the task's commit\n");
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options options;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--wsl") == 0 && i + 1 < argc) {
            options.wsl_distribution = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return std::nullopt;
        } else {
            positional.push_back(argv[i]);
        }
    }
    if (positional.size() < 2) {
        return std::nullopt;
    }
    options.command = positional[0];
    options.root = positional[1];
    options.args.assign(positional.begin() + 2, positional.end());
    return options;
}

easel::WorkspaceSession root_session(const Options& options) {
    if (options.wsl_distribution) {
        return easel::WslSession{*options.wsl_distribution, options.root};
    }
    std::error_code ec;
    fs::path path = fs::weakly_canonical(fs::absolute(options.root, ec), ec);
    return easel::LocalSession{ec ? options.root : path.string()};
}

const char* task_marker(const easel::Task& task) {
    if (auto* done = std::get_if<easel::CompletedTask>(&task)) {
        if (done->is_reverted) return "reverted";
        if (done->commit_hash.empty()) return "failed";
        if (done->commit_hash == easel::NO_CHANGES) return "no changes";
        return "committed";
    }
    return easel::task_status_name(task);
}

void print_status(const easel::GitProject& project) {
    printf("%s (%s)\n", project.name().c_str(), easel::working_directory(project.root()).c_str());

    int current = project.current_canvas_index();
    auto canvases = project.canvases();
    for (size_t i = 0; i < canvases.size(); ++i) {
        const auto& c = canvases[i];
        printf("%s %s  %s  [%s]\n", static_cast<int>(i) == current ? "*" : " ", c.id.c_str(), c.name.c_str(),
               easel::lock_state_name(c.lock_state));
        for (const auto& task : c.ledger.tasks()) {
            printf("    %s  %-10s  %s\n", easel::task_id(task).c_str(), task_marker(task),
                   easel::task_prompt(task).c_str());
        }
    }

    for (const auto& agent : project.background_agents()) {
        printf("  agent %s  %s  %s%s%s\n", agent.id.c_str(), easel::agent_status_name(agent.status),
               agent.progress.value_or("").c_str(), agent.error_message ? "  error: " : "",
               agent.error_message.value_or("").c_str());
    }
}

std::optional<std::string> canvas_of_task(const easel::GitProject& project, const std::string& task_id) {
    for (const auto& c : project.canvases()) {
        if (c.ledger.task(task_id)) {
            return c.id;
        }
    }
    return std::nullopt;
}

}

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 2;
    }

    auto config = easel::EaselConfig::load(options->config_path.value_or(easel::EaselConfig::default_path()));
    easel::init_logging(config.logging);

    easel::ProjectStore store;
    if (!store.load()) {
        fprintf(stderr, "Cannot read %s\n", store.path().c_str());
        return 1;
    }

    easel::EventLoop loop;
    easel::PtyTransport transport;
    loop.add_poller([&transport]() { transport.poll(); });

    easel::ProcessRegistry registry;
    easel::CommandRunner runner;
    easel::ShellGitClient git(runner);
    easel::LocalFileSystem file_system(runner);

    auto driver_factory = [&]() -> std::shared_ptr<easel::AutomationDriver> {
        return std::make_shared<easel::TuiAutomationDriver>(transport, loop, config.driver, &registry);
    };

    auto agent_options = easel::AgentManagerOptions::from_config(config.agent);
    easel::BackgroundAgentManager agents(git, file_system, registry, driver_factory, agent_options);

    easel::GitProject& project = store.open(root_session(*options));
    project.ensure_default_canvas();

    // Nothing survives a restart; every claim of a running process is stale.
    auto recovered = project.recover_processes(registry);
    if (!recovered.empty()) {
        fprintf(stderr, "%zu interrupted task(s) were closed without a commit\n", recovered.size());
    }

    int status = 0;
    const std::string& command = options->command;

    if (command == "status") {
        print_status(project);
    } else if (command == "canvas") {
        try {
            std::string id = project.add_canvas_copy(git, file_system);
            printf("%s\n", id.c_str());
        } catch (const easel::Error& e) {
            fprintf(stderr, "Cannot create canvas: %s\n", e.what());
            status = 1;
        }
    } else if (command == "run" && !options->args.empty()) {
        std::string prompt;
        for (const auto& word : options->args) {
            if (!prompt.empty()) prompt += " ";
            prompt += word;
        }

        auto canvas = project.current_canvas();
        std::string element = canvas->elements.empty() ? easel::generate_id() : canvas->elements.front();
        easel::TaskRunner tasks(project, git, registry, driver_factory);
        auto result = tasks.submit(canvas->id, element, prompt);
        if (!result.success) {
            fprintf(stderr, "Cannot start task: %s\n", result.error.c_str());
            status = 1;
        } else {
            auto finished = [&]() {
                auto c = project.canvas(canvas->id);
                const easel::Task* task = c ? c->ledger.task(result.task_id) : nullptr;
                return !tasks.driver(canvas->id, element) ||
                       (task && std::holds_alternative<easel::CompletedTask>(*task));
            };
            if (!loop.run_until(finished, agent_options.attempt_timeout)) {
                fprintf(stderr, "Task did not finish in time\n");
                status = 1;
            }
            tasks.cleanup(canvas->id, element);
            print_status(project);
        }
    } else if (command == "merge" && !options->args.empty()) {
        auto result = project.merge_canvas_to_root(options->args[0], agents);
        if (!result.success) {
            fprintf(stderr, "Cannot merge: %s\n", result.error.c_str());
            status = 1;
        } else {
            auto budget = agent_options.attempt_timeout * (agent_options.max_attempts + 1);
            if (!loop.run_until([&agents]() { return agents.poll() == 0; }, budget)) {
                fprintf(stderr, "Merge did not finish in time\n");
                agents.force_remove_agent(project, result.agent_id);
            }
            auto agent = project.background_agent(result.agent_id);
            if (!agent || agent->status != easel::AgentStatus::Completed) {
                status = 1;
            }
            print_status(project);
        }
    } else if ((command == "revert" || command == "restore") && !options->args.empty()) {
        const std::string& task_id = options->args[0];
        auto canvas_id = canvas_of_task(project, task_id);
        if (!canvas_id) {
            fprintf(stderr, "Unknown task %s\n", task_id.c_str());
            status = 1;
        } else {
            easel::TaskRunner tasks(project, git, registry, driver_factory);
            auto result = command == "revert" ? tasks.revert(*canvas_id, task_id) : tasks.restore(*canvas_id, task_id);
            if (!result.success) {
                fprintf(stderr, "Cannot %s: %s\n", command.c_str(), result.error.c_str());
                status = 1;
            }
        }
    } else {
        print_usage();
        status = 2;
    }

    agents.wait_all();
    if (!store.save()) {
        fprintf(stderr, "Cannot write %s\n", store.path().c_str());
        return 1;
    }
    return status;
}
