#include "agents/merge_agent.h"
#include "core/error.h"
#include "core/logging.h"
#include "os/file_system.h"
#include "os/git_client.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace easel {

MergeAgent::MergeAgent(BackgroundAgent agent, GitClient& git, FileSystem& fs)
    : agent_(std::move(agent))
    , git_(git)
    , fs_(fs)
{
}

void MergeAgent::set_status_listener(StatusListener listener) {
    listener_ = std::move(listener);
}

void MergeAgent::setup() {
    update_status(AgentStatus::Initializing, "Setting up merge environment...");

    auto& ctx = mutable_context();
    const std::string& root_dir = working_directory(ctx.root_session);
    const std::string& canvas_dir = working_directory(ctx.canvas_session);
    const std::string work_dir = working_dir();
    auto logger = log::get("agent");

    if (!fs_.path_exists(canvas_dir, ctx.canvas_session)) {
        throw FileSystemError("Canvas directory no longer exists: " + canvas_dir +
                              ". The canvas may have been deleted.");
    }

    logger->info("Agent {}: copying root {} to {}", agent_.id, root_dir, work_dir);
    fs_.copy_directory(root_dir, work_dir, ctx.root_session);

    std::string current = git_.current_branch(work_dir, agent_.session).value_or(ctx.root_branch);
    if (current != ctx.root_branch) {
        try {
            git_.checkout(work_dir, ctx.root_branch, agent_.session);
        } catch (const GitError& e) {
            logger->warn("Agent {}: cannot check out {}, staying on {}: {}", agent_.id, ctx.root_branch, current,
                         e.what());
            ctx.root_branch = current;
        }
    }

    git_.create_branch(work_dir, CANVAS_CHANGES_BRANCH, agent_.session);
    fs_.copy_files(canvas_dir, work_dir, agent_.session, true);

    try {
        git_.commit(work_dir, "Apply changes from canvas branch " + ctx.canvas_branch, agent_.session);
    } catch (const GitError& e) {
        logger->info("Agent {}: nothing committed from canvas: {}", agent_.id, e.what());
    }

    try {
        git_.checkout(work_dir, ctx.root_branch, agent_.session);
    } catch (const GitError&) {
        try {
            git_.create_branch(work_dir, ctx.root_branch, agent_.session);
        } catch (const GitError& e) {
            auto actual = git_.current_branch(work_dir, agent_.session);
            logger->warn("Agent {}: cannot create {}, using {}: {}", agent_.id, ctx.root_branch,
                         actual.value_or(ctx.root_branch), e.what());
            if (actual) {
                ctx.root_branch = *actual;
            }
        }
    }

    update_status(AgentStatus::Checking, "Checking for merge conflicts...");
}

CompletionCheck MergeAgent::check_completion() {
    const auto& ctx = context();
    auto outcome = git_.merge_branch(working_dir(), CANVAS_CHANGES_BRANCH, ctx.root_branch, agent_.session);
    if (outcome.success) {
        log::get("agent")->info("Agent {}: merge into {} succeeded", agent_.id, ctx.root_branch);
        return {true, std::nullopt, {}};
    }

    auto files = git_.conflict_files(working_dir(), agent_.session);
    if (files.empty()) {
        throw GitError("Merge failed but no conflicts detected: " + outcome.output);
    }

    MergeAgentContext next = ctx;
    next.conflict_files = files;
    next.merge_attempts = ctx.merge_attempts + 1;

    CompletionCheck check;
    check.complete = false;
    check.new_context = std::move(next);
    check.instructions = fmt::format(
        "Merge conflicts detected in: {}. Please resolve all conflicts in these files by editing them "
        "directly. Do NOT run any git commands - only edit the files to resolve conflicts.",
        fmt::join(files, ", "));
    log::get("agent")->info("Agent {}: {} conflicted file(s)", agent_.id, files.size());
    return check;
}

std::string MergeAgent::generate_prompt(const std::string& retry_instructions) const {
    const auto& ctx = context();

    std::string history;
    for (size_t i = 0; i < ctx.historical_prompts.size(); ++i) {
        if (i > 0) history += "\n";
        history += fmt::format("{}. {}", i + 1, ctx.historical_prompts[i]);
    }

    std::string conflicts;
    for (size_t i = 0; i < ctx.conflict_files.size(); ++i) {
        if (i > 0) conflicts += "\n";
        conflicts += "- " + ctx.conflict_files[i];
    }

    const std::string& guidance = retry_instructions.empty()
        ? std::string("Please resolve all merge conflicts while preserving the intent of both versions.")
        : retry_instructions;

    return fmt::format(
        "You are resolving merge conflicts in a collaborative coding environment.\n"
        "\n"
        "HISTORICAL CONTEXT (all previous work that led to this merge):\n"
        "{}\n"
        "\n"
        "CURRENT TASK:\n"
        "Git has attempted to merge changes from a canvas workspace into the main branch, but merge "
        "conflicts were detected.\n"
        "Your job is to resolve these conflicts by editing the affected files directly.\n"
        "\n"
        "CONFLICT FILES TO RESOLVE:\n"
        "{}\n"
        "\n"
        "{}\n"
        "\n"
        "IMPORTANT INSTRUCTIONS:\n"
        "- DO NOT run any git commands (git merge, git add, git commit, etc.)\n"
        "- ONLY edit the conflicted files to resolve the conflicts\n"
        "- Look for conflict markers like <<<<<<< HEAD, =======, and >>>>>>>\n"
        "- Remove the conflict markers and integrate both changes appropriately\n"
        "- Focus on preserving functionality from both the original code and the canvas changes\n"
        "- The system will automatically commit your changes after you resolve the conflicts\n"
        "\n"
        "FILES WITH CONFLICTS: {}\n"
        "\n"
        "Attempt {} of {}.",
        history, conflicts, guidance, fmt::join(ctx.conflict_files, ", "),
        ctx.merge_attempts, ctx.max_attempts);
}

void MergeAgent::finalize() {
    update_status(AgentStatus::Completed, "Finalizing merge...");

    const auto& ctx = context();
    try {
        auto result = git_.commit(working_dir(), "Merge canvas changes: resolved conflicts automatically",
                                  agent_.session);
        if (result.outcome == CommitOutcome::Committed) {
            log::get("agent")->info("Agent {}: committed resolutions as {}", agent_.id, result.hash);
        }
    } catch (const GitError& e) {
        log::get("agent")->info("Agent {}: nothing to commit after resolution: {}", agent_.id, e.what());
    }

    fs_.copy_files(working_dir(), working_directory(ctx.root_session), ctx.root_session, true);
    update_status(AgentStatus::Completed, "Merge completed successfully");
}

void MergeAgent::apply_context(MergeAgentContext context) {
    mutable_context() = std::move(context);
    publish();
}

void MergeAgent::update_status(AgentStatus status, std::optional<std::string> progress,
                               std::optional<std::string> error) {
    agent_.update_status(status, std::move(progress), std::move(error));
    log::get("agent")->debug("Agent {} -> {} ({})", agent_.id, agent_status_name(status),
                             agent_.progress.value_or(""));
    publish();
}

void MergeAgent::set_driver_process(std::optional<std::string> process_id) {
    agent_.driver_process_id = std::move(process_id);
    publish();
}

void MergeAgent::publish() {
    if (listener_) {
        listener_(agent_);
    }
}

}
