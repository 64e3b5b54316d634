#include "os/shell_git_client.h"
#include "core/error.h"
#include "core/logging.h"

#include <cctype>
#include <sstream>

namespace easel {

namespace {

std::string trim(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    return value.substr(start);
}

bool is_nothing_to_commit(const std::string& output) {
    return output.find("nothing to commit") != std::string::npos ||
           output.find("nothing added to commit") != std::string::npos ||
           output.find("no changes added to commit") != std::string::npos;
}

}

ShellGitClient::ShellGitClient(CommandRunner& runner)
    : runner_(runner)
{
}

CommandResult ShellGitClient::git(const std::vector<std::string>& args, const std::string& directory,
                                  const WorkspaceSession& session) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_.run(argv, directory, session);
}

CommandResult ShellGitClient::git_or_throw(const std::vector<std::string>& args, const std::string& directory,
                                           const WorkspaceSession& session) {
    auto result = git(args, directory, session);
    if (!result.ok()) {
        std::string command = "git";
        for (const auto& a : args) command += " " + a;
        throw GitError(command + " failed in " + directory + ": " + trim(result.output));
    }
    return result;
}

std::optional<std::string> ShellGitClient::current_branch(const std::string& directory,
                                                          const WorkspaceSession& session) {
    auto result = git({"rev-parse", "--abbrev-ref", "HEAD"}, directory, session);
    if (!result.ok()) {
        return std::nullopt;
    }
    std::string branch = trim(result.output);
    if (branch.empty() || branch == "HEAD") {
        return std::nullopt;
    }
    return branch;
}

CommitResult ShellGitClient::commit(const std::string& directory, const std::string& message,
                                    const WorkspaceSession& session) {
    git_or_throw({"add", "-A"}, directory, session);

    auto result = git({"commit", "-m", message}, directory, session);
    if (!result.ok()) {
        if (is_nothing_to_commit(result.output)) {
            return CommitResult{CommitOutcome::NothingToCommit, {}};
        }
        throw GitError("git commit failed in " + directory + ": " + trim(result.output));
    }

    auto head = git_or_throw({"rev-parse", "HEAD"}, directory, session);
    std::string hash = trim(head.output);
    log::get("git")->info("Committed {} in {}", hash, directory);
    return CommitResult{CommitOutcome::Committed, hash};
}

void ShellGitClient::add_files(const std::string& directory, const std::vector<std::string>& files,
                               const WorkspaceSession& session) {
    std::vector<std::string> args{"add", "--"};
    args.insert(args.end(), files.begin(), files.end());
    git_or_throw(args, directory, session);
}

void ShellGitClient::discard_file_changes(const std::string& directory, const std::vector<std::string>& files,
                                          const WorkspaceSession& session) {
    std::vector<std::string> args{"checkout", "--"};
    args.insert(args.end(), files.begin(), files.end());
    git_or_throw(args, directory, session);
}

void ShellGitClient::revert_to_commit(const std::string& directory, const std::string& commit,
                                      const WorkspaceSession& session) {
    git_or_throw({"reset", "--hard", commit}, directory, session);
    log::get("git")->info("Reset {} to {}", directory, commit);
}

void ShellGitClient::create_branch(const std::string& directory, const std::string& branch,
                                   const WorkspaceSession& session) {
    git_or_throw({"checkout", "-b", branch}, directory, session);
}

void ShellGitClient::checkout(const std::string& directory, const std::string& branch,
                              const WorkspaceSession& session) {
    git_or_throw({"checkout", branch}, directory, session);
}

MergeOutcome ShellGitClient::merge_branch(const std::string& directory, const std::string& source,
                                          const std::string& target, const WorkspaceSession& session) {
    auto checkout_result = git({"checkout", target}, directory, session);
    if (!checkout_result.ok()) {
        return MergeOutcome{false, trim(checkout_result.output)};
    }
    auto result = git({"merge", "--no-edit", source}, directory, session);
    return MergeOutcome{result.ok(), trim(result.output)};
}

std::vector<std::string> ShellGitClient::conflict_files(const std::string& directory,
                                                        const WorkspaceSession& session) {
    auto result = git_or_throw({"diff", "--name-only", "--diff-filter=U"}, directory, session);
    std::vector<std::string> files;
    std::istringstream stream(result.output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) files.push_back(line);
    }
    return files;
}

}
