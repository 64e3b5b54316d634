#include "os/local_file_system.h"
#include "core/error.h"
#include "core/logging.h"

#include <filesystem>

namespace easel {

namespace fs = std::filesystem;

LocalFileSystem::LocalFileSystem(CommandRunner& runner)
    : runner_(runner)
{
}

void LocalFileSystem::run_or_throw(const std::vector<std::string>& argv, const WorkspaceSession& session) {
    auto result = runner_.run(argv, "/", session);
    if (!result.ok()) {
        std::string command;
        for (const auto& a : argv) command += (command.empty() ? "" : " ") + a;
        throw FileSystemError(command + " failed: " + result.output);
    }
}

void LocalFileSystem::copy_directory(const std::string& src, const std::string& dst,
                                     const WorkspaceSession& session) {
    log::get("fs")->info("Copying {} to {}", src, dst);
    if (is_wsl(session)) {
        run_or_throw({"cp", "-a", src, dst}, session);
        return;
    }

    std::error_code ec;
    if (fs::exists(dst, ec)) {
        throw FileSystemError("Destination already exists: " + dst);
    }
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        throw FileSystemError("Failed to copy " + src + " to " + dst + ": " + ec.message());
    }
}

void LocalFileSystem::copy_files(const std::string& src, const std::string& dst,
                                 const WorkspaceSession& session, bool exclude_git) {
    if (is_wsl(session)) {
        std::vector<std::string> argv{"rsync", "-a"};
        if (exclude_git) argv.push_back("--exclude=.git");
        argv.push_back(src + "/");
        argv.push_back(dst + "/");
        run_or_throw(argv, session);
        return;
    }

    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        throw FileSystemError("Source directory does not exist: " + src);
    }

    for (const auto& entry : fs::directory_iterator(src, ec)) {
        if (exclude_git && entry.path().filename() == ".git") {
            continue;
        }
        fs::path target = fs::path(dst) / entry.path().filename();
        std::error_code copy_ec;
        if (entry.is_directory(copy_ec)) {
            fs::create_directories(target, copy_ec);
            fs::copy(entry.path(), target,
                     fs::copy_options::recursive | fs::copy_options::overwrite_existing |
                     fs::copy_options::copy_symlinks, copy_ec);
        } else {
            fs::copy(entry.path(), target,
                     fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks, copy_ec);
        }
        if (copy_ec) {
            throw FileSystemError("Failed to copy " + entry.path().string() + ": " + copy_ec.message());
        }
    }
    if (ec) {
        throw FileSystemError("Failed to list " + src + ": " + ec.message());
    }
}

bool LocalFileSystem::path_exists(const std::string& path, const WorkspaceSession& session) {
    if (is_wsl(session)) {
        return runner_.run({"test", "-e", path}, "/", session).ok();
    }
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

void LocalFileSystem::delete_path(const std::string& path, const WorkspaceSession& session) {
    log::get("fs")->info("Deleting {}", path);
    if (is_wsl(session)) {
        run_or_throw({"rm", "-rf", path}, session);
        return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw FileSystemError("Failed to delete " + path + ": " + ec.message());
    }
}

}
