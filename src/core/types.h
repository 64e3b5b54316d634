#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace easel {

struct LocalSession {
    std::string path;
};

struct WslSession {
    std::string distribution;
    std::string path;
};

// Where a canvas, root or agent working copy lives.
using WorkspaceSession = std::variant<LocalSession, WslSession>;

const std::string& working_directory(const WorkspaceSession& session);

// Same session kind and distribution, different directory.
WorkspaceSession with_path(const WorkspaceSession& session, const std::string& path);

bool is_wsl(const WorkspaceSession& session);

void to_json(nlohmann::json& j, const WorkspaceSession& session);
void from_json(const nlohmann::json& j, WorkspaceSession& session);

// RFC 4122 version 4 identifier.
std::string generate_id();

// Lowercase alphanumeric suffix used for canvas and merge directory names.
std::string random_suffix(size_t length = 8);

int64_t now_millis();

}
