#pragma once

#include "core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace easel {

enum class AgentStatus {
    Initializing,
    Checking,
    Running,
    Completed,
    Failed
};

const char* agent_status_name(AgentStatus status);

struct MergeAgentContext {
    WorkspaceSession root_session;
    WorkspaceSession canvas_session;
    std::vector<std::string> historical_prompts;
    std::vector<std::string> conflict_files;
    int merge_attempts = 0;
    int max_attempts = 3;
    std::string root_branch;
    std::string canvas_branch;
};

// One alternative per agent kind; merge is the only kind so far.
using AgentContext = std::variant<MergeAgentContext>;

const char* agent_kind_name(const AgentContext& context);

struct BackgroundAgent {
    std::string id;
    AgentStatus status = AgentStatus::Initializing;
    int64_t created_at = 0;
    int64_t last_updated = 0;
    // Working copy the agent operates in.
    WorkspaceSession session;
    AgentContext context;
    std::optional<std::string> progress;
    std::optional<std::string> driver_process_id;
    std::optional<std::string> error_message;

    // Progress and error are only replaced when given.
    void update_status(AgentStatus next, std::optional<std::string> progress_text = std::nullopt,
                       std::optional<std::string> error = std::nullopt);

    bool is_finished() const { return status == AgentStatus::Completed || status == AgentStatus::Failed; }
};

void to_json(nlohmann::json& j, const MergeAgentContext& context);
void from_json(const nlohmann::json& j, MergeAgentContext& context);

nlohmann::json agent_to_json(const BackgroundAgent& agent);
// Throws easel::Error for unknown agent kinds.
BackgroundAgent agent_from_json(const nlohmann::json& j);

}
