#include "agents/background_agent.h"
#include "core/error.h"

namespace easel {

namespace {

AgentStatus parse_agent_status(const std::string& s) {
    if (s == "checking") return AgentStatus::Checking;
    if (s == "running") return AgentStatus::Running;
    if (s == "completed") return AgentStatus::Completed;
    if (s == "failed") return AgentStatus::Failed;
    return AgentStatus::Initializing;
}

}

const char* agent_status_name(AgentStatus status) {
    switch (status) {
        case AgentStatus::Initializing: return "initializing";
        case AgentStatus::Checking: return "checking";
        case AgentStatus::Running: return "running";
        case AgentStatus::Completed: return "completed";
        case AgentStatus::Failed: return "failed";
    }
    return "initializing";
}

const char* agent_kind_name(const AgentContext& context) {
    return std::visit([](const auto&) { return "merge"; }, context);
}

void BackgroundAgent::update_status(AgentStatus next, std::optional<std::string> progress_text,
                                    std::optional<std::string> error) {
    status = next;
    last_updated = now_millis();
    if (progress_text) progress = std::move(progress_text);
    if (error) error_message = std::move(error);
}

void to_json(nlohmann::json& j, const MergeAgentContext& context) {
    j = nlohmann::json::object();
    j["rootOsSession"] = context.root_session;
    j["canvasToMergeOsSession"] = context.canvas_session;
    j["allHistoricalPrompts"] = context.historical_prompts;
    j["conflictFiles"] = context.conflict_files;
    j["mergeAttempts"] = context.merge_attempts;
    j["maxAttempts"] = context.max_attempts;
    j["rootBranchName"] = context.root_branch;
    j["canvasBranchName"] = context.canvas_branch;
}

void from_json(const nlohmann::json& j, MergeAgentContext& context) {
    if (j.contains("rootOsSession")) context.root_session = j["rootOsSession"].get<WorkspaceSession>();
    if (j.contains("canvasToMergeOsSession")) context.canvas_session = j["canvasToMergeOsSession"].get<WorkspaceSession>();
    if (j.contains("allHistoricalPrompts") && j["allHistoricalPrompts"].is_array()) {
        context.historical_prompts = j["allHistoricalPrompts"].get<std::vector<std::string>>();
    }
    if (j.contains("conflictFiles") && j["conflictFiles"].is_array()) {
        context.conflict_files = j["conflictFiles"].get<std::vector<std::string>>();
    }
    context.merge_attempts = j.value("mergeAttempts", 0);
    context.max_attempts = j.value("maxAttempts", 3);
    context.root_branch = j.value("rootBranchName", std::string{"main"});
    context.canvas_branch = j.value("canvasBranchName", context.root_branch);
}

nlohmann::json agent_to_json(const BackgroundAgent& agent) {
    nlohmann::json j;
    j["id"] = agent.id;
    j["type"] = agent_kind_name(agent.context);
    j["status"] = agent_status_name(agent.status);
    j["createdAt"] = agent.created_at;
    j["lastUpdated"] = agent.last_updated;
    j["osSession"] = agent.session;
    j["context"] = std::visit([](const auto& c) { return nlohmann::json(c); }, agent.context);
    if (agent.progress) j["progress"] = *agent.progress;
    if (agent.driver_process_id) j["claudeCodeProcessId"] = *agent.driver_process_id;
    if (agent.error_message) j["errorMessage"] = *agent.error_message;
    return j;
}

BackgroundAgent agent_from_json(const nlohmann::json& j) {
    std::string type = j.value("type", std::string{});
    if (type != "merge") {
        throw Error("Unknown background agent type: " + type);
    }

    BackgroundAgent agent;
    agent.id = j.value("id", std::string{});
    agent.status = parse_agent_status(j.value("status", std::string{}));
    agent.created_at = j.value("createdAt", int64_t{0});
    agent.last_updated = j.value("lastUpdated", agent.created_at);
    if (j.contains("osSession")) agent.session = j["osSession"].get<WorkspaceSession>();
    if (j.contains("context") && j["context"].is_object()) {
        agent.context = j["context"].get<MergeAgentContext>();
    }
    if (j.contains("progress") && j["progress"].is_string()) agent.progress = j["progress"].get<std::string>();
    if (j.contains("claudeCodeProcessId") && j["claudeCodeProcessId"].is_string()) {
        agent.driver_process_id = j["claudeCodeProcessId"].get<std::string>();
    }
    if (j.contains("errorMessage") && j["errorMessage"].is_string()) {
        agent.error_message = j["errorMessage"].get<std::string>();
    }
    return agent;
}

}
