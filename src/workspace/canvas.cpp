#include "workspace/canvas.h"

namespace easel {

namespace {

ProcessKind parse_process_kind(const std::string& s) {
    if (s == "custom-terminal") return ProcessKind::CustomTerminal;
    return ProcessKind::ClaudeCode;
}

ProcessStatus parse_process_status(const std::string& s) {
    if (s == "finished") return ProcessStatus::Finished;
    if (s == "completed") return ProcessStatus::Completed;
    if (s == "error") return ProcessStatus::Error;
    return ProcessStatus::Running;
}

CanvasLockState parse_lock_state(const std::string& s) {
    if (s == "merging") return CanvasLockState::Merging;
    if (s == "merged") return CanvasLockState::Merged;
    return CanvasLockState::Normal;
}

}

const char* process_kind_name(ProcessKind kind) {
    switch (kind) {
        case ProcessKind::ClaudeCode: return "claude-code";
        case ProcessKind::CustomTerminal: return "custom-terminal";
    }
    return "claude-code";
}

const char* process_status_name(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Running: return "running";
        case ProcessStatus::Finished: return "finished";
        case ProcessStatus::Completed: return "completed";
        case ProcessStatus::Error: return "error";
    }
    return "running";
}

const char* lock_state_name(CanvasLockState state) {
    switch (state) {
        case CanvasLockState::Normal: return "normal";
        case CanvasLockState::Merging: return "merging";
        case CanvasLockState::Merged: return "merged";
    }
    return "normal";
}

void to_json(nlohmann::json& j, const ProcessState& process) {
    j = nlohmann::json::object();
    j["processId"] = process.process_id;
    j["terminalId"] = process.terminal_id;
    j["type"] = process_kind_name(process.kind);
    j["status"] = process_status_name(process.status);
    j["startTime"] = process.start_time;
    j["elementId"] = process.element_id;
    if (process.prompt) j["prompt"] = *process.prompt;
}

void from_json(const nlohmann::json& j, ProcessState& process) {
    process.process_id = j.value("processId", std::string{});
    process.terminal_id = j.value("terminalId", std::string{});
    process.kind = parse_process_kind(j.value("type", std::string{}));
    process.status = parse_process_status(j.value("status", std::string{}));
    process.start_time = j.value("startTime", int64_t{0});
    process.element_id = j.value("elementId", std::string{});
    if (j.contains("prompt") && j["prompt"].is_string()) {
        process.prompt = j["prompt"].get<std::string>();
    }
}

nlohmann::json canvas_to_json(const Canvas& canvas) {
    nlohmann::json j;
    j["id"] = canvas.id;
    j["name"] = canvas.name;
    j["elements"] = canvas.elements;
    j["osSession"] = canvas.session;
    j["taskManager"] = canvas.ledger.to_json();
    j["runningProcesses"] = canvas.processes;
    j["lockState"] = lock_state_name(canvas.lock_state);
    if (canvas.locking_agent_id) j["lockingAgentId"] = *canvas.locking_agent_id;
    if (canvas.locked_at) j["lockedAt"] = *canvas.locked_at;
    j["createdAt"] = canvas.created_at;
    j["lastModified"] = canvas.last_modified;
    return j;
}

Canvas canvas_from_json(const nlohmann::json& j, const WorkspaceSession& fallback_session) {
    Canvas canvas;
    canvas.id = j.value("id", std::string{});
    if (canvas.id.empty()) {
        canvas.id = generate_id();
    }
    canvas.name = j.value("name", std::string{"Canvas"});

    if (j.contains("elements") && j["elements"].is_array()) {
        for (const auto& e : j["elements"]) {
            if (e.is_string()) canvas.elements.push_back(e.get<std::string>());
        }
    }

    canvas.session = fallback_session;
    if (j.contains("osSession") && j["osSession"].is_object()) {
        canvas.session = j["osSession"].get<WorkspaceSession>();
    }

    if (j.contains("taskManager") && j["taskManager"].is_object()) {
        canvas.ledger = TaskLedger::from_json(j["taskManager"]);
    }

    if (j.contains("runningProcesses") && j["runningProcesses"].is_array()) {
        canvas.processes = j["runningProcesses"].get<std::vector<ProcessState>>();
    }

    canvas.lock_state = parse_lock_state(j.value("lockState", std::string{"normal"}));
    if (j.contains("lockingAgentId") && j["lockingAgentId"].is_string()) {
        canvas.locking_agent_id = j["lockingAgentId"].get<std::string>();
    }
    if (j.contains("lockedAt") && j["lockedAt"].is_number()) {
        canvas.locked_at = j["lockedAt"].get<int64_t>();
    }

    int64_t now = now_millis();
    canvas.created_at = j.value("createdAt", now);
    canvas.last_modified = j.value("lastModified", now);
    return canvas;
}

}
