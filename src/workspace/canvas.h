#pragma once

#include "core/types.h"
#include "workspace/task_ledger.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace easel {

enum class ProcessKind {
    ClaudeCode,
    CustomTerminal
};

enum class ProcessStatus {
    Running,
    Finished,
    Completed,
    Error
};

const char* process_kind_name(ProcessKind kind);
const char* process_status_name(ProcessStatus status);

// Persisted claim that a driver runs for an element. The process registry
// decides whether the claim still holds.
struct ProcessState {
    std::string process_id;
    std::string terminal_id;
    ProcessKind kind = ProcessKind::ClaudeCode;
    ProcessStatus status = ProcessStatus::Running;
    int64_t start_time = 0;
    std::string element_id;
    std::optional<std::string> prompt;
};

enum class CanvasLockState {
    Normal,
    Merging,
    Merged
};

const char* lock_state_name(CanvasLockState state);

struct Canvas {
    std::string id;
    std::string name;
    // Ids of the prompt elements placed on this canvas.
    std::vector<std::string> elements;
    WorkspaceSession session;
    TaskLedger ledger;
    std::vector<ProcessState> processes;
    CanvasLockState lock_state = CanvasLockState::Normal;
    std::optional<std::string> locking_agent_id;
    std::optional<int64_t> locked_at;
    int64_t created_at = 0;
    int64_t last_modified = 0;

    bool is_locked() const { return lock_state != CanvasLockState::Normal; }
};

void to_json(nlohmann::json& j, const ProcessState& process);
void from_json(const nlohmann::json& j, ProcessState& process);

nlohmann::json canvas_to_json(const Canvas& canvas);
// Canvases saved before sessions or locks existed fall back to the project root and Normal.
Canvas canvas_from_json(const nlohmann::json& j, const WorkspaceSession& fallback_session);

}
