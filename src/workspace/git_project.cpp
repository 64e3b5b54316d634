#include "workspace/git_project.h"
#include "agents/agent_manager.h"
#include "core/error.h"
#include "core/logging.h"
#include "os/file_system.h"
#include "os/git_client.h"
#include "process/process_registry.h"

#include <algorithm>

namespace easel {

namespace {

std::string default_project_name(const WorkspaceSession& root) {
    std::string path = working_directory(root);
    while (path.size() > 1 && (path.back() == '/' || path.back() == '\\')) {
        path.pop_back();
    }
    auto pos = path.find_last_of("/\\");
    std::string last = pos == std::string::npos ? path : path.substr(pos + 1);
    if (!last.empty()) {
        return last;
    }
    return is_wsl(root) ? "WSL Project" : "Local Project";
}

}

GitProject::GitProject(WorkspaceSession root, std::string name)
    : id_(generate_id())
    , name_(std::move(name))
    , root_(std::move(root))
    , created_at_(now_millis())
    , last_modified_(created_at_)
{
    if (name_.empty()) {
        name_ = default_project_name(root_);
    }
}

std::string GitProject::id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

std::string GitProject::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

WorkspaceSession GitProject::root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_;
}

int64_t GitProject::created_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_at_;
}

int64_t GitProject::last_modified() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_modified_;
}

std::vector<Canvas> GitProject::canvases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return canvases_;
}

std::optional<Canvas> GitProject::canvas(const std::string& canvas_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* c = find_canvas_locked(canvas_id)) {
        return *c;
    }
    return std::nullopt;
}

std::optional<Canvas> GitProject::current_canvas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_canvas_index_ < 0 || current_canvas_index_ >= static_cast<int>(canvases_.size())) {
        return std::nullopt;
    }
    return canvases_[current_canvas_index_];
}

int GitProject::current_canvas_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_canvas_index_;
}

bool GitProject::set_current_canvas_index(int index) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index < -1 || index >= static_cast<int>(canvases_.size()) || index == current_canvas_index_) {
            return false;
        }
        current_canvas_index_ = index;
        touch_locked();
    }
    notify(ProjectTopic::CurrentCanvasIndex);
    return true;
}

std::string GitProject::add_canvas(Canvas canvas) {
    std::string id = canvas.id;
    bool selected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        canvases_.push_back(std::move(canvas));
        if (current_canvas_index_ == -1) {
            current_canvas_index_ = 0;
            selected = true;
        }
        touch_locked();
    }
    notify(ProjectTopic::Canvases);
    if (selected) {
        notify(ProjectTopic::CurrentCanvasIndex);
    }
    return id;
}

std::string GitProject::ensure_default_canvas() {
    Canvas canvas;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!canvases_.empty()) {
            int index = std::clamp(current_canvas_index_, 0, static_cast<int>(canvases_.size()) - 1);
            return canvases_[index].id;
        }
        canvas = make_canvas_locked("Initial version", root_);
    }
    return add_canvas(std::move(canvas));
}

std::string GitProject::add_canvas_copy(GitClient& git, FileSystem& fs) {
    WorkspaceSession root_session = root();
    std::string suffix = random_suffix();
    std::string branch = "canvas-" + suffix;
    std::string copy_dir = working_directory(root_session) + "-" + suffix;

    fs.copy_directory(working_directory(root_session), copy_dir, root_session);
    WorkspaceSession canvas_session = with_path(root_session, copy_dir);
    git.create_branch(copy_dir, branch, canvas_session);

    Canvas canvas;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        canvas = make_canvas_locked("Canvas " + std::to_string(canvases_.size() + 1) + " (" + branch + ")",
                                    canvas_session);
    }
    log::get("project")->info("Created canvas copy {} on branch {}", copy_dir, branch);
    return add_canvas(std::move(canvas));
}

bool GitProject::remove_canvas(const std::string& canvas_id) {
    bool index_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (canvases_.size() <= 1) {
            return false;
        }
        auto it = std::find_if(canvases_.begin(), canvases_.end(),
                               [&](const Canvas& c) { return c.id == canvas_id; });
        if (it == canvases_.end()) {
            return false;
        }
        int removed = static_cast<int>(it - canvases_.begin());
        canvases_.erase(it);

        int size = static_cast<int>(canvases_.size());
        int previous = current_canvas_index_;
        if (current_canvas_index_ >= size) {
            current_canvas_index_ = size - 1;
        } else if (current_canvas_index_ > removed) {
            --current_canvas_index_;
        }
        index_changed = previous != current_canvas_index_;
        touch_locked();
    }
    notify(ProjectTopic::Canvases);
    if (index_changed) {
        notify(ProjectTopic::CurrentCanvasIndex);
    }
    return true;
}

bool GitProject::rename_canvas(const std::string& canvas_id, const std::string& name) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        c.name = name;
        return true;
    });
}

bool GitProject::update_canvas_elements(const std::string& canvas_id, std::vector<std::string> elements) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        c.elements = std::move(elements);
        return true;
    });
}

std::optional<std::string> GitProject::create_task(const std::string& canvas_id, const std::string& prompt) {
    std::optional<std::string> id;
    mutate_canvas(canvas_id, [&](Canvas& c) {
        if (c.is_locked()) {
            return false;
        }
        id = c.ledger.create_prompting_task(prompt);
        return true;
    });
    return id;
}

bool GitProject::update_task_prompt(const std::string& canvas_id, const std::string& task_id,
                                    const std::string& prompt) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        return !c.is_locked() && c.ledger.update_task_prompt(task_id, prompt);
    });
}

bool GitProject::start_task(const std::string& canvas_id, const std::string& task_id,
                            std::optional<std::string> process_id) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        return c.ledger.start_task(task_id, std::move(process_id));
    });
}

bool GitProject::complete_task(const std::string& canvas_id, const std::string& task_id,
                               const std::string& commit_hash) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        return c.ledger.complete_task(task_id, commit_hash);
    });
}

bool GitProject::revert_task(const std::string& canvas_id, const std::string& task_id) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        return c.ledger.revert_task(task_id);
    });
}

bool GitProject::restore_task(const std::string& canvas_id, const std::string& task_id) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        return c.ledger.restore_task(task_id);
    });
}

std::vector<std::string> GitProject::historical_prompts(const std::string& canvas_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> prompts;
    if (auto* c = find_canvas_locked(canvas_id)) {
        prompts = c->ledger.prompts();
    }
    for (const auto& agent : agents_) {
        if (agent.status != AgentStatus::Completed) {
            continue;
        }
        if (auto* merge = std::get_if<MergeAgentContext>(&agent.context)) {
            prompts.insert(prompts.end(), merge->historical_prompts.begin(), merge->historical_prompts.end());
        }
    }
    return prompts;
}

bool GitProject::lock_canvas(const std::string& canvas_id, CanvasLockState state,
                             std::optional<std::string> agent_id) {
    bool locked = mutate_canvas(canvas_id, [&](Canvas& c) {
        if (c.lock_state != CanvasLockState::Normal && c.locking_agent_id != agent_id) {
            return false;
        }
        if (state == CanvasLockState::Merging && c.lock_state == CanvasLockState::Merged) {
            return false;
        }
        if (state == CanvasLockState::Merged && c.lock_state == CanvasLockState::Normal) {
            return false;
        }
        c.lock_state = state;
        c.locking_agent_id = agent_id;
        c.locked_at = now_millis();
        return true;
    });
    if (locked) {
        log::get("project")->info("Canvas {} locked as {}", canvas_id, lock_state_name(state));
    }
    return locked;
}

bool GitProject::unlock_canvas(const std::string& canvas_id, std::optional<std::string> agent_id) {
    bool unlocked = mutate_canvas(canvas_id, [&](Canvas& c) {
        if (agent_id && c.locking_agent_id && *c.locking_agent_id != *agent_id) {
            return false;
        }
        c.lock_state = CanvasLockState::Normal;
        c.locking_agent_id.reset();
        c.locked_at.reset();
        return true;
    });
    if (unlocked) {
        log::get("project")->info("Canvas {} unlocked", canvas_id);
    }
    return unlocked;
}

std::optional<CanvasLockState> GitProject::lock_state(const std::string& canvas_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* c = find_canvas_locked(canvas_id)) {
        return c->lock_state;
    }
    return std::nullopt;
}

bool GitProject::is_canvas_locked(const std::string& canvas_id) const {
    auto state = lock_state(canvas_id);
    return state && *state != CanvasLockState::Normal;
}

bool GitProject::can_edit_canvas(const std::string& canvas_id) const {
    return lock_state(canvas_id) == CanvasLockState::Normal;
}

bool GitProject::add_process(const std::string& canvas_id, ProcessState process) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        c.processes.push_back(std::move(process));
        return true;
    });
}

bool GitProject::update_process_status(const std::string& canvas_id, const std::string& process_id,
                                       ProcessStatus status) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        for (auto& p : c.processes) {
            if (p.process_id == process_id) {
                p.status = status;
                return true;
            }
        }
        return false;
    });
}

bool GitProject::remove_process(const std::string& canvas_id, const std::string& process_id) {
    return mutate_canvas(canvas_id, [&](Canvas& c) {
        auto before = c.processes.size();
        std::erase_if(c.processes, [&](const ProcessState& p) { return p.process_id == process_id; });
        return c.processes.size() != before;
    });
}

std::vector<ProcessState> GitProject::canvas_processes(const std::string& canvas_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* c = find_canvas_locked(canvas_id)) {
        return c->processes;
    }
    return {};
}

std::optional<ProcessState> GitProject::process_by_element(const std::string& canvas_id,
                                                           const std::string& element_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* c = find_canvas_locked(canvas_id);
    if (!c) {
        return std::nullopt;
    }
    // Latest record wins when an element ran more than once.
    for (auto it = c->processes.rbegin(); it != c->processes.rend(); ++it) {
        if (it->element_id == element_id) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<std::string> GitProject::recover_processes(const ProcessRegistry& registry) {
    std::vector<std::string> recovered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& canvas : canvases_) {
            bool changed = false;
            for (auto& p : canvas.processes) {
                if (p.status != ProcessStatus::Running || registry.is_running(p.process_id)) {
                    continue;
                }
                p.status = ProcessStatus::Finished;
                recovered.push_back(p.process_id);
                changed = true;

                for (const auto& task : canvas.ledger.in_progress_tasks()) {
                    if (task.process_id && *task.process_id == p.process_id) {
                        canvas.ledger.complete_task(task.id, "");
                    }
                }
                log::get("project")->warn("Process {} on canvas {} has no live driver; marked finished",
                                          p.process_id, canvas.name);
            }
            if (changed) {
                touch_locked(&canvas);
            }
        }
    }
    if (!recovered.empty()) {
        notify(ProjectTopic::Canvases);
    }
    return recovered;
}

void GitProject::add_background_agent(BackgroundAgent agent) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_.push_back(std::move(agent));
        touch_locked();
    }
    notify(ProjectTopic::BackgroundAgents);
}

bool GitProject::update_background_agent(const BackgroundAgent& agent) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(agents_.begin(), agents_.end(),
                               [&](const BackgroundAgent& a) { return a.id == agent.id; });
        if (it == agents_.end()) {
            return false;
        }
        *it = agent;
        touch_locked();
    }
    notify(ProjectTopic::BackgroundAgents);
    return true;
}

bool GitProject::remove_background_agent(const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto before = agents_.size();
        std::erase_if(agents_, [&](const BackgroundAgent& a) { return a.id == agent_id; });
        if (agents_.size() == before) {
            return false;
        }
        touch_locked();
    }
    notify(ProjectTopic::BackgroundAgents);
    return true;
}

std::vector<BackgroundAgent> GitProject::background_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_;
}

std::optional<BackgroundAgent> GitProject::background_agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& a : agents_) {
        if (a.id == agent_id) {
            return a;
        }
    }
    return std::nullopt;
}

MergeResult GitProject::merge_canvas_to_root(const std::string& canvas_id, BackgroundAgentManager& agents) {
    auto target = canvas(canvas_id);
    if (!target) {
        return {false, {}, "Canvas not found"};
    }
    if (target->lock_state != CanvasLockState::Normal) {
        return {false, {}, std::string("Canvas is currently ") + lock_state_name(target->lock_state) +
                           ". Cannot start merge."};
    }

    const std::string& dir = working_directory(target->session);
    try {
        if (!agents.file_system().path_exists(dir, target->session)) {
            return {false, {}, "Canvas directory no longer exists: " + dir + ". The canvas may have been deleted."};
        }
    } catch (const FileSystemError& e) {
        return {false, {}, e.what()};
    }

    try {
        std::string agent_id = agents.create_merge_agent(*this, canvas_id, historical_prompts(canvas_id));
        return {true, agent_id, {}};
    } catch (const Error& e) {
        log::get("project")->error("Failed to start merge of canvas {}: {}", canvas_id, e.what());
        return {false, {}, e.what()};
    }
}

GitProject::Unsubscribe GitProject::subscribe(ProjectTopic topic, Listener listener) {
    size_t id;
    {
        std::lock_guard<std::mutex> lock(listeners_->mutex);
        id = listeners_->next_id++;
        listeners_->by_topic[topic][id] = std::move(listener);
    }
    std::weak_ptr<Listeners> weak = listeners_;
    return [weak, topic, id]() {
        if (auto listeners = weak.lock()) {
            std::lock_guard<std::mutex> lock(listeners->mutex);
            listeners->by_topic[topic].erase(id);
        }
    };
}

nlohmann::json GitProject::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j;
    j["id"] = id_;
    j["name"] = name_;
    j["root"] = root_;
    j["canvases"] = nlohmann::json::array();
    for (const auto& c : canvases_) {
        j["canvases"].push_back(canvas_to_json(c));
    }
    j["currentCanvasIndex"] = current_canvas_index_;
    j["backgroundAgents"] = nlohmann::json::array();
    for (const auto& a : agents_) {
        j["backgroundAgents"].push_back(agent_to_json(a));
    }
    j["createdAt"] = created_at_;
    j["lastModified"] = last_modified_;
    return j;
}

std::unique_ptr<GitProject> GitProject::from_json(const nlohmann::json& j) {
    if (!j.contains("root") || !j["root"].is_object()) {
        throw Error("project without a root session");
    }
    auto root = j["root"].get<WorkspaceSession>();
    auto project = std::make_unique<GitProject>(root, j.value("name", std::string{}));
    if (j.contains("id") && j["id"].is_string()) {
        project->id_ = j["id"].get<std::string>();
    }

    if (j.contains("canvases") && j["canvases"].is_array()) {
        for (const auto& c : j["canvases"]) {
            project->canvases_.push_back(canvas_from_json(c, root));
        }
    }

    int size = static_cast<int>(project->canvases_.size());
    int index = j.value("currentCanvasIndex", -1);
    if (index < 0 || index >= size) {
        index = size > 0 ? 0 : -1;
    }
    project->current_canvas_index_ = index;

    if (j.contains("backgroundAgents") && j["backgroundAgents"].is_array()) {
        for (const auto& a : j["backgroundAgents"]) {
            try {
                project->agents_.push_back(agent_from_json(a));
            } catch (const Error& e) {
                log::get("project")->warn("Skipping background agent: {}", e.what());
            }
        }
    }

    int64_t now = now_millis();
    project->created_at_ = j.value("createdAt", now);
    project->last_modified_ = j.value("lastModified", now);
    return project;
}

Canvas* GitProject::find_canvas_locked(const std::string& canvas_id) {
    for (auto& c : canvases_) {
        if (c.id == canvas_id) {
            return &c;
        }
    }
    return nullptr;
}

const Canvas* GitProject::find_canvas_locked(const std::string& canvas_id) const {
    for (const auto& c : canvases_) {
        if (c.id == canvas_id) {
            return &c;
        }
    }
    return nullptr;
}

void GitProject::touch_locked(Canvas* canvas) {
    last_modified_ = now_millis();
    if (canvas) {
        canvas->last_modified = last_modified_;
    }
}

Canvas GitProject::make_canvas_locked(std::string name, WorkspaceSession session) const {
    Canvas canvas;
    canvas.id = generate_id();
    canvas.name = std::move(name);
    canvas.elements.push_back(generate_id());
    canvas.session = std::move(session);
    canvas.created_at = now_millis();
    canvas.last_modified = canvas.created_at;
    return canvas;
}

bool GitProject::mutate_canvas(const std::string& canvas_id, const std::function<bool(Canvas&)>& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* c = find_canvas_locked(canvas_id);
        if (!c || !fn(*c)) {
            return false;
        }
        touch_locked(c);
    }
    notify(ProjectTopic::Canvases);
    return true;
}

void GitProject::notify(ProjectTopic topic) {
    std::vector<Listener> to_call;
    {
        std::lock_guard<std::mutex> lock(listeners_->mutex);
        auto it = listeners_->by_topic.find(topic);
        if (it == listeners_->by_topic.end()) {
            return;
        }
        for (const auto& [id, fn] : it->second) {
            to_call.push_back(fn);
        }
    }
    for (const auto& fn : to_call) {
        fn();
    }
}

}
