#include "process/process_registry.h"
#include "core/logging.h"

namespace easel {

void ProcessRegistry::register_process(const std::string& process_id, std::shared_ptr<ManagedProcess> instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[process_id] = std::move(instance);
    log::get("registry")->debug("Registered process {}", process_id);
}

std::shared_ptr<ManagedProcess> ProcessRegistry::get(const std::string& process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    if (it == processes_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ProcessRegistry::unregister(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = processes_.erase(process_id) > 0;
    if (removed) {
        log::get("registry")->debug("Unregistered process {}", process_id);
    }
    return removed;
}

size_t ProcessRegistry::unregister_instance(const ManagedProcess* instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (it->second.get() == instance) {
            it = processes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool ProcessRegistry::is_running(const std::string& process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_running_locked(process_id);
}

bool ProcessRegistry::is_running_locked(const std::string& process_id) const {
    auto it = processes_.find(process_id);
    if (it == processes_.end() || !it->second) {
        return false;
    }
    return it->second->liveness().value_or(true);
}

void ProcessRegistry::associate_terminal(const std::string& element_id, const std::string& terminal_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    terminals_[element_id] = terminal_id;
}

std::optional<std::string> ProcessRegistry::lookup_terminal(const std::string& element_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = terminals_.find(element_id);
    if (it == terminals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProcessRegistry::remove_terminal(const std::string& element_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminals_.erase(element_id) > 0;
}

std::vector<std::string> ProcessRegistry::active_process_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(processes_.size());
    for (const auto& [id, instance] : processes_) {
        ids.push_back(id);
    }
    return ids;
}

size_t ProcessRegistry::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (!is_running_locked(it->first)) {
            log::get("registry")->debug("Sweeping dead process {}", it->first);
            it = processes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

}
