#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace easel {

// Anything the registry can track. An instance that can tell whether it is
// still alive overrides liveness(); otherwise it counts as running while it
// stays registered.
class ManagedProcess {
public:
    virtual ~ManagedProcess() = default;
    virtual std::optional<bool> liveness() const { return std::nullopt; }
};

// Single source of truth for which driver instances are actually alive.
// Persisted ProcessState records only claim liveness; this registry knows.
class ProcessRegistry {
public:
    ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    void register_process(const std::string& process_id, std::shared_ptr<ManagedProcess> instance);
    std::shared_ptr<ManagedProcess> get(const std::string& process_id) const;

    template<typename T>
    std::shared_ptr<T> get_as(const std::string& process_id) const {
        return std::dynamic_pointer_cast<T>(get(process_id));
    }

    bool unregister(const std::string& process_id);
    // Removes every id the instance is registered under.
    size_t unregister_instance(const ManagedProcess* instance);

    bool is_running(const std::string& process_id) const;

    void associate_terminal(const std::string& element_id, const std::string& terminal_id);
    std::optional<std::string> lookup_terminal(const std::string& element_id) const;
    bool remove_terminal(const std::string& element_id);

    std::vector<std::string> active_process_ids() const;

    // Unregisters every entry whose is_running() is false; returns how many.
    size_t sweep();

    size_t size() const;

private:
    bool is_running_locked(const std::string& process_id) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ManagedProcess>> processes_;
    std::unordered_map<std::string, std::string> terminals_;
};

}
