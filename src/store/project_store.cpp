#include "store/project_store.h"
#include "core/error.h"
#include "core/logging.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace easel {

namespace {

constexpr int STORE_VERSION = 1;

}

ProjectStore::ProjectStore()
    : path_(default_path())
{
}

ProjectStore::ProjectStore(std::string path)
    : path_(std::move(path))
{
}

std::string ProjectStore::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/easel/projects.json";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/easel/projects.json";
    }
    return "easel-projects.json";
}

bool ProjectStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return true;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        log::get("store")->error("Cannot parse {}: {}", path_, e.what());
        return false;
    }

    int version = j.value("version", STORE_VERSION);
    if (version > STORE_VERSION) {
        log::get("store")->warn("{} has version {}, expected {}", path_, version, STORE_VERSION);
    }

    projects_.clear();
    if (j.contains("projects") && j["projects"].is_array()) {
        for (const auto& pj : j["projects"]) {
            try {
                projects_.push_back(GitProject::from_json(pj));
            } catch (const nlohmann::json::exception& e) {
                log::get("store")->warn("Skipping unreadable project: {}", e.what());
            } catch (const Error& e) {
                log::get("store")->warn("Skipping project: {}", e.what());
            }
        }
    }
    log::get("store")->debug("Loaded {} project(s) from {}", projects_.size(), path_);
    return true;
}

bool ProjectStore::save() const {
    nlohmann::json j;
    j["version"] = STORE_VERSION;
    j["projects"] = nlohmann::json::array();
    for (const auto& p : projects_) {
        j["projects"].push_back(p->to_json());
    }

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log::get("store")->error("Cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    std::string temp_path = path_ + ".tmp";
    std::ofstream file(temp_path);
    if (!file.is_open()) {
        log::get("store")->error("Cannot write {}", temp_path);
        return false;
    }

    file << j.dump(2);
    file.close();

    if (!file.good()) {
        std::remove(temp_path.c_str());
        return false;
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        log::get("store")->error("Cannot replace {}", path_);
        return false;
    }

    return true;
}

GitProject* ProjectStore::find(const std::string& project_id) const {
    for (const auto& p : projects_) {
        if (p->id() == project_id) return p.get();
    }
    return nullptr;
}

GitProject* ProjectStore::find_by_root(const std::string& root_directory) const {
    for (const auto& p : projects_) {
        if (working_directory(p->root()) == root_directory) return p.get();
    }
    return nullptr;
}

GitProject& ProjectStore::open(const WorkspaceSession& root) {
    if (auto* existing = find_by_root(working_directory(root))) {
        return *existing;
    }
    projects_.push_back(std::make_unique<GitProject>(root));
    log::get("store")->info("Created project {} for {}", projects_.back()->name(), working_directory(root));
    return *projects_.back();
}

bool ProjectStore::remove(const std::string& project_id) {
    auto it = std::find_if(projects_.begin(), projects_.end(),
        [&project_id](const auto& p) { return p->id() == project_id; });
    if (it == projects_.end()) {
        return false;
    }
    projects_.erase(it);
    return true;
}

}
