#pragma once

#include "core/types.h"
#include "workspace/git_project.h"

#include <memory>
#include <string>
#include <vector>

namespace easel {

// Every known project, persisted as one JSON document.
class ProjectStore {
public:
    ProjectStore();
    explicit ProjectStore(std::string path);

    // A missing file is an empty store. Returns false when the file is unreadable.
    bool load();
    // Writes through a temporary file and renames it into place.
    bool save() const;

    const std::vector<std::unique_ptr<GitProject>>& projects() const { return projects_; }
    GitProject* find(const std::string& project_id) const;
    GitProject* find_by_root(const std::string& root_directory) const;
    // Returns the project rooted at the session's directory, creating it if needed.
    GitProject& open(const WorkspaceSession& root);
    bool remove(const std::string& project_id);

    const std::string& path() const { return path_; }

    static std::string default_path();

private:
    std::string path_;
    std::vector<std::unique_ptr<GitProject>> projects_;
};

}
