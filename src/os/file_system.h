#pragma once

#include "core/types.h"

#include <string>

namespace easel {

// Directory operations inside a workspace session. Failures throw FileSystemError.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Full recursive copy, .git included; dst must not exist yet.
    virtual void copy_directory(const std::string& src, const std::string& dst,
                                const WorkspaceSession& session) = 0;
    // Overlays src onto an existing dst.
    virtual void copy_files(const std::string& src, const std::string& dst,
                            const WorkspaceSession& session, bool exclude_git) = 0;
    virtual bool path_exists(const std::string& path, const WorkspaceSession& session) = 0;
    virtual void delete_path(const std::string& path, const WorkspaceSession& session) = 0;
};

}
