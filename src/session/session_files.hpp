//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session_files.hpp
//
// A session's private working directory
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include <filesystem>

namespace sandbox_server {

class SessionFiles {
public:
    SessionFiles(std::filesystem::path root_p, uint64_t max_file_bytes_p);

    const std::filesystem::path& GetRoot() const { return root; }

    // Create an empty directory, replacing anything left at the same path
    void Create();

    // Delete the directory tree; safe to call twice
    void Remove();
    bool IsRemoved() const { return removed; }

    // Store data at a relative path, creating parent directories
    void Write(const std::string& relative, const std::vector<uint8_t>& data);

    std::vector<uint8_t> Read(const std::string& relative) const;

    // Regular files below the root, paths relative to it, sorted
    std::vector<FileEntry> List() const;

    // Map a caller path into the directory. Throws SandboxError(INVALID_REQUEST)
    // for absolute paths, ".." components or empty paths.
    std::filesystem::path Resolve(const std::string& relative) const;

private:
    std::filesystem::path root;
    uint64_t max_file_bytes;
    bool removed = false;
};

} // namespace sandbox_server
