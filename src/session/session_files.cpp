//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// session/session_files.cpp
//
// Session working directory implementation
//===----------------------------------------------------------------------===//

#include "session/session_files.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace sandbox_server {

SessionFiles::SessionFiles(fs::path root_p, uint64_t max_file_bytes_p)
    : root(std::move(root_p))
    , max_file_bytes(max_file_bytes_p) {
}

void SessionFiles::Create() {
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root, ec);
    if (ec) {
        throw SandboxError(ErrorCode::ENGINE_START_FAILED,
                           "Cannot create workdir " + root.string() + ": " + ec.message());
    }
    removed = false;
}

void SessionFiles::Remove() {
    if (removed) {
        return;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        LOG_WARN("session", "Cannot remove workdir " + root.string() + ": " + ec.message());
        return;
    }
    removed = true;
}

fs::path SessionFiles::Resolve(const std::string& relative) const {
    if (relative.empty()) {
        throw SandboxError(ErrorCode::INVALID_REQUEST, "File path must not be empty");
    }

    fs::path path(relative);
    if (path.is_absolute()) {
        throw SandboxError(ErrorCode::INVALID_REQUEST, "File path must be relative: " + relative);
    }
    for (const auto& part : path) {
        if (part == "..") {
            throw SandboxError(ErrorCode::INVALID_REQUEST,
                               "File path must stay inside the session: " + relative);
        }
    }

    auto normal = path.lexically_normal();
    if (normal.empty() || normal == ".") {
        throw SandboxError(ErrorCode::INVALID_REQUEST, "File path names no file: " + relative);
    }
    return root / normal;
}

void SessionFiles::Write(const std::string& relative, const std::vector<uint8_t>& data) {
    if (data.size() > max_file_bytes) {
        throw SandboxError(ErrorCode::FILE_ERROR,
                           "File of " + std::to_string(data.size()) + " bytes exceeds limit of " +
                           std::to_string(max_file_bytes));
    }

    auto target = Resolve(relative);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Cannot create directory for " + relative +
                           ": " + ec.message());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Cannot open " + relative + " for writing");
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Write failed for " + relative);
    }
}

std::vector<uint8_t> SessionFiles::Read(const std::string& relative) const {
    auto target = Resolve(relative);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw SandboxError(ErrorCode::FILE_ERROR, "No such file: " + relative);
    }
    auto size = fs::file_size(target, ec);
    if (ec) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Cannot stat " + relative + ": " + ec.message());
    }
    if (size > max_file_bytes) {
        throw SandboxError(ErrorCode::FILE_ERROR,
                           "File of " + std::to_string(size) + " bytes exceeds limit of " +
                           std::to_string(max_file_bytes));
    }

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Cannot open " + relative + " for reading");
    }
    std::vector<uint8_t> data(static_cast<size_t>(size));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    data.resize(static_cast<size_t>(in.gcount()));
    return data;
}

std::vector<FileEntry> SessionFiles::List() const {
    std::vector<FileEntry> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw SandboxError(ErrorCode::FILE_ERROR, "Cannot list workdir: " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw SandboxError(ErrorCode::FILE_ERROR, "Cannot list workdir: " + ec.message());
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        FileEntry entry;
        entry.path = it->path().lexically_relative(root).generic_string();
        entry.size = it->file_size(entry_ec);
        files.push_back(std::move(entry));
    }

    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    return files;
}

} // namespace sandbox_server
