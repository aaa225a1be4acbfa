//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// engine/output_capture.hpp
//
// Redirects stdout/stderr into temporary files for the duration of a call
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdio>
#include <string>

namespace sandbox_server {

class OutputCapture {
public:
    explicit OutputCapture(size_t max_bytes);
    ~OutputCapture();

    // Non-copyable
    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    // Start capturing fd 1 and fd 2. Throws std::runtime_error on failure.
    void Begin();

    // Restore the original descriptors and collect what was written
    void End();

    const std::string& GetStdout() const { return stdout_text_; }
    const std::string& GetStderr() const { return stderr_text_; }

    bool IsActive() const { return active_; }

private:
    std::string ReadBack(FILE* file) const;
    void Release();

    size_t max_bytes_;
    bool active_ = false;
    FILE* out_file_ = nullptr;
    FILE* err_file_ = nullptr;
    int saved_stdout_ = -1;
    int saved_stderr_ = -1;
    std::string stdout_text_;
    std::string stderr_text_;
};

} // namespace sandbox_server
