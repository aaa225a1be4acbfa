//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// engine/output_capture.cpp
//
// stdout/stderr capture implementation
//===----------------------------------------------------------------------===//

#include "engine/output_capture.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace sandbox_server {

namespace {

const char TRUNCATED_MARKER[] = "\n[output truncated]\n";

void FlushStandardStreams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(stdout);
    std::fflush(stderr);
}

} // anonymous namespace

OutputCapture::OutputCapture(size_t max_bytes)
    : max_bytes_(max_bytes) {
}

OutputCapture::~OutputCapture() {
    if (active_) {
        End();
    }
    Release();
}

void OutputCapture::Begin() {
    if (active_) {
        return;
    }

    stdout_text_.clear();
    stderr_text_.clear();

    out_file_ = std::tmpfile();
    err_file_ = std::tmpfile();
    if (!out_file_ || !err_file_) {
        Release();
        throw std::runtime_error("Cannot create capture file: " + std::string(strerror(errno)));
    }

    FlushStandardStreams();

    saved_stdout_ = dup(STDOUT_FILENO);
    saved_stderr_ = dup(STDERR_FILENO);
    if (saved_stdout_ < 0 || saved_stderr_ < 0) {
        Release();
        throw std::runtime_error("Cannot duplicate standard streams: " + std::string(strerror(errno)));
    }

    if (dup2(fileno(out_file_), STDOUT_FILENO) < 0 || dup2(fileno(err_file_), STDERR_FILENO) < 0) {
        int err = errno;
        dup2(saved_stdout_, STDOUT_FILENO);
        dup2(saved_stderr_, STDERR_FILENO);
        Release();
        throw std::runtime_error("Cannot redirect standard streams: " + std::string(strerror(err)));
    }

    active_ = true;
}

void OutputCapture::End() {
    if (!active_) {
        return;
    }

    FlushStandardStreams();

    dup2(saved_stdout_, STDOUT_FILENO);
    dup2(saved_stderr_, STDERR_FILENO);
    active_ = false;

    stdout_text_ = ReadBack(out_file_);
    stderr_text_ = ReadBack(err_file_);

    Release();
}

std::string OutputCapture::ReadBack(FILE* file) const {
    std::string text;
    if (!file) {
        return text;
    }

    std::rewind(file);
    char buffer[8192];
    size_t n;
    bool truncated = false;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        if (text.size() + n > max_bytes_) {
            text.append(buffer, max_bytes_ - text.size());
            truncated = true;
            break;
        }
        text.append(buffer, n);
    }

    if (truncated) {
        text += TRUNCATED_MARKER;
    }
    return text;
}

void OutputCapture::Release() {
    if (out_file_) {
        std::fclose(out_file_);
        out_file_ = nullptr;
    }
    if (err_file_) {
        std::fclose(err_file_);
        err_file_ = nullptr;
    }
    if (saved_stdout_ >= 0) {
        close(saved_stdout_);
        saved_stdout_ = -1;
    }
    if (saved_stderr_ >= 0) {
        close(saved_stderr_);
        saved_stderr_ = -1;
    }
}

} // namespace sandbox_server
