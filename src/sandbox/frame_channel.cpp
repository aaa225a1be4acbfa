//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/frame_channel.cpp
//
// Framed channel implementation
//===----------------------------------------------------------------------===//

#include "sandbox/frame_channel.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sandbox_server {

const char* FrameStatusToString(FrameChannel::Status status) {
    switch (status) {
        case FrameChannel::Status::OK: return "ok";
        case FrameChannel::Status::TIMEOUT: return "timeout";
        case FrameChannel::Status::CLOSED: return "closed";
        case FrameChannel::Status::FAILED: return "failed";
    }
    return "unknown";
}

FrameChannel::FrameChannel(int fd, size_t max_message_bytes)
    : fd_(fd)
    , max_message_bytes_(max_message_bytes) {
}

FrameChannel::~FrameChannel() {
    Close();
}

void FrameChannel::Close() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

FrameChannel::Status FrameChannel::Send(const Message& message, std::string& error) {
    if (fd_ < 0) {
        error = "channel closed";
        return Status::CLOSED;
    }

    auto data = message.Serialize();
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE || errno == ECONNRESET) {
                error = "peer closed the channel";
                return Status::CLOSED;
            }
            error = std::string("send failed: ") + strerror(errno);
            return Status::FAILED;
        }
        sent += static_cast<size_t>(n);
    }
    return Status::OK;
}

FrameChannel::Status FrameChannel::Receive(Message& message, TimePoint deadline, std::string& error) {
    if (fd_ < 0) {
        error = "channel closed";
        return Status::CLOSED;
    }

    MessageHeader header;
    auto status = ReadExact(reinterpret_cast<uint8_t*>(&header), MessageHeader::SIZE, deadline, error);
    if (status != Status::OK) {
        return status;
    }

    if (!header.IsValid()) {
        error = "invalid frame header";
        return Status::FAILED;
    }
    if (header.length > max_message_bytes_) {
        error = "frame of " + std::to_string(header.length) + " bytes exceeds limit";
        return Status::FAILED;
    }

    std::vector<uint8_t> payload(header.length);
    if (header.length > 0) {
        status = ReadExact(payload.data(), payload.size(), deadline, error);
        if (status != Status::OK) {
            return status;
        }
    }

    message = Message(header.GetType(), std::move(payload), header.request_id);
    return Status::OK;
}

FrameChannel::Status FrameChannel::ReadExact(uint8_t* data, size_t size,
                                             TimePoint deadline, std::string& error) {
    size_t received = 0;
    while (received < size) {
        int timeout_ms = -1;
        if (deadline != TimePoint::max()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (remaining <= 0) {
                error = "deadline exceeded";
                return Status::TIMEOUT;
            }
            timeout_ms = static_cast<int>(std::min<int64_t>(remaining, INT32_MAX));
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("poll failed: ") + strerror(errno);
            return Status::FAILED;
        }
        if (ready == 0) {
            continue;  // re-check the deadline
        }

        ssize_t n = recv(fd_, data + received, size - received, 0);
        if (n == 0) {
            error = "peer closed the channel";
            return Status::CLOSED;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            if (errno == ECONNRESET) {
                error = "peer closed the channel";
                return Status::CLOSED;
            }
            error = std::string("recv failed: ") + strerror(errno);
            return Status::FAILED;
        }
        received += static_cast<size_t>(n);
    }
    return Status::OK;
}

} // namespace sandbox_server
