//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// sandbox/frame_channel.hpp
//
// Blocking framed message channel over a socket descriptor
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace sandbox_server {

class FrameChannel {
public:
    enum class Status {
        OK,
        TIMEOUT,
        CLOSED,
        FAILED
    };

    // Takes ownership of fd
    FrameChannel(int fd, size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES);
    ~FrameChannel();

    // Non-copyable
    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    // Write one whole frame
    Status Send(const Message& message, std::string& error);

    // Read one whole frame; TimePoint::max() waits forever
    Status Receive(Message& message, TimePoint deadline, std::string& error);

    int GetFd() const { return fd_; }
    void Close();

private:
    Status ReadExact(uint8_t* data, size_t size, TimePoint deadline, std::string& error);

    int fd_;
    size_t max_message_bytes_;
};

const char* FrameStatusToString(FrameChannel::Status status);

} // namespace sandbox_server
