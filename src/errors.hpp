//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// errors.hpp
//
// Exception type carrying a protocol error code
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include <stdexcept>
#include <string>

namespace sandbox_server {

// Thrown by session and file operations; the protocol handler turns it into
// an ERROR reply with the same code.
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode GetCode() const { return code_; }

private:
    ErrorCode code_;
};

// Raised by the client when the network call itself failed
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sandbox_server
