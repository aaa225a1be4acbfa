//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// protocol/message_types.hpp
//
// Protocol message type definitions
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sandbox_server {

constexpr uint32_t PROTOCOL_MAGIC = 0x44584253;  // "SBXD" little-endian
constexpr uint8_t PROTOCOL_VERSION = 1;

//===----------------------------------------------------------------------===//
// Message Types
//===----------------------------------------------------------------------===//
enum class MessageType : uint8_t {
    // ===== Connection Management (0x01-0x0F) =====
    PING                = 0x01,
    PONG                = 0x02,
    ERROR               = 0x03,  // Error reply (ErrorPayload)

    // ===== Session Lifecycle (0x10-0x1F) =====
    CREATE_SESSION      = 0x10,
    SESSION_CREATED     = 0x11,
    DESTROY_SESSION     = 0x12,
    SESSION_DESTROYED   = 0x13,
    STATUS              = 0x14,
    STATUS_RESPONSE     = 0x15,

    // ===== Execution (0x20-0x2F) =====
    EXECUTE             = 0x20,
    EXECUTE_RESULT      = 0x21,
    GET_VARIABLE        = 0x22,
    VARIABLE_VALUE      = 0x23,
    LIST_VARIABLES      = 0x24,
    VARIABLE_LIST       = 0x25,

    // ===== Session Files (0x30-0x3F) =====
    PUT_FILE            = 0x30,
    FILE_STORED         = 0x31,
    GET_FILE            = 0x32,
    FILE_CONTENT        = 0x33,
    LIST_FILES          = 0x34,
    FILE_LIST           = 0x35,

    // ===== Worker Channel (0x40-0x4F) =====
    WORKER_READY        = 0x40,
    SHUTDOWN            = 0x41,

    UNKNOWN             = 0xFF
};

//===----------------------------------------------------------------------===//
// Error Codes
//===----------------------------------------------------------------------===//
enum class ErrorCode : uint32_t {
    OK                      = 0x00000000,

    // ===== 0x0001xxxx: Session Errors =====
    SESSION_NOT_FOUND       = 0x00010001,  // Unknown, destroyed or expired session
    SESSION_BUSY            = 0x00010002,  // Another execute is in flight
    SESSION_EXISTS          = 0x00010003,  // Requested id already in use
    CAPACITY_EXCEEDED       = 0x00010004,  // max_sessions reached
    TIMED_OUT               = 0x00010005,  // Deadline passed; the session was expired

    // ===== 0x0002xxxx: Request Errors =====
    INVALID_REQUEST         = 0x00020001,  // Malformed id, path or argument
    FILE_ERROR              = 0x00020002,  // File operation failed

    // ===== 0x0003xxxx: Server Errors =====
    ENGINE_START_FAILED     = 0x00030001,  // Worker could not be spawned
    ENGINE_FAILURE          = 0x00030002,  // Worker died or misbehaved
    INTERNAL_ERROR          = 0x00030003,
    SHUTTING_DOWN           = 0x00030004,

    // ===== 0x0004xxxx: Protocol Errors =====
    PROTOCOL_ERROR          = 0x00040001,
    VERSION_MISMATCH        = 0x00040002,
    MAX_CONNECTIONS         = 0x00040003,
};

//===----------------------------------------------------------------------===//
// Execution Status
//===----------------------------------------------------------------------===//
enum class ExecutionStatus : uint8_t {
    OK                  = 0,
    FAULTED             = 1,
    TIMED_OUT           = 2,
    SESSION_NOT_FOUND   = 3,
    SESSION_BUSY        = 4,
};

//===----------------------------------------------------------------------===//
// Session State
//===----------------------------------------------------------------------===//
enum class SessionState : uint8_t {
    ACTIVE      = 0,
    EXPIRED     = 1,
    DESTROYED   = 2,
    NOT_FOUND   = 3,  // status replies only
};

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//
inline const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::PING:              return "PING";
        case MessageType::PONG:              return "PONG";
        case MessageType::ERROR:             return "ERROR";
        case MessageType::CREATE_SESSION:    return "CREATE_SESSION";
        case MessageType::SESSION_CREATED:   return "SESSION_CREATED";
        case MessageType::DESTROY_SESSION:   return "DESTROY_SESSION";
        case MessageType::SESSION_DESTROYED: return "SESSION_DESTROYED";
        case MessageType::STATUS:            return "STATUS";
        case MessageType::STATUS_RESPONSE:   return "STATUS_RESPONSE";
        case MessageType::EXECUTE:           return "EXECUTE";
        case MessageType::EXECUTE_RESULT:    return "EXECUTE_RESULT";
        case MessageType::GET_VARIABLE:      return "GET_VARIABLE";
        case MessageType::VARIABLE_VALUE:    return "VARIABLE_VALUE";
        case MessageType::LIST_VARIABLES:    return "LIST_VARIABLES";
        case MessageType::VARIABLE_LIST:     return "VARIABLE_LIST";
        case MessageType::PUT_FILE:          return "PUT_FILE";
        case MessageType::FILE_STORED:       return "FILE_STORED";
        case MessageType::GET_FILE:          return "GET_FILE";
        case MessageType::FILE_CONTENT:      return "FILE_CONTENT";
        case MessageType::LIST_FILES:        return "LIST_FILES";
        case MessageType::FILE_LIST:         return "FILE_LIST";
        case MessageType::WORKER_READY:      return "WORKER_READY";
        case MessageType::SHUTDOWN:          return "SHUTDOWN";
        default:                             return "UNKNOWN";
    }
}

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::SESSION_NOT_FOUND:   return "SessionNotFound";
        case ErrorCode::SESSION_BUSY:        return "SessionBusy";
        case ErrorCode::SESSION_EXISTS:      return "SessionExists";
        case ErrorCode::CAPACITY_EXCEEDED:   return "CapacityExceeded";
        case ErrorCode::TIMED_OUT:           return "TimedOut";
        case ErrorCode::INVALID_REQUEST:     return "InvalidRequest";
        case ErrorCode::FILE_ERROR:          return "FileError";
        case ErrorCode::ENGINE_START_FAILED: return "EngineStartFailed";
        case ErrorCode::ENGINE_FAILURE:      return "EngineFailure";
        case ErrorCode::INTERNAL_ERROR:      return "InternalError";
        case ErrorCode::SHUTTING_DOWN:       return "ShuttingDown";
        case ErrorCode::PROTOCOL_ERROR:      return "ProtocolError";
        case ErrorCode::VERSION_MISMATCH:    return "VersionMismatch";
        case ErrorCode::MAX_CONNECTIONS:     return "MaxConnections";
        default:                             return "Unknown";
    }
}

inline const char* ExecutionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::OK:                return "Ok";
        case ExecutionStatus::FAULTED:           return "Faulted";
        case ExecutionStatus::TIMED_OUT:         return "TimedOut";
        case ExecutionStatus::SESSION_NOT_FOUND: return "SessionNotFound";
        case ExecutionStatus::SESSION_BUSY:      return "SessionBusy";
        default:                                 return "Unknown";
    }
}

inline const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::ACTIVE:    return "Active";
        case SessionState::EXPIRED:   return "Expired";
        case SessionState::DESTROYED: return "Destroyed";
        case SessionState::NOT_FOUND: return "NotFound";
        default:                      return "Unknown";
    }
}

} // namespace sandbox_server
