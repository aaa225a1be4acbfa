//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// protocol/message.hpp
//
// Protocol message framing and payload definitions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message_types.hpp"
#include <cstring>
#include <stdexcept>

namespace sandbox_server {

//===----------------------------------------------------------------------===//
// Message Header
//===----------------------------------------------------------------------===//
#pragma pack(push, 1)
struct MessageHeader {
    uint32_t magic;       // Protocol magic: "SBXD"
    uint8_t  version;     // Protocol version
    uint8_t  type;        // Message type
    uint16_t flags;       // Reserved for future use
    uint32_t request_id;  // Echoed back in the reply
    uint32_t length;      // Payload length

    static constexpr size_t SIZE = 16;

    MessageHeader()
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(MessageType::UNKNOWN))
        , flags(0)
        , request_id(0)
        , length(0) {}

    MessageHeader(MessageType msg_type, uint32_t payload_length, uint32_t req_id = 0)
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(msg_type))
        , flags(0)
        , request_id(req_id)
        , length(payload_length) {}

    bool IsValid() const {
        return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION;
    }

    MessageType GetType() const {
        return static_cast<MessageType>(type);
    }
};
#pragma pack(pop)

static_assert(sizeof(MessageHeader) == MessageHeader::SIZE, "MessageHeader size mismatch");

//===----------------------------------------------------------------------===//
// Message Class
//===----------------------------------------------------------------------===//
class Message {
public:
    Message() = default;

    explicit Message(MessageType type, uint32_t request_id = 0)
        : header_(type, 0, request_id) {}

    Message(MessageType type, std::vector<uint8_t> payload, uint32_t request_id = 0)
        : header_(type, static_cast<uint32_t>(payload.size()), request_id)
        , payload_(std::move(payload)) {}

    const MessageHeader& GetHeader() const { return header_; }
    MessageHeader& GetHeader() { return header_; }
    MessageType GetType() const { return header_.GetType(); }
    uint32_t GetRequestId() const { return header_.request_id; }
    uint32_t GetPayloadLength() const { return header_.length; }
    const std::vector<uint8_t>& GetPayload() const { return payload_; }
    std::vector<uint8_t>& GetPayload() { return payload_; }

    void SetRequestId(uint32_t request_id) { header_.request_id = request_id; }
    void SetPayload(std::vector<uint8_t> payload) {
        payload_ = std::move(payload);
        header_.length = static_cast<uint32_t>(payload_.size());
    }

    bool IsValid() const { return header_.IsValid(); }

    std::vector<uint8_t> Serialize() const {
        std::vector<uint8_t> buffer(MessageHeader::SIZE + payload_.size());
        std::memcpy(buffer.data(), &header_, MessageHeader::SIZE);
        if (!payload_.empty()) {
            std::memcpy(buffer.data() + MessageHeader::SIZE, payload_.data(), payload_.size());
        }
        return buffer;
    }

    size_t TotalSize() const {
        return MessageHeader::SIZE + payload_.size();
    }

private:
    MessageHeader header_;
    std::vector<uint8_t> payload_;
};

//===----------------------------------------------------------------------===//
// Byte Writer / Reader (little-endian, u32 length-prefixed strings)
//===----------------------------------------------------------------------===//
class ProtocolException : public std::runtime_error {
public:
    explicit ProtocolException(const std::string& message)
        : std::runtime_error(message) {}
};

class ByteWriter {
public:
    void WriteU8(uint8_t v) { buffer_.push_back(v); }

    void WriteU16(uint16_t v) {
        buffer_.push_back(v & 0xFF);
        buffer_.push_back((v >> 8) & 0xFF);
    }

    void WriteU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buffer_.push_back((v >> (i * 8)) & 0xFF);
        }
    }

    void WriteU64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buffer_.push_back((v >> (i * 8)) & 0xFF);
        }
    }

    void WriteString(const std::string& s) {
        WriteU32(static_cast<uint32_t>(s.size()));
        buffer_.insert(buffer_.end(), s.begin(), s.end());
    }

    void WriteBytes(const std::vector<uint8_t>& data) {
        WriteU32(static_cast<uint32_t>(data.size()));
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    std::vector<uint8_t> Take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const std::vector<uint8_t>& data, const char* what)
        : data_(data), pos_(0), what_(what) {}

    uint8_t ReadU8() {
        Require(1);
        return data_[pos_++];
    }

    uint16_t ReadU16() {
        Require(2);
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    uint32_t ReadU32() {
        Require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[pos_++]) << (i * 8);
        }
        return v;
    }

    uint64_t ReadU64() {
        Require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_++]) << (i * 8);
        }
        return v;
    }

    std::string ReadString() {
        uint32_t len = ReadU32();
        Require(len);
        std::string s(data_.begin() + pos_, data_.begin() + pos_ + len);
        pos_ += len;
        return s;
    }

    std::vector<uint8_t> ReadBytes() {
        uint32_t len = ReadU32();
        Require(len);
        std::vector<uint8_t> v(data_.begin() + pos_, data_.begin() + pos_ + len);
        pos_ += len;
        return v;
    }

    bool AtEnd() const { return pos_ == data_.size(); }

private:
    void Require(size_t bytes) const {
        if (pos_ + bytes > data_.size()) {
            throw ProtocolException(std::string(what_) + " truncated at offset " +
                                    std::to_string(pos_));
        }
    }

    const std::vector<uint8_t>& data_;
    size_t pos_;
    const char* what_;
};

//===----------------------------------------------------------------------===//
// Error Payload
//===----------------------------------------------------------------------===//
struct ErrorPayload {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    ErrorPayload() = default;
    ErrorPayload(ErrorCode code_p, std::string message_p)
        : code(code_p), message(std::move(message_p)) {}

    std::vector<uint8_t> Serialize() const;
    static ErrorPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Session Payloads
//===----------------------------------------------------------------------===//

// CREATE_SESSION (empty id = server-generated), SESSION_CREATED,
// DESTROY_SESSION, SESSION_DESTROYED, LIST_VARIABLES, LIST_FILES
struct SessionPayload {
    std::string session_id;
    uint32_t timeout_ms = 0;  // LIST_VARIABLES only

    std::vector<uint8_t> Serialize() const;
    static SessionPayload Deserialize(const std::vector<uint8_t>& data);
};

struct StatusRequestPayload {
    std::string session_id;  // optional

    std::vector<uint8_t> Serialize() const;
    static StatusRequestPayload Deserialize(const std::vector<uint8_t>& data);
};

struct StatusResponsePayload {
    bool accepting = false;
    uint32_t active_sessions = 0;
    uint32_t max_sessions = 0;
    uint64_t total_sessions_created = 0;
    uint64_t total_executions = 0;
    uint64_t total_timeouts = 0;
    uint64_t total_evictions = 0;
    SessionState session_state = SessionState::NOT_FOUND;
    uint64_t session_idle_ms = 0;

    std::vector<uint8_t> Serialize() const;
    static StatusResponsePayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Execution Payloads
//===----------------------------------------------------------------------===//
struct ExecutePayload {
    std::string session_id;
    uint32_t timeout_ms = 0;  // 0 = server default
    std::string code;

    std::vector<uint8_t> Serialize() const;
    static ExecutePayload Deserialize(const std::vector<uint8_t>& data);
};

struct FaultInfo {
    std::string kind;
    std::string message;
    std::string trace;
};

// Outcome of one execute call. Exactly one status holds.
struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::OK;
    std::string stdout_text;
    std::string stderr_text;
    std::string display_value;  // single value of a 1x1 last result
    uint64_t row_count = 0;
    uint32_t statements_executed = 0;
    FaultInfo fault;
    uint64_t elapsed_us = 0;

    bool IsOk() const { return status == ExecutionStatus::OK; }

    static ExecutionResult WithStatus(ExecutionStatus status) {
        ExecutionResult result;
        result.status = status;
        return result;
    }

    std::vector<uint8_t> Serialize() const;
    static ExecutionResult Deserialize(const std::vector<uint8_t>& data);
};

struct GetVariablePayload {
    std::string session_id;
    std::string name;
    uint32_t timeout_ms = 0;

    std::vector<uint8_t> Serialize() const;
    static GetVariablePayload Deserialize(const std::vector<uint8_t>& data);
};

struct VariableValuePayload {
    bool found = false;
    std::string name;
    std::string type;
    std::string value;

    std::vector<uint8_t> Serialize() const;
    static VariableValuePayload Deserialize(const std::vector<uint8_t>& data);
};

struct BindingInfo {
    std::string name;
    std::string kind;   // "variable", "table" or "view"
    std::string type;
    std::string value;  // variables only
};

struct VariableListPayload {
    std::vector<BindingInfo> bindings;

    std::vector<uint8_t> Serialize() const;
    static VariableListPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// File Payloads
//===----------------------------------------------------------------------===//

// PUT_FILE (with data), GET_FILE (without), FILE_CONTENT (with data)
struct FilePayload {
    std::string session_id;
    std::string path;
    std::vector<uint8_t> data;

    std::vector<uint8_t> Serialize() const;
    static FilePayload Deserialize(const std::vector<uint8_t>& data);
};

struct FileEntry {
    std::string path;
    uint64_t size = 0;
};

// FILE_STORED (single entry) and FILE_LIST
struct FileListPayload {
    std::vector<FileEntry> files;

    std::vector<uint8_t> Serialize() const;
    static FileListPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Worker Payloads
//===----------------------------------------------------------------------===//
struct WorkerReadyPayload {
    uint32_t pid = 0;
    std::string engine_version;

    std::vector<uint8_t> Serialize() const;
    static WorkerReadyPayload Deserialize(const std::vector<uint8_t>& data);
};

} // namespace sandbox_server
