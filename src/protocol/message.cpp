//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// protocol/message.cpp
//
// Protocol payload serialization
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"

namespace sandbox_server {

//===----------------------------------------------------------------------===//
// ErrorPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ErrorPayload::Serialize() const {
    ByteWriter w;
    w.WriteU32(static_cast<uint32_t>(code));
    w.WriteString(message);
    return w.Take();
}

ErrorPayload ErrorPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "ErrorPayload");
    ErrorPayload payload;
    payload.code = static_cast<ErrorCode>(r.ReadU32());
    payload.message = r.ReadString();
    return payload;
}

//===----------------------------------------------------------------------===//
// SessionPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> SessionPayload::Serialize() const {
    ByteWriter w;
    w.WriteString(session_id);
    w.WriteU32(timeout_ms);
    return w.Take();
}

SessionPayload SessionPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "SessionPayload");
    SessionPayload payload;
    payload.session_id = r.ReadString();
    payload.timeout_ms = r.ReadU32();
    return payload;
}

//===----------------------------------------------------------------------===//
// Status
//===----------------------------------------------------------------------===//
std::vector<uint8_t> StatusRequestPayload::Serialize() const {
    ByteWriter w;
    w.WriteString(session_id);
    return w.Take();
}

StatusRequestPayload StatusRequestPayload::Deserialize(const std::vector<uint8_t>& data) {
    StatusRequestPayload payload;
    if (data.empty()) {
        return payload;  // Bare STATUS
    }
    ByteReader r(data, "StatusRequestPayload");
    payload.session_id = r.ReadString();
    return payload;
}

std::vector<uint8_t> StatusResponsePayload::Serialize() const {
    ByteWriter w;
    w.WriteU8(accepting ? 1 : 0);
    w.WriteU32(active_sessions);
    w.WriteU32(max_sessions);
    w.WriteU64(total_sessions_created);
    w.WriteU64(total_executions);
    w.WriteU64(total_timeouts);
    w.WriteU64(total_evictions);
    w.WriteU8(static_cast<uint8_t>(session_state));
    w.WriteU64(session_idle_ms);
    return w.Take();
}

StatusResponsePayload StatusResponsePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "StatusResponsePayload");
    StatusResponsePayload payload;
    payload.accepting = r.ReadU8() != 0;
    payload.active_sessions = r.ReadU32();
    payload.max_sessions = r.ReadU32();
    payload.total_sessions_created = r.ReadU64();
    payload.total_executions = r.ReadU64();
    payload.total_timeouts = r.ReadU64();
    payload.total_evictions = r.ReadU64();
    payload.session_state = static_cast<SessionState>(r.ReadU8());
    payload.session_idle_ms = r.ReadU64();
    return payload;
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ExecutePayload::Serialize() const {
    ByteWriter w;
    w.WriteString(session_id);
    w.WriteU32(timeout_ms);
    w.WriteString(code);
    return w.Take();
}

ExecutePayload ExecutePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "ExecutePayload");
    ExecutePayload payload;
    payload.session_id = r.ReadString();
    payload.timeout_ms = r.ReadU32();
    payload.code = r.ReadString();
    return payload;
}

std::vector<uint8_t> ExecutionResult::Serialize() const {
    ByteWriter w;
    w.WriteU8(static_cast<uint8_t>(status));
    w.WriteString(stdout_text);
    w.WriteString(stderr_text);
    w.WriteString(display_value);
    w.WriteU64(row_count);
    w.WriteU32(statements_executed);
    w.WriteString(fault.kind);
    w.WriteString(fault.message);
    w.WriteString(fault.trace);
    w.WriteU64(elapsed_us);
    return w.Take();
}

ExecutionResult ExecutionResult::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "ExecutionResult");
    ExecutionResult result;
    uint8_t status = r.ReadU8();
    if (status > static_cast<uint8_t>(ExecutionStatus::SESSION_BUSY)) {
        throw ProtocolException("ExecutionResult has unknown status " + std::to_string(status));
    }
    result.status = static_cast<ExecutionStatus>(status);
    result.stdout_text = r.ReadString();
    result.stderr_text = r.ReadString();
    result.display_value = r.ReadString();
    result.row_count = r.ReadU64();
    result.statements_executed = r.ReadU32();
    result.fault.kind = r.ReadString();
    result.fault.message = r.ReadString();
    result.fault.trace = r.ReadString();
    result.elapsed_us = r.ReadU64();
    return result;
}

std::vector<uint8_t> GetVariablePayload::Serialize() const {
    ByteWriter w;
    w.WriteString(session_id);
    w.WriteString(name);
    w.WriteU32(timeout_ms);
    return w.Take();
}

GetVariablePayload GetVariablePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "GetVariablePayload");
    GetVariablePayload payload;
    payload.session_id = r.ReadString();
    payload.name = r.ReadString();
    payload.timeout_ms = r.ReadU32();
    return payload;
}

std::vector<uint8_t> VariableValuePayload::Serialize() const {
    ByteWriter w;
    w.WriteU8(found ? 1 : 0);
    w.WriteString(name);
    w.WriteString(type);
    w.WriteString(value);
    return w.Take();
}

VariableValuePayload VariableValuePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "VariableValuePayload");
    VariableValuePayload payload;
    payload.found = r.ReadU8() != 0;
    payload.name = r.ReadString();
    payload.type = r.ReadString();
    payload.value = r.ReadString();
    return payload;
}

std::vector<uint8_t> VariableListPayload::Serialize() const {
    ByteWriter w;
    w.WriteU32(static_cast<uint32_t>(bindings.size()));
    for (const auto& b : bindings) {
        w.WriteString(b.name);
        w.WriteString(b.kind);
        w.WriteString(b.type);
        w.WriteString(b.value);
    }
    return w.Take();
}

VariableListPayload VariableListPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "VariableListPayload");
    VariableListPayload payload;
    uint32_t count = r.ReadU32();
    for (uint32_t i = 0; i < count; ++i) {
        BindingInfo b;
        b.name = r.ReadString();
        b.kind = r.ReadString();
        b.type = r.ReadString();
        b.value = r.ReadString();
        payload.bindings.push_back(std::move(b));
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// Files
//===----------------------------------------------------------------------===//
std::vector<uint8_t> FilePayload::Serialize() const {
    ByteWriter w;
    w.WriteString(session_id);
    w.WriteString(path);
    w.WriteBytes(data);
    return w.Take();
}

FilePayload FilePayload::Deserialize(const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes, "FilePayload");
    FilePayload payload;
    payload.session_id = r.ReadString();
    payload.path = r.ReadString();
    payload.data = r.ReadBytes();
    return payload;
}

std::vector<uint8_t> FileListPayload::Serialize() const {
    ByteWriter w;
    w.WriteU32(static_cast<uint32_t>(files.size()));
    for (const auto& f : files) {
        w.WriteString(f.path);
        w.WriteU64(f.size);
    }
    return w.Take();
}

FileListPayload FileListPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "FileListPayload");
    FileListPayload payload;
    uint32_t count = r.ReadU32();
    for (uint32_t i = 0; i < count; ++i) {
        FileEntry f;
        f.path = r.ReadString();
        f.size = r.ReadU64();
        payload.files.push_back(std::move(f));
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// Worker
//===----------------------------------------------------------------------===//
std::vector<uint8_t> WorkerReadyPayload::Serialize() const {
    ByteWriter w;
    w.WriteU32(pid);
    w.WriteString(engine_version);
    return w.Take();
}

WorkerReadyPayload WorkerReadyPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader r(data, "WorkerReadyPayload");
    WorkerReadyPayload payload;
    payload.pid = r.ReadU32();
    payload.engine_version = r.ReadString();
    return payload;
}

} // namespace sandbox_server
