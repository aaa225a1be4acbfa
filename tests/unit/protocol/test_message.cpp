//===----------------------------------------------------------------------===//
//                         SandboxD Server - Unit Tests
//
// tests/unit/protocol/test_message.cpp
//
// Unit tests for message framing and payload encoding
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include <cassert>
#include <cstring>
#include <iostream>

using namespace sandbox_server;

//===----------------------------------------------------------------------===//
// Header Tests
//===----------------------------------------------------------------------===//

void TestHeaderLayout() {
    std::cout << "  Testing header layout..." << std::endl;

    Message msg(MessageType::EXECUTE, std::vector<uint8_t>{1, 2, 3}, 0x01020304);
    auto bytes = msg.Serialize();

    assert(bytes.size() == MessageHeader::SIZE + 3);
    // "SBXD" on the wire
    assert(bytes[0] == 'S' && bytes[1] == 'B' && bytes[2] == 'X' && bytes[3] == 'D');
    assert(bytes[4] == PROTOCOL_VERSION);
    assert(bytes[5] == static_cast<uint8_t>(MessageType::EXECUTE));
    // request_id, little-endian
    assert(bytes[8] == 0x04 && bytes[9] == 0x03 && bytes[10] == 0x02 && bytes[11] == 0x01);
    // length
    assert(bytes[12] == 3 && bytes[13] == 0 && bytes[14] == 0 && bytes[15] == 0);
    assert(bytes[16] == 1 && bytes[18] == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestHeaderValidation() {
    std::cout << "  Testing header validation..." << std::endl;

    MessageHeader header(MessageType::PING, 0);
    assert(header.IsValid());

    header.magic = 0x4B435544;  // some other protocol
    assert(!header.IsValid());

    header.magic = PROTOCOL_MAGIC;
    header.version = PROTOCOL_VERSION + 1;
    assert(!header.IsValid());

    Message empty;
    assert(empty.GetType() == MessageType::UNKNOWN);
    assert(empty.GetPayloadLength() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestSetPayloadUpdatesLength() {
    std::cout << "  Testing SetPayload updates length..." << std::endl;

    Message msg(MessageType::PUT_FILE);
    assert(msg.GetPayloadLength() == 0);
    msg.SetPayload(std::vector<uint8_t>(100, 7));
    assert(msg.GetPayloadLength() == 100);
    assert(msg.TotalSize() == MessageHeader::SIZE + 100);

    msg.SetRequestId(42);
    assert(msg.GetRequestId() == 42);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Payload Tests
//===----------------------------------------------------------------------===//

void TestExecutionResultFault() {
    std::cout << "  Testing ExecutionResult with fault..." << std::endl;

    ExecutionResult result;
    result.status = ExecutionStatus::FAULTED;
    result.stdout_text = "partial output\n";
    result.statements_executed = 1;
    result.fault.kind = "Conversion";
    result.fault.message = "Could not convert string 'abc' to INT32";
    result.fault.trace = "statement 2 (line 3): SELECT 'abc'::INTEGER";
    result.elapsed_us = 1234;

    auto decoded = ExecutionResult::Deserialize(result.Serialize());
    assert(decoded.status == ExecutionStatus::FAULTED);
    assert(!decoded.IsOk());
    assert(decoded.stdout_text == "partial output\n");
    assert(decoded.stderr_text.empty());
    assert(decoded.statements_executed == 1);
    assert(decoded.fault.kind == "Conversion");
    assert(decoded.fault.message == result.fault.message);
    assert(decoded.fault.trace == result.fault.trace);
    assert(decoded.elapsed_us == 1234);

    auto busy = ExecutionResult::WithStatus(ExecutionStatus::SESSION_BUSY);
    assert(ExecutionResult::Deserialize(busy.Serialize()).status == ExecutionStatus::SESSION_BUSY);

    std::cout << "    PASSED" << std::endl;
}

void TestFilePayloadBinaryData() {
    std::cout << "  Testing FilePayload with binary data..." << std::endl;

    FilePayload payload;
    payload.session_id = "s1";
    payload.path = "data/input.parquet";
    for (int i = 0; i < 256; i++) {
        payload.data.push_back(static_cast<uint8_t>(i));
    }

    auto decoded = FilePayload::Deserialize(payload.Serialize());
    assert(decoded.session_id == "s1");
    assert(decoded.path == "data/input.parquet");
    assert(decoded.data == payload.data);

    std::cout << "    PASSED" << std::endl;
}

void TestVariableListPayload() {
    std::cout << "  Testing VariableListPayload..." << std::endl;

    VariableListPayload list;
    list.bindings.push_back({"x", "variable", "INTEGER", "42"});
    list.bindings.push_back({"patients", "table", "", ""});

    auto decoded = VariableListPayload::Deserialize(list.Serialize());
    assert(decoded.bindings.size() == 2);
    assert(decoded.bindings[0].name == "x");
    assert(decoded.bindings[0].value == "42");
    assert(decoded.bindings[1].kind == "table");

    std::cout << "    PASSED" << std::endl;
}

void TestStatusRequestEmptyPayload() {
    std::cout << "  Testing bare STATUS request..." << std::endl;

    // A STATUS with no payload asks for the server-wide report
    auto request = StatusRequestPayload::Deserialize({});
    assert(request.session_id.empty());

    StatusResponsePayload response;
    response.accepting = true;
    response.active_sessions = 3;
    response.max_sessions = 16;
    response.session_state = SessionState::EXPIRED;
    response.session_idle_ms = 500;
    auto decoded = StatusResponsePayload::Deserialize(response.Serialize());
    assert(decoded.accepting);
    assert(decoded.active_sessions == 3);
    assert(decoded.max_sessions == 16);
    assert(decoded.session_state == SessionState::EXPIRED);
    assert(decoded.session_idle_ms == 500);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Malformed Payload Tests
//===----------------------------------------------------------------------===//

void TestTruncatedPayloadThrows() {
    std::cout << "  Testing truncated payloads throw ProtocolException..." << std::endl;

    ExecutePayload payload;
    payload.session_id = "session-a";
    payload.timeout_ms = 5000;
    payload.code = "SELECT 1;";
    auto bytes = payload.Serialize();

    // Every strict prefix is malformed
    for (size_t len = 0; len < bytes.size(); len++) {
        std::vector<uint8_t> prefix(bytes.begin(), bytes.begin() + len);
        bool threw = false;
        try {
            ExecutePayload::Deserialize(prefix);
        } catch (const ProtocolException&) {
            threw = true;
        }
        assert(threw);
    }

    // A string length pointing past the end
    std::vector<uint8_t> bogus = {0xFF, 0xFF, 0xFF, 0x7F, 'a'};
    bool threw = false;
    try {
        SessionPayload::Deserialize(bogus);
    } catch (const ProtocolException& e) {
        threw = true;
        assert(std::string(e.what()).find("SessionPayload") != std::string::npos);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Name Table Tests
//===----------------------------------------------------------------------===//

void TestNames() {
    std::cout << "  Testing name tables..." << std::endl;

    assert(std::string(ErrorCodeToString(ErrorCode::SESSION_NOT_FOUND)) == "SessionNotFound");
    assert(std::string(ErrorCodeToString(ErrorCode::CAPACITY_EXCEEDED)) == "CapacityExceeded");
    assert(std::string(ExecutionStatusToString(ExecutionStatus::TIMED_OUT)) == "TimedOut");
    assert(std::string(SessionStateToString(SessionState::NOT_FOUND)) == "NotFound");
    assert(std::string(MessageTypeToString(MessageType::EXECUTE_RESULT)) == "EXECUTE_RESULT");
    assert(std::string(MessageTypeToString(static_cast<MessageType>(0x7E))) == "UNKNOWN");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Message Unit Tests ===" << std::endl;

    std::cout << "\n1. Header:" << std::endl;
    TestHeaderLayout();
    TestHeaderValidation();
    TestSetPayloadUpdatesLength();

    std::cout << "\n2. Payloads:" << std::endl;
    TestExecutionResultFault();
    TestFilePayloadBinaryData();
    TestVariableListPayload();
    TestStatusRequestEmptyPayload();

    std::cout << "\n3. Malformed Payloads:" << std::endl;
    TestTruncatedPayloadThrows();

    std::cout << "\n4. Names:" << std::endl;
    TestNames();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
