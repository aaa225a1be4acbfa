//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// engine/script_engine.cpp
//
// Script engine implementation
//===----------------------------------------------------------------------===//

#include "engine/script_engine.hpp"
#include "engine/output_capture.hpp"
#include "duckdb/common/box_renderer.hpp"
#include "duckdb/parser/keyword_helper.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sandbox_server {

namespace {

constexpr size_t MAX_TRACE_STATEMENT_CHARS = 200;

size_t LineOf(const std::string& code, size_t location) {
    location = std::min(location, code.size());
    return 1 + static_cast<size_t>(std::count(code.begin(), code.begin() + location, '\n'));
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

ScriptEngine::ScriptEngine(const Options& options_p)
    : options(options_p) {
    duckdb::DBConfig config;
    config.options.maximum_threads = std::max<uint32_t>(1, options.threads);
    if (options.max_memory > 0) {
        config.options.maximum_memory = options.max_memory;
    }

    db = std::make_unique<duckdb::DuckDB>(nullptr, &config);
    conn = std::make_unique<duckdb::Connection>(*db);
}

ScriptEngine::~ScriptEngine() {
    conn.reset();
    db.reset();
}

std::string ScriptEngine::EngineVersion() {
    return std::string("DuckDB ") + duckdb::DuckDB::LibraryVersion();
}

ExecutionResult ScriptEngine::Execute(const std::string& code) {
    auto start_time = Clock::now();
    ExecutionResult result;
    result.status = ExecutionStatus::OK;

    OutputCapture capture(options.max_output_bytes);
    if (options.capture_output) {
        capture.Begin();
    }

    try {
        auto statements = conn->ExtractStatements(code);
        const size_t total = statements.size();

        for (size_t i = 0; i < total; i++) {
            auto& statement = statements[i];
            std::string text = statement->query.substr(statement->stmt_location,
                                                       statement->stmt_length);
            size_t location = statement->stmt_location;

            auto query_result = conn->Query(std::move(statement));
            if (query_result->HasError()) {
                auto& error = query_result->GetErrorObject();
                result.status = ExecutionStatus::FAULTED;
                result.fault = MakeFault(duckdb::Exception::ExceptionTypeToString(error.Type()),
                                         error.RawMessage(), code, text, i, location);
                break;
            }

            result.statements_executed++;
            result.display_value.clear();

            auto return_type = query_result->properties.return_type;
            if (return_type == duckdb::StatementReturnType::QUERY_RESULT) {
                result.row_count = query_result->RowCount();
                if (query_result->ColumnCount() > 0) {
                    Render(*query_result);
                }
                if (query_result->RowCount() == 1 && query_result->ColumnCount() == 1) {
                    result.display_value = query_result->GetValue(0, 0).ToString();
                }
            } else if (return_type == duckdb::StatementReturnType::CHANGED_ROWS &&
                       query_result->RowCount() == 1 && query_result->ColumnCount() == 1) {
                result.row_count = query_result->GetValue(0, 0).GetValue<int64_t>();
            } else {
                result.row_count = 0;
            }
        }
    } catch (const std::exception& e) {
        // Parse errors surface here, before any statement has run
        duckdb::ErrorData error(e);
        result.status = ExecutionStatus::FAULTED;
        result.fault = MakeFault(duckdb::Exception::ExceptionTypeToString(error.Type()),
                                 error.RawMessage(), code, "", 0, 0);
    }

    if (options.capture_output) {
        capture.End();
        result.stdout_text = capture.GetStdout();
        result.stderr_text = capture.GetStderr();
    }

    result.elapsed_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - start_time).count());
    return result;
}

void ScriptEngine::Render(duckdb::MaterializedQueryResult& result) {
    duckdb::BoxRendererConfig config;
    config.max_rows = options.max_rows_rendered;
    std::cout << result.ToBox(*conn->context, config);
    std::cout.flush();
}

FaultInfo ScriptEngine::MakeFault(const std::string& kind, const std::string& message,
                                  const std::string& code, const std::string& statement,
                                  size_t statement_index, size_t location) {
    FaultInfo fault;
    fault.kind = kind;
    fault.message = message;
    if (statement.empty()) {
        return fault;
    }

    std::string text = Trim(statement);
    if (text.size() > MAX_TRACE_STATEMENT_CHARS) {
        text = text.substr(0, MAX_TRACE_STATEMENT_CHARS) + "...";
    }
    fault.trace = "statement " + std::to_string(statement_index + 1) +
                  " (line " + std::to_string(LineOf(code, location)) + "): " + text;
    return fault;
}

std::unique_ptr<duckdb::MaterializedQueryResult> ScriptEngine::RunInternal(const std::string& sql) {
    auto result = conn->Query(sql);
    if (result->HasError()) {
        throw std::runtime_error(result->GetError());
    }
    return result;
}

VariableValuePayload ScriptEngine::GetVariable(const std::string& name) {
    VariableValuePayload payload;
    payload.name = name;

    auto result = RunInternal(
        "SELECT CAST(value AS VARCHAR), type FROM duckdb_variables() WHERE name = " +
        duckdb::KeywordHelper::WriteQuoted(name, '\''));
    if (result->RowCount() == 0) {
        return payload;
    }

    payload.found = true;
    auto value = result->GetValue(0, 0);
    payload.value = value.IsNull() ? "NULL" : value.ToString();
    payload.type = result->GetValue(1, 0).ToString();
    return payload;
}

VariableListPayload ScriptEngine::ListVariables() {
    VariableListPayload payload;

    auto variables = RunInternal(
        "SELECT name, CAST(value AS VARCHAR), type FROM duckdb_variables() ORDER BY name");
    for (duckdb::idx_t row = 0; row < variables->RowCount(); row++) {
        BindingInfo binding;
        binding.name = variables->GetValue(0, row).ToString();
        binding.kind = "variable";
        auto value = variables->GetValue(1, row);
        binding.value = value.IsNull() ? "NULL" : value.ToString();
        binding.type = variables->GetValue(2, row).ToString();
        payload.bindings.push_back(std::move(binding));
    }

    auto tables = RunInternal(
        "SELECT table_name, column_count, estimated_size FROM duckdb_tables() "
        "WHERE NOT internal ORDER BY table_name");
    for (duckdb::idx_t row = 0; row < tables->RowCount(); row++) {
        BindingInfo binding;
        binding.name = tables->GetValue(0, row).ToString();
        binding.kind = "table";
        binding.type = "TABLE(" + tables->GetValue(1, row).ToString() + " columns)";
        binding.value = tables->GetValue(2, row).ToString() + " rows";
        payload.bindings.push_back(std::move(binding));
    }

    auto views = RunInternal(
        "SELECT view_name FROM duckdb_views() WHERE NOT internal ORDER BY view_name");
    for (duckdb::idx_t row = 0; row < views->RowCount(); row++) {
        BindingInfo binding;
        binding.name = views->GetValue(0, row).ToString();
        binding.kind = "view";
        binding.type = "VIEW";
        payload.bindings.push_back(std::move(binding));
    }

    return payload;
}

} // namespace sandbox_server
