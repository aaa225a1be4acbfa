//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// engine/script_engine.hpp
//
// Persistent interpreter state: one in-memory DuckDB database per session
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "duckdb.hpp"

namespace sandbox_server {

class ScriptEngine {
public:
    struct Options {
        uint32_t threads = 1;
        uint64_t max_memory = 0;  // 0 = DuckDB default
        size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
        size_t max_rows_rendered = DEFAULT_MAX_ROWS_RENDERED;
        bool capture_output = true;  // redirect fd 1/2 while running
    };

    explicit ScriptEngine(const Options& options_p = Options{});
    ~ScriptEngine();

    // Non-copyable
    ScriptEngine(const ScriptEngine&) = delete;
    ScriptEngine& operator=(const ScriptEngine&) = delete;

    // Run a fragment of one or more statements against the persistent state.
    // Statements run in order and stop at the first failure; effects of the
    // statements before it are kept.
    ExecutionResult Execute(const std::string& code);

    // Look up a variable created with SET VARIABLE
    VariableValuePayload GetVariable(const std::string& name);

    // Variables, tables and views defined in the session
    VariableListPayload ListVariables();

    static std::string EngineVersion();

private:
    static FaultInfo MakeFault(const std::string& kind, const std::string& message,
                               const std::string& code, const std::string& statement,
                               size_t statement_index, size_t location);

    void Render(duckdb::MaterializedQueryResult& result);

    std::unique_ptr<duckdb::MaterializedQueryResult> RunInternal(const std::string& sql);

private:
    Options options;
    std::unique_ptr<duckdb::DuckDB> db;
    std::unique_ptr<duckdb::Connection> conn;
};

} // namespace sandbox_server
