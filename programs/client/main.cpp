//===----------------------------------------------------------------------===//
//                         SandboxD CLI
//
// programs/client/main.cpp
//
// Interactive and script-driven client for the SandboxD server.
// Opens one session, sends SQL fragments to it and prints each result.
//
// Usage:
//   sandboxd-cli                            -- interactive shell on 127.0.0.1:7421
//   sandboxd-cli --port 7500 --session s1   -- named session on another port
//   sandboxd-cli --script analysis.sql      -- run fragments separated by "-- %%"
//
// Exit status in script mode: 0 when every fragment succeeded, 1 when a
// fragment faulted or timed out, 2 when the server could not be used
// (connection failures after retries, capacity exhausted).
//===----------------------------------------------------------------------===//

#include "client/sandbox_client.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace sandbox_server;

namespace {

constexpr const char* FRAGMENT_SEPARATOR = "-- %%";

struct CliOptions {
    SandboxClient::Options client;
    std::string session_id;
    uint32_t timeout_ms = 0;
    std::string script_file;
    bool keep_session = false;
    std::string log_level = "warn";
};

std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

void PrintUsage(const char* program) {
    std::cout <<
        "Usage: " << program << " [options]\n"
        "\n"
        "Options:\n"
        "  -h, --host HOST       Server host (default: 127.0.0.1)\n"
        "  -p, --port PORT       Server port (default: 7421)\n"
        "  -s, --session ID      Session id to request (default: server-generated)\n"
        "  -t, --timeout MS      Per-fragment timeout (default: server default)\n"
        "  -f, --script FILE     Run FILE non-interactively ('-' reads stdin)\n"
        "  --attempts N          Attempts per request on transport failure (default: 3)\n"
        "  --backoff MS          Initial retry backoff, doubled per attempt (default: 200)\n"
        "  --keep                Do not destroy the session on exit\n"
        "  --log-level LEVEL     trace|debug|info|warn|error (default: warn)\n"
        "  --help                Show this help\n";
}

void PrintHelp() {
    std::cout <<
        "\nSandboxD CLI\n"
        "\nMeta commands:\n"
        "  .help               Show this message\n"
        "  .quit / .exit       Exit the shell\n"
        "  .vars               List variables, tables and views in the session\n"
        "  .get NAME           Show one variable\n"
        "  .files              List files in the session working directory\n"
        "  .put LOCAL [PATH]   Upload LOCAL into the working directory\n"
        "  .fetch PATH [LOCAL] Download PATH from the working directory\n"
        "  .status             Show server and session status\n"
        "  .reset              Destroy the session and start a new one\n"
        "\nSQL tips:\n"
        "  Terminate statements with ';'\n"
        "  State persists: SET VARIABLE x = 42; then SELECT getvariable('x');\n"
        "  Uploaded files are read relative to the session: SELECT * FROM 'data.csv';\n\n";
}

bool ParseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help") {
            PrintUsage(argv[0]);
            return false;
        } else if (arg == "-h" || arg == "--host") {
            options.client.host = next();
        } else if (arg == "-p" || arg == "--port") {
            options.client.port = static_cast<uint16_t>(std::stoi(next()));
        } else if (arg == "-s" || arg == "--session") {
            options.session_id = next();
        } else if (arg == "-t" || arg == "--timeout") {
            options.timeout_ms = static_cast<uint32_t>(std::stoul(next()));
        } else if (arg == "-f" || arg == "--script") {
            options.script_file = next();
        } else if (arg == "--attempts") {
            options.client.max_attempts = static_cast<uint32_t>(std::stoul(next()));
        } else if (arg == "--backoff") {
            options.client.retry_backoff_ms = static_cast<uint32_t>(std::stoul(next()));
        } else if (arg == "--keep") {
            options.keep_session = true;
        } else if (arg == "--log-level") {
            options.log_level = next();
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return true;
}

bool ReadFile(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

void PrintResult(const ExecutionResult& result) {
    if (!result.stdout_text.empty()) {
        std::cout << result.stdout_text;
        if (result.stdout_text.back() != '\n') std::cout << "\n";
    }
    if (!result.stderr_text.empty()) {
        std::cerr << result.stderr_text;
        if (result.stderr_text.back() != '\n') std::cerr << "\n";
    }

    double elapsed_ms = result.elapsed_us / 1000.0;
    switch (result.status) {
        case ExecutionStatus::OK:
            if (!result.display_value.empty()) {
                std::cout << "=> " << result.display_value << "\n";
            }
            std::cout << "(" << result.row_count << " row" << (result.row_count != 1 ? "s" : "")
                      << ", " << elapsed_ms << " ms)\n\n";
            break;
        case ExecutionStatus::FAULTED:
            std::cerr << result.fault.kind << " Error: " << result.fault.message << "\n";
            if (!result.fault.trace.empty()) {
                std::cerr << "  at " << result.fault.trace << "\n";
            }
            std::cerr << "\n";
            break;
        default:
            std::cerr << ExecutionStatusToString(result.status);
            if (!result.fault.message.empty()) {
                std::cerr << ": " << result.fault.message;
            }
            std::cerr << "\n\n";
            break;
    }
}

//===----------------------------------------------------------------------===//
// Shell: one client, one session
//===----------------------------------------------------------------------===//
class Shell {
public:
    explicit Shell(const CliOptions& options)
        : options_(options), client_(options.client) {}

    void Open() {
        session_id_ = client_.CreateSession(options_.session_id);
    }

    void Close() {
        if (session_id_.empty() || options_.keep_session) {
            return;
        }
        try {
            client_.DestroySession(session_id_);
        } catch (const SandboxError& e) {
            // Already gone: evicted or expired
            if (e.GetCode() != ErrorCode::SESSION_NOT_FOUND) {
                std::cerr << "Destroy failed: " << e.what() << "\n";
            }
        } catch (const TransportFailure& e) {
            std::cerr << "Destroy failed: " << e.what() << "\n";
        }
        session_id_.clear();
    }

    // Replaces a session that can no longer be used
    void Reset() {
        Close();
        session_id_ = client_.CreateSession(options_.session_id);
        std::cerr << "Started new session " << session_id_ << "\n";
    }

    ExecutionResult Execute(const std::string& code) {
        auto result = client_.Execute(session_id_, code, options_.timeout_ms);
        PrintResult(result);
        if (result.status == ExecutionStatus::TIMED_OUT ||
            result.status == ExecutionStatus::SESSION_NOT_FOUND ||
            result.fault.kind == "EngineCrashed") {
            // Interpreter state is lost; the next fragment runs in a fresh session
            Reset();
        }
        return result;
    }

    // Returns true when the line was a meta command
    bool HandleMeta(const std::string& line, bool& quit) {
        std::istringstream in(line);
        std::string command;
        in >> command;
        std::transform(command.begin(), command.end(), command.begin(), ::tolower);
        if (command.empty() || command[0] != '.') {
            return false;
        }

        std::string arg1, arg2;
        in >> arg1 >> arg2;

        try {
            if (command == ".quit" || command == ".exit" || command == ".q") {
                quit = true;
            } else if (command == ".help" || command == ".h") {
                PrintHelp();
            } else if (command == ".vars") {
                for (const auto& binding : client_.ListVariables(session_id_, options_.timeout_ms)) {
                    std::cout << binding.kind << "\t" << binding.name << "\t" << binding.type;
                    if (!binding.value.empty()) std::cout << "\t" << binding.value;
                    std::cout << "\n";
                }
            } else if (command == ".get") {
                if (arg1.empty()) {
                    std::cerr << "Usage: .get NAME\n";
                } else {
                    auto value = client_.GetVariable(session_id_, arg1, options_.timeout_ms);
                    if (value.found) {
                        std::cout << value.name << " (" << value.type << ") = " << value.value << "\n";
                    } else {
                        std::cout << arg1 << " is not defined\n";
                    }
                }
            } else if (command == ".files") {
                for (const auto& entry : client_.ListFiles(session_id_)) {
                    std::cout << entry.size << "\t" << entry.path << "\n";
                }
            } else if (command == ".put") {
                std::vector<uint8_t> data;
                if (arg1.empty()) {
                    std::cerr << "Usage: .put LOCAL [PATH]\n";
                } else if (!ReadFile(arg1, data)) {
                    std::cerr << "Cannot read " << arg1 << "\n";
                } else {
                    std::string remote = arg2.empty() ? arg1.substr(arg1.find_last_of('/') + 1) : arg2;
                    auto entry = client_.PutFile(session_id_, remote, data);
                    std::cout << "Stored " << entry.path << " (" << entry.size << " bytes)\n";
                }
            } else if (command == ".fetch") {
                if (arg1.empty()) {
                    std::cerr << "Usage: .fetch PATH [LOCAL]\n";
                } else {
                    auto data = client_.GetFile(session_id_, arg1);
                    std::string local = arg2.empty() ? arg1.substr(arg1.find_last_of('/') + 1) : arg2;
                    std::ofstream out(local, std::ios::binary);
                    out.write(reinterpret_cast<const char*>(data.data()),
                              static_cast<std::streamsize>(data.size()));
                    if (!out) {
                        std::cerr << "Cannot write " << local << "\n";
                    } else {
                        std::cout << "Saved " << local << " (" << data.size() << " bytes)\n";
                    }
                }
            } else if (command == ".status") {
                auto status = client_.Status(session_id_);
                std::cout << "server:    " << (status.accepting ? "accepting" : "draining") << "\n"
                          << "sessions:  " << status.active_sessions << "/" << status.max_sessions << "\n"
                          << "created:   " << status.total_sessions_created << "\n"
                          << "executed:  " << status.total_executions << "\n"
                          << "timeouts:  " << status.total_timeouts << "\n"
                          << "evicted:   " << status.total_evictions << "\n"
                          << "session:   " << session_id_ << " ("
                          << SessionStateToString(status.session_state) << ", idle "
                          << status.session_idle_ms << " ms)\n";
            } else if (command == ".reset") {
                Reset();
            } else {
                std::cerr << "Unknown command: " << command << " (.help for a list)\n";
            }
        } catch (const SandboxError& e) {
            std::cerr << ErrorCodeToString(e.GetCode()) << ": " << e.what() << "\n";
        }
        return true;
    }

    const std::string& GetSessionId() const { return session_id_; }

private:
    const CliOptions& options_;
    SandboxClient client_;
    std::string session_id_;
};

//===----------------------------------------------------------------------===//
// Modes
//===----------------------------------------------------------------------===//
std::vector<std::string> SplitFragments(std::istream& in) {
    std::vector<std::string> fragments;
    std::string current;
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, std::char_traits<char>::length(FRAGMENT_SEPARATOR),
                         FRAGMENT_SEPARATOR) == 0) {
            if (!Trim(current).empty()) fragments.push_back(current);
            current.clear();
            continue;
        }
        current += line;
        current += "\n";
    }
    if (!Trim(current).empty()) fragments.push_back(current);
    return fragments;
}

int RunScript(Shell& shell, const std::string& script_file) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (script_file != "-") {
        file.open(script_file);
        if (!file) {
            std::cerr << "Cannot open script " << script_file << "\n";
            return 2;
        }
        in = &file;
    }

    auto fragments = SplitFragments(*in);
    int exit_code = 0;
    for (size_t i = 0; i < fragments.size(); i++) {
        std::cout << "-- fragment " << (i + 1) << "/" << fragments.size() << "\n";
        auto result = shell.Execute(fragments[i]);
        if (!result.IsOk()) {
            exit_code = 1;
        }
    }
    return exit_code;
}

int RunInteractive(Shell& shell, const CliOptions& options) {
    std::cout << "SandboxD CLI - session " << shell.GetSessionId() << " on "
              << options.client.host << ":" << options.client.port << "\n"
                 "Enter SQL followed by ';'  |  .help for commands  |  .quit to exit\n\n";

    using_history();

    std::string buf;
    bool multiline = false;

    while (true) {
        const char* prompt = multiline ? "   ...> " : "sandbox> ";
        char* raw = readline(prompt);
        if (!raw) { std::cout << "\nBye!\n"; break; }

        std::string line(raw);
        free(raw);

        if (Trim(line).empty()) continue;
        add_history(line.c_str());

        // Meta commands (only at start of a fresh statement)
        if (!multiline) {
            bool quit = false;
            if (shell.HandleMeta(Trim(line), quit)) {
                if (quit) { std::cout << "Bye!\n"; break; }
                continue;
            }
        }

        buf += (multiline ? "\n" : "") + line;

        if (Trim(buf).back() != ';') { multiline = true; continue; }
        multiline = false;

        shell.Execute(buf);
        buf.clear();
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        if (!ParseArgs(argc, argv, options)) {
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        PrintUsage(argv[0]);
        return 2;
    }

    sandboxd::LogOptions log_options;
    log_options.level = options.log_level;
    log_options.name = "sandboxd-cli";
    log_options.console = sandboxd::ConsoleTarget::STDERR;
    sandboxd::Logger::Initialize(log_options);

    Shell shell(options);
    int exit_code = 0;
    try {
        shell.Open();
        if (!options.script_file.empty()) {
            exit_code = RunScript(shell, options.script_file);
        } else {
            exit_code = RunInteractive(shell, options);
        }
    } catch (const SandboxError& e) {
        std::cerr << ErrorCodeToString(e.GetCode()) << ": " << e.what() << "\n";
        exit_code = 2;
    } catch (const TransportFailure& e) {
        std::cerr << "Connection error: " << e.what() << "\n";
        exit_code = 2;
    }

    shell.Close();
    sandboxd::Logger::Shutdown();
    return exit_code;
}
