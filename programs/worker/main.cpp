//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// main.cpp
//
// sandboxd-worker: one session's interpreter, driven over an inherited socket
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "engine/script_engine.hpp"
#include "sandbox/frame_channel.hpp"
#include "sandbox/worker_service.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <unistd.h>

using namespace sandbox_server;

namespace {

struct WorkerArgs {
    int channel_fd = -1;
    std::string workdir;
    std::string session_id;
    std::string log_level = "warn";
    uint32_t threads = 1;
    uint64_t max_memory = 0;
    uint64_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
    uint64_t max_rows = DEFAULT_MAX_ROWS_RENDERED;
    uint64_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " --channel-fd <fd> [options]\n"
              << "\nStarted by sandboxd; not meant to be run by hand.\n"
              << "\nOptions:\n"
              << "  --channel-fd <fd>          Connected socket to the server\n"
              << "  --workdir <dir>            Session working directory\n"
              << "  --session <id>             Session id (for logging)\n"
              << "  --threads <n>              DuckDB threads (default: 1)\n"
              << "  --max-memory <bytes>       Address space limit applied by the server\n"
              << "  --max-output-bytes <n>     Captured output limit per stream\n"
              << "  --max-rows <n>             Rows rendered per result\n"
              << "  --max-message-bytes <n>    Largest accepted frame\n"
              << "  --log-level <level>        Log level (default: warn)\n"
              << "  --version                  Show version info\n";
}

bool ParseArgs(int argc, char* argv[], WorkerArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "sandboxd-worker " << SANDBOXD_VERSION << std::endl;
            std::exit(0);
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--channel-fd") {
                args.channel_fd = std::stoi(value);
            } else if (arg == "--workdir") {
                args.workdir = value;
            } else if (arg == "--session") {
                args.session_id = value;
            } else if (arg == "--threads") {
                args.threads = static_cast<uint32_t>(std::stoul(value));
            } else if (arg == "--max-memory") {
                args.max_memory = std::stoull(value);
            } else if (arg == "--max-output-bytes") {
                args.max_output_bytes = std::stoull(value);
            } else if (arg == "--max-rows") {
                args.max_rows = std::stoull(value);
            } else if (arg == "--max-message-bytes") {
                args.max_message_bytes = std::stoull(value);
            } else if (arg == "--log-level") {
                args.log_level = value;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
            return false;
        }
    }
    return args.channel_fd >= 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    WorkerArgs args;
    if (!ParseArgs(argc, argv, args)) {
        PrintUsage(argv[0]);
        return 2;
    }

    // Own process group: terminal signals meant for the server do not reach us
    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGPIPE, SIG_IGN);

    sandboxd::LogOptions log_options;
    log_options.level = args.log_level;
    log_options.name = "sandboxd-worker/" + args.session_id;
    log_options.console = sandboxd::ConsoleTarget::STDERR;
    sandboxd::Logger::Initialize(log_options);

    if (!args.workdir.empty() && chdir(args.workdir.c_str()) != 0) {
        LOG_ERROR("worker", "Cannot enter workdir " + args.workdir + ": " + strerror(errno));
        return 1;
    }

    FrameChannel channel(args.channel_fd, args.max_message_bytes);

    ScriptEngine::Options options;
    options.threads = args.threads;
    // The address space limit also covers code, stacks and allocator slack
    options.max_memory = args.max_memory / 4 * 3;
    options.max_output_bytes = args.max_output_bytes;
    options.max_rows_rendered = args.max_rows;
    options.capture_output = true;

    std::unique_ptr<ScriptEngine> engine;
    try {
        engine = std::make_unique<ScriptEngine>(options);
    } catch (const std::exception& e) {
        LOG_ERROR("worker", std::string("Engine initialization failed: ") + e.what());
        std::string error;
        ErrorPayload payload(ErrorCode::ENGINE_START_FAILED, e.what());
        if (channel.Send(Message(MessageType::ERROR, payload.Serialize()), error) !=
            FrameChannel::Status::OK) {
            LOG_ERROR("worker", "Cannot report failure to server: " + error);
        }
        return 1;
    }

    LOG_DEBUG("worker", "Worker " + std::to_string(getpid()) + " serving session " + args.session_id);

    WorkerService service(*engine, channel);
    int rc = service.Run();

    engine.reset();
    sandboxd::Logger::Shutdown();
    return rc;
}
