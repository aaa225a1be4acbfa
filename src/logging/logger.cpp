//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// logging/logger.cpp
//
// Process logger for the server, the workers and the CLI
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace sandboxd {

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

namespace {

// Workers share the server's terminal, so every line carries the pid
constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n:%P] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n:%P] %v";

spdlog::sink_ptr MakeConsoleSink(ConsoleTarget target) {
    if (target == ConsoleTarget::STDERR) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

} // anonymous namespace

void Logger::Initialize(const LogOptions& options) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = MakeConsoleSink(options.console);
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    if (!options.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_bytes, options.max_files);
        file_sink->set_pattern(FILE_PATTERN);
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());

    spdlog::level::level_enum level = spdlog::level::info;
    ParseLevel(options.level, level);
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    initialized_ = true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    logger_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

bool Logger::SetLevel(const std::string& level) {
    spdlog::level::level_enum parsed;
    if (!ParseLevel(level, parsed)) {
        return false;
    }
    Get()->set_level(parsed);
    return true;
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        level = spdlog::level::trace;
    } else if (lower == "debug") {
        level = spdlog::level::debug;
    } else if (lower == "info") {
        level = spdlog::level::info;
    } else if (lower == "warn" || lower == "warning") {
        level = spdlog::level::warn;
    } else if (lower == "error") {
        level = spdlog::level::err;
    } else if (lower == "fatal" || lower == "critical") {
        level = spdlog::level::critical;
    } else {
        return false;
    }
    return true;
}

} // namespace sandboxd
