// =============================================================================
// sendstream-upgrade - Logger Module Implementation
// =============================================================================

#include "ssu/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ssu::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

std::atomic<quill::Logger*> gLogger{nullptr};

std::atomic<bool> gInitialized{false};

std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "info";
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        auto consoleSink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        sinks.push_back(std::move(consoleSink));
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('w');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(std::move(fileSink));
    }

    // Console output disabled and no log file: stay silent, macros remain no-ops.
    if (sinks.empty()) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* loggerPtr = logger()) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
    gInitialized.store(false, std::memory_order_release);
}

}  // namespace ssu::log
