// =============================================================================
// remio - Logger Module Implementation
// =============================================================================

#include "remio/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace remio::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Global logger instance pointer.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Flag indicating if the logger has been initialized.
std::atomic<bool> gInitialized{false};

/// @brief Mutex for initialization synchronization.
std::mutex gInitMutex;

struct LevelName {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

/// @brief Canonical names first; aliases follow and are only parsed.
constexpr std::array<LevelName, 8> kLevelNames{{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
    {Level::kWarning, "warn", quill::LogLevel::Warning},
    {Level::kCritical, "fatal", quill::LogLevel::Critical},
}};

const LevelName* findLevel(Level level) noexcept {
    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                 [level](const LevelName& entry) { return entry.level == level; });
    return it == kLevelNames.end() ? nullptr : &*it;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    const LevelName* entry = findLevel(level);
    return entry != nullptr ? entry->quillLevel : quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name, levelStr)) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    const LevelName* entry = findLevel(level);
    return entry != nullptr ? entry->name : "info";
}

Level levelFromEnvironment() noexcept {
    const char* env = std::getenv("REMIO_LOG_LEVEL");
    if (env == nullptr || *env == '\0') {
        return Level::kWarning;
    }
    return levelFromString(env);
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        gLogger.load(std::memory_order_acquire)->set_log_level(toQuillLevel(config.level));
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        auto consoleSink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        sinks.push_back(consoleSink);
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(fileSink);
    }

    quill::Logger* loggerPtr = nullptr;

    if (!sinks.empty()) {
        loggerPtr = quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    } else {
        // No sinks configured, fall back to the console
        auto consoleSink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        loggerPtr = quill::Frontend::create_or_get_logger(config.loggerName, std::move(consoleSink));
    }

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

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        return loggerPtr;
    }

    Config config;
    config.level = levelFromEnvironment();
    init(config);
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void setLevel(Level level) {
    logger()->set_log_level(toQuillLevel(level));
}

void flush() {
    if (isInitialized()) {
        quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (isInitialized()) {
        quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }

        quill::Backend::stop();

        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

}  // namespace remio::log
