#pragma once

#include <atomic>
#include <condition_variable>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace difflane {

// ============================================================================
// Log Level Enumeration
// ============================================================================

enum class LogLevel { TRACE, DEBUG, INFO, WARNING, ERROR, FATAL };
enum class LogOutput { CONSOLE, FILE, BOTH };

/// Upper-case name of a level ("TRACE" ... "FATAL")
std::string_view toString(LogLevel level);

/// Parse a level name, case-insensitive. Throws std::runtime_error on unknown names.
LogLevel parseLogLevel(std::string_view name);

// ============================================================================
// Log Entry Structure
// ============================================================================

struct LogEntry {
    std::string timestamp;
    LogLevel level;
    std::string scope;    // "Dispatch", "Demo", ...
    std::string message;
};

// ============================================================================
// Logger Class
// ============================================================================

/**
 * @brief Scoped, asynchronous logger
 * @details One Logger exists per scope name and is obtained with getInstance().
 *          Messages are queued and written by a single background thread, so
 *          logging from many threads never interleaves partial lines. Output
 *          goes to the console (coloured when stdout is a terminal), to a file,
 *          or both. Level filtering is global via setMinLogLevel().
 */
class Logger {
  public:
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // ------------------------------------------------------------------------
    // Logging Methods
    // ------------------------------------------------------------------------

    /// Log a message at this scope's level
    void log(const std::string& message) const;

    void trace(const std::string& message) const;
    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;
    void fatal(const std::string& message) const;

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::TRACE)) {
            trace(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::DEBUG)) {
            debug(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::INFO)) {
            info(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::WARNING)) {
            warning(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::ERROR)) {
            error(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) const {
        if (enabled(LogLevel::FATAL)) {
            fatal(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    /// True if a message at this level would be written
    static bool enabled(LogLevel level) { return level >= sMinLogLevel.load(); }

    const std::string& scope() const { return mScope; }
    LogLevel level() const { return mLogLevel; }

    // ------------------------------------------------------------------------
    // Static Methods
    // ------------------------------------------------------------------------

    /// Get or create the logger for a scope
    static Logger& getInstance(const std::string& scope, LogLevel level = LogLevel::INFO);

    static void setMinLogLevel(LogLevel level);
    static LogLevel minLogLevel();

    static void setLogFile(const std::string& file);
    static void setLogOutput(LogOutput output);

    /// Stop the writer thread after draining the queue
    static void shutdown();

    /// Final shutdown at process exit. Later log calls are written
    /// synchronously to stderr and never restart the writer thread.
    static void shutdownForExit();

    /// Block until every queued message has been written
    static void flush();

  private:
    explicit Logger(std::string scope, LogLevel level = LogLevel::INFO);

    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables,readability-identifier-naming)
    static std::unordered_map<std::string, std::unique_ptr<Logger>> sLoggers;
    static std::mutex sRegistryMutex;
    static std::mutex sFileMutex;
    static std::atomic<LogLevel> sMinLogLevel;
    static std::atomic<LogOutput> sLogOutput;
    static std::string sLogFile;
    static std::ofstream sFileStream;

    // Writer thread
    static std::queue<LogEntry> sLogQueue;
    static std::mutex sLogQueueMutex;
    static std::condition_variable sLogQueueCondition;
    static std::condition_variable sDrainedCondition;
    static std::size_t sInFlight;  /// Entries popped but not yet written
    static std::thread sLoggingThread;
    static std::mutex sThreadMutex;
    static bool sShutdownRequested;
    static bool sStoppedForExit;  /// Guarded by sThreadMutex
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables,readability-identifier-naming)

    void logInternal(const std::string& message, LogLevel level) const;

    /// Returns false once shutdownForExit() has run
    static bool ensureThreadStarted();
    static void runLoggingThread();

    /// PRECONDITION: caller holds sFileMutex
    static void openLogFileInternal();

    std::string mScope;
    LogLevel mLogLevel = LogLevel::INFO;
};

}  // namespace difflane
