#include "difflane/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <unistd.h>  // For isatty()

namespace difflane {

// ============================================================================
// ANSI Color Codes for Terminal Output
// ============================================================================

namespace colors {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
}  // namespace colors

// ============================================================================
// Static Helper Functions
// ============================================================================

namespace {

std::string generateTimestampedLogFilename() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::stringstream ss;
    ss << "./logs/difflane_" << std::put_time(&local, "%Y-%m-%d_%H-%M-%S") << ".txt";
    return ss.str();
}

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << millis.count();
    return ss.str();
}

bool isTerminalColorSupported() {
    return isatty(fileno(stdout)) != 0;
}

const char* getLogLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return colors::DIM;
        case LogLevel::DEBUG:
            return colors::CYAN;
        case LogLevel::INFO:
            return colors::BRIGHT_GREEN;
        case LogLevel::WARNING:
            return colors::BRIGHT_YELLOW;
        case LogLevel::ERROR:
        case LogLevel::FATAL:
            return colors::BRIGHT_RED;
    }
    return colors::RESET;
}

// "2026-10-18 09:12:44.031 [INFO] [Dispatch] message"
std::string formatPlain(const LogEntry& entry) {
    std::string line;
    line.reserve(entry.message.size() + 48);
    line += entry.timestamp;
    line += " [";
    line += toString(entry.level);
    line += "] [";
    line += entry.scope;
    line += "] ";
    line += entry.message;
    line += '\n';
    return line;
}

std::string formatColored(const LogEntry& entry) {
    std::stringstream ss;
    ss << colors::DIM << entry.timestamp << colors::RESET << ' ';
    if (entry.level == LogLevel::FATAL) {
        ss << colors::BOLD;
    }
    ss << getLogLevelColor(entry.level) << '[' << toString(entry.level) << ']' << colors::RESET
       << ' ' << colors::CYAN << '[' << entry.scope << ']' << colors::RESET << ' '
       << entry.message << '\n';
    return ss.str();
}

}  // namespace

// ============================================================================
// Level Names
// ============================================================================

std::string_view toString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") {
        return LogLevel::TRACE;
    }
    if (upper == "DEBUG") {
        return LogLevel::DEBUG;
    }
    if (upper == "INFO") {
        return LogLevel::INFO;
    }
    if (upper == "WARNING" || upper == "WARN") {
        return LogLevel::WARNING;
    }
    if (upper == "ERROR") {
        return LogLevel::ERROR;
    }
    if (upper == "FATAL") {
        return LogLevel::FATAL;
    }
    throw std::runtime_error("Unknown log level '" + std::string(name) + "'");
}

// ============================================================================
// Static Member Initialization
// ============================================================================

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::sLoggers;
std::mutex Logger::sRegistryMutex;
std::mutex Logger::sFileMutex;
std::atomic<LogLevel> Logger::sMinLogLevel{LogLevel::INFO};
std::atomic<LogOutput> Logger::sLogOutput{LogOutput::CONSOLE};
std::string Logger::sLogFile = generateTimestampedLogFilename();
std::ofstream Logger::sFileStream;

std::queue<LogEntry> Logger::sLogQueue;
std::mutex Logger::sLogQueueMutex;
std::condition_variable Logger::sLogQueueCondition;
std::condition_variable Logger::sDrainedCondition;
std::size_t Logger::sInFlight = 0;
std::thread Logger::sLoggingThread;
std::mutex Logger::sThreadMutex;
bool Logger::sShutdownRequested = false;
bool Logger::sStoppedForExit = false;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

// Joins the writer thread at exit for programs that never call shutdown().
// Defined after the members above so it is destroyed before them. Static
// destructors that run later still log, synchronously.
namespace {
struct WriterThreadGuard {
    ~WriterThreadGuard() { Logger::shutdownForExit(); }
};
WriterThreadGuard writerThreadGuard;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
}  // namespace

// ============================================================================
// Constructor & Destructor
// ============================================================================

Logger::Logger(std::string scope, LogLevel level) : mScope(std::move(scope)), mLogLevel(level) {}

Logger::~Logger() = default;

// ============================================================================
// Static Methods
// ============================================================================

Logger& Logger::getInstance(const std::string& scope, LogLevel level) {
    ensureThreadStarted();

    std::lock_guard<std::mutex> lock(sRegistryMutex);
    auto it = sLoggers.find(scope);
    if (it == sLoggers.end()) {
        it = sLoggers.emplace(scope, std::unique_ptr<Logger>(new Logger(scope, level))).first;
    }
    // An existing scope keeps the level it was created with
    return *it->second;
}

void Logger::setMinLogLevel(LogLevel level) {
    sMinLogLevel = level;
}

LogLevel Logger::minLogLevel() {
    return sMinLogLevel;
}

void Logger::setLogOutput(LogOutput output) {
    if (output == LogOutput::FILE || output == LogOutput::BOTH) {
        std::lock_guard<std::mutex> lock(sFileMutex);
        if (!sFileStream.is_open()) {
            openLogFileInternal();
        }
    }
    sLogOutput = output;
}

void Logger::setLogFile(const std::string& file) {
    std::lock_guard<std::mutex> lock(sFileMutex);
    if (sFileStream.is_open()) {
        sFileStream.close();
    }

    sLogFile = file;
    openLogFileInternal();

    if (sFileStream.is_open()) {
        sLogOutput = LogOutput::BOTH;
    }
}

void Logger::openLogFileInternal() {
    // PRECONDITION: sFileMutex is held
    const std::filesystem::path path(sLogFile);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: Failed to create log directory " << path.parent_path() << ": "
                      << ec.message() << std::endl;
            return;
        }
    }

    sFileStream.open(sLogFile, std::ios::app);
    if (!sFileStream.is_open()) {
        std::cerr << "Error: Failed to open log file: " << sLogFile << std::endl;
    }
}

// ============================================================================
// Logging Methods
// ============================================================================

void Logger::log(const std::string& message) const {
    if (enabled(mLogLevel)) {
        logInternal(message, mLogLevel);
    }
}

void Logger::trace(const std::string& message) const {
    if (enabled(LogLevel::TRACE)) {
        logInternal(message, LogLevel::TRACE);
    }
}

void Logger::debug(const std::string& message) const {
    if (enabled(LogLevel::DEBUG)) {
        logInternal(message, LogLevel::DEBUG);
    }
}

void Logger::info(const std::string& message) const {
    if (enabled(LogLevel::INFO)) {
        logInternal(message, LogLevel::INFO);
    }
}

void Logger::warning(const std::string& message) const {
    if (enabled(LogLevel::WARNING)) {
        logInternal(message, LogLevel::WARNING);
    }
}

void Logger::error(const std::string& message) const {
    if (enabled(LogLevel::ERROR)) {
        logInternal(message, LogLevel::ERROR);
    }
}

void Logger::fatal(const std::string& message) const {
    if (enabled(LogLevel::FATAL)) {
        logInternal(message, LogLevel::FATAL);
    }
}

void Logger::logInternal(const std::string& message, LogLevel level) const {
    LogEntry entry{currentTimestamp(), level, mScope, message};

    if (!ensureThreadStarted()) {
        std::cerr << formatPlain(entry);
        return;
    }

    std::lock_guard<std::mutex> lock(sLogQueueMutex);
    sLogQueue.push(std::move(entry));
    sLogQueueCondition.notify_one();
}

// ============================================================================
// Writer Thread
// ============================================================================

bool Logger::ensureThreadStarted() {
    std::lock_guard<std::mutex> lock(sThreadMutex);
    if (sStoppedForExit) {
        return false;
    }
    if (sLoggingThread.joinable()) {
        return true;
    }
    {
        std::lock_guard<std::mutex> queueLock(sLogQueueMutex);
        sShutdownRequested = false;
    }
    sLoggingThread = std::thread(runLoggingThread);
    return true;
}

void Logger::runLoggingThread() {
    static const bool useColor = isTerminalColorSupported();

    std::unique_lock<std::mutex> lock(sLogQueueMutex);
    while (true) {
        sLogQueueCondition.wait(lock, [] { return !sLogQueue.empty() || sShutdownRequested; });
        if (sLogQueue.empty()) {
            break;  // shutdown with nothing left to write
        }

        std::vector<LogEntry> entries;
        while (!sLogQueue.empty()) {
            entries.emplace_back(std::move(sLogQueue.front()));
            sLogQueue.pop();
        }
        sInFlight = entries.size();
        lock.unlock();

        const LogOutput output = sLogOutput;
        if (output == LogOutput::CONSOLE || output == LogOutput::BOTH) {
            for (const auto& entry : entries) {
                std::cout << (useColor ? formatColored(entry) : formatPlain(entry));
            }
            std::cout.flush();
        }

        // Files never get colour codes
        if (output == LogOutput::FILE || output == LogOutput::BOTH) {
            std::lock_guard<std::mutex> fileLock(sFileMutex);
            if (sFileStream.is_open()) {
                for (const auto& entry : entries) {
                    sFileStream << formatPlain(entry);
                }
                sFileStream.flush();
            }
        }

        lock.lock();
        sInFlight = 0;
        sDrainedCondition.notify_all();
    }
    sDrainedCondition.notify_all();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> threadLock(sThreadMutex);
    {
        std::lock_guard<std::mutex> lock(sLogQueueMutex);
        sShutdownRequested = true;
    }
    sLogQueueCondition.notify_all();

    if (sLoggingThread.joinable()) {
        sLoggingThread.join();
    }

    std::lock_guard<std::mutex> fileLock(sFileMutex);
    if (sFileStream.is_open()) {
        sFileStream.close();
    }
}

void Logger::shutdownForExit() {
    {
        std::lock_guard<std::mutex> threadLock(sThreadMutex);
        sStoppedForExit = true;
    }
    shutdown();
}

void Logger::flush() {
    {
        std::lock_guard<std::mutex> threadLock(sThreadMutex);
        if (!sLoggingThread.joinable()) {
            return;
        }
    }
    std::unique_lock<std::mutex> lock(sLogQueueMutex);
    sDrainedCondition.wait(lock, [] { return sLogQueue.empty() && sInFlight == 0; });
}

}  // namespace difflane
