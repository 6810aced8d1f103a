#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace heartfield {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4
};

/**
 * Parse a level name ("trace", "debug", "info", "warning"/"warn", "error").
 * Case-insensitive. Returns false and leaves level untouched on unknown names.
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * Process-wide logger shared by the tracking thread and the display loop.
 *
 * Every line carries the level, an optional component tag ("engine",
 * "session", ...) and the source location. Messages go to the console,
 * a timestamped session file, or both. Emitted messages are counted per
 * level so a run can report how many warnings and errors it produced.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }
    LogLevel getLevel() const { return minLevel_; }

    bool consoleOutput() const { return consoleOutput_; }

    /**
     * Set threshold and console output in one call. Leaves any open file alone.
     */
    void configure(LogLevel level, bool consoleOutput);

    /**
     * Open a new session file heartfield_<date>_<time>.log in directory,
     * creating the directory when needed. Closes a previously open file.
     * @return false if the directory or file could not be created
     */
    bool openSessionFile(const std::string& directory);

    void closeLogFile();

    /**
     * @return Path of the open session file, empty when logging to console only
     */
    std::string getCurrentLogFile() const;

    void log(LogLevel level, const std::string& component, const std::string& message,
             const char* file = nullptr, int line = 0);

    /**
     * Number of messages emitted at level since startup or resetCounters()
     */
    uint64_t messageCount(LogLevel level) const;
    void resetCounters();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatLine(LogLevel level, const std::string& component, const std::string& message,
                           const char* file, int line) const;

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};
    std::array<std::atomic<uint64_t>, 5> counts_{};

    mutable std::mutex mutex_;
    std::ofstream logFile_;
    std::string currentLogFile_;
};

/**
 * Collects one message with operator<< and logs it on destruction
 */
class LogStream {
public:
    LogStream(LogLevel level, const char* component, const char* file, int line)
        : level_(level), component_(component), file_(file), line_(line) {}

    ~LogStream() {
        Logger::getInstance().log(level_, component_, stream_.str(), file_, line_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    const char* file_;
    int line_;
    std::ostringstream stream_;
};

#define LOG_TRACE(msg) heartfield::core::Logger::getInstance().log(heartfield::core::LogLevel::TRACE, "", msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) heartfield::core::Logger::getInstance().log(heartfield::core::LogLevel::DEBUG, "", msg, __FILE__, __LINE__)
#define LOG_INFO(msg) heartfield::core::Logger::getInstance().log(heartfield::core::LogLevel::INFO, "", msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) heartfield::core::Logger::getInstance().log(heartfield::core::LogLevel::WARNING, "", msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) heartfield::core::Logger::getInstance().log(heartfield::core::LogLevel::ERROR, "", msg, __FILE__, __LINE__)

// Component-tagged stream: HEARTFIELD_LOG(INFO, "engine") << "mode " << name;
#define HEARTFIELD_LOG(level, component) \
    heartfield::core::LogStream(heartfield::core::LogLevel::level, component, __FILE__, __LINE__)

} // namespace core
} // namespace heartfield
