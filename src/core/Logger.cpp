#include "heartfield/core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace heartfield {
namespace core {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:   return "TRACE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

std::tm localTime(std::time_t t) {
    std::tm result{};
    localtime_r(&t, &result);
    return result;
}

std::string wallClock() {
    const auto now = std::chrono::system_clock::now();
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        level = LogLevel::TRACE;
    } else if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::configure(LogLevel level, bool consoleOutput) {
    minLevel_ = level;
    consoleOutput_ = consoleOutput;
}

bool Logger::openSessionFile(const std::string& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec || !std::filesystem::is_directory(directory)) {
        std::cerr << "[Logger] Cannot use log directory " << directory
                  << (ec ? ": " + ec.message() : std::string()) << std::endl;
        return false;
    }

    const std::tm tm = localTime(std::time(nullptr));
    std::ostringstream name;
    name << "heartfield_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S") << ".log";
    const std::string path = (std::filesystem::path(directory) / name.str()).string();

    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << path << std::endl;
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path;

    logFile_ << "# Heartfield session log, started "
             << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
             << ", level " << levelName(minLevel_.load()) << std::endl;
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const char* file, int line) {
    if (level < minLevel_.load()) {
        return;
    }
    counts_[static_cast<size_t>(level)].fetch_add(1, std::memory_order_relaxed);

    const std::string formatted = formatLine(level, component, message, file, line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_.load()) {
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << formatted << '\n';
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
    }
}

uint64_t Logger::messageCount(LogLevel level) const {
    return counts_[static_cast<size_t>(level)].load(std::memory_order_relaxed);
}

void Logger::resetCounters() {
    for (auto& count : counts_) {
        count.store(0, std::memory_order_relaxed);
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& component, const std::string& message,
                               const char* file, int line) const {
    std::ostringstream oss;
    oss << wallClock() << " " << std::left << std::setw(7) << levelName(level) << " ";
    if (!component.empty()) {
        oss << "[" << component << "] ";
    }
    oss << message;

    if (file != nullptr && line > 0) {
        const char* base = std::strrchr(file, '/');
        oss << " (" << (base ? base + 1 : file) << ":" << line << ")";
    }
    return oss.str();
}

} // namespace core
} // namespace heartfield
