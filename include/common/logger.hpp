#pragma once

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Process-wide logger. Every line goes to stderr and, when a path was given,
// to the log file. stdout is never touched: it carries the MCP protocol.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

    static std::string levelToString(LogLevel level);
    // Throws std::invalid_argument for names other than debug/info/warning/error/fatal.
    static LogLevel parseLogLevel(const std::string& name);

private:
    static void log(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static std::string logPath_;
    static std::ofstream logFile_;
};
