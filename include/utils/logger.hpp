#pragma once

#include <chrono>
#include <string>
#include <fstream>
#include <mutex>

namespace ActivePref {
namespace Utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parse "debug", "info", "warning" or "error" (case-insensitive)
LogLevel parse_log_level(const std::string& name);

/**
 * Process-wide log sink
 *
 * Every line goes to the console (warnings and errors on stderr so they do
 * not interleave with query prompts on stdout) and to a per-day file
 * <dir>/activepref_<YYYY-MM-DD>.log. The file is opened lazily on the first
 * message, so a process that never logs leaves no directory behind.
 */
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& module, const std::string& message);
    void set_log_directory(const std::string& dir);
    void set_min_level(LogLevel level);
    LogLevel min_level() const;

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warning(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_file_for_today();

    std::string log_dir_;
    std::string current_date_;
    std::ofstream log_file_;
    mutable std::mutex log_mutex_;
    LogLevel min_level_;
};

// Per-component logger carrying the module tag
class ModuleLogger {
public:
    explicit ModuleLogger(const std::string& module_name);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    const std::string& module() const { return module_name_; }

private:
    std::string module_name_;
};

/**
 * Logs "<label> took N ms" at debug level when it goes out of scope
 */
class ScopedTimer {
public:
    ScopedTimer(ModuleLogger& logger, std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    long long elapsed_ms() const;

private:
    ModuleLogger& logger_;
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

#define LOG_DEBUG(module, msg) ActivePref::Utils::Logger::instance().debug(module, msg)
#define LOG_INFO(module, msg) ActivePref::Utils::Logger::instance().info(module, msg)
#define LOG_WARNING(module, msg) ActivePref::Utils::Logger::instance().warning(module, msg)
#define LOG_ERROR(module, msg) ActivePref::Utils::Logger::instance().error(module, msg)

} // namespace Utils
} // namespace ActivePref
