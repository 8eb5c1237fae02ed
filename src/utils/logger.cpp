#include "utils/logger.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <sstream>
#include <system_error>
#include <utility>

namespace ActivePref {
namespace Utils {

namespace {

std::string format_now(const char* pattern) {
    time_t now = time(nullptr);
    struct tm timeinfo;
    localtime_r(&now, &timeinfo);
    char buffer[32];
    strftime(buffer, sizeof(buffer), pattern, &timeinfo);
    return std::string(buffer);
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO: return "\033[32m";     // Green
        case LogLevel::WARNING: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
    }
    return "\033[0m";
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : log_dir_("logs"), min_level_(LogLevel::INFO) {}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::set_log_directory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (dir == log_dir_) {
        return;
    }
    log_dir_ = dir;
    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_date_.clear();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

LogLevel Logger::min_level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_level_;
}

// Daily rotation; caller holds the mutex
void Logger::open_file_for_today() {
    std::string today = format_now("%Y-%m-%d");
    if (today == current_date_) {
        return;
    }
    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_date_ = today;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    std::string log_filename = log_dir_ + "/activepref_" + current_date_ + ".log";
    log_file_.open(log_filename, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Failed to open log file: " << log_filename << std::endl;
    }
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < min_level_) {
        return;
    }

    open_file_for_today();

    std::ostringstream line;
    line << "[" << format_now("%Y-%m-%d %H:%M:%S") << "] "
         << "[" << std::setw(7) << std::left << level_name(level) << "] "
         << "[" << module << "] "
         << message;

    std::ostream& console = level >= LogLevel::WARNING ? std::cerr : std::cout;
    console << level_color(level) << line.str() << "\033[0m" << std::endl;

    if (log_file_.is_open()) {
        log_file_ << line.str() << std::endl;
    }
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warning(const std::string& module, const std::string& message) {
    log(LogLevel::WARNING, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

// ModuleLogger

ModuleLogger::ModuleLogger(const std::string& module_name) : module_name_(module_name) {}

void ModuleLogger::debug(const std::string& message) {
    Logger::instance().debug(module_name_, message);
}

void ModuleLogger::info(const std::string& message) {
    Logger::instance().info(module_name_, message);
}

void ModuleLogger::warning(const std::string& message) {
    Logger::instance().warning(module_name_, message);
}

void ModuleLogger::error(const std::string& message) {
    Logger::instance().error(module_name_, message);
}

// ScopedTimer

ScopedTimer::ScopedTimer(ModuleLogger& logger, std::string label)
    : logger_(logger), label_(std::move(label)), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    logger_.debug(label_ + " took " + std::to_string(elapsed_ms()) + " ms");
}

long long ScopedTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace Utils
} // namespace ActivePref
