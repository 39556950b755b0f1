#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace forumbot {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::ostringstream thread;
    thread << std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    const std::string line = mask(formatLine(currentTimestamp(), level, thread.str(), message));
    if (console_) {
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << line << std::endl;
    }
    if (log_file_.is_open()) {
        log_file_ << line << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

bool Logger::isEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (filename.empty()) {
        return;
    }
    log_file_.clear();
    log_file_.open(filename, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Logger: cannot open log file " << filename << ", console only" << std::endl;
    }
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::getMinLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::addSecret(const std::string& secret) {
    if (secret.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
        secrets_.push_back(secret);
    }
}

void Logger::clearSecrets() {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.clear();
}

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

std::string Logger::formatLine(const std::string& timestamp, LogLevel level, const std::string& thread,
                               const std::string& message) {
    std::ostringstream line;
    line << timestamp << " " << std::left << std::setw(5) << levelName(level) << " [" << thread << "] " << message;
    return line.str();
}

// Caller holds mutex_.
std::string Logger::mask(std::string line) const {
    for (const auto& secret : secrets_) {
        size_t pos = 0;
        while ((pos = line.find(secret, pos)) != std::string::npos) {
            line.replace(pos, secret.size(), "***");
            pos += 3;
        }
    }
    return line;
}

std::string Logger::currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

} // namespace forumbot
