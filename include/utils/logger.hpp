#ifndef FORUMBOT_LOGGER_HPP
#define FORUMBOT_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace forumbot {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide logger. Lines go to stdout (WARNING and ERROR to stderr) and,
// when configured, are appended to a file. Registered secrets are masked in
// every line before it is written anywhere.
class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Lets callers skip building a message that would be dropped.
    bool isEnabled(LogLevel level);

    // An empty name closes the current file and logs to the console only.
    void setLogFile(const std::string& filename);
    void setConsoleOutput(bool enabled);
    void setMinLevel(LogLevel level);
    LogLevel getMinLevel();

    // Replaced by "***" in every later line. Empty values are ignored.
    void addSecret(const std::string& secret);
    void clearSecrets();

    // Accepts "debug", "info", "warning"/"warn", "error" (any case); unknown names map to INFO.
    static LogLevel levelFromString(const std::string& name);
    static const char* levelName(LogLevel level);

    // "<timestamp> <LEVEL> [<thread>] <message>", without the trailing newline.
    static std::string formatLine(const std::string& timestamp, LogLevel level, const std::string& thread,
                                  const std::string& message);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string mask(std::string line) const;
    static std::string currentTimestamp();

    std::mutex mutex_;
    std::ofstream log_file_;
    bool console_ = true;
    LogLevel min_level_ = LogLevel::INFO;
    std::vector<std::string> secrets_;
};

} // namespace forumbot

#endif // FORUMBOT_LOGGER_HPP
