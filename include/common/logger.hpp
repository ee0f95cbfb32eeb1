#ifndef CHUNKSHARE_LOGGER_HPP
#define CHUNKSHARE_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();

    // Opens (append mode) the log file. An empty name disables file output.
    void init(const std::string& filename);
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);
    bool enabled(LogLevel level) const;

    void set_console_output(bool enabled);

    template<typename... Args>
    void log_args(LogLevel level, Args&&... args) {
        if (!enabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_ = true;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // CHUNKSHARE_LOGGER_HPP
