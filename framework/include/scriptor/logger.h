#ifndef SCRIPTOR_LOGGER_H
#define SCRIPTOR_LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <queue>
#include <condition_variable>
#include <atomic>

namespace scriptor {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide asynchronous logger.
 *
 * Callers only enqueue; a single worker thread formats and writes, so logging
 * from inside a pool lock never waits on I/O.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Select the destination.
     * "stdout" (or empty) writes to the console, "/dev/null" disables logging,
     * anything else is a file opened in append mode (parent dirs are created).
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void log_error(const std::string& message);

    /**
     * @brief Block until everything queued so far has been written.
     */
    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    static std::string get_timestamp();
    void process_queue();

    std::mutex io_mutex_;
    std::ofstream file_stream_;
    bool use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    size_t in_progress_{0};
    std::thread worker_;
    std::atomic<bool> running_{true};
};

} // namespace scriptor

#endif // SCRIPTOR_LOGGER_H
