#include <scriptor/logger.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <filesystem>

namespace scriptor {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    worker_ = std::thread(&Logger::process_queue, this);
}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string Logger::get_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto now_time_t = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};

    localtime_r(&now_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

void Logger::process_queue() {
    while (true) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty() && !running_) {
                break;
            }

            msg = std::move(queue_.front());
            queue_.pop();
            ++in_progress_;
        }

        std::stringstream output;
        output << "[" << get_timestamp() << "] " << msg << "\n";
        std::string out_str = output.str();
        const bool is_error = msg.starts_with("ERROR");

        {
            std::lock_guard<std::mutex> io_lock(io_mutex_);
            if (use_stdout_) {
                (is_error ? std::cerr : std::cout) << out_str;
            } else if (file_stream_.is_open()) {
                file_stream_ << out_str;
                if (is_error) {
                    file_stream_.flush();
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_progress_;
            if (queue_.empty() && in_progress_ == 0) {
                drained_cv_.notify_all();
            }
        }
    }
}

void Logger::configure(const std::string& path) {
    if (path == "/dev/null") {
        enabled_ = false;
        return;
    }

    enabled_ = true;

    // Let the worker finish with the old destination first
    flush();
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (path == "stdout" || path.empty()) {
        use_stdout_ = true;
        return;
    }

    use_stdout_ = false;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    if (file_stream_.is_open()) file_stream_.close();
    file_stream_.open(path, std::ios::out | std::ios::app);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled_ || level < level_) return;

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO:  level_str = "INFO";  break;
        case LogLevel::WARN:  level_str = "WARN";  break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
    }

    std::string msg = level_str + ": " + std::string(message);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(msg));
    }
    cv_.notify_one();
}

void Logger::log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return (queue_.empty() && in_progress_ == 0) || !running_; });
    lock.unlock();

    std::lock_guard<std::mutex> io_lock(io_mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

} // namespace scriptor
