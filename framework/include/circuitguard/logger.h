#ifndef CIRCUITGUARD_LOGGER_H
#define CIRCUITGUARD_LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <queue>
#include <condition_variable>
#include <atomic>

namespace circuitguard {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

std::string_view to_string(LogLevel level);

/**
 * @brief Destination for diagnostic events raised by a Guard.
 * A Guard built without a sink behaves identically, it only stays silent.
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/**
 * @brief Asynchronous line logger.
 * Messages are queued and written by a background worker thread.
 */
class Logger : public LogSink {
private:
    // Destination, guarded by io_mutex_
    std::ofstream file_stream_;
    bool use_stdout_{true};
    std::mutex io_mutex_;

    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    // Async Queue
    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{true};

    static std::string get_timestamp();
    void process_queue();

public:
    Logger();
    ~Logger() override;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /** @brief Process-wide default logger (stdout). */
    static Logger& instance();

    /**
     * @brief Selects the destination.
     * "stdout" or "" writes to the console, "/dev/null" disables output,
     * anything else is a file opened in append mode.
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    void log(LogLevel level, std::string_view message) override;
    void log_error(const std::string& message);
};

} // namespace circuitguard

#endif // CIRCUITGUARD_LOGGER_H
