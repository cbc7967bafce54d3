#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* level_name(LogLevel level);

// Parses DEBUG/INFO/WARN/WARNING/ERROR (case-insensitive); unknown names map to INFO
LogLevel parse_log_level(const std::string& name);

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string component;
    std::string thread_id;
    uint64_t timestamp_us;
    std::map<std::string, std::string> metadata;   // rendered as {key=value, ...}

    LogEntry(LogLevel lvl, std::string msg, std::string comp);
};

/**
 * Process-wide log sink
 *
 * After initialize() entries are queued and written by one writer thread,
 * so connection threads never block on console or file I/O. Before
 * initialize() and after shutdown() entries are written synchronously.
 * Lines go to stdout (stderr for ERROR) and, when configured, to a file
 * opened in append mode.
 */
class LogManager {
public:
    static LogManager& get_instance();

    void initialize(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO);

    // Stops the writer thread after draining the queue
    void shutdown();

    void log(LogEntry entry);

    void set_level(LogLevel level) { min_level_.store(level); }
    LogLevel get_level() const { return min_level_.load(); }
    bool is_running() const { return running_.load(); }

    // "2024-01-02 03:04:05.123456Z [INFO] [COMPONENT] [T<id>] message {k=v}"
    static std::string format_entry(const LogEntry& entry);

private:
    LogManager() = default;
    ~LogManager();

    void writer_loop();
    void write_entry(const LogEntry& entry);

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::ofstream file_stream_;
    std::mutex write_mutex_;

    std::atomic<bool> running_{false};
    std::thread writer_thread_;
    std::queue<LogEntry> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
};

class Logger {
public:
    explicit Logger(std::string component) : component_(std::move(component)) {}

    const std::string& component() const { return component_; }

    void debug(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::DEBUG, message, metadata);
    }

    void info(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::INFO, message, metadata);
    }

    void warn(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::WARN, message, metadata);
    }

    void error(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::ERROR, message, metadata);
    }

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& metadata = {});

private:
    std::string component_;
};

void initialize_logging(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO);

void cleanup_logging();

} // namespace logging
