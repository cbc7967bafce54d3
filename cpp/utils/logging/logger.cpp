#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogEntry::LogEntry(LogLevel lvl, std::string msg, std::string comp)
    : level(lvl)
    , message(std::move(msg))
    , component(std::move(comp))
    , timestamp_us(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count())) {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    thread_id = ss.str();
}

LogManager& LogManager::get_instance() {
    static LogManager instance;
    return instance;
}

LogManager::~LogManager() {
    shutdown();
}

void LogManager::initialize(const std::string& log_file, LogLevel min_level) {
    min_level_.store(min_level);
    if (running_.load()) {
        return;
    }

    if (!log_file.empty()) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        file_stream_.open(log_file, std::ios::app);
        if (!file_stream_.is_open()) {
            std::cerr << "[LOG_MANAGER] Failed to open log file " << log_file << ", logging to console only" << std::endl;
        }
    }

    running_.store(true);
    writer_thread_ = std::thread(&LogManager::writer_loop, this);
}

void LogManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void LogManager::log(LogEntry entry) {
    if (entry.level < min_level_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_.load()) {
            queue_.push(std::move(entry));
            queue_cv_.notify_one();
            return;
        }
    }
    write_entry(entry);
}

void LogManager::writer_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    for (;;) {
        queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

        while (!queue_.empty()) {
            LogEntry entry = std::move(queue_.front());
            queue_.pop();
            lock.unlock();
            write_entry(entry);
            lock.lock();
        }

        // Queue is drained here, nothing pushed after the flag flips
        if (!running_.load()) {
            return;
        }
    }
}

void LogManager::write_entry(const LogEntry& entry) {
    std::string line = format_entry(entry);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (entry.level >= LogLevel::ERROR) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << '\n';
    }
    if (file_stream_.is_open()) {
        file_stream_ << line << '\n';
        file_stream_.flush();
    }
}

std::string LogManager::format_entry(const LogEntry& entry) {
    std::ostringstream ss;

    auto seconds = static_cast<std::time_t>(entry.timestamp_us / 1000000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(6) << (entry.timestamp_us % 1000000) << "Z";

    ss << " [" << level_name(entry.level) << "]";
    if (!entry.component.empty()) {
        ss << " [" << entry.component << "]";
    }
    ss << " [T" << entry.thread_id << "] " << entry.message;

    if (!entry.metadata.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& [key, value] : entry.metadata) {
            if (!first) {
                ss << ", ";
            }
            ss << key << "=" << value;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& metadata) {
    LogManager& manager = LogManager::get_instance();
    if (level < manager.get_level()) {
        return;
    }
    LogEntry entry(level, message, component_);
    entry.metadata = metadata;
    manager.log(std::move(entry));
}

void initialize_logging(const std::string& log_file, LogLevel min_level) {
    LogManager::get_instance().initialize(log_file, min_level);
    Logger("LOGGING").info(std::string("Level ") + level_name(min_level) +
                           (log_file.empty() ? ", console only" : ", file " + log_file));
}

void cleanup_logging() {
    LogManager::get_instance().shutdown();
}

} // namespace logging
