#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <signal.h>
#include "../config/process_config_manager.hpp"

namespace app_service {

/**
 * Base class for a long-running process
 *
 * initialize() parses the command line, loads the INI file and calls
 * configure_service(). start() calls start_service(), then blocks until
 * SIGINT/SIGTERM or request_shutdown(), reporting stats every
 * --stats-interval seconds and on SIGUSR1. Signal handlers only set flags;
 * all work happens on the thread that called start().
 *
 * Command line: --config <file>, --stats-interval <seconds>, --help.
 * Both value options also accept the --name=value form.
 */
class AppService {
public:
    // config_name selects the default config file, config/<config_name>.ini
    AppService(const std::string& service_name, const std::string& config_name);
    virtual ~AppService();

    AppService(const AppService&) = delete;
    AppService& operator=(const AppService&) = delete;

    bool initialize(int argc, char** argv);

    // Process exit code: 0 after a clean shutdown, 1 if the service failed to start
    int start();
    void stop();
    bool is_running() const { return running_.load(); }
    bool help_requested() const { return help_requested_; }

    // Asks start() to return; safe from any thread and from signal handlers
    void request_shutdown() { shutdown_requested_.store(true); }

    void set_config_file(const std::string& config_file) { config_file_ = config_file; }
    int get_stats_interval() const { return stats_interval_seconds_; }

    // Seconds since start_service() succeeded, 0 when not running
    int64_t uptime_seconds() const;

protected:
    virtual bool configure_service() = 0;
    virtual bool start_service() = 0;
    virtual void stop_service() = 0;
    virtual void print_service_stats() = 0;

    config::ProcessConfigManager* get_config_manager() { return config_manager_.get(); }
    const std::string& get_service_name() const { return service_name_; }
    const std::string& get_config_file() const { return config_file_; }

private:
    bool parse_arguments(int argc, char** argv);
    bool load_configuration();
    void print_usage() const;
    void setup_signal_handlers();
    void restore_signal_handlers();
    void stats_reporting_loop();
    void stop_stats_thread();

    std::string service_name_;
    std::string config_name_;
    std::string config_file_;
    int stats_interval_seconds_{60};
    bool help_requested_{false};

    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int64_t> started_at_ms_{0};   // steady clock

    std::unique_ptr<config::ProcessConfigManager> config_manager_;

    std::thread stats_thread_;
    bool stats_running_{false};
    std::mutex stats_mutex_;
    std::condition_variable stats_cv_;

    // One instance receives signals; the handler only sets flags
    static std::atomic<AppService*> g_instance;
    static std::atomic<bool> g_stats_requested;
    static void signal_handler(int signal);
};

} // namespace app_service
