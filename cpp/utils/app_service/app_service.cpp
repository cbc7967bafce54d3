#include "app_service.hpp"
#include "../logging/log_helper.hpp"
#include <fstream>
#include <stdexcept>

namespace app_service {

namespace {
const char* kComponent = "APP_SERVICE";

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Matches "--name value" and "--name=value"; advances i past a separate value
bool take_option(const std::string& name, int argc, char** argv, int& i, std::string& value) {
    std::string arg = argv[i];
    if (arg == name) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(name + " requires a value");
        }
        value = argv[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}
}

std::atomic<AppService*> AppService::g_instance{nullptr};
std::atomic<bool> AppService::g_stats_requested{false};

AppService::AppService(const std::string& service_name, const std::string& config_name)
    : service_name_(service_name), config_name_(config_name) {
}

AppService::~AppService() {
    stop();
    restore_signal_handlers();
}

bool AppService::parse_arguments(int argc, char** argv) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;

            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                print_usage();
                return false;
            } else if (take_option("--config", argc, argv, i, value)) {
                config_file_ = value;
            } else if (take_option("--stats-interval", argc, argv, i, value)) {
                size_t used = 0;
                int seconds = std::stoi(value, &used);
                if (used != value.size() || seconds <= 0) {
                    throw std::invalid_argument("--stats-interval must be a positive integer");
                }
                stats_interval_seconds_ = seconds;
            } else {
                throw std::invalid_argument("unknown argument " + arg);
            }
        }
    } catch (const std::logic_error& e) {
        // invalid_argument from the checks above, or out_of_range from stoi
        LOG_ERROR_COMP(kComponent, std::string("Invalid command line: ") + e.what());
        print_usage();
        return false;
    }
    return true;
}

void AppService::print_usage() const {
    LOG_INFO_COMP(kComponent, "Usage: " + config_name_ + " [options]\n"
                  "  --config <file>              INI file (default " +
                  config::get_default_config_file(config_name_) + ", optional)\n"
                  "  --stats-interval <seconds>   Statistics log interval (default 60)\n"
                  "  --help                       Show this help message");
}

bool AppService::load_configuration() {
    // An explicit --config must load; the default file may be absent so the
    // service can run from environment variables alone
    bool explicit_config = !config_file_.empty();
    if (!explicit_config) {
        config_file_ = config::get_default_config_file(config_name_);
    }

    config_manager_ = std::make_unique<config::ProcessConfigManager>();
    if (!explicit_config && !std::ifstream(config_file_).good()) {
        LOG_WARN_COMP(kComponent, "Config file " + config_file_ + " not found, using environment and defaults");
        return true;
    }

    if (!config_manager_->load_config(config_file_)) {
        LOG_ERROR_COMP(kComponent, "Failed to load configuration from " + config_file_);
        return false;
    }
    LOG_INFO_COMP(kComponent, "Loaded " + config_file_);
    return true;
}

bool AppService::initialize(int argc, char** argv) {
    if (initialized_.load()) {
        return true;
    }

    if (!parse_arguments(argc, argv)) {
        return false;
    }

    LOG_INFO_COMP(kComponent, service_name_ + " starting");

    if (!load_configuration()) {
        return false;
    }

    try {
        if (!configure_service()) {
            LOG_ERROR_COMP(kComponent, "Service configuration failed");
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(kComponent, "Service configuration failed: " + std::string(e.what()));
        return false;
    }

    setup_signal_handlers();
    initialized_.store(true);
    return true;
}

int AppService::start() {
    if (!initialized_.load()) {
        LOG_ERROR_COMP(kComponent, "Service not initialized");
        return 1;
    }
    if (running_.load()) {
        LOG_WARN_COMP(kComponent, "Service already running");
        return 1;
    }

    if (!start_service()) {
        LOG_ERROR_COMP(kComponent, "Failed to start " + service_name_);
        stop_service();
        return 1;
    }

    started_at_ms_.store(steady_now_ms());
    running_.store(true);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_running_ = true;
    }
    stats_thread_ = std::thread(&AppService::stats_reporting_loop, this);

    LOG_INFO_COMP(kComponent, service_name_ + " running, stats every " +
                  std::to_string(stats_interval_seconds_) + "s");

    while (running_.load() && !shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (g_stats_requested.exchange(false)) {
            print_service_stats();
        }
    }

    if (shutdown_requested_.load()) {
        LOG_INFO_COMP(kComponent, "Shutdown requested");
    }
    stop();
    return 0;
}

void AppService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO_COMP(kComponent, "Stopping " + service_name_ + "...");
    stop_stats_thread();
    stop_service();
    LOG_INFO_COMP(kComponent, service_name_ + " stopped after " + std::to_string(uptime_seconds()) + "s");
    started_at_ms_.store(0);
}

int64_t AppService::uptime_seconds() const {
    int64_t started = started_at_ms_.load();
    return started == 0 ? 0 : (steady_now_ms() - started) / 1000;
}

void AppService::stop_stats_thread() {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_running_ = false;
    }
    stats_cv_.notify_all();
    if (stats_thread_.joinable()) {
        stats_thread_.join();
    }
}

void AppService::setup_signal_handlers() {
    g_instance.store(this);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, signal_handler);
    // A peer closing a socket must not kill the process
    signal(SIGPIPE, SIG_IGN);
}

void AppService::restore_signal_handlers() {
    AppService* expected = this;
    if (g_instance.compare_exchange_strong(expected, nullptr)) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGUSR1, SIG_DFL);
    }
}

void AppService::stats_reporting_loop() {
    std::unique_lock<std::mutex> lock(stats_mutex_);
    while (stats_running_) {
        stats_cv_.wait_for(lock, std::chrono::seconds(stats_interval_seconds_),
                           [this]() { return !stats_running_; });
        if (!stats_running_) {
            break;
        }
        lock.unlock();
        print_service_stats();
        lock.lock();
    }
}

void AppService::signal_handler(int signal) {
    AppService* instance = g_instance.load();
    if (!instance) {
        return;
    }
    if (signal == SIGUSR1) {
        g_stats_requested.store(true);
    } else {
        instance->request_shutdown();
    }
}

} // namespace app_service
