#pragma once

/**
 * Health Check Utilities
 *
 * Provides standardized health checking for system components
 */

#include <string>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace health {

/**
 * Health status levels
 */
enum class HealthStatus {
    HEALTHY,      // Component is operating normally
    DEGRADED,     // Component is operating but with reduced functionality
    UNHEALTHY,    // Component is not operating correctly
    UNKNOWN       // Health status cannot be determined
};

/**
 * Health check result
 */
struct HealthCheckResult {
    HealthStatus status;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> details;  // Additional context

    HealthCheckResult()
        : status(HealthStatus::UNKNOWN)
        , timestamp(std::chrono::system_clock::now()) {}

    HealthCheckResult(HealthStatus s, const std::string& msg)
        : status(s)
        , message(msg)
        , timestamp(std::chrono::system_clock::now()) {}

    bool is_healthy() const { return status == HealthStatus::HEALTHY; }
};

/**
 * Health check function type
 */
using HealthCheckFunction = std::function<HealthCheckResult()>;

/**
 * Health checker for components
 *
 * Checks run in registration order. The overall message is the message of
 * the first check that reported the worst status, so callers can register
 * checks from most to least fundamental and surface a single reason.
 */
class HealthChecker {
public:
    explicit HealthChecker(const std::string& component_name)
        : component_name_(component_name)
    {}

    /**
     * Register a health check function; re-registering a name replaces it in place
     */
    void register_check(const std::string& check_name, HealthCheckFunction check_func) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : checks_) {
            if (entry.first == check_name) {
                entry.second = std::move(check_func);
                return;
            }
        }
        checks_.emplace_back(check_name, std::move(check_func));
    }

    /**
     * Perform all registered health checks
     */
    HealthCheckResult check() {
        std::lock_guard<std::mutex> lock(mutex_);

        HealthStatus overall_status = HealthStatus::HEALTHY;
        std::string overall_message = "All checks passed";
        std::map<std::string, std::string> details;

        for (const auto& [name, check_func] : checks_) {
            HealthCheckResult result;
            try {
                result = check_func();
            } catch (const std::exception& e) {
                result = HealthCheckResult(HealthStatus::UNHEALTHY,
                                           component_name_ + " check '" + name + "' threw: " + std::string(e.what()));
            }
            details[name] = result.message;

            // Overall status is worst of all checks; first reporter wins the message
            if (result.status == HealthStatus::UNHEALTHY && overall_status != HealthStatus::UNHEALTHY) {
                overall_status = HealthStatus::UNHEALTHY;
                overall_message = result.message;
            } else if (result.status == HealthStatus::DEGRADED &&
                      overall_status == HealthStatus::HEALTHY) {
                overall_status = HealthStatus::DEGRADED;
                overall_message = result.message;
            }
        }

        HealthCheckResult result(overall_status, overall_message);
        result.details = details;
        return result;
    }

private:
    std::string component_name_;
    std::vector<std::pair<std::string, HealthCheckFunction>> checks_;
    std::mutex mutex_;
};

/**
 * Helper function to create a simple health check
 */
inline HealthCheckFunction make_simple_check(
    std::function<bool()> condition,
    const std::string& success_msg = "OK",
    const std::string& failure_msg = "Failed") {

    return [condition, success_msg, failure_msg]() -> HealthCheckResult {
        bool ok = condition();
        return HealthCheckResult(
            ok ? HealthStatus::HEALTHY : HealthStatus::UNHEALTHY,
            ok ? success_msg : failure_msg
        );
    };
}

} // namespace health
