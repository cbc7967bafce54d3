#pragma once
#include <string>
#include <exception>
#include <chrono>
#include <algorithm>
#include <functional>
#include <random>
#include <thread>

namespace resilience {

enum class ErrorType {
    NETWORK_ERROR,
    API_ERROR,
    RATE_LIMIT_ERROR,
    AUTHENTICATION_ERROR,
    VALIDATION_ERROR,
    SYSTEM_ERROR,
    UNKNOWN_ERROR
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::NETWORK_ERROR: return "network";
        case ErrorType::API_ERROR: return "api";
        case ErrorType::RATE_LIMIT_ERROR: return "rate_limit";
        case ErrorType::AUTHENTICATION_ERROR: return "authentication";
        case ErrorType::VALIDATION_ERROR: return "validation";
        case ErrorType::SYSTEM_ERROR: return "system";
        default: return "unknown";
    }
}

class ResilientError : public std::exception {
public:
    ResilientError(ErrorType type, const std::string& message, const std::string& context = "")
        : type_(type), message_(message), context_(context) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorType get_type() const { return type_; }
    const std::string& get_context() const { return context_; }

private:
    ErrorType type_;
    std::string message_;
    std::string context_;
};

/**
 * Exponential reconnect delay with a cap and additive random jitter
 *
 *   base_delay(n) = min(base * 2^n, max_delay)
 *   next_delay(n) = base_delay(n) + U(0, jitter_fraction * base_delay(n))
 *
 * Not thread-safe; each connection owns its own instance.
 */
class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::milliseconds base,
                       std::chrono::milliseconds max_delay,
                       double jitter_fraction = 0.1)
        : base_(base)
        , max_delay_(max_delay)
        , jitter_fraction_(jitter_fraction)
        , rng_(std::random_device{}()) {}

    std::chrono::milliseconds base_delay(int retry_count) const {
        if (retry_count < 0) {
            retry_count = 0;
        }
        // Double arithmetic so large retry counts saturate instead of overflowing
        double delay = static_cast<double>(base_.count());
        double cap = static_cast<double>(max_delay_.count());
        for (int i = 0; i < retry_count && delay < cap; ++i) {
            delay *= 2.0;
        }
        return std::chrono::milliseconds(static_cast<long long>(std::min(delay, cap)));
    }

    std::chrono::milliseconds next_delay(int retry_count) {
        auto delay = base_delay(retry_count);
        double jitter_max = jitter_fraction_ * static_cast<double>(delay.count());
        if (jitter_max <= 0.0) {
            return delay;
        }
        std::uniform_real_distribution<double> jitter(0.0, jitter_max);
        return delay + std::chrono::milliseconds(static_cast<long long>(jitter(rng_)));
    }

    std::chrono::milliseconds get_base() const { return base_; }
    std::chrono::milliseconds get_max_delay() const { return max_delay_; }
    double get_jitter_fraction() const { return jitter_fraction_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_delay_;
    double jitter_fraction_;
    std::mt19937_64 rng_;
};

/**
 * Retries an operation that signals transient failure by throwing
 * ResilientError with a retryable type (network, rate limit). Any other
 * exception propagates on the first attempt.
 */
class RetryPolicy {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy(int max_retries = 3,
                std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100),
                double backoff_multiplier = 2.0,
                std::chrono::milliseconds max_delay = std::chrono::seconds(30))
        : max_retries_(max_retries)
        , initial_delay_(initial_delay)
        , backoff_multiplier_(backoff_multiplier)
        , max_delay_(max_delay)
        , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

    // Replaces the blocking sleep, e.g. with an interruptible wait
    void set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

    template<typename Func>
    auto execute(Func func) -> decltype(func()) {
        int retry_count = 0;
        std::chrono::milliseconds delay = initial_delay_;

        while (true) {
            try {
                return func();
            } catch (const ResilientError& e) {
                if (!should_retry(e.get_type()) || retry_count >= max_retries_) {
                    throw;
                }

                retry_count++;
                sleep_(delay);
                auto next = std::chrono::duration_cast<std::chrono::milliseconds>(delay * backoff_multiplier_);
                delay = std::min(next, max_delay_);
            }
        }
    }

    int get_max_retries() const { return max_retries_; }

private:
    static bool should_retry(ErrorType type) {
        switch (type) {
            case ErrorType::NETWORK_ERROR:
            case ErrorType::RATE_LIMIT_ERROR:
                return true;
            default:
                return false;
        }
    }

    int max_retries_;
    std::chrono::milliseconds initial_delay_;
    double backoff_multiplier_;
    std::chrono::milliseconds max_delay_;
    SleepFunction sleep_;
};

} // namespace resilience
