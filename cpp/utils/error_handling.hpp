#pragma once

/**
 * Error reporting for the ingest pipeline
 *
 * Fallible I/O (discovery sources, stream appends) returns Result<T> and
 * never throws. Connection threads and user callbacks run under
 * safe_execute_void / safe_callback so a std::exception is logged at the
 * component instead of unwinding a worker thread.
 */

#include <string>
#include <exception>
#include <stdexcept>
#include <optional>
#include <utility>
#include "logging/log_helper.hpp"

namespace error_handling {

// Value or error message
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    static Result error(std::string error_message) {
        Result result;
        result.error_message_ = std::move(error_message);
        return result;
    }

    bool is_success() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }
    explicit operator bool() const { return is_success(); }

    // Throws std::logic_error on an error result
    const T& value() const {
        if (!value_) {
            throw std::logic_error("value() on failed result: " + error_message_);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("value() on failed result: " + error_message_);
        }
        return *value_;
    }

    // Empty on success
    const std::string& error() const { return error_message_; }

    // Error result with "context: " prepended to the message
    Result with_context(const std::string& context) const {
        if (is_success()) {
            return *this;
        }
        return error(context + ": " + error_message_);
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::string error_message_;
};

/**
 * Runs func, logging a thrown std::exception under component_name
 *
 * @return false if func threw
 */
template<typename Func>
bool safe_execute_void(Func&& func, const std::string& component_name, const std::string& operation_name) {
    try {
        func();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, operation_name + " failed: " + std::string(e.what()));
        return false;
    }
}

// Invokes an optional callback; a throwing callback is logged and does not affect the caller
template<typename Callback, typename... Args>
void safe_callback(Callback&& callback, const std::string& component_name,
                   const std::string& operation_name, Args&&... args) {
    if (!callback) {
        return;
    }

    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, "Exception in " + operation_name + " callback: " + std::string(e.what()));
    }
}

} // namespace error_handling
