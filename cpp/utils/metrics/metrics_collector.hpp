#pragma once

/**
 * Lock-free counters and gauges
 *
 * Components own their metric objects and expose them through an injected
 * stats struct; every update is a single atomic operation so connection
 * threads can share them without a lock.
 */

#include <string>
#include <atomic>
#include <cstdint>

namespace metrics {

/**
 * Metric types
 */
enum class MetricType {
    COUNTER,    // Incrementing counter
    GAUGE       // Current value (can go up or down)
};

/**
 * Base metric interface
 */
class IMetric {
public:
    virtual ~IMetric() = default;
    virtual MetricType get_type() const = 0;
    virtual std::string get_name() const = 0;
    virtual std::string to_string() const = 0;
};

/**
 * Counter metric - increments only
 */
class Counter : public IMetric {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void reset() {
        value_.store(0);
    }

    int64_t get() const {
        return value_.load(std::memory_order_relaxed);
    }

    MetricType get_type() const override { return MetricType::COUNTER; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        return name_ + ": " + std::to_string(get());
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

/**
 * Gauge metric - can increase or decrease
 */
class Gauge : public IMetric {
public:
    explicit Gauge(const std::string& name) : name_(name), value_(0) {}

    void set(int64_t value) {
        value_.store(value);
    }

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta);
    }

    void decrement(int64_t delta = 1) {
        value_.fetch_sub(delta);
    }

    int64_t get() const {
        return value_.load();
    }

    MetricType get_type() const override { return MetricType::GAUGE; }
    std::string get_name() const override { return name_; }

    std::string to_string() const override {
        return name_ + ": " + std::to_string(get());
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

} // namespace metrics
