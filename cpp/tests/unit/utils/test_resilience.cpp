#include "doctest.h"
#include "../../../utils/resilience/resilience.hpp"
#include "../../../utils/health/health_checker.hpp"
#include "../../../utils/error_handling.hpp"
#include <functional>
#include <stdexcept>

TEST_CASE("ExponentialBackoff - Doubles Up To The Cap") {
    resilience::ExponentialBackoff backoff(std::chrono::milliseconds(1000), std::chrono::milliseconds(60000), 0.0);

    CHECK(backoff.base_delay(0).count() == 1000);
    CHECK(backoff.base_delay(1).count() == 2000);
    CHECK(backoff.base_delay(5).count() == 32000);
    CHECK(backoff.base_delay(6).count() == 60000);
    CHECK(backoff.base_delay(500).count() == 60000);
    CHECK(backoff.next_delay(3).count() == 8000);
}

TEST_CASE("ExponentialBackoff - Jitter Stays Within Bound") {
    resilience::ExponentialBackoff backoff(std::chrono::milliseconds(100), std::chrono::milliseconds(10000), 0.1);

    std::chrono::milliseconds previous_floor(0);
    for (int retry = 0; retry < 8; ++retry) {
        auto floor = backoff.base_delay(retry);
        CHECK(floor >= previous_floor);
        previous_floor = floor;
        for (int i = 0; i < 20; ++i) {
            auto delay = backoff.next_delay(retry);
            CHECK(delay >= floor);
            CHECK(delay.count() <= floor.count() + floor.count() / 10);
        }
    }
}

TEST_CASE("RetryPolicy - Retries Only Transient Errors") {
    resilience::RetryPolicy policy(3, std::chrono::milliseconds(10));
    std::vector<std::chrono::milliseconds> sleeps;
    policy.set_sleep_function([&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    int attempts = 0;
    int value = policy.execute([&attempts]() {
        if (++attempts < 3) {
            throw resilience::ResilientError(resilience::ErrorType::NETWORK_ERROR, "reset");
        }
        return 42;
    });
    CHECK(value == 42);
    CHECK(attempts == 3);
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0].count() == 10);
    CHECK(sleeps[1].count() == 20);

    attempts = 0;
    CHECK_THROWS_AS(policy.execute([&attempts]() -> int {
        ++attempts;
        throw resilience::ResilientError(resilience::ErrorType::AUTHENTICATION_ERROR, "denied");
    }), resilience::ResilientError);
    CHECK(attempts == 1);
}

TEST_CASE("HealthChecker - First Failing Check Supplies The Reason") {
    health::HealthChecker checker("test");
    bool a_ok = true;
    bool b_ok = true;
    checker.register_check("a", health::make_simple_check([&a_ok]() { return a_ok; }, "a ok", "a down"));
    checker.register_check("b", health::make_simple_check([&b_ok]() { return b_ok; }, "b ok", "b down"));

    CHECK(checker.check().is_healthy());

    b_ok = false;
    auto result = checker.check();
    CHECK(result.status == health::HealthStatus::UNHEALTHY);
    CHECK(result.message == "b down");

    a_ok = false;
    result = checker.check();
    CHECK(result.message == "a down");
    CHECK(result.details.at("b") == "b down");
}

TEST_CASE("HealthChecker - Throwing Check Is Unhealthy") {
    health::HealthChecker checker("test");
    checker.register_check("boom", []() -> health::HealthCheckResult { throw std::runtime_error("kaput"); });

    auto result = checker.check();
    CHECK(result.status == health::HealthStatus::UNHEALTHY);
    CHECK(result.message == "test check 'boom' threw: kaput");
}

TEST_CASE("Result - Error Carries Context And Guards Value") {
    auto ok = error_handling::Result<int>::success(7);
    CHECK(ok);
    CHECK(ok.value() == 7);
    CHECK(ok.error().empty());
    CHECK(ok.with_context("ranking").value() == 7);

    auto failed = error_handling::Result<int>::error("timeout");
    CHECK_FALSE(failed);
    CHECK(failed.is_error());
    CHECK(failed.with_context("ranking").error() == "ranking: timeout");
    CHECK_THROWS_AS(failed.value(), std::logic_error);
}

TEST_CASE("Result - Safe Helpers Contain Exceptions") {
    CHECK(error_handling::safe_execute_void([]() {}, "TEST", "noop"));
    CHECK_FALSE(error_handling::safe_execute_void([]() { throw std::runtime_error("boom"); }, "TEST", "throw"));

    int seen = 0;
    std::function<void(int)> callback = [&seen](int v) {
        seen = v;
        throw std::runtime_error("callback failed");
    };
    error_handling::safe_callback(callback, "TEST", "trade", 5);
    CHECK(seen == 5);

    std::function<void(int)> empty;
    error_handling::safe_callback(empty, "TEST", "trade", 6);
}
