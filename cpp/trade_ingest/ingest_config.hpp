#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "../utils/config/process_config_manager.hpp"

namespace trade_ingest {

/**
 * Service configuration, built once at startup and never modified
 *
 * Precedence: environment override > INI value > compiled default.
 * Components receive it by const reference.
 */
struct IngestConfig {
    // [binance]
    std::string ws_base_url;
    std::string rest_base_url;
    bool verify_tls{true};

    // [ingest]
    int pairs_per_connection{0};
    int max_retries{0};
    int backoff_base_ms{0};
    int backoff_max_ms{0};
    double backoff_jitter{0.0};
    size_t raw_payload_max{0};
    int connect_timeout_seconds{0};
    int read_timeout_seconds{0};
    int ping_interval_seconds{0};

    // [discovery]
    int refresh_interval_seconds{0};
    int ranking_top_n{0};
    int pair_limit{0};
    int startup_wait_seconds{0};
    std::vector<std::string> quote_assets;
    std::vector<std::string> fallback_pairs;
    std::string coingecko_base_url;
    std::string coingecko_api_key;

    // [stream]
    std::string redis_url;
    long long max_stream_length{0};
    bool exact_trim{false};
    int redis_timeout_ms{0};

    // [zmq]
    bool zmq_enabled{false};
    std::string zmq_endpoint;
    int zmq_hwm{0};

    // [health]
    std::string health_bind_address;
    int health_port{0};

    // [logging]
    std::string log_level;
    std::string log_file;

    // Compiled defaults only
    static IngestConfig defaults();

    // INI values overridden by the process environment
    static IngestConfig load(const config::ProcessConfigManager& ini);

    // INI values overridden by the given environment map (REDIS_URL, PAIR_LIMIT, ...)
    // Throws std::invalid_argument on any invalid value.
    static IngestConfig load(const config::ProcessConfigManager& ini,
                             const std::map<std::string, std::string>& env);

    // Comma-separated pair list, trimmed, uppercased, duplicates removed
    static std::vector<std::string> parse_pair_list(const std::string& value);

    std::string describe() const;
};

} // namespace trade_ingest
