#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "proto/trade.pb.h"
#include "../utils/metrics/metrics_collector.hpp"
#include "../utils/redis/i_stream_client.hpp"

namespace trade_ingest {

// Flattened field -> value entry appended to trades:<PAIR>
using StreamRecord = redis::StreamFields;

/**
 * Appends normalized trades to the per-pair capped stream
 *
 * Safe to share between connection threads; the broker client serializes
 * commands. publish() never throws: failures are logged, counted and
 * reported as false. There is no retry queue.
 */
class StreamPublisher {
public:
    struct Stats {
        int64_t publish_count{0};
        int64_t error_count{0};
        double error_rate{0.0};
    };

    StreamPublisher(std::shared_ptr<redis::IStreamClient> client, long long max_length, bool exact_trim = false);
    ~StreamPublisher();

    StreamPublisher(const StreamPublisher&) = delete;
    StreamPublisher& operator=(const StreamPublisher&) = delete;

    bool connect();
    void disconnect();
    bool is_initialized() const { return initialized_.load(); }

    // Broker PING
    bool is_healthy();

    bool publish(const std::string& pair, const StreamRecord& record);
    bool publish_trade(const ingest::proto::NormalizedTrade& trade);

    Stats get_stats() const;
    long long get_max_length() const { return max_length_; }
    bool is_exact_trim() const { return exact_trim_; }

    static std::string stream_key(const std::string& pair);
    static StreamRecord to_stream_record(const ingest::proto::NormalizedTrade& trade);

    // 2024-01-02T03:04:05.678Z
    static std::string format_iso8601(int64_t epoch_ms);
    static const char* side_name(ingest::proto::TradeSide side);

private:
    std::shared_ptr<redis::IStreamClient> client_;
    long long max_length_;
    bool exact_trim_;
    std::atomic<bool> initialized_{false};

    metrics::Counter publish_count_{"publish_count"};
    metrics::Counter error_count_{"error_count"};
};

} // namespace trade_ingest
