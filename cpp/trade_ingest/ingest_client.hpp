#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "proto/trade.pb.h"
#include "ingest_config.hpp"
#include "ingest_stats.hpp"
#include "stream_publisher.hpp"
#include "../exchanges/binance/public_websocket/binance_trade_normalizer.hpp"
#include "../exchanges/websocket/i_websocket_transport.hpp"
#include "../utils/metrics/metrics_collector.hpp"
#include "../utils/resilience/resilience.hpp"

namespace trade_ingest {

// Connecting -> Streaming -> Backoff -> Connecting ... -> Failed (terminal)
enum class ConnectionPhase {
    CONNECTING,
    STREAMING,
    BACKOFF,
    FAILED,
    STOPPED
};

const char* phase_name(ConnectionPhase phase);

struct ConnectionSnapshot {
    int id{0};
    std::vector<std::string> pairs;
    ConnectionPhase phase{ConnectionPhase::CONNECTING};
    int retry_count{0};
    bool active{false};
    int64_t messages{0};
    int64_t errors{0};
    std::string last_error;
};

/**
 * Supervises one WebSocket connection per chunk of pairs
 *
 * Each chunk runs on its own thread with its own transport. Frames are
 * normalized and published on that thread, so append order per pair equals
 * receive order. A connection that keeps failing backs off exponentially
 * and is abandoned after max_retries consecutive failures without
 * affecting the others.
 */
class IngestClient {
public:
    using TradeCallback = std::function<void(const ingest::proto::NormalizedTrade&)>;
    using Clock = std::function<int64_t()>;   // epoch ms

    IngestClient(const IngestConfig& config,
                 std::shared_ptr<StreamPublisher> publisher,
                 std::shared_ptr<IngestStats> stats,
                 websocket_transport::WebSocketTransportFactoryFn transport_factory);
    ~IngestClient();

    IngestClient(const IngestClient&) = delete;
    IngestClient& operator=(const IngestClient&) = delete;

    // One connection thread per chunk; false if already running or no pairs
    bool start(const std::vector<std::string>& pairs);

    // Cancels connects, reads and backoff waits on every connection and joins
    void stop();
    bool is_running() const { return running_.load(); }

    IngestStats::Snapshot get_stats() const { return stats_->snapshot(); }
    std::vector<ConnectionSnapshot> get_connections() const;
    size_t get_connection_count() const;

    // Called on the connection thread after each trade is published
    void set_trade_callback(TradeCallback callback) { trade_callback_ = std::move(callback); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    // Splits pairs into consecutive chunks of at most chunk_size; throws on chunk_size <= 0
    static std::vector<std::vector<std::string>> chunk_pairs(const std::vector<std::string>& pairs, int chunk_size);

    // {base}/stream?streams=btcusdt@trade/ethusdt@trade
    static std::string build_stream_url(const std::string& ws_base_url, const std::vector<std::string>& pairs);

private:
    struct Connection {
        Connection(int connection_id, std::vector<std::string> chunk, std::string stream_url,
                   const resilience::ExponentialBackoff& backoff_policy)
            : id(connection_id), pairs(std::move(chunk)), url(std::move(stream_url)), backoff(backoff_policy) {}

        int id;
        std::vector<std::string> pairs;
        std::string url;
        resilience::ExponentialBackoff backoff;
        std::thread thread;

        std::atomic<ConnectionPhase> phase{ConnectionPhase::CONNECTING};
        std::atomic<int> retry_count{0};
        std::atomic<bool> active{false};
        metrics::Counter messages{"messages"};
        metrics::Counter errors{"errors"};

        mutable std::mutex mutex;
        std::string last_error;
        websocket_transport::IWebSocketTransport* transport{nullptr};   // live while connecting/streaming
    };

    void run_connection(Connection& connection);
    void supervise(Connection& connection);
    void handle_message(Connection& connection, const websocket_transport::WebSocketMessage& message);
    bool wait_backoff(std::chrono::milliseconds delay);

    IngestConfig config_;
    std::shared_ptr<StreamPublisher> publisher_;
    std::shared_ptr<IngestStats> stats_;
    websocket_transport::WebSocketTransportFactoryFn transport_factory_;
    binance::BinanceTradeNormalizer normalizer_;
    TradeCallback trade_callback_;
    Clock clock_;

    std::vector<std::unique_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;

    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

} // namespace trade_ingest
