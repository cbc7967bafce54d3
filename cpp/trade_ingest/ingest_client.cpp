#include "ingest_client.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace trade_ingest {

namespace {
const char* kComponent = "INGEST_CLIENT";

int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Publishes a transport to stop() and withdraws it before the transport is destroyed,
// including when the connection unwinds on an exception
class TransportSlot {
public:
    TransportSlot(std::mutex& mutex, websocket_transport::IWebSocketTransport*& slot,
                  websocket_transport::IWebSocketTransport* transport)
        : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = transport;
    }
    ~TransportSlot() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = nullptr;
    }

    TransportSlot(const TransportSlot&) = delete;
    TransportSlot& operator=(const TransportSlot&) = delete;

private:
    std::mutex& mutex_;
    websocket_transport::IWebSocketTransport*& slot_;
};
}

const char* phase_name(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::CONNECTING: return "connecting";
        case ConnectionPhase::STREAMING: return "streaming";
        case ConnectionPhase::BACKOFF: return "backoff";
        case ConnectionPhase::FAILED: return "failed";
        case ConnectionPhase::STOPPED: return "stopped";
        default: return "unknown";
    }
}

IngestClient::IngestClient(const IngestConfig& config,
                           std::shared_ptr<StreamPublisher> publisher,
                           std::shared_ptr<IngestStats> stats,
                           websocket_transport::WebSocketTransportFactoryFn transport_factory)
    : config_(config)
    , publisher_(std::move(publisher))
    , stats_(stats ? std::move(stats) : std::make_shared<IngestStats>())
    , transport_factory_(std::move(transport_factory))
    , normalizer_(config.raw_payload_max)
    , clock_(system_now_ms) {
}

IngestClient::~IngestClient() {
    stop();
}

std::vector<std::vector<std::string>> IngestClient::chunk_pairs(const std::vector<std::string>& pairs, int chunk_size) {
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    std::vector<std::vector<std::string>> chunks;
    const size_t size = static_cast<size_t>(chunk_size);
    for (size_t i = 0; i < pairs.size(); i += size) {
        size_t end = std::min(i + size, pairs.size());
        chunks.emplace_back(pairs.begin() + static_cast<std::ptrdiff_t>(i),
                            pairs.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

std::string IngestClient::build_stream_url(const std::string& ws_base_url, const std::vector<std::string>& pairs) {
    std::string url = ws_base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/stream?streams=";
    for (size_t i = 0; i < pairs.size(); ++i) {
        std::string stream = pairs[i];
        std::transform(stream.begin(), stream.end(), stream.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (i > 0) {
            url += "/";
        }
        url += stream + "@trade";
    }
    return url;
}

bool IngestClient::start(const std::vector<std::string>& pairs) {
    if (pairs.empty()) {
        LOG_ERROR_COMP(kComponent, "No pairs to ingest");
        return false;
    }
    if (!transport_factory_) {
        LOG_ERROR_COMP(kComponent, "No transport factory configured");
        return false;
    }
    if (running_.exchange(true)) {
        LOG_WARN_COMP(kComponent, "Already running");
        return false;
    }

    auto chunks = chunk_pairs(pairs, config_.pairs_per_connection);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
    for (size_t i = 0; i < chunks.size(); ++i) {
        // Separate instance per connection so jitter is not shared
        resilience::ExponentialBackoff backoff(std::chrono::milliseconds(config_.backoff_base_ms),
                                               std::chrono::milliseconds(config_.backoff_max_ms),
                                               config_.backoff_jitter);
        std::string url = build_stream_url(config_.ws_base_url, chunks[i]);
        connections_.push_back(std::make_unique<Connection>(static_cast<int>(i), std::move(chunks[i]),
                                                            std::move(url), backoff));
    }

    LOG_INFO_COMP(kComponent, "Starting " + std::to_string(connections_.size()) + " connections for " +
                  std::to_string(pairs.size()) + " pairs (" +
                  std::to_string(config_.pairs_per_connection) + " per connection)");

    for (auto& connection : connections_) {
        Connection* conn = connection.get();
        conn->thread = std::thread([this, conn]() { run_connection(*conn); });
    }
    return true;
}

void IngestClient::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stop_cv_.notify_all();

    LOG_INFO_COMP(kComponent, "Stopping connections...");

    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& connection : connections_) {
        std::lock_guard<std::mutex> conn_lock(connection->mutex);
        if (connection->transport) {
            connection->transport->stop_event_loop();
        }
    }
    for (auto& connection : connections_) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }

    LOG_INFO_COMP(kComponent, "All connections stopped");
}

std::vector<ConnectionSnapshot> IngestClient::get_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::vector<ConnectionSnapshot> snapshots;
    snapshots.reserve(connections_.size());
    for (const auto& connection : connections_) {
        ConnectionSnapshot snapshot;
        snapshot.id = connection->id;
        snapshot.pairs = connection->pairs;
        snapshot.phase = connection->phase.load();
        snapshot.retry_count = connection->retry_count.load();
        snapshot.active = connection->active.load();
        snapshot.messages = connection->messages.get();
        snapshot.errors = connection->errors.get();
        {
            std::lock_guard<std::mutex> conn_lock(connection->mutex);
            snapshot.last_error = connection->last_error;
        }
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}

size_t IngestClient::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void IngestClient::run_connection(Connection& connection) {
    const std::string tag = "connection " + std::to_string(connection.id);
    std::string failure;
    try {
        supervise(connection);
        return;
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        // A connection thread must not take the process down with it
        failure = "unknown exception";
    }

    LOG_ERROR_COMP(kComponent, tag + " failed: " + failure);
    {
        std::lock_guard<std::mutex> lock(connection.mutex);
        connection.last_error = failure;
    }
    if (connection.active.exchange(false)) {
        stats_->active_connections.decrement();
    }
    connection.phase.store(ConnectionPhase::FAILED);
}

void IngestClient::supervise(Connection& connection) {
    const std::string tag = "connection " + std::to_string(connection.id);

    while (running_.load()) {
        connection.phase.store(ConnectionPhase::CONNECTING);

        std::unique_ptr<websocket_transport::IWebSocketTransport> transport = transport_factory_();
        if (!transport) {
            throw std::runtime_error("transport factory returned null");
        }
        transport->set_ping_interval(config_.ping_interval_seconds);
        transport->set_timeout(config_.connect_timeout_seconds);
        transport->set_read_timeout(config_.read_timeout_seconds);
        transport->set_message_callback([this, &connection](const websocket_transport::WebSocketMessage& message) {
            handle_message(connection, message);
        });
        transport->set_error_callback([tag](int error_code, const std::string& error_message) {
            LOG_DEBUG_COMP(kComponent, tag + " transport error " + std::to_string(error_code) + ": " + error_message);
        });

        TransportSlot slot(connection.mutex, connection.transport, transport.get());
        // stop() may have run before the transport was visible to it
        if (!running_.load()) {
            transport->stop_event_loop();
        }

        LOG_DEBUG_COMP(kComponent, tag + " connecting to " + connection.url);
        bool connected = transport->connect(connection.url);

        if (connected && running_.load()) {
            connection.retry_count.store(0);
            connection.active.store(true);
            stats_->active_connections.increment();
            connection.phase.store(ConnectionPhase::STREAMING);
            LOG_INFO_COMP(kComponent, tag + " streaming " + std::to_string(connection.pairs.size()) + " pairs");

            transport->run_event_loop();

            connection.active.store(false);
            stats_->active_connections.decrement();
        }

        std::string error = transport->get_last_error();
        {
            std::lock_guard<std::mutex> lock(connection.mutex);
            connection.transport = nullptr;
            if (!error.empty()) {
                connection.last_error = error;
            }
        }
        transport.reset();

        if (!running_.load()) {
            break;
        }

        stats_->connection_errors.increment();

        int retries = connection.retry_count.load();
        if (retries >= config_.max_retries) {
            connection.phase.store(ConnectionPhase::FAILED);
            LOG_ERROR_COMP(kComponent, tag + " abandoned after " + std::to_string(retries) +
                           " consecutive failures: " + (error.empty() ? "unknown error" : error));
            return;
        }

        auto delay = connection.backoff.next_delay(retries);
        connection.retry_count.store(retries + 1);
        connection.phase.store(ConnectionPhase::BACKOFF);
        LOG_WARN_COMP(kComponent, tag + " " + (connected ? "disconnected" : "connect failed") +
                      (error.empty() ? "" : ": " + error) + "; retry " + std::to_string(retries + 1) + "/" +
                      std::to_string(config_.max_retries) + " in " + std::to_string(delay.count()) + "ms");

        if (!wait_backoff(delay)) {
            break;
        }
    }

    connection.phase.store(ConnectionPhase::STOPPED);
}

void IngestClient::handle_message(Connection& connection, const websocket_transport::WebSocketMessage& message) {
    binance::TradeConversion conversion = normalizer_.convert(message.data, clock_());

    switch (conversion.status) {
        case binance::TradeConversion::Status::TRADE:
            stats_->total_messages.increment();
            connection.messages.increment();
            if (publisher_) {
                publisher_->publish_trade(conversion.trade);
            }
            error_handling::safe_callback(trade_callback_, kComponent, "trade", conversion.trade);
            break;

        case binance::TradeConversion::Status::IGNORED:
            stats_->ignored_messages.increment();
            break;

        case binance::TradeConversion::Status::MALFORMED:
            stats_->error_messages.increment();
            connection.errors.increment();
            LOG_DEBUG_COMP(kComponent, "connection " + std::to_string(connection.id) +
                           " dropped malformed frame: " + conversion.error);
            break;
    }
}

bool IngestClient::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
    return running_.load();
}

} // namespace trade_ingest
