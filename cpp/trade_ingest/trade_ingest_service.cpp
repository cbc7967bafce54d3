#include "trade_ingest_service.hpp"
#include "../exchanges/binance/http/binance_data_fetcher.hpp"
#include "../exchanges/websocket/websocket_transport.hpp"
#include "../ranking/coingecko_ranking_source.hpp"
#include "../utils/constants.hpp"
#include "../utils/http/curl_http_handler.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/redis/redis_stream_client.hpp"
#include <map>
#include <stdexcept>

namespace trade_ingest {

namespace {
const char* kComponent = "TRADE_INGEST";
}

TradeIngestService::TradeIngestService()
    : app_service::AppService("TradeIngest", "trade_ingest") {
}

TradeIngestService::~TradeIngestService() {
    stop();
}

bool TradeIngestService::configure_service() {
    try {
        config_ = IngestConfig::load(*get_config_manager());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR_COMP("CONFIG", std::string("Invalid configuration: ") + e.what());
        return false;
    }

    logging::initialize_logging(config_.log_file, logging::parse_log_level(config_.log_level));
    LOG_INFO_COMP(kComponent, "Configuration: " + config_.describe());

    http_handler_ = std::make_shared<CurlHttpHandler>();
    if (!http_handler_->initialize()) {
        LOG_ERROR_COMP(kComponent, "Failed to initialize HTTP client");
        return false;
    }
    http_handler_->set_default_timeout(constants::timeout::DEFAULT_HTTP_MS);

    auto ranking = std::make_shared<coingecko::CoinGeckoRankingSource>(
        http_handler_, config_.coingecko_base_url, config_.coingecko_api_key);
    auto exchange = std::make_shared<binance::BinanceDataFetcher>(http_handler_, config_.rest_base_url);

    auto redis_client = std::make_shared<redis::RedisStreamClient>(config_.redis_url, config_.redis_timeout_ms);
    publisher_ = std::make_shared<StreamPublisher>(redis_client, config_.max_stream_length, config_.exact_trim);

    stats_ = std::make_shared<IngestStats>();
    discovery_ = std::make_shared<PairDiscovery>(config_, ranking, exchange);
    ingest_client_ = std::make_shared<IngestClient>(
        config_, publisher_, stats_,
        websocket_transport::WebSocketTransportFactory::make_factory(config_.verify_tls));

    if (config_.zmq_enabled) {
        zmq_tap_ = std::make_shared<ZmqPublisher>(config_.zmq_endpoint, config_.zmq_hwm);
        if (!zmq_tap_->is_bound()) {
            LOG_ERROR_COMP(kComponent, "Failed to bind ZMQ trade tap on " + config_.zmq_endpoint);
            return false;
        }
        ingest_client_->set_trade_callback([this](const ingest::proto::NormalizedTrade& trade) {
            publish_to_tap(trade);
        });
        LOG_INFO_COMP(kComponent, "ZMQ trade tap on " + config_.zmq_endpoint);
    }

    health_service_ = std::make_unique<HealthService>(config_, publisher_, stats_, discovery_, ingest_client_);
    return true;
}

bool TradeIngestService::start_service() {
    // A broker outage at startup is not fatal: health reports it and
    // each publish retries the connection
    if (!publisher_->connect()) {
        LOG_WARN_COMP(kComponent, "Stream broker unreachable at startup, continuing");
    }

    discovery_->start();
    if (!discovery_->wait_for_first_refresh(std::chrono::seconds(config_.startup_wait_seconds))) {
        LOG_WARN_COMP(kComponent, "First pair refresh still pending, starting with fallback pairs");
    }

    auto pairs = discovery_->get_pairs();
    if (!ingest_client_->start(pairs)) {
        LOG_ERROR_COMP(kComponent, "Failed to start ingestion");
        return false;
    }
    LOG_INFO_COMP(kComponent, "Ingesting " + std::to_string(pairs.size()) + " pairs over " +
                  std::to_string(ingest_client_->get_connection_count()) + " connections");

    if (!health_service_->start()) {
        LOG_ERROR_COMP(kComponent, "Failed to start health endpoints on port " + std::to_string(config_.health_port));
        return false;
    }
    return true;
}

void TradeIngestService::stop_service() {
    if (health_service_) {
        health_service_->stop();
    }
    if (ingest_client_) {
        ingest_client_->stop();
    }
    if (discovery_) {
        discovery_->stop();
    }
    if (publisher_) {
        publisher_->disconnect();
    }
}

void TradeIngestService::print_service_stats() {
    if (!ingest_client_) {
        return;
    }

    auto ingest = ingest_client_->get_stats();
    auto publish = publisher_->get_stats();
    auto discovery = discovery_->get_status();

    std::map<std::string, std::string> fields = {
        {"trades", std::to_string(ingest.total_messages)},
        {"malformed", std::to_string(ingest.error_messages)},
        {"ignored", std::to_string(ingest.ignored_messages)},
        {"active_connections", std::to_string(ingest.active_connections)},
        {"connection_errors", std::to_string(ingest.connection_errors)},
        {"published", std::to_string(publish.publish_count)},
        {"publish_errors", std::to_string(publish.error_count)},
        {"pairs", std::to_string(discovery.pair_count)},
        {"refreshes", std::to_string(discovery.refresh_count)},
        {"refresh_failures", std::to_string(discovery.refresh_failures)},
        {"uptime_s", std::to_string(uptime_seconds())},
    };
    if (zmq_tap_) {
        fields["zmq_sent"] = std::to_string(zmq_tap_->get_messages_sent());
        fields["zmq_dropped"] = std::to_string(zmq_tap_->get_messages_dropped());
    }
    logging::Logger("STATS").info(get_service_name(), fields);
}

void TradeIngestService::publish_to_tap(const ingest::proto::NormalizedTrade& trade) {
    std::string payload;
    if (!trade.SerializeToString(&payload)) {
        LOG_WARN_COMP(kComponent, "Failed to serialize trade for ZMQ tap");
        return;
    }
    zmq_tap_->publish(constants::zmq::TOPIC_PREFIX + trade.pair(), payload);
}

} // namespace trade_ingest
