#pragma once
#include <memory>
#include "../utils/app_service/app_service.hpp"
#include "../utils/http/i_http_handler.hpp"
#include "../utils/zmq/zmq_publisher.hpp"
#include "health_service.hpp"
#include "ingest_client.hpp"
#include "ingest_config.hpp"
#include "ingest_stats.hpp"
#include "pair_discovery.hpp"
#include "stream_publisher.hpp"

namespace trade_ingest {

/**
 * Trade Ingest Service
 *
 * Wires discovery, ingestion, the stream publisher and the health surface
 * into the AppService lifecycle. Start order is publisher, discovery,
 * ingestion, health; stop runs in reverse.
 */
class TradeIngestService : public app_service::AppService {
public:
    TradeIngestService();
    ~TradeIngestService() override;

    const IngestConfig& get_ingest_config() const { return config_; }

protected:
    // AppService interface implementation
    bool configure_service() override;
    bool start_service() override;
    void stop_service() override;
    void print_service_stats() override;

private:
    void publish_to_tap(const ingest::proto::NormalizedTrade& trade);

    IngestConfig config_;

    std::shared_ptr<IHttpHandler> http_handler_;
    std::shared_ptr<StreamPublisher> publisher_;
    std::shared_ptr<IngestStats> stats_;
    std::shared_ptr<PairDiscovery> discovery_;
    std::shared_ptr<IngestClient> ingest_client_;
    std::unique_ptr<HealthService> health_service_;
    std::shared_ptr<ZmqPublisher> zmq_tap_;
};

} // namespace trade_ingest
