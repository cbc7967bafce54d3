#pragma once
#include <memory>
#include <string>
#include <json/json.h>
#include "ingest_config.hpp"
#include "ingest_stats.hpp"
#include "ingest_client.hpp"
#include "pair_discovery.hpp"
#include "stream_publisher.hpp"
#include "../utils/health/health_checker.hpp"
#include "../utils/http/http_server.hpp"

namespace trade_ingest {

/**
 * Liveness and introspection for the ingest pipeline
 *
 * Healthy requires, in this order: an initialized publisher, a reachable
 * broker and at least one streaming connection. The first failing check
 * supplies the 503 reason.
 *
 * Routes: GET /health, GET /stats, GET /pairs.
 */
class HealthService {
public:
    HealthService(const IngestConfig& config,
                  std::shared_ptr<StreamPublisher> publisher,
                  std::shared_ptr<IngestStats> stats,
                  std::shared_ptr<PairDiscovery> discovery,
                  std::shared_ptr<IngestClient> ingest_client = nullptr);
    ~HealthService();

    HealthService(const HealthService&) = delete;
    HealthService& operator=(const HealthService&) = delete;

    health::HealthCheckResult check_health();

    // Bodies of the three routes; health_json sets status_code to 200 or 503
    Json::Value health_json(int& status_code);
    Json::Value stats_json() const;
    Json::Value pairs_json() const;

    // Routes one request; usable without a listening server
    void handle_request(const HttpServer::Request& request, HttpServer::Response& response);

    bool start();
    void stop();
    unsigned short get_port() const;

private:
    std::string bind_address_;
    int port_;
    std::shared_ptr<StreamPublisher> publisher_;
    std::shared_ptr<IngestStats> stats_;
    std::shared_ptr<PairDiscovery> discovery_;
    std::shared_ptr<IngestClient> ingest_client_;

    health::HealthChecker checker_;
    std::unique_ptr<HttpServer> server_;
};

} // namespace trade_ingest
