#include "health_service.hpp"
#include <algorithm>
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"

namespace trade_ingest {

namespace {
const char* kComponent = "HEALTH";

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

void write_json(HttpServer::Response& response, http::status status, const Json::Value& body) {
    response.result(status);
    response.set(http::field::content_type, "application/json");
    response.set(http::field::cache_control, "no-store");
    response.body() = to_json_string(body);
}
}

HealthService::HealthService(const IngestConfig& config,
                             std::shared_ptr<StreamPublisher> publisher,
                             std::shared_ptr<IngestStats> stats,
                             std::shared_ptr<PairDiscovery> discovery,
                             std::shared_ptr<IngestClient> ingest_client)
    : bind_address_(config.health_bind_address)
    , port_(config.health_port)
    , publisher_(std::move(publisher))
    , stats_(std::move(stats))
    , discovery_(std::move(discovery))
    , ingest_client_(std::move(ingest_client))
    , checker_("trade_ingest") {

    checker_.register_check("publisher", [this]() {
        bool ok = publisher_ && publisher_->is_initialized();
        return health::HealthCheckResult(ok ? health::HealthStatus::HEALTHY : health::HealthStatus::UNHEALTHY,
                                         ok ? "initialized" : "publisher not initialized");
    });

    checker_.register_check("broker", [this]() {
        bool ok = publisher_ && publisher_->is_initialized() && publisher_->is_healthy();
        return health::HealthCheckResult(ok ? health::HealthStatus::HEALTHY : health::HealthStatus::UNHEALTHY,
                                         ok ? "connected" : "broker not connected");
    });

    checker_.register_check("websocket", health::make_simple_check(
        [this]() { return stats_ && stats_->active_connections.get() > 0; },
        "streaming",
        "no active websocket connections"));
}

HealthService::~HealthService() {
    stop();
}

health::HealthCheckResult HealthService::check_health() {
    return checker_.check();
}

Json::Value HealthService::health_json(int& status_code) {
    auto result = check_health();

    Json::Value body(Json::objectValue);
    if (result.is_healthy()) {
        status_code = 200;
        body["status"] = "healthy";
        body["broker"] = "connected";
        body["websocket_connections"] = static_cast<Json::Int64>(stats_->active_connections.get());
    } else {
        status_code = 503;
        body["status"] = "unhealthy";
        body["reason"] = result.message;
    }
    return body;
}

Json::Value HealthService::stats_json() const {
    Json::Value body(Json::objectValue);

    Json::Value publisher(Json::objectValue);
    if (publisher_) {
        auto stats = publisher_->get_stats();
        publisher["publish_count"] = static_cast<Json::Int64>(stats.publish_count);
        publisher["error_count"] = static_cast<Json::Int64>(stats.error_count);
        publisher["error_rate"] = stats.error_rate;
        publisher["max_length"] = static_cast<Json::Int64>(publisher_->get_max_length());
    }
    body["publisher"] = publisher;

    Json::Value ingest(Json::objectValue);
    if (stats_) {
        auto snapshot = stats_->snapshot();
        ingest["active_connections"] = static_cast<Json::Int64>(snapshot.active_connections);
        ingest["total_messages"] = static_cast<Json::Int64>(snapshot.total_messages);
        ingest["error_messages"] = static_cast<Json::Int64>(snapshot.error_messages);
        ingest["ignored_messages"] = static_cast<Json::Int64>(snapshot.ignored_messages);
        ingest["connection_errors"] = static_cast<Json::Int64>(snapshot.connection_errors);
    }
    body["ingest"] = ingest;

    Json::Value sample(Json::arrayValue);
    Json::Value discovery(Json::objectValue);
    if (discovery_) {
        auto pairs = discovery_->get_snapshot();
        body["pairs_count"] = static_cast<Json::UInt64>(pairs->size());
        size_t sample_size = std::min(pairs->size(), static_cast<size_t>(constants::health::PAIRS_SAMPLE_SIZE));
        for (size_t i = 0; i < sample_size; ++i) {
            sample.append((*pairs)[i]);
        }

        auto status = discovery_->get_status();
        discovery["last_refresh_ok"] = status.last_refresh_ok;
        discovery["refresh_count"] = static_cast<Json::UInt64>(status.refresh_count);
        discovery["refresh_failures"] = static_cast<Json::UInt64>(status.refresh_failures);
        if (status.last_refresh_time_ms > 0) {
            discovery["last_refresh_time"] = StreamPublisher::format_iso8601(status.last_refresh_time_ms);
        } else {
            discovery["last_refresh_time"] = Json::Value(Json::nullValue);
        }
        if (!status.last_error.empty()) {
            discovery["last_error"] = status.last_error;
        }
    } else {
        body["pairs_count"] = 0;
    }
    body["pairs_sample"] = sample;
    body["discovery"] = discovery;

    Json::Value connections(Json::arrayValue);
    if (ingest_client_) {
        for (const auto& connection : ingest_client_->get_connections()) {
            Json::Value entry(Json::objectValue);
            entry["id"] = connection.id;
            entry["pairs"] = static_cast<Json::UInt64>(connection.pairs.size());
            entry["phase"] = phase_name(connection.phase);
            entry["active"] = connection.active;
            entry["retry_count"] = connection.retry_count;
            entry["messages"] = static_cast<Json::Int64>(connection.messages);
            entry["errors"] = static_cast<Json::Int64>(connection.errors);
            if (!connection.last_error.empty()) {
                entry["last_error"] = connection.last_error;
            }
            connections.append(entry);
        }
    }
    body["connections"] = connections;

    return body;
}

Json::Value HealthService::pairs_json() const {
    Json::Value body(Json::objectValue);
    Json::Value pairs(Json::arrayValue);
    if (discovery_) {
        auto snapshot = discovery_->get_snapshot();
        for (const auto& pair : *snapshot) {
            pairs.append(pair);
        }
    }
    body["count"] = pairs.size();
    body["pairs"] = pairs;
    return body;
}

void HealthService::handle_request(const HttpServer::Request& request, HttpServer::Response& response) {
    std::string target(request.target());
    size_t query = target.find('?');
    if (query != std::string::npos) {
        target.resize(query);
    }

    if (target != "/health" && target != "/stats" && target != "/pairs") {
        Json::Value body(Json::objectValue);
        body["error"] = "not found";
        write_json(response, http::status::not_found, body);
        return;
    }

    if (request.method() != http::verb::get) {
        Json::Value body(Json::objectValue);
        body["error"] = "method not allowed";
        response.set(http::field::allow, "GET");
        write_json(response, http::status::method_not_allowed, body);
        return;
    }

    if (target == "/health") {
        int status_code = 200;
        Json::Value body = health_json(status_code);
        write_json(response, static_cast<http::status>(status_code), body);
    } else if (target == "/stats") {
        write_json(response, http::status::ok, stats_json());
    } else {
        write_json(response, http::status::ok, pairs_json());
    }
}

bool HealthService::start() {
    if (server_ && server_->is_running()) {
        return true;
    }
    server_ = std::make_unique<HttpServer>(bind_address_, static_cast<unsigned short>(port_),
        [this](const HttpServer::Request& request, HttpServer::Response& response) {
            handle_request(request, response);
        });
    if (!server_->start()) {
        server_.reset();
        return false;
    }
    LOG_INFO_COMP(kComponent, "Health endpoints on port " + std::to_string(server_->get_port()));
    return true;
}

void HealthService::stop() {
    if (server_) {
        server_->stop();
        server_.reset();
    }
}

unsigned short HealthService::get_port() const {
    return server_ ? server_->get_port() : 0;
}

} // namespace trade_ingest
