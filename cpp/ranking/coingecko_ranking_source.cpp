#include "coingecko_ranking_source.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <json/json.h>

namespace coingecko {

namespace {
const char* kComponent = "COINGECKO";
}

CoinGeckoRankingSource::CoinGeckoRankingSource(std::shared_ptr<IHttpHandler> http_handler,
                                               const std::string& base_url,
                                               const std::string& api_key)
    : http_handler_(std::move(http_handler))
    , base_url_(base_url)
    , api_key_(api_key)
    , retry_policy_(constants::retry::RATE_LIMIT_RETRIES,
                    std::chrono::milliseconds(constants::retry::RATE_LIMIT_DELAY_MS)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string CoinGeckoRankingSource::build_url(int limit) const {
    return base_url_ + "/coins/markets?vs_currency=usd&order=market_cap_desc&per_page=" +
           std::to_string(limit) + "&page=1";
}

error_handling::Result<std::vector<std::string>> CoinGeckoRankingSource::get_top_assets(int limit) {
    using ResultType = error_handling::Result<std::vector<std::string>>;
    
    if (!http_handler_) {
        return ResultType::error("HTTP handler not set");
    }
    if (limit <= 0) {
        return ResultType::error("ranking limit must be positive");
    }
    
    std::string url = build_url(limit);
    std::string body;
    try {
        body = retry_policy_.execute([this, &url]() { return fetch(url); });
    } catch (const resilience::ResilientError& e) {
        LOG_WARN_COMP(kComponent, std::string("markets request failed (") +
                      resilience::error_type_name(e.get_type()) + "): " + e.what());
        return ResultType::error(e.what());
    }
    
    auto result = parse_markets(body);
    if (result.is_error()) {
        LOG_WARN_COMP(kComponent, "markets parse failed: " + result.error());
    }
    return result;
}

std::string CoinGeckoRankingSource::fetch(const std::string& url) {
    using resilience::ErrorType;
    using resilience::ResilientError;
    
    HttpRequest request;
    request.url = url;
    request.timeout_ms = constants::timeout::DEFAULT_HTTP_MS;
    request.headers["Accept"] = "application/json";
    if (!api_key_.empty()) {
        request.headers[constants::exchange::coingecko::API_KEY_HEADER] = api_key_;
    }
    
    HttpResponse response = http_handler_->make_request(request);
    if (response.status_code == 0) {
        throw ResilientError(ErrorType::NETWORK_ERROR, response.error_message, url);
    }
    if (response.status_code == 429) {
        LOG_WARN_COMP(kComponent, "Rate limited by CoinGecko");
        throw ResilientError(ErrorType::RATE_LIMIT_ERROR, "HTTP 429", url);
    }
    if (response.status_code == 401 || response.status_code == 403) {
        throw ResilientError(ErrorType::AUTHENTICATION_ERROR, "HTTP " + std::to_string(response.status_code), url);
    }
    if (!response.success) {
        throw ResilientError(ErrorType::API_ERROR, "HTTP " + std::to_string(response.status_code), url);
    }
    return response.body;
}

error_handling::Result<std::vector<std::string>> CoinGeckoRankingSource::parse_markets(const std::string& json_response) {
    using ResultType = error_handling::Result<std::vector<std::string>>;
    
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(json_response, root)) {
        return ResultType::error("Failed to parse JSON: " + reader.getFormattedErrorMessages());
    }
    if (!root.isArray()) {
        return ResultType::error("markets response is not an array");
    }
    
    std::vector<std::string> assets;
    std::unordered_set<std::string> seen;
    for (const auto& coin : root) {
        if (!coin.isObject() || !coin["symbol"].isString()) continue;
        
        std::string symbol = coin["symbol"].asString();
        std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (symbol.empty() || !seen.insert(symbol).second) continue;
        assets.push_back(symbol);
    }
    
    return ResultType::success(std::move(assets));
}

} // namespace coingecko
