#include "binance_data_fetcher.hpp"
#include "../../../utils/constants.hpp"
#include "../../../utils/logging/log_helper.hpp"
#include <json/json.h>
#include <string>

namespace binance {

namespace {
const char* kComponent = "BINANCE_FETCHER";
}

BinanceDataFetcher::BinanceDataFetcher(std::shared_ptr<IHttpHandler> http_handler, const std::string& base_url)
    : http_handler_(std::move(http_handler))
    , base_url_(base_url)
    , retry_policy_(constants::retry::RATE_LIMIT_RETRIES,
                    std::chrono::milliseconds(constants::retry::RATE_LIMIT_DELAY_MS)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

error_handling::Result<std::vector<ExchangeSymbolInfo>> BinanceDataFetcher::get_symbols() {
    using ResultType = error_handling::Result<std::vector<ExchangeSymbolInfo>>;
    
    if (!http_handler_) {
        return ResultType::error("HTTP handler not set");
    }
    
    std::string url = base_url_ + constants::exchange::binance::EXCHANGE_INFO_PATH;
    std::string body;
    try {
        body = retry_policy_.execute([this, &url]() { return fetch(url); });
    } catch (const resilience::ResilientError& e) {
        LOG_WARN_COMP(kComponent, std::string("exchangeInfo request failed (") +
                      resilience::error_type_name(e.get_type()) + "): " + e.what());
        return ResultType::error(e.what());
    }
    
    auto result = parse_exchange_info(body);
    if (result.is_success()) {
        LOG_DEBUG_COMP(kComponent, "Fetched " + std::to_string(result.value().size()) + " symbols");
    } else {
        LOG_WARN_COMP(kComponent, "exchangeInfo parse failed: " + result.error());
    }
    return result;
}

std::string BinanceDataFetcher::fetch(const std::string& url) {
    using resilience::ErrorType;
    using resilience::ResilientError;
    
    HttpRequest request;
    request.url = url;
    request.timeout_ms = constants::timeout::DEFAULT_HTTP_MS;
    
    HttpResponse response = http_handler_->make_request(request);
    if (response.status_code == 0) {
        throw ResilientError(ErrorType::NETWORK_ERROR, response.error_message, url);
    }
    if (response.status_code == 429 || response.status_code == 418) {
        throw ResilientError(ErrorType::RATE_LIMIT_ERROR, "HTTP " + std::to_string(response.status_code), url);
    }
    if (response.status_code >= 500) {
        throw ResilientError(ErrorType::NETWORK_ERROR, "HTTP " + std::to_string(response.status_code), url);
    }
    if (!response.success) {
        throw ResilientError(ErrorType::API_ERROR, "HTTP " + std::to_string(response.status_code), url);
    }
    return response.body;
}

error_handling::Result<std::vector<ExchangeSymbolInfo>> BinanceDataFetcher::parse_exchange_info(const std::string& json_response) {
    using ResultType = error_handling::Result<std::vector<ExchangeSymbolInfo>>;
    
    Json::Value root;
    Json::Reader reader;
    
    if (!reader.parse(json_response, root)) {
        return ResultType::error("Failed to parse JSON: " + reader.getFormattedErrorMessages());
    }
    if (!root.isObject() || !root["symbols"].isArray()) {
        return ResultType::error("exchangeInfo response has no symbols array");
    }
    
    std::vector<ExchangeSymbolInfo> symbols;
    symbols.reserve(root["symbols"].size());
    for (const auto& symbol_json : root["symbols"]) {
        if (!symbol_json.isObject() || !symbol_json["symbol"].isString() ||
            !symbol_json["baseAsset"].isString() || !symbol_json["quoteAsset"].isString()) {
            continue;
        }
        
        ExchangeSymbolInfo info(symbol_json["symbol"].asString(),
                                "binance",
                                symbol_json["baseAsset"].asString(),
                                symbol_json["quoteAsset"].asString(),
                                symbol_json["status"].isString() ? symbol_json["status"].asString() : "");
        if (info.symbol.empty() || info.base_asset.empty() || info.quote_asset.empty()) {
            continue;
        }
        symbols.push_back(std::move(info));
    }
    
    return ResultType::success(std::move(symbols));
}

}
