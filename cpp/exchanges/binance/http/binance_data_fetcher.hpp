#pragma once
#include "../../i_exchange_data_fetcher.hpp"
#include "../../../utils/http/i_http_handler.hpp"
#include "../../../utils/resilience/resilience.hpp"
#include <string>
#include <vector>
#include <memory>

namespace binance {

/**
 * Spot exchange info over REST (GET /api/v3/exchangeInfo)
 *
 * Transport failures, 5xx and rate-limit responses (429, 418) are retried
 * through the RetryPolicy; anything else fails the call immediately.
 */
class BinanceDataFetcher : public IExchangeDataFetcher {
public:
    BinanceDataFetcher(std::shared_ptr<IHttpHandler> http_handler, const std::string& base_url);
    ~BinanceDataFetcher() override = default;
    
    error_handling::Result<std::vector<ExchangeSymbolInfo>> get_symbols() override;
    std::string get_exchange_name() const override { return "binance"; }
    
    void set_retry_policy(const resilience::RetryPolicy& policy) { retry_policy_ = policy; }
    const std::string& get_base_url() const { return base_url_; }
    
    // Parses an exchangeInfo body; symbols missing a name or assets are skipped
    static error_handling::Result<std::vector<ExchangeSymbolInfo>> parse_exchange_info(const std::string& json_response);

private:
    std::shared_ptr<IHttpHandler> http_handler_;
    std::string base_url_;
    resilience::RetryPolicy retry_policy_;
    
    std::string fetch(const std::string& url);
};

}
