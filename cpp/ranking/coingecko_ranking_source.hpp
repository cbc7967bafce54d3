#pragma once
#include "i_ranking_source.hpp"
#include "../utils/http/i_http_handler.hpp"
#include "../utils/resilience/resilience.hpp"
#include <memory>
#include <string>
#include <vector>

namespace coingecko {

/**
 * CoinGecko /coins/markets ordered by market cap
 *
 * The pro API key, when set, is sent in the x-cg-pro-api-key header.
 * HTTP 429 is retried a bounded number of times.
 */
class CoinGeckoRankingSource : public IRankingSource {
public:
    CoinGeckoRankingSource(std::shared_ptr<IHttpHandler> http_handler,
                           const std::string& base_url,
                           const std::string& api_key = "");
    
    error_handling::Result<std::vector<std::string>> get_top_assets(int limit) override;
    std::string get_source_name() const override { return "coingecko"; }
    
    void set_retry_policy(const resilience::RetryPolicy& policy) { retry_policy_ = policy; }
    
    std::string build_url(int limit) const;
    
    // Uppercased "symbol" of each entry, rank order kept, duplicates dropped
    static error_handling::Result<std::vector<std::string>> parse_markets(const std::string& json_response);

private:
    std::shared_ptr<IHttpHandler> http_handler_;
    std::string base_url_;
    std::string api_key_;
    resilience::RetryPolicy retry_policy_;
    
    std::string fetch(const std::string& url);
};

} // namespace coingecko
