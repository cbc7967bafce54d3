#pragma once
#include <string>
#include <vector>
#include "../utils/error_handling.hpp"

/**
 * Market-cap ranking of base assets
 *
 * get_top_assets() returns uppercase asset symbols (BTC, ETH, ...) in rank
 * order, best first. Failures come back as an error Result.
 */
class IRankingSource {
public:
    virtual ~IRankingSource() = default;
    
    virtual error_handling::Result<std::vector<std::string>> get_top_assets(int limit) = 0;
    virtual std::string get_source_name() const = 0;
};
