#pragma once
#include <string>
#include <vector>
#include "../utils/error_handling.hpp"
#include "../utils/exchange/exchange_symbol_info.hpp"

/**
 * IExchangeDataFetcher - HTTP Data Fetcher Interface
 * 
 * Purpose: list the symbols an exchange currently offers
 * Used by: PairDiscovery on every refresh
 * 
 * Key Design:
 * - HTTP only, public endpoints, no authentication
 * - Failures are returned as an error Result, never thrown
 */
class IExchangeDataFetcher {
public:
    virtual ~IExchangeDataFetcher() = default;
    
    virtual error_handling::Result<std::vector<ExchangeSymbolInfo>> get_symbols() = 0;
    virtual std::string get_exchange_name() const = 0;
};
