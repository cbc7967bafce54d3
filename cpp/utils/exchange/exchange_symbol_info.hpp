#pragma once
#include <string>

/**
 * Spot symbol as listed by an exchange
 * 
 * Only the fields pair discovery needs: which base/quote the symbol
 * trades and whether it is currently open for trading.
 */
struct ExchangeSymbolInfo {
    std::string symbol;           // e.g. BTCUSDT
    std::string exchange;
    std::string base_asset;       // e.g. BTC
    std::string quote_asset;      // e.g. USDT
    std::string status;           // e.g. TRADING, BREAK, HALT
    
    ExchangeSymbolInfo() = default;
    
    ExchangeSymbolInfo(const std::string& sym, const std::string& exch,
                       const std::string& base, const std::string& quote,
                       const std::string& st)
        : symbol(sym), exchange(exch), base_asset(base), quote_asset(quote), status(st) {}
    
    bool is_trading() const { return status == "TRADING"; }
};
