#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "proto/trade.pb.h"
#include "../../../utils/constants.hpp"

namespace binance {

// Outcome of converting one inbound frame
struct TradeConversion {
    enum class Status {
        TRADE,       // trade is populated
        IGNORED,     // well-formed but not a trade (acks, other event types)
        MALFORMED    // error describes the problem
    };

    Status status{Status::MALFORMED};
    ingest::proto::NormalizedTrade trade;
    std::string error;

    bool is_trade() const { return status == Status::TRADE; }
};

/**
 * Binance spot trade frame -> NormalizedTrade
 *
 * Accepts a bare trade event or the combined-stream envelope
 * {"stream":"btcusdt@trade","data":{...}}. Required fields are s, p, q, t
 * and m; T falls back to now_ms. The buyer-is-maker flag m marks the
 * aggressor as the seller.
 *
 * convert() has no side effects: the same frame and now_ms always give the
 * same result.
 */
class BinanceTradeNormalizer {
public:
    explicit BinanceTradeNormalizer(size_t raw_payload_max = constants::ingest::RAW_PAYLOAD_MAX_BYTES)
        : raw_payload_max_(raw_payload_max) {}

    TradeConversion convert(const std::string& raw, int64_t now_ms) const;

    // Plain decimal ("123", "0.0012") strictly greater than zero
    static bool is_positive_decimal(const std::string& value);

private:
    size_t raw_payload_max_;
};

} // namespace binance
