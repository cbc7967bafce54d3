#include "binance_trade_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <json/json.h>

namespace binance {

namespace {

TradeConversion malformed(const std::string& error) {
    TradeConversion result;
    result.status = TradeConversion::Status::MALFORMED;
    result.error = error;
    return result;
}

TradeConversion ignored() {
    TradeConversion result;
    result.status = TradeConversion::Status::IGNORED;
    return result;
}

// Binance sends ids and times as numbers; tolerate numeric strings too
bool read_int64(const Json::Value& value, int64_t& out) {
    if (value.isInt64()) {
        out = value.asInt64();
        return true;
    }
    if (value.isUInt64()) {
        out = static_cast<int64_t>(value.asUInt64());
        return true;
    }
    if (value.isString()) {
        const std::string text = value.asString();
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        try {
            out = std::stoll(text);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

} // namespace

bool BinanceTradeNormalizer::is_positive_decimal(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    bool seen_dot = false;
    bool seen_digit = false;
    bool seen_nonzero = false;
    for (char c : value) {
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
        } else if (c >= '0' && c <= '9') {
            seen_digit = true;
            if (c != '0') seen_nonzero = true;
        } else {
            return false;
        }
    }
    return seen_digit && seen_nonzero;
}

TradeConversion BinanceTradeNormalizer::convert(const std::string& raw, int64_t now_ms) const {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(raw, root, false)) {
        return malformed("invalid JSON: " + reader.getFormattedErrorMessages());
    }
    if (!root.isObject()) {
        return malformed("frame is not a JSON object");
    }

    // Subscription acks look like {"result":null,"id":1}
    if (root.isMember("id") && root.isMember("result")) {
        return ignored();
    }

    const Json::Value& data = root.isMember("data") && root["data"].isObject() ? root["data"] : root;

    if (!data.isMember("e")) {
        return malformed("missing event type");
    }
    if (!data["e"].isString() || data["e"].asString() != "trade") {
        return ignored();
    }

    const Json::Value& symbol = data["s"];
    const Json::Value& price = data["p"];
    const Json::Value& quantity = data["q"];
    const Json::Value& buyer_is_maker = data["m"];

    if (!symbol.isString() || symbol.asString().empty()) {
        return malformed("missing symbol");
    }
    if (!price.isString() || !is_positive_decimal(price.asString())) {
        return malformed("invalid price");
    }
    if (!quantity.isString() || !is_positive_decimal(quantity.asString())) {
        return malformed("invalid quantity");
    }
    if (!buyer_is_maker.isBool()) {
        return malformed("missing buyer-is-maker flag");
    }

    int64_t trade_id = 0;
    if (!data.isMember("t") || !read_int64(data["t"], trade_id)) {
        return malformed("missing trade id");
    }

    int64_t timestamp_ms = now_ms;
    if (data.isMember("T") && !data["T"].isNull()) {
        if (!read_int64(data["T"], timestamp_ms)) {
            return malformed("invalid trade time");
        }
    }

    std::string pair = symbol.asString();
    std::transform(pair.begin(), pair.end(), pair.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    TradeConversion result;
    result.status = TradeConversion::Status::TRADE;

    auto& trade = result.trade;
    trade.set_exchange(constants::ingest::EXCHANGE_NAME);
    trade.set_pair(pair);
    trade.set_price(price.asString());
    trade.set_quantity(quantity.asString());
    trade.set_timestamp_ms(timestamp_ms);
    trade.set_side(buyer_is_maker.asBool() ? ingest::proto::SELL : ingest::proto::BUY);
    trade.set_trade_id(std::to_string(trade_id));
    trade.set_raw_payload(raw.size() > raw_payload_max_ ? raw.substr(0, raw_payload_max_) : raw);
    trade.set_ingested_at_ms(now_ms);

    return result;
}

} // namespace binance
