#include "doctest.h"
#include "../../../exchanges/binance/public_websocket/binance_trade_normalizer.hpp"

using binance::BinanceTradeNormalizer;
using binance::TradeConversion;

TEST_CASE("BinanceTradeNormalizer - Combined Stream Trade") {
    BinanceTradeNormalizer normalizer;
    std::string frame = R"({"stream":"btcusdt@trade","data":{"e":"trade","E":1704164645700,"s":"BTCUSDT","t":3001,)"
                        R"("p":"42000.10","q":"0.015","T":1704164645678,"m":false,"M":true}})";

    TradeConversion result = normalizer.convert(frame, 1704164645999);

    REQUIRE(result.is_trade());
    CHECK(result.trade.exchange() == "binance");
    CHECK(result.trade.pair() == "BTCUSDT");
    CHECK(result.trade.price() == "42000.10");
    CHECK(result.trade.quantity() == "0.015");
    CHECK(result.trade.timestamp_ms() == 1704164645678);
    CHECK(result.trade.side() == ingest::proto::BUY);
    CHECK(result.trade.trade_id() == "3001");
    CHECK(result.trade.ingested_at_ms() == 1704164645999);
    CHECK(result.trade.raw_payload() == frame);
}

TEST_CASE("BinanceTradeNormalizer - Buyer Maker Is Sell") {
    BinanceTradeNormalizer normalizer;
    auto result = normalizer.convert(
        R"({"e":"trade","s":"ethusdt","t":"77","p":"2250.15","q":"0.5","T":1700000000000,"m":true})", 1);

    REQUIRE(result.is_trade());
    CHECK(result.trade.side() == ingest::proto::SELL);
    CHECK(result.trade.pair() == "ETHUSDT");
    CHECK(result.trade.trade_id() == "77");
}

TEST_CASE("BinanceTradeNormalizer - Missing Trade Time Uses Receive Time") {
    BinanceTradeNormalizer normalizer;
    auto result = normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":"1.0","q":"2.0","m":false})", 5555);

    REQUIRE(result.is_trade());
    CHECK(result.trade.timestamp_ms() == 5555);
}

TEST_CASE("BinanceTradeNormalizer - Non Trade Frames Are Ignored") {
    BinanceTradeNormalizer normalizer;

    CHECK(normalizer.convert(R"({"result":null,"id":1})", 0).status == TradeConversion::Status::IGNORED);
    CHECK(normalizer.convert(R"({"stream":"ethusdt@depth","data":{"e":"depthUpdate","s":"ETHUSDT","b":[],"a":[]}})", 0)
              .status == TradeConversion::Status::IGNORED);
    CHECK(normalizer.convert(R"({"e":"aggTrade","s":"BTCUSDT","p":"1","q":"1"})", 0).status ==
          TradeConversion::Status::IGNORED);
}

TEST_CASE("BinanceTradeNormalizer - Malformed Frames") {
    BinanceTradeNormalizer normalizer;

    SUBCASE("Invalid JSON") {
        auto result = normalizer.convert("not json at all", 0);
        CHECK(result.status == TradeConversion::Status::MALFORMED);
        CHECK_FALSE(result.error.empty());
    }
    SUBCASE("Not an object") {
        CHECK(normalizer.convert("[1,2,3]", 0).status == TradeConversion::Status::MALFORMED);
    }
    SUBCASE("No event type") {
        CHECK(normalizer.convert(R"({"s":"BTCUSDT","p":"1","q":"1"})", 0).status == TradeConversion::Status::MALFORMED);
    }
    SUBCASE("Missing quantity") {
        CHECK(normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":"1.0","m":false})", 0).status ==
              TradeConversion::Status::MALFORMED);
    }
    SUBCASE("Zero price") {
        CHECK(normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":"0.000","q":"1","m":false})", 0).status ==
              TradeConversion::Status::MALFORMED);
    }
    SUBCASE("Numeric price") {
        CHECK(normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":1.5,"q":"1","m":false})", 0).status ==
              TradeConversion::Status::MALFORMED);
    }
    SUBCASE("Missing trade id") {
        CHECK(normalizer.convert(R"({"e":"trade","s":"BTCUSDT","p":"1","q":"1","m":false})", 0).status ==
              TradeConversion::Status::MALFORMED);
    }
    SUBCASE("Missing maker flag") {
        CHECK(normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":"1","q":"1"})", 0).status ==
              TradeConversion::Status::MALFORMED);
    }
}

TEST_CASE("BinanceTradeNormalizer - Raw Payload Is Truncated") {
    BinanceTradeNormalizer normalizer(16);
    auto result = normalizer.convert(R"({"e":"trade","s":"BTCUSDT","t":1,"p":"1.0","q":"2.0","m":false})", 0);

    REQUIRE(result.is_trade());
    CHECK(result.trade.raw_payload().size() == 16);
    CHECK(result.trade.raw_payload() == R"({"e":"trade","s")");
}

TEST_CASE("BinanceTradeNormalizer - Positive Decimal Check") {
    CHECK(BinanceTradeNormalizer::is_positive_decimal("42000.10"));
    CHECK(BinanceTradeNormalizer::is_positive_decimal("0.00000001"));
    CHECK(BinanceTradeNormalizer::is_positive_decimal("5"));
    CHECK_FALSE(BinanceTradeNormalizer::is_positive_decimal(""));
    CHECK_FALSE(BinanceTradeNormalizer::is_positive_decimal("0"));
    CHECK_FALSE(BinanceTradeNormalizer::is_positive_decimal("-1.0"));
    CHECK_FALSE(BinanceTradeNormalizer::is_positive_decimal("1.2.3"));
    CHECK_FALSE(BinanceTradeNormalizer::is_positive_decimal("1e5"));
}

TEST_CASE("BinanceTradeNormalizer - Same Frame Gives Identical Trade") {
    std::string frame = R"({"stream":"solusdt@trade","data":{"e":"trade","s":"SOLUSDT","t":901,)"
                        R"("p":"101.25","q":"3.5","T":1704164645678,"m":true}})";
    BinanceTradeNormalizer first;
    BinanceTradeNormalizer second;

    auto a = first.convert(frame, 1704164646000);
    auto b = first.convert(frame, 1704164646000);
    auto c = second.convert(frame, 1704164646000);

    REQUIRE(a.is_trade());
    REQUIRE(b.is_trade());
    REQUIRE(c.is_trade());
    CHECK(a.trade.SerializeAsString() == b.trade.SerializeAsString());
    CHECK(a.trade.SerializeAsString() == c.trade.SerializeAsString());
}

TEST_CASE("BinanceTradeNormalizer - Receive Time Only Affects Timestamps") {
    std::string frame = R"({"e":"trade","s":"BTCUSDT","t":42,"p":"42000.10","q":"0.015","m":false})";
    BinanceTradeNormalizer normalizer;

    auto early = normalizer.convert(frame, 1000);
    auto late = normalizer.convert(frame, 2000);

    REQUIRE(early.is_trade());
    REQUIRE(late.is_trade());
    CHECK(early.trade.timestamp_ms() == 1000);
    CHECK(early.trade.ingested_at_ms() == 1000);
    CHECK(late.trade.timestamp_ms() == 2000);
    CHECK(late.trade.ingested_at_ms() == 2000);

    ingest::proto::NormalizedTrade aligned = late.trade;
    aligned.set_timestamp_ms(early.trade.timestamp_ms());
    aligned.set_ingested_at_ms(early.trade.ingested_at_ms());
    CHECK(aligned.SerializeAsString() == early.trade.SerializeAsString());
}
