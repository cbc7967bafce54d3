#include "doctest.h"
#include "../../../trade_ingest/pair_discovery.hpp"
#include "../../../exchanges/binance/http/binance_data_fetcher.hpp"
#include "../../../ranking/coingecko_ranking_source.hpp"
#include "../../mocks/mock_http_handler.hpp"
#include "../../test_helpers.hpp"
#include <atomic>

using trade_ingest::PairDiscovery;

namespace {

class StubRankingSource : public IRankingSource {
public:
    error_handling::Result<std::vector<std::string>> get_top_assets(int limit) override {
        calls++;
        last_limit = limit;
        if (fail) {
            return error_handling::Result<std::vector<std::string>>::error("ranking unavailable");
        }
        return error_handling::Result<std::vector<std::string>>::success(assets);
    }
    std::string get_source_name() const override { return "stub-ranking"; }

    std::vector<std::string> assets;
    bool fail{false};
    std::atomic<int> calls{0};
    int last_limit{0};
};

class StubExchangeSource : public IExchangeDataFetcher {
public:
    error_handling::Result<std::vector<ExchangeSymbolInfo>> get_symbols() override {
        calls++;
        if (fail) {
            return error_handling::Result<std::vector<ExchangeSymbolInfo>>::error("exchange unavailable");
        }
        return error_handling::Result<std::vector<ExchangeSymbolInfo>>::success(symbols);
    }
    std::string get_exchange_name() const override { return "stub-exchange"; }

    void add(const std::string& base, const std::string& quote, const std::string& status = "TRADING") {
        symbols.emplace_back(base + quote, "stub", base, quote, status);
    }

    std::vector<ExchangeSymbolInfo> symbols;
    bool fail{false};
    std::atomic<int> calls{0};
};

std::shared_ptr<MockHttpHandler> fixture_http() {
    return std::make_shared<MockHttpHandler>(TEST_DATA_DIR);
}

resilience::RetryPolicy no_retries() {
    resilience::RetryPolicy policy(0, std::chrono::milliseconds(0));
    policy.set_sleep_function([](std::chrono::milliseconds) {});
    return policy;
}

}

TEST_CASE("PairDiscovery - Initial Working Set Is Fallback") {
    auto config = test_utils::make_test_config();
    config.fallback_pairs = {"BTCUSDT", "ETHUSDT", "SOLUSDT"};
    config.pair_limit = 2;

    PairDiscovery discovery(config, std::make_shared<StubRankingSource>(), std::make_shared<StubExchangeSource>());

    CHECK(discovery.get_pairs() == std::vector<std::string>{"BTCUSDT", "ETHUSDT"});
    CHECK(discovery.get_pair_count() == 2);
    auto status = discovery.get_status();
    CHECK(status.refresh_count == 0);
    CHECK(status.last_refresh_time_ms == 0);
}

TEST_CASE("PairDiscovery - Select Pairs Ranks Then Appends Fallback") {
    std::vector<ExchangeSymbolInfo> symbols = {
        {"ETHBTC", "x", "ETH", "BTC", "TRADING"},
        {"ETHUSDT", "x", "ETH", "USDT", "TRADING"},
        {"BTCUSDT", "x", "BTC", "USDT", "TRADING"},
        {"BTCFDUSD", "x", "BTC", "FDUSD", "TRADING"},
        {"LUNAUSDT", "x", "LUNA", "USDT", "BREAK"},
        {"ADAUSDT", "x", "ADA", "USDT", "TRADING"},
    };

    auto pairs = PairDiscovery::select_pairs({"BTC", "LUNA", "ETH", "NOTLISTED"}, symbols, {"USDT", "FDUSD"},
                                             {"XRPUSDT", "BTCUSDT"}, 10);
    CHECK(pairs == std::vector<std::string>{"BTCUSDT", "BTCFDUSD", "ETHUSDT", "XRPUSDT"});

    auto limited = PairDiscovery::select_pairs({"BTC", "ETH"}, symbols, {"USDT"}, {"XRPUSDT"}, 2);
    CHECK(limited == std::vector<std::string>{"BTCUSDT", "ETHUSDT"});

    auto nothing_ranked = PairDiscovery::select_pairs({}, symbols, {"USDT"}, {"XRPUSDT"}, 10);
    CHECK(nothing_ranked == std::vector<std::string>{"XRPUSDT"});
}

TEST_CASE("PairDiscovery - Refresh From Fixtures") {
    auto config = test_utils::make_test_config();
    auto http = fixture_http();
    auto ranking = std::make_shared<coingecko::CoinGeckoRankingSource>(http, "https://api.coingecko.test/api/v3");
    auto exchange = std::make_shared<binance::BinanceDataFetcher>(http, "https://api.binance.test");

    PairDiscovery discovery(config, ranking, exchange);
    REQUIRE(discovery.refresh_pairs());

    // USDT ranks but has no USDT pair, LUNA is halted, BNB and XRP come from the fallback
    CHECK(discovery.get_pairs() ==
          std::vector<std::string>{"BTCUSDT", "ETHUSDT", "SOLUSDT", "DOGEUSDT", "BNBUSDT", "XRPUSDT"});

    auto status = discovery.get_status();
    CHECK(status.last_refresh_ok);
    CHECK(status.refresh_count == 1);
    CHECK(status.refresh_failures == 0);
    CHECK(status.last_refresh_time_ms > 0);
    CHECK(status.pair_count == 6);
    CHECK(http->request_count("per_page=100") == 1);
}

TEST_CASE("PairDiscovery - Failed Refresh Keeps Previous Set") {
    auto config = test_utils::make_test_config();
    config.fallback_pairs = {"BTCUSDT"};

    auto ranking = std::make_shared<StubRankingSource>();
    ranking->assets = {"ETH", "SOL"};
    auto exchange = std::make_shared<StubExchangeSource>();
    exchange->add("ETH", "USDT");
    exchange->add("SOL", "USDT");

    PairDiscovery discovery(config, ranking, exchange);
    REQUIRE(discovery.refresh_pairs());
    auto before = discovery.get_snapshot();
    CHECK(*before == std::vector<std::string>{"ETHUSDT", "SOLUSDT", "BTCUSDT"});

    SUBCASE("Ranking source down") {
        ranking->fail = true;
        CHECK_FALSE(discovery.refresh_pairs());
        CHECK(exchange->calls.load() == 1);
        auto status = discovery.get_status();
        CHECK(status.last_error.find("stub-ranking") != std::string::npos);
    }
    SUBCASE("Exchange source down") {
        exchange->fail = true;
        CHECK_FALSE(discovery.refresh_pairs());
        auto status = discovery.get_status();
        CHECK(status.last_error.find("stub-exchange") != std::string::npos);
    }

    CHECK(discovery.get_pairs() == *before);
    auto status = discovery.get_status();
    CHECK_FALSE(status.last_refresh_ok);
    CHECK(status.refresh_count == 1);
    CHECK(status.refresh_failures == 1);
}

TEST_CASE("PairDiscovery - Both Sources Down Leaves Fallback") {
    auto config = test_utils::make_test_config();
    config.fallback_pairs = {"BTCUSDT", "ETHUSDT"};
    auto http = fixture_http();
    http->enable_network_failure(true);

    auto ranking = std::make_shared<coingecko::CoinGeckoRankingSource>(http, "https://api.coingecko.test/api/v3");
    ranking->set_retry_policy(no_retries());
    auto exchange = std::make_shared<binance::BinanceDataFetcher>(http, "https://api.binance.test");
    exchange->set_retry_policy(no_retries());

    PairDiscovery discovery(config, ranking, exchange);
    CHECK_FALSE(discovery.refresh_pairs());
    CHECK(discovery.get_pairs() == std::vector<std::string>{"BTCUSDT", "ETHUSDT"});
    CHECK(discovery.get_status().refresh_failures == 1);
}

TEST_CASE("PairDiscovery - Ranking Limit Follows Config") {
    auto config = test_utils::make_test_config();
    config.ranking_top_n = 42;
    auto ranking = std::make_shared<StubRankingSource>();
    auto exchange = std::make_shared<StubExchangeSource>();

    PairDiscovery discovery(config, ranking, exchange);
    REQUIRE(discovery.refresh_pairs());
    CHECK(ranking->last_limit == 42);
    // Nothing ranked: the working set is the fallback
    CHECK(discovery.get_pairs() == config.fallback_pairs);
}

TEST_CASE("PairDiscovery - Background Refresh") {
    auto config = test_utils::make_test_config();
    config.refresh_interval_seconds = 3600;
    auto ranking = std::make_shared<StubRankingSource>();
    ranking->assets = {"DOGE"};
    auto exchange = std::make_shared<StubExchangeSource>();
    exchange->add("DOGE", "USDT");

    PairDiscovery discovery(config, ranking, exchange);
    discovery.start();
    CHECK(discovery.is_running());
    REQUIRE(discovery.wait_for_first_refresh(std::chrono::milliseconds(2000)));
    CHECK(discovery.get_pairs().front() == "DOGEUSDT");

    // stop() interrupts the hour-long wait
    auto begin = std::chrono::steady_clock::now();
    discovery.stop();
    CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
    CHECK_FALSE(discovery.is_running());
    CHECK(ranking->calls.load() == 1);
}

TEST_CASE("PairDiscovery - First Refresh Wait Times Out Without Start") {
    auto config = test_utils::make_test_config();
    PairDiscovery discovery(config, std::make_shared<StubRankingSource>(), std::make_shared<StubExchangeSource>());
    CHECK_FALSE(discovery.wait_for_first_refresh(std::chrono::milliseconds(20)));
}
