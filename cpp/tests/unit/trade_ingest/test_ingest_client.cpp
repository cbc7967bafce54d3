#include "doctest.h"
#include "../../../trade_ingest/ingest_client.hpp"
#include "../../mocks/mock_stream_client.hpp"
#include "../../mocks/mock_websocket_transport.hpp"
#include "../../test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>

using trade_ingest::ConnectionPhase;
using trade_ingest::IngestClient;
using trade_ingest::IngestStats;
using trade_ingest::StreamPublisher;
using test_utils::MockStreamClient;
using test_utils::MockTransportScript;
using test_utils::TestWebSocketTransportFactory;

namespace {

struct IngestFixture {
    trade_ingest::IngestConfig config = test_utils::make_test_config();
    std::shared_ptr<MockStreamClient> streams = std::make_shared<MockStreamClient>();
    std::shared_ptr<StreamPublisher> publisher;
    std::shared_ptr<IngestStats> stats = std::make_shared<IngestStats>();
    std::shared_ptr<MockTransportScript> script = std::make_shared<MockTransportScript>();

    IngestFixture() {
        publisher = std::make_shared<StreamPublisher>(streams, config.max_stream_length);
        publisher->connect();
    }

    std::unique_ptr<IngestClient> make_client() {
        auto client = std::make_unique<IngestClient>(config, publisher, stats,
                                                     TestWebSocketTransportFactory::make_factory(script));
        client->set_clock([]() { return int64_t{1704164646000}; });
        return client;
    }
};

}

TEST_CASE("IngestClient - Chunking Covers Every Pair Once") {
    std::vector<std::string> pairs;
    for (int i = 0; i < 7; ++i) {
        pairs.push_back("PAIR" + std::to_string(i) + "USDT");
    }

    auto chunks = IngestClient::chunk_pairs(pairs, 3);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size() == 3);
    CHECK(chunks[1].size() == 3);
    CHECK(chunks[2].size() == 1);

    std::vector<std::string> flattened;
    for (const auto& chunk : chunks) {
        flattened.insert(flattened.end(), chunk.begin(), chunk.end());
    }
    CHECK(flattened == pairs);

    CHECK(IngestClient::chunk_pairs(pairs, 7).size() == 1);
    CHECK(IngestClient::chunk_pairs(pairs, 100).size() == 1);
    CHECK(IngestClient::chunk_pairs({}, 5).empty());
    CHECK_THROWS_AS(IngestClient::chunk_pairs(pairs, 0), std::invalid_argument);
}

TEST_CASE("IngestClient - Combined Stream Url") {
    CHECK(IngestClient::build_stream_url("wss://stream.binance.com:9443/", {"BTCUSDT", "EthUsdt"}) ==
          "wss://stream.binance.com:9443/stream?streams=btcusdt@trade/ethusdt@trade");
    CHECK(IngestClient::build_stream_url("wss://stream.binance.com:9443", {"SOLUSDT"}) ==
          "wss://stream.binance.com:9443/stream?streams=solusdt@trade");
}

TEST_CASE("IngestClient - Backoff Schedule From Config") {
    auto config = trade_ingest::IngestConfig::defaults();
    resilience::ExponentialBackoff backoff(std::chrono::milliseconds(config.backoff_base_ms),
                                           std::chrono::milliseconds(config.backoff_max_ms),
                                           config.backoff_jitter);

    std::chrono::milliseconds previous(0);
    for (int retry = 0; retry < 10; ++retry) {
        auto floor = backoff.base_delay(retry);
        CHECK(floor >= previous);
        CHECK(floor.count() <= std::min<long long>(1000LL << retry, config.backoff_max_ms));
        previous = floor;
    }
    CHECK(backoff.base_delay(9).count() == config.backoff_max_ms);
}

TEST_CASE("IngestClient - Trades Are Published In Receive Order") {
    IngestFixture fixture;
    fixture.script->set_frames(TestWebSocketTransportFactory::load_frames(
        test_utils::data_path("binance_trade_frames.jsonl")));

    auto client = fixture.make_client();
    std::vector<std::string> callback_ids;
    std::mutex callback_mutex;
    client->set_trade_callback([&](const ingest::proto::NormalizedTrade& trade) {
        std::lock_guard<std::mutex> lock(callback_mutex);
        callback_ids.push_back(trade.trade_id());
    });

    REQUIRE(client->start({"BTCUSDT"}));
    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().total_messages == 3; }));
    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().active_connections == 1; }));

    auto entries = fixture.streams->get_entries("trades:BTCUSDT");
    REQUIRE(entries.size() == 3);
    CHECK(MockStreamClient::field(entries[0], "trade_id") == "3001");
    CHECK(MockStreamClient::field(entries[1], "trade_id") == "3002");
    CHECK(MockStreamClient::field(entries[2], "trade_id") == "3003");
    CHECK(MockStreamClient::field(entries[1], "side") == "sell");
    CHECK(MockStreamClient::field(entries[0], "ingested_at") == "2024-01-02T03:04:06.000Z");

    auto stats = client->get_stats();
    CHECK(stats.error_messages == 0);

    auto connections = client->get_connections();
    REQUIRE(connections.size() == 1);
    CHECK(connections[0].phase == ConnectionPhase::STREAMING);
    CHECK(connections[0].active);
    CHECK(connections[0].messages == 3);

    auto urls = fixture.script->get_connected_urls();
    REQUIRE(urls.size() == 1);
    CHECK(urls[0] == "wss://stream.test:9443/stream?streams=btcusdt@trade");

    client->stop();
    CHECK_FALSE(client->is_running());
    CHECK(client->get_stats().active_connections == 0);
    CHECK(client->get_connections()[0].phase == ConnectionPhase::STOPPED);

    std::lock_guard<std::mutex> lock(callback_mutex);
    CHECK(callback_ids == std::vector<std::string>{"3001", "3002", "3003"});
}

TEST_CASE("IngestClient - Non Trade Events Do Not Count As Errors") {
    IngestFixture fixture;
    fixture.script->set_frames({
        R"({"stream":"ethusdt@depth","data":{"e":"depthUpdate","s":"ETHUSDT","b":[],"a":[]}})",
        R"({"stream":"ethusdt@trade","data":{"e":"trade","s":"ETHUSDT","t":9001,"p":"2250.15","q":"0.5","T":1704164645705,"m":true}})",
    });

    auto client = fixture.make_client();
    REQUIRE(client->start({"ETHUSDT"}));
    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().total_messages == 1; }));
    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().ignored_messages == 1; }));

    CHECK(client->get_stats().error_messages == 0);
    CHECK(fixture.streams->get_entries("trades:ETHUSDT").size() == 1);
    client->stop();
}

TEST_CASE("IngestClient - Malformed Frames Are Counted And Skipped") {
    IngestFixture fixture;
    fixture.script->set_frames(TestWebSocketTransportFactory::load_frames(
        test_utils::data_path("binance_mixed_frames.jsonl")));

    auto client = fixture.make_client();
    REQUIRE(client->start({"ETHUSDT"}));
    REQUIRE(test_utils::wait_until([&]() {
        auto stats = client->get_stats();
        return stats.total_messages + stats.error_messages + stats.ignored_messages == 5;
    }));

    auto stats = client->get_stats();
    CHECK(stats.total_messages == 1);
    CHECK(stats.error_messages == 2);
    CHECK(stats.ignored_messages == 2);
    CHECK(client->get_connections()[0].errors == 2);
    // The connection survives bad frames
    CHECK(client->get_connections()[0].phase == ConnectionPhase::STREAMING);
    client->stop();
}

TEST_CASE("IngestClient - One Connection Per Chunk") {
    IngestFixture fixture;
    fixture.config.pairs_per_connection = 2;

    auto client = fixture.make_client();
    REQUIRE(client->start({"BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT", "XRPUSDT"}));
    CHECK(client->get_connection_count() == 3);
    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().active_connections == 3; }));

    auto urls = fixture.script->get_connected_urls();
    std::set<std::string> unique(urls.begin(), urls.end());
    CHECK(unique.size() == 3);
    CHECK(unique.count("wss://stream.test:9443/stream?streams=btcusdt@trade/ethusdt@trade") == 1);
    CHECK(unique.count("wss://stream.test:9443/stream?streams=xrpusdt@trade") == 1);

    client->stop();
    CHECK(client->get_stats().active_connections == 0);
}

TEST_CASE("IngestClient - Failing Connection Is Abandoned Alone") {
    IngestFixture fixture;
    fixture.config.pairs_per_connection = 1;
    fixture.config.max_retries = 2;
    fixture.script->fail_when_url_contains = "ethusdt";

    auto client = fixture.make_client();
    REQUIRE(client->start({"BTCUSDT", "ETHUSDT"}));

    REQUIRE(test_utils::wait_until([&]() {
        return client->get_connections()[1].phase == ConnectionPhase::FAILED;
    }));

    auto connections = client->get_connections();
    CHECK(connections[1].retry_count == 2);
    CHECK_FALSE(connections[1].active);
    CHECK(connections[1].last_error == "connection refused");
    // Initial attempt plus two retries
    CHECK(client->get_stats().connection_errors == 3);

    REQUIRE(test_utils::wait_until([&]() { return client->get_stats().active_connections == 1; }));
    CHECK(client->get_connections()[0].phase == ConnectionPhase::STREAMING);

    client->stop();
    CHECK(client->get_connections()[1].phase == ConnectionPhase::FAILED);
}

TEST_CASE("IngestClient - Non Standard Exception Fails Only Its Connection") {
    IngestFixture fixture;
    fixture.config.pairs_per_connection = 1;

    auto base_factory = TestWebSocketTransportFactory::make_factory(fixture.script);
    auto factory_calls = std::make_shared<std::atomic<int>>(0);
    websocket_transport::WebSocketTransportFactoryFn factory =
        [base_factory, factory_calls]() -> std::unique_ptr<websocket_transport::IWebSocketTransport> {
            if (factory_calls->fetch_add(1) == 1) {
                throw 42;
            }
            return base_factory();
        };

    IngestClient client(fixture.config, fixture.publisher, fixture.stats, factory);
    REQUIRE(client.start({"BTCUSDT", "ETHUSDT"}));

    REQUIRE(test_utils::wait_until([&]() {
        auto connections = client.get_connections();
        return std::count_if(connections.begin(), connections.end(), [](const auto& c) {
                   return c.phase == ConnectionPhase::FAILED;
               }) == 1 &&
               client.get_stats().active_connections == 1;
    }));

    auto connections = client.get_connections();
    const auto& failed = connections[0].phase == ConnectionPhase::FAILED ? connections[0] : connections[1];
    const auto& healthy = connections[0].phase == ConnectionPhase::FAILED ? connections[1] : connections[0];
    CHECK(failed.last_error == "unknown exception");
    CHECK_FALSE(failed.active);
    CHECK(healthy.phase == ConnectionPhase::STREAMING);
    CHECK(client.is_running());

    client.stop();
    CHECK(client.get_stats().active_connections == 0);
}

TEST_CASE("IngestClient - Reconnects After Peer Close") {
    IngestFixture fixture;
    fixture.script->hold_open = false;
    fixture.script->set_frames({
        R"({"e":"trade","s":"BTCUSDT","t":1,"p":"1.0","q":"1.0","T":1,"m":false})",
    });

    auto client = fixture.make_client();
    REQUIRE(client->start({"BTCUSDT"}));
    REQUIRE(test_utils::wait_until([&]() { return fixture.script->connect_attempts.load() >= 3; }));

    client->stop();
    // A clean connect resets the retry budget, so the connection never fails
    CHECK(client->get_connections()[0].phase == ConnectionPhase::STOPPED);
    CHECK(client->get_stats().total_messages >= 2);
    CHECK(client->get_stats().connection_errors >= 2);
    CHECK(client->get_stats().active_connections == 0);
}

TEST_CASE("IngestClient - Stop Interrupts Backoff") {
    IngestFixture fixture;
    fixture.config.backoff_base_ms = 60000;
    fixture.config.backoff_max_ms = 60000;
    fixture.script->connect_succeeds = false;

    auto client = fixture.make_client();
    REQUIRE(client->start({"BTCUSDT"}));
    REQUIRE(test_utils::wait_until([&]() {
        return client->get_connections()[0].phase == ConnectionPhase::BACKOFF;
    }));

    auto begin = std::chrono::steady_clock::now();
    client->stop();
    CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
    CHECK(fixture.script->connect_attempts.load() == 1);
}

TEST_CASE("IngestClient - Start Preconditions") {
    IngestFixture fixture;
    auto client = fixture.make_client();

    CHECK_FALSE(client->start({}));
    REQUIRE(client->start({"BTCUSDT"}));
    CHECK_FALSE(client->start({"ETHUSDT"}));
    client->stop();
    client->stop();
}
