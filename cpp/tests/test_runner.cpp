#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"
#include <chrono>
#include <iostream>
#include <thread>

// Include all test files

// Unit tests - Core utilities
#include "unit/config/test_process_config_manager.cpp"
#include "unit/utils/test_logger.cpp"
#include "unit/utils/test_app_service.cpp"
#include "unit/utils/test_resilience.cpp"
#include "unit/utils/test_zmq_publisher.cpp"
#include "unit/utils/test_redis_stream_client.cpp"

// Unit tests - Exchange and ranking sources
#include "unit/exchanges/test_websocket_frame.cpp"
#include "unit/exchanges/test_binance_trade_normalizer.cpp"
#include "unit/exchanges/test_binance_data_fetcher.cpp"
#include "unit/ranking/test_coingecko_ranking_source.cpp"

// Unit tests - Ingest pipeline
#include "unit/trade_ingest/test_ingest_config.cpp"
#include "unit/trade_ingest/test_stream_publisher.cpp"
#include "unit/trade_ingest/test_pair_discovery.cpp"
#include "unit/trade_ingest/test_ingest_client.cpp"
#include "unit/trade_ingest/test_health_service.cpp"

// Integration tests
#include "integration/test_ingest_pipeline.cpp"

// Add timeout to prevent hanging
int main(int argc, char** argv) {
    // Set a timeout for the entire test suite
    std::thread timeout_thread([]() {
        std::this_thread::sleep_for(std::chrono::seconds(120));
        std::cout << "\n[TEST_RUNNER] Timeout reached, forcing exit..." << std::endl;
        std::exit(1);
    });
    timeout_thread.detach();
    
    return doctest::Context(argc, argv).run();
}
