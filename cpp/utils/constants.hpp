#pragma once

/**
 * System-wide constants
 *
 * Defaults for the trade ingest service. Every value here can be
 * overridden from the INI file or the environment (see IngestConfig).
 */

namespace constants {

// Timeouts (in milliseconds unless otherwise specified)
namespace timeout {
    constexpr int DEFAULT_HTTP_MS = 10000;                // 10 seconds
    constexpr int CONNECTION_TIMEOUT_MS = 10000;          // 10 seconds
    constexpr int READ_TIMEOUT_MS = 60000;                // no frame for 60s => reconnect
    constexpr int PING_INTERVAL_SECONDS = 20;
    constexpr int STARTUP_DISCOVERY_SECONDS = 30;         // wait for first pair refresh
}

// Reconnect backoff
namespace retry {
    constexpr int DEFAULT_MAX_RETRIES = 10;
    constexpr int BACKOFF_BASE_MS = 1000;                 // 1 second
    constexpr int BACKOFF_MAX_MS = 60000;                 // 60 seconds
    constexpr double BACKOFF_JITTER_FRACTION = 0.1;
    constexpr int RATE_LIMIT_RETRIES = 2;                 // ranking source HTTP 429
    constexpr int RATE_LIMIT_DELAY_MS = 2000;
}

// Ingestion
namespace ingest {
    constexpr int PAIRS_PER_CONNECTION = 50;
    constexpr int RAW_PAYLOAD_MAX_BYTES = 512;
    constexpr const char* EXCHANGE_NAME = "binance";
}

// Pair discovery
namespace discovery {
    constexpr int REFRESH_INTERVAL_SECONDS = 3600;        // hourly
    constexpr int RANKING_TOP_N = 100;
    constexpr int PAIR_LIMIT = 200;
    constexpr const char* DEFAULT_QUOTE_ASSET = "USDT";
    constexpr const char* DEFAULT_FALLBACK_PAIRS = "BTCUSDT,ETHUSDT,BNBUSDT,SOLUSDT,XRPUSDT";
    constexpr const char* TRADING_STATUS = "TRADING";
}

// Append-log broker
namespace stream {
    constexpr const char* DEFAULT_REDIS_URL = "redis://localhost:6379/0";
    constexpr const char* KEY_PREFIX = "trades";
    constexpr long long MAX_STREAM_LENGTH = 10000;
    constexpr int RECONNECT_COOLDOWN_BASE_MS = 500;      // first wait after a failed connect
    constexpr int RECONNECT_COOLDOWN_MAX_MS = 30000;
}

// ZMQ trade tap
namespace zmq {
    constexpr int DEFAULT_HWM = 1000;                     // High water mark
    constexpr const char* DEFAULT_ENDPOINT = "tcp://*:5556";
    constexpr const char* TOPIC_PREFIX = "trades.";
}

// Exchange-specific defaults
namespace exchange {
    namespace binance {
        constexpr const char* DEFAULT_WS_URL = "wss://stream.binance.com:9443";
        constexpr const char* DEFAULT_HTTP_URL = "https://api.binance.com";
        constexpr const char* EXCHANGE_INFO_PATH = "/api/v3/exchangeInfo";
    }

    namespace coingecko {
        constexpr const char* DEFAULT_HTTP_URL = "https://api.coingecko.com/api/v3";
        constexpr const char* API_KEY_HEADER = "x-cg-pro-api-key";
    }
}

// Health and stats surface
namespace health {
    constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
    constexpr int DEFAULT_PORT = 8080;
    constexpr int PAIRS_SAMPLE_SIZE = 10;
}

} // namespace constants
