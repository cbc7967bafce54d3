#pragma once
#include "logger.hpp"

/**
 * Component-tagged logging macros
 * Usage: LOG_INFO_COMP("INGEST_CLIENT", "connection 3 streaming 50 pairs")
 *
 * Component tags used by the service:
 *   TRADE_INGEST, APP_SERVICE, CONFIG, PAIR_DISCOVERY, INGEST_CLIENT,
 *   STREAM_PUBLISHER, REDIS, HEALTH, HTTP_SERVER, WS_TRANSPORT,
 *   BINANCE_FETCHER, BINANCE_NORMALIZER, COINGECKO, ZMQ_PUBLISHER, STATS
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define LOG_COMP_AT(level, component, msg) \
    do { \
        if ((level) >= logging::LogManager::get_instance().get_level()) { \
            logging::Logger(component).log(level, msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP(component, msg) LOG_COMP_AT(logging::LogLevel::DEBUG, component, msg)
#define LOG_INFO_COMP(component, msg) LOG_COMP_AT(logging::LogLevel::INFO, component, msg)
#define LOG_WARN_COMP(component, msg) LOG_COMP_AT(logging::LogLevel::WARN, component, msg)
#define LOG_ERROR_COMP(component, msg) LOG_COMP_AT(logging::LogLevel::ERROR, component, msg)
