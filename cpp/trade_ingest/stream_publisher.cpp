#include "stream_publisher.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace trade_ingest {

namespace {
const char* kComponent = "STREAM_PUBLISHER";

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
}

StreamPublisher::StreamPublisher(std::shared_ptr<redis::IStreamClient> client, long long max_length, bool exact_trim)
    : client_(std::move(client))
    , max_length_(max_length)
    , exact_trim_(exact_trim) {
}

StreamPublisher::~StreamPublisher() {
    disconnect();
}

bool StreamPublisher::connect() {
    if (!client_) {
        LOG_ERROR_COMP(kComponent, "No stream client configured");
        return false;
    }
    initialized_.store(true);
    bool connected = client_->connect();
    if (connected) {
        LOG_INFO_COMP(kComponent, "Connected to " + client_->describe() +
                      " (MAXLEN " + std::string(exact_trim_ ? "" : "~ ") + std::to_string(max_length_) + ")");
    } else {
        LOG_ERROR_COMP(kComponent, "Initial connect to " + client_->describe() +
                       " failed; will retry on next publish");
    }
    return connected;
}

void StreamPublisher::disconnect() {
    if (!initialized_.exchange(false)) {
        return;
    }
    if (client_) {
        client_->disconnect();
    }
    LOG_INFO_COMP(kComponent, "Disconnected");
}

bool StreamPublisher::is_healthy() {
    if (!initialized_.load() || !client_) {
        return false;
    }
    return client_->ping();
}

bool StreamPublisher::publish(const std::string& pair, const StreamRecord& record) {
    if (!initialized_.load() || !client_) {
        error_count_.increment();
        return false;
    }

    StreamRecord fields = record;
    bool has_timestamp = std::any_of(fields.begin(), fields.end(),
                                     [](const auto& field) { return field.first == "timestamp"; });
    if (!has_timestamp) {
        fields.emplace_back("timestamp", format_iso8601(now_ms()));
    }

    auto result = client_->xadd(stream_key(pair), fields, max_length_, !exact_trim_);
    if (result.is_error()) {
        error_count_.increment();
        LOG_WARN_COMP(kComponent, "XADD " + stream_key(pair) + " failed: " + result.error());
        return false;
    }

    publish_count_.increment();
    return true;
}

bool StreamPublisher::publish_trade(const ingest::proto::NormalizedTrade& trade) {
    return publish(trade.pair(), to_stream_record(trade));
}

StreamPublisher::Stats StreamPublisher::get_stats() const {
    Stats stats;
    stats.publish_count = publish_count_.get();
    stats.error_count = error_count_.get();
    int64_t attempts = stats.publish_count + stats.error_count;
    stats.error_rate = attempts > 0 ? static_cast<double>(stats.error_count) / static_cast<double>(attempts) : 0.0;
    return stats;
}

std::string StreamPublisher::stream_key(const std::string& pair) {
    std::string upper = pair;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::string(constants::stream::KEY_PREFIX) + ":" + upper;
}

StreamRecord StreamPublisher::to_stream_record(const ingest::proto::NormalizedTrade& trade) {
    StreamRecord record;
    record.reserve(10);
    record.emplace_back("exchange", trade.exchange());
    record.emplace_back("pair", trade.pair());
    record.emplace_back("price", trade.price());
    record.emplace_back("quantity", trade.quantity());
    record.emplace_back("timestamp", format_iso8601(trade.timestamp_ms()));
    record.emplace_back("timestamp_ms", std::to_string(trade.timestamp_ms()));
    record.emplace_back("side", side_name(trade.side()));
    record.emplace_back("trade_id", trade.trade_id());
    record.emplace_back("raw", trade.raw_payload());
    record.emplace_back("ingested_at", format_iso8601(trade.ingested_at_ms()));
    return record;
}

std::string StreamPublisher::format_iso8601(int64_t epoch_ms) {
    int64_t seconds = epoch_ms / 1000;
    int millis = static_cast<int>(epoch_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

const char* StreamPublisher::side_name(ingest::proto::TradeSide side) {
    switch (side) {
        case ingest::proto::BUY: return "buy";
        case ingest::proto::SELL: return "sell";
        default: return "unknown";
    }
}

} // namespace trade_ingest
