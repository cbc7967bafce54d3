#pragma once
#include "i_stream_client.hpp"
#include "../resilience/resilience.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <hiredis/hiredis.h>

namespace redis {

struct RedisEndpoint {
    std::string host{"localhost"};
    int port{6379};
    std::string username;
    std::string password;
    int database{0};
};

/**
 * hiredis-backed stream client
 *
 * A hiredis context is not thread-safe, so every command is serialized on
 * one mutex. A command that fails at the transport level drops the context;
 * the next command reconnects.
 *
 * A failed connect opens a cooldown window that doubles with each further
 * failure. Inside the window commands fail at once without touching the
 * network, so a dead broker costs callers no connect timeout.
 */
class RedisStreamClient : public IStreamClient {
public:
    // Milliseconds on any monotonic scale
    using Clock = std::function<int64_t()>;

    explicit RedisStreamClient(const std::string& url, int timeout_ms = 2000);
    ~RedisStreamClient() override;
    
    RedisStreamClient(const RedisStreamClient&) = delete;
    RedisStreamClient& operator=(const RedisStreamClient&) = delete;
    
    bool connect() override;
    void disconnect() override;
    bool is_connected() const override;
    bool ping() override;
    
    error_handling::Result<std::string> xadd(const std::string& key,
                                             const StreamFields& fields,
                                             long long max_length,
                                             bool approximate) override;
    
    std::string describe() const override;
    
    void set_clock(Clock clock);

    // Clock value before which no connect is attempted, 0 when not cooling down
    int64_t get_next_reconnect_at_ms() const;
    
    // Parses redis://[[user]:password@]host[:port][/db]; throws std::invalid_argument
    static RedisEndpoint parse_url(const std::string& url);

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const { freeReplyObject(reply); }
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;
    
    // Callers hold mutex_
    bool connect_locked();
    void disconnect_locked();
    bool ensure_connected_locked();
    bool attempt_connect_locked();
    ReplyPtr command_locked(const std::vector<std::string>& args, std::string& error);
    
    RedisEndpoint endpoint_;
    int timeout_ms_;
    
    mutable std::mutex mutex_;
    redisContext* ctx_{nullptr};
    std::atomic<bool> connected_{false};

    Clock clock_;
    resilience::ExponentialBackoff reconnect_cooldown_;
    int failed_connects_{0};
    int64_t next_reconnect_at_ms_{0};
};

} // namespace redis
