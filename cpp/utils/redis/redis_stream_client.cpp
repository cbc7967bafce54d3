#include "redis_stream_client.hpp"
#include "../constants.hpp"
#include "../logging/log_helper.hpp"
#include <chrono>
#include <stdexcept>
#include <sys/time.h>

namespace redis {

namespace {
int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}
}

RedisStreamClient::RedisStreamClient(const std::string& url, int timeout_ms)
    : endpoint_(parse_url(url))
    , timeout_ms_(timeout_ms)
    , clock_(steady_now_ms)
    , reconnect_cooldown_(std::chrono::milliseconds(constants::stream::RECONNECT_COOLDOWN_BASE_MS),
                          std::chrono::milliseconds(constants::stream::RECONNECT_COOLDOWN_MAX_MS),
                          0.0) {
}

RedisStreamClient::~RedisStreamClient() {
    disconnect();
}

RedisEndpoint RedisStreamClient::parse_url(const std::string& url) {
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Unsupported broker URL (expected redis://): " + url);
    }

    RedisEndpoint endpoint;
    std::string rest = url.substr(scheme.size());

    size_t at_pos = rest.rfind('@');
    if (at_pos != std::string::npos) {
        std::string userinfo = rest.substr(0, at_pos);
        rest = rest.substr(at_pos + 1);
        size_t colon = userinfo.find(':');
        if (colon == std::string::npos) {
            endpoint.password = userinfo;
        } else {
            endpoint.username = userinfo.substr(0, colon);
            endpoint.password = userinfo.substr(colon + 1);
        }
    }

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        std::string db = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (!db.empty()) {
            try {
                endpoint.database = std::stoi(db);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid database index in broker URL: " + url);
            }
        }
    }

    size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            endpoint.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in broker URL: " + url);
        }
        rest = rest.substr(0, colon);
    }
    if (!rest.empty()) {
        endpoint.host = rest;
    }
    if (endpoint.port <= 0 || endpoint.port > 65535 || endpoint.database < 0) {
        throw std::invalid_argument("Broker URL out of range: " + url);
    }
    return endpoint;
}

bool RedisStreamClient::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_connect_locked();
}

void RedisStreamClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

bool RedisStreamClient::is_connected() const {
    return connected_.load();
}

void RedisStreamClient::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

int64_t RedisStreamClient::get_next_reconnect_at_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_reconnect_at_ms_;
}

bool RedisStreamClient::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected_locked()) {
        return false;
    }

    std::string error;
    ReplyPtr reply = command_locked({"PING"}, error);
    if (!reply) {
        LOG_WARN_COMP("REDIS", "PING failed: " + error);
        return false;
    }
    return reply->type == REDIS_REPLY_STATUS && std::string(reply->str, reply->len) == "PONG";
}

error_handling::Result<std::string> RedisStreamClient::xadd(const std::string& key,
                                                            const StreamFields& fields,
                                                            long long max_length,
                                                            bool approximate) {
    if (fields.empty()) {
        return error_handling::Result<std::string>::error("XADD requires at least one field");
    }

    std::vector<std::string> args;
    args.reserve(6 + fields.size() * 2);
    args.emplace_back("XADD");
    args.push_back(key);
    if (max_length > 0) {
        args.emplace_back("MAXLEN");
        if (approximate) {
            args.emplace_back("~");
        }
        args.push_back(std::to_string(max_length));
    }
    args.emplace_back("*");
    for (const auto& [field, value] : fields) {
        args.push_back(field);
        args.push_back(value);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected_locked()) {
        return error_handling::Result<std::string>::error("broker not connected");
    }

    std::string error;
    ReplyPtr reply = command_locked(args, error);
    if (!reply) {
        return error_handling::Result<std::string>::error(error);
    }
    if (reply->type != REDIS_REPLY_STRING) {
        return error_handling::Result<std::string>::error("unexpected XADD reply type " + std::to_string(reply->type));
    }
    return error_handling::Result<std::string>::success(std::string(reply->str, reply->len));
}

std::string RedisStreamClient::describe() const {
    return "redis://" + endpoint_.host + ":" + std::to_string(endpoint_.port) + "/" +
           std::to_string(endpoint_.database);
}

bool RedisStreamClient::connect_locked() {
    if (ctx_) {
        return true;
    }

    struct timeval tv;
    tv.tv_sec = timeout_ms_ / 1000;
    tv.tv_usec = (timeout_ms_ % 1000) * 1000;

    redisContext* ctx = redisConnectWithTimeout(endpoint_.host.c_str(), endpoint_.port, tv);
    if (!ctx) {
        LOG_ERROR_COMP("REDIS", "Cannot allocate redis context");
        return false;
    }
    if (ctx->err) {
        LOG_ERROR_COMP("REDIS", "Connect to " + describe() + " failed: " + std::string(ctx->errstr));
        redisFree(ctx);
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        LOG_WARN_COMP("REDIS", "Failed to set command timeout");
    }
    ctx_ = ctx;

    std::string error;
    if (!endpoint_.password.empty()) {
        std::vector<std::string> auth{"AUTH"};
        if (!endpoint_.username.empty()) {
            auth.push_back(endpoint_.username);
        }
        auth.push_back(endpoint_.password);
        ReplyPtr reply = command_locked(auth, error);
        if (!reply) {
            LOG_ERROR_COMP("REDIS", "AUTH failed: " + error);
            disconnect_locked();
            return false;
        }
    }
    if (endpoint_.database != 0) {
        ReplyPtr reply = command_locked({"SELECT", std::to_string(endpoint_.database)}, error);
        if (!reply) {
            LOG_ERROR_COMP("REDIS", "SELECT " + std::to_string(endpoint_.database) + " failed: " + error);
            disconnect_locked();
            return false;
        }
    }

    connected_.store(true);
    LOG_INFO_COMP("REDIS", "Connected to " + describe());
    return true;
}

void RedisStreamClient::disconnect_locked() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
    connected_.store(false);
}

bool RedisStreamClient::ensure_connected_locked() {
    if (ctx_) {
        return true;
    }
    if (clock_() < next_reconnect_at_ms_) {
        return false;
    }
    return attempt_connect_locked();
}

bool RedisStreamClient::attempt_connect_locked() {
    if (connect_locked()) {
        failed_connects_ = 0;
        next_reconnect_at_ms_ = 0;
        return true;
    }
    auto cooldown = reconnect_cooldown_.base_delay(failed_connects_);
    ++failed_connects_;
    next_reconnect_at_ms_ = clock_() + cooldown.count();
    LOG_WARN_COMP("REDIS", "Broker unavailable, next connect attempt in " +
                  std::to_string(cooldown.count()) + "ms");
    return false;
}

RedisStreamClient::ReplyPtr RedisStreamClient::command_locked(const std::vector<std::string>& args, std::string& error) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    void* raw = redisCommandArgv(ctx_, static_cast<int>(argv.size()), argv.data(), argvlen.data());
    ReplyPtr reply(static_cast<redisReply*>(raw));
    if (!reply) {
        // Transport failure leaves the context unusable
        error = ctx_->err ? std::string(ctx_->errstr) : "no reply";
        LOG_WARN_COMP("REDIS", "Connection lost: " + error);
        disconnect_locked();
        return nullptr;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        error = std::string(reply->str, reply->len);
        return nullptr;
    }
    return reply;
}

} // namespace redis
