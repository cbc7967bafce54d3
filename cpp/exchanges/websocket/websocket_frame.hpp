#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace websocket_transport {

// One RFC 6455 frame, payload already unmasked
struct WebSocketFrame {
    static constexpr uint8_t OPCODE_CONTINUATION = 0x0;
    static constexpr uint8_t OPCODE_TEXT = 0x1;
    static constexpr uint8_t OPCODE_BINARY = 0x2;
    static constexpr uint8_t OPCODE_CLOSE = 0x8;
    static constexpr uint8_t OPCODE_PING = 0x9;
    static constexpr uint8_t OPCODE_PONG = 0xA;

    bool fin{true};
    uint8_t opcode{OPCODE_TEXT};
    std::string payload;

    bool is_control() const { return (opcode & 0x8) != 0; }
};

/**
 * Incremental frame decoder
 *
 * Bytes are fed as they arrive from the socket; next() pops complete
 * frames. Frames larger than max_payload are a protocol error.
 */
class WebSocketFrameParser {
public:
    enum class Result {
        NEED_MORE,
        FRAME,
        PROTOCOL_ERROR
    };

    explicit WebSocketFrameParser(size_t max_payload = 16 * 1024 * 1024)
        : max_payload_(max_payload) {}

    void feed(const char* data, size_t size);
    Result next(WebSocketFrame& frame, std::string& error);
    size_t buffered() const { return buffer_.size() - offset_; }

private:
    std::string buffer_;
    size_t offset_{0};
    size_t max_payload_;
};

// Client frames are always masked with the given 4-byte key
std::string encode_frame(uint8_t opcode, const std::string& payload, const uint8_t mask_key[4], bool fin = true);

// Sec-WebSocket-Accept value for a Sec-WebSocket-Key
std::string compute_accept_key(const std::string& websocket_key);

std::string base64_encode(const unsigned char* data, size_t size);

struct WebSocketUrl {
    bool secure{false};
    std::string host;
    int port{0};
    std::string target{"/"};     // path + query
};

// ws://host[:port][/path] or wss://...; false on anything else
bool parse_websocket_url(const std::string& url, WebSocketUrl& out);

} // namespace websocket_transport
