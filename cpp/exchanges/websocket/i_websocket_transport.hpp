#pragma once
#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace websocket_transport {

// WebSocket message structure
struct WebSocketMessage {
    std::string data;
    bool is_binary{false};
    uint64_t timestamp_us{0};
};

// WebSocket connection states
enum class WebSocketState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DISCONNECTING,
    ERROR
};

inline const char* state_name(WebSocketState state) {
    switch (state) {
        case WebSocketState::DISCONNECTED: return "disconnected";
        case WebSocketState::CONNECTING: return "connecting";
        case WebSocketState::CONNECTED: return "connected";
        case WebSocketState::DISCONNECTING: return "disconnecting";
        case WebSocketState::ERROR: return "error";
        default: return "unknown";
    }
}

// Callback types
using WebSocketMessageCallback = std::function<void(const WebSocketMessage& message)>;
using WebSocketErrorCallback = std::function<void(int error_code, const std::string& error_message)>;

/**
 * WebSocket Transport Interface
 *
 * One instance carries one connection. connect() blocks until the
 * upgrade completes or fails; run_event_loop() then blocks on the calling
 * thread, delivering messages to the message callback on that same thread,
 * until the peer closes, the connection fails, or stop_event_loop() is
 * called from any thread.
 */
class IWebSocketTransport {
public:
    virtual ~IWebSocketTransport() = default;

    // Connection management
    virtual bool connect(const std::string& url) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    virtual WebSocketState get_state() const = 0;
    virtual std::string get_last_error() const = 0;

    // Message handling (thread-safe)
    virtual bool send_message(const std::string& message) = 0;
    virtual bool send_ping() = 0;

    // Callbacks
    virtual void set_message_callback(WebSocketMessageCallback callback) = 0;
    virtual void set_error_callback(WebSocketErrorCallback callback) = 0;

    // Configuration, before connect()
    virtual void set_ping_interval(int seconds) = 0;
    virtual void set_timeout(int seconds) = 0;          // connect + upgrade
    virtual void set_read_timeout(int seconds) = 0;     // max silence while open

    // Event loop management
    virtual void run_event_loop() = 0;
    virtual void stop_event_loop() = 0;
    virtual bool is_event_loop_running() const = 0;
};

using WebSocketTransportFactoryFn = std::function<std::unique_ptr<IWebSocketTransport>()>;

} // namespace websocket_transport
