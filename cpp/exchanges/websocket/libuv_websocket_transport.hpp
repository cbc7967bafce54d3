#pragma once
#include "i_websocket_transport.hpp"
#include "websocket_frame.hpp"
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>

#include <uv.h>
#include <openssl/ssl.h>

namespace websocket_transport {

/**
 * WebSocket client on libuv TCP with OpenSSL TLS (memory BIOs)
 *
 * Each instance owns a private uv loop that runs on whichever thread calls
 * connect() and run_event_loop(). Only stop_event_loop(), send_message()
 * and send_ping() may be called from other threads; they hand work to the
 * loop through a uv_async_t.
 */
class LibuvWebSocketTransport : public IWebSocketTransport {
public:
    LibuvWebSocketTransport();
    ~LibuvWebSocketTransport() override;

    LibuvWebSocketTransport(const LibuvWebSocketTransport&) = delete;
    LibuvWebSocketTransport& operator=(const LibuvWebSocketTransport&) = delete;

    // IWebSocketTransport interface
    bool connect(const std::string& url) override;
    void disconnect() override;
    bool is_connected() const override;
    WebSocketState get_state() const override;
    std::string get_last_error() const override;

    bool send_message(const std::string& message) override;
    bool send_ping() override;

    void set_message_callback(WebSocketMessageCallback callback) override;
    void set_error_callback(WebSocketErrorCallback callback) override;

    void set_ping_interval(int seconds) override;
    void set_timeout(int seconds) override;
    void set_read_timeout(int seconds) override;

    void run_event_loop() override;
    void stop_event_loop() override;
    bool is_event_loop_running() const override;

    void set_verify_peer(bool verify) { verify_peer_ = verify; }

private:
    enum class Phase {
        IDLE,
        RESOLVING,
        TCP_CONNECTING,
        TLS_HANDSHAKE,
        UPGRADE,
        OPEN,
        CLOSED
    };

    struct WriteRequest {
        uv_write_t req;
        LibuvWebSocketTransport* owner;
        std::string data;
    };

    // libuv callbacks
    static void on_resolved(uv_getaddrinfo_t* req, int status, struct addrinfo* res);
    static void on_tcp_connect(uv_connect_t* req, int status);
    static void on_alloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
    static void on_tcp_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void on_tcp_write(uv_write_t* req, int status);
    static void on_ping_timer(uv_timer_t* timer);
    static void on_timeout_timer(uv_timer_t* timer);
    static void on_async(uv_async_t* handle);

    // Internal methods, loop thread only
    bool init_loop();
    bool init_tls();
    void start_tls_handshake();
    void continue_tls_handshake();
    void send_upgrade_request();
    void handle_ciphertext(const char* data, size_t size);
    void handle_plaintext(const char* data, size_t size);
    void handle_upgrade_response(const char* data, size_t size);
    void process_frames();
    void handle_frame(const WebSocketFrame& frame);
    void deliver_message(std::string data, bool binary);
    void write_frame(uint8_t opcode, const std::string& payload);
    void write_plain(const std::string& data);
    void write_raw(std::string data);
    void flush_tls_output();
    void drain_outbox();
    void arm_timeout(int seconds);
    void finish_connect(bool ok);
    void fail(int code, const std::string& error);
    void close_handles();
    void set_last_error(const std::string& error);

    // Configuration
    int ping_interval_seconds_{20};
    int timeout_seconds_{10};
    int read_timeout_seconds_{60};
    bool verify_peer_{true};

    // Target
    WebSocketUrl url_;
    std::string websocket_key_;

    // libuv components
    uv_loop_t loop_;
    uv_tcp_t tcp_;
    uv_async_t async_;
    uv_timer_t ping_timer_;
    uv_timer_t timeout_timer_;
    uv_getaddrinfo_t resolver_;
    uv_connect_t connect_req_;
    bool loop_initialized_{false};
    bool tcp_initialized_{false};
    bool resolver_pending_{false};
    bool closing_{false};
    std::array<char, 65536> read_buffer_;

    // TLS
    SSL_CTX* ssl_ctx_{nullptr};
    SSL* ssl_{nullptr};
    BIO* rbio_{nullptr};   // network -> SSL
    BIO* wbio_{nullptr};   // SSL -> network

    // Protocol state
    Phase phase_{Phase::IDLE};
    std::string upgrade_buffer_;
    WebSocketFrameParser parser_;
    std::string fragment_buffer_;
    bool fragment_binary_{false};
    bool in_fragment_{false};
    bool close_sent_{false};
    bool connect_done_{false};
    bool connect_ok_{false};

    // Cross-thread state
    std::atomic<WebSocketState> state_{WebSocketState::DISCONNECTED};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> loop_running_{false};
    std::mutex async_mutex_;
    bool async_open_{false};
    std::deque<std::string> outbox_;    // encoded frames waiting for the loop
    bool ping_requested_{false};
    mutable std::mutex error_mutex_;
    std::string last_error_;

    // Callbacks
    WebSocketMessageCallback message_callback_;
    WebSocketErrorCallback error_callback_;
};

} // namespace websocket_transport
