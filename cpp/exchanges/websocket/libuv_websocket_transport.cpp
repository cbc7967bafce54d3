#include "libuv_websocket_transport.hpp"
#include "../../utils/error_handling.hpp"
#include "../../utils/logging/log_helper.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/x509v3.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <sstream>

namespace websocket_transport {

namespace {

const char* kComponent = "WS_TRANSPORT";
const size_t kMaxUpgradeResponseBytes = 16384;

uint64_t now_us() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown TLS error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

LibuvWebSocketTransport::LibuvWebSocketTransport() = default;

LibuvWebSocketTransport::~LibuvWebSocketTransport() {
    if (loop_initialized_) {
        close_handles();
        // Let every close and cancel callback fire before the memory goes away
        uv_run(&loop_, UV_RUN_DEFAULT);
        int rc = uv_loop_close(&loop_);
        if (rc != 0) {
            LOG_WARN_COMP(kComponent, std::string("uv_loop_close: ") + uv_strerror(rc));
        }
        loop_initialized_ = false;
    }
    if (ssl_) {
        SSL_free(ssl_);     // owns rbio_ and wbio_
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

bool LibuvWebSocketTransport::connect(const std::string& url) {
    if (phase_ != Phase::IDLE) {
        set_last_error("transport already used for a connection");
        return false;
    }
    if (!parse_websocket_url(url, url_)) {
        set_last_error("invalid WebSocket URL: " + url);
        state_.store(WebSocketState::ERROR);
        return false;
    }
    if (stop_requested_.load()) {
        set_last_error("stopped before connect");
        return false;
    }
    if (!init_loop()) {
        state_.store(WebSocketState::ERROR);
        return false;
    }

    state_.store(WebSocketState::CONNECTING);

    if (url_.secure && !init_tls()) {
        fail(-1, get_last_error());
    } else {
        phase_ = Phase::RESOLVING;
        arm_timeout(timeout_seconds_);

        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        std::string port = std::to_string(url_.port);

        resolver_.data = this;
        int rc = uv_getaddrinfo(&loop_, &resolver_, on_resolved, url_.host.c_str(), port.c_str(), &hints);
        if (rc != 0) {
            fail(rc, "resolve " + url_.host + " failed: " + uv_strerror(rc));
        } else {
            resolver_pending_ = true;
        }
    }

    loop_running_.store(true);
    while (!connect_done_) {
        if (uv_run(&loop_, UV_RUN_ONCE) == 0 && !connect_done_) {
            set_last_error("event loop drained before connect completed");
            finish_connect(false);
        }
    }
    loop_running_.store(false);

    if (!connect_ok_) {
        close_handles();
        uv_run(&loop_, UV_RUN_DEFAULT);
        return false;
    }
    return true;
}

void LibuvWebSocketTransport::disconnect() {
    stop_event_loop();
}

bool LibuvWebSocketTransport::is_connected() const {
    return state_.load() == WebSocketState::CONNECTED;
}

WebSocketState LibuvWebSocketTransport::get_state() const {
    return state_.load();
}

std::string LibuvWebSocketTransport::get_last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

bool LibuvWebSocketTransport::send_message(const std::string& message) {
    uint8_t mask_key[4];
    if (RAND_bytes(mask_key, sizeof(mask_key)) != 1) {
        return false;
    }
    std::string frame = encode_frame(WebSocketFrame::OPCODE_TEXT, message, mask_key);

    std::lock_guard<std::mutex> lock(async_mutex_);
    if (!async_open_ || state_.load() != WebSocketState::CONNECTED) {
        return false;
    }
    outbox_.push_back(std::move(frame));
    uv_async_send(&async_);
    return true;
}

bool LibuvWebSocketTransport::send_ping() {
    std::lock_guard<std::mutex> lock(async_mutex_);
    if (!async_open_ || state_.load() != WebSocketState::CONNECTED) {
        return false;
    }
    ping_requested_ = true;
    uv_async_send(&async_);
    return true;
}

void LibuvWebSocketTransport::set_message_callback(WebSocketMessageCallback callback) {
    message_callback_ = std::move(callback);
}

void LibuvWebSocketTransport::set_error_callback(WebSocketErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void LibuvWebSocketTransport::set_ping_interval(int seconds) {
    ping_interval_seconds_ = seconds;
}

void LibuvWebSocketTransport::set_timeout(int seconds) {
    timeout_seconds_ = seconds;
}

void LibuvWebSocketTransport::set_read_timeout(int seconds) {
    read_timeout_seconds_ = seconds;
}

void LibuvWebSocketTransport::run_event_loop() {
    if (!loop_initialized_ || phase_ != Phase::OPEN) {
        return;
    }
    loop_running_.store(true);
    uv_run(&loop_, UV_RUN_DEFAULT);
    loop_running_.store(false);

    WebSocketState expected = WebSocketState::CONNECTED;
    state_.compare_exchange_strong(expected, WebSocketState::DISCONNECTED);
    expected = WebSocketState::DISCONNECTING;
    state_.compare_exchange_strong(expected, WebSocketState::DISCONNECTED);
}

void LibuvWebSocketTransport::stop_event_loop() {
    stop_requested_.store(true);
    std::lock_guard<std::mutex> lock(async_mutex_);
    if (async_open_) {
        uv_async_send(&async_);
    }
}

bool LibuvWebSocketTransport::is_event_loop_running() const {
    return loop_running_.load();
}

// ---------------------------------------------------------------------------
// libuv callbacks

void LibuvWebSocketTransport::on_resolved(uv_getaddrinfo_t* req, int status, struct addrinfo* res) {
    auto* self = static_cast<LibuvWebSocketTransport*>(req->data);
    self->resolver_pending_ = false;

    if (self->closing_) {
        if (res) uv_freeaddrinfo(res);
        return;
    }
    if (status < 0 || !res) {
        if (res) uv_freeaddrinfo(res);
        self->fail(status, "resolve " + self->url_.host + " failed: " + uv_strerror(status));
        return;
    }

    uv_tcp_init(&self->loop_, &self->tcp_);
    self->tcp_initialized_ = true;
    self->tcp_.data = self;
    uv_tcp_nodelay(&self->tcp_, 1);

    self->phase_ = Phase::TCP_CONNECTING;
    self->connect_req_.data = self;
    int rc = uv_tcp_connect(&self->connect_req_, &self->tcp_, res->ai_addr, on_tcp_connect);
    uv_freeaddrinfo(res);
    if (rc != 0) {
        self->fail(rc, "connect to " + self->url_.host + " failed: " + uv_strerror(rc));
    }
}

void LibuvWebSocketTransport::on_tcp_connect(uv_connect_t* req, int status) {
    auto* self = static_cast<LibuvWebSocketTransport*>(req->data);
    if (self->closing_) {
        return;
    }
    if (status < 0) {
        self->fail(status, "connect to " + self->url_.host + " failed: " + uv_strerror(status));
        return;
    }

    int rc = uv_read_start(reinterpret_cast<uv_stream_t*>(&self->tcp_), on_alloc, on_tcp_read);
    if (rc != 0) {
        self->fail(rc, std::string("read start failed: ") + uv_strerror(rc));
        return;
    }

    if (self->url_.secure) {
        self->start_tls_handshake();
    } else {
        self->send_upgrade_request();
    }
}

void LibuvWebSocketTransport::on_alloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf) {
    (void)suggested_size;
    auto* self = static_cast<LibuvWebSocketTransport*>(handle->data);
    buf->base = self->read_buffer_.data();
    buf->len = self->read_buffer_.size();
}

void LibuvWebSocketTransport::on_tcp_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* self = static_cast<LibuvWebSocketTransport*>(stream->data);
    if (self->closing_) {
        return;
    }
    if (nread < 0) {
        int code = static_cast<int>(nread);
        self->fail(code, code == UV_EOF ? std::string("connection closed by peer")
                                        : std::string("read failed: ") + uv_strerror(code));
        return;
    }
    if (nread == 0) {
        return;
    }

    if (self->phase_ == Phase::OPEN) {
        self->arm_timeout(self->read_timeout_seconds_);
    }

    if (self->url_.secure) {
        self->handle_ciphertext(buf->base, static_cast<size_t>(nread));
    } else {
        self->handle_plaintext(buf->base, static_cast<size_t>(nread));
    }
}

void LibuvWebSocketTransport::on_tcp_write(uv_write_t* req, int status) {
    std::unique_ptr<WriteRequest> request(static_cast<WriteRequest*>(req->data));
    LibuvWebSocketTransport* self = request->owner;
    if (status < 0 && status != UV_ECANCELED && !self->closing_) {
        self->fail(status, std::string("write failed: ") + uv_strerror(status));
    }
}

void LibuvWebSocketTransport::on_ping_timer(uv_timer_t* timer) {
    auto* self = static_cast<LibuvWebSocketTransport*>(timer->data);
    if (self->phase_ == Phase::OPEN && !self->closing_) {
        self->write_frame(WebSocketFrame::OPCODE_PING, "");
    }
}

void LibuvWebSocketTransport::on_timeout_timer(uv_timer_t* timer) {
    auto* self = static_cast<LibuvWebSocketTransport*>(timer->data);
    if (self->closing_) {
        return;
    }
    if (!self->connect_done_) {
        self->fail(UV_ETIMEDOUT, "connect to " + self->url_.host + " timed out after " +
                                     std::to_string(self->timeout_seconds_) + "s");
    } else if (self->phase_ == Phase::OPEN) {
        self->fail(UV_ETIMEDOUT, "no data received for " + std::to_string(self->read_timeout_seconds_) + "s");
    }
}

void LibuvWebSocketTransport::on_async(uv_async_t* handle) {
    auto* self = static_cast<LibuvWebSocketTransport*>(handle->data);
    if (self->closing_) {
        return;
    }

    if (self->stop_requested_.load()) {
        if (!self->connect_done_) {
            self->set_last_error("stopped while connecting");
            self->finish_connect(false);
        }
        if (self->phase_ == Phase::OPEN && !self->close_sent_) {
            // 1000 normal closure
            self->write_frame(WebSocketFrame::OPCODE_CLOSE, std::string("\x03\xe8", 2));
            self->close_sent_ = true;
        }
        self->state_.store(WebSocketState::DISCONNECTING);
        self->close_handles();
        return;
    }

    self->drain_outbox();
}

// ---------------------------------------------------------------------------
// Loop-thread internals

bool LibuvWebSocketTransport::init_loop() {
    int rc = uv_loop_init(&loop_);
    if (rc != 0) {
        set_last_error(std::string("uv_loop_init failed: ") + uv_strerror(rc));
        return false;
    }
    loop_initialized_ = true;

    uv_timer_init(&loop_, &ping_timer_);
    ping_timer_.data = this;
    uv_timer_init(&loop_, &timeout_timer_);
    timeout_timer_.data = this;

    rc = uv_async_init(&loop_, &async_, on_async);
    if (rc != 0) {
        set_last_error(std::string("uv_async_init failed: ") + uv_strerror(rc));
        close_handles();
        uv_run(&loop_, UV_RUN_DEFAULT);
        return false;
    }
    async_.data = this;

    std::lock_guard<std::mutex> lock(async_mutex_);
    async_open_ = true;
    // A stop that raced with startup found no handle to signal
    if (stop_requested_.load()) {
        uv_async_send(&async_);
    }
    return true;
}

bool LibuvWebSocketTransport::init_tls() {
    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        set_last_error("SSL_CTX_new failed: " + openssl_error_string());
        return false;
    }
    SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);

    if (verify_peer_) {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
            LOG_WARN_COMP(kComponent, "Could not load default CA paths: " + openssl_error_string());
        }
    } else {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
    }

    ssl_ = SSL_new(ssl_ctx_);
    if (!ssl_) {
        set_last_error("SSL_new failed: " + openssl_error_string());
        return false;
    }

    rbio_ = BIO_new(BIO_s_mem());
    wbio_ = BIO_new(BIO_s_mem());
    if (!rbio_ || !wbio_) {
        BIO_free(rbio_);
        BIO_free(wbio_);
        rbio_ = wbio_ = nullptr;
        set_last_error("BIO allocation failed");
        return false;
    }
    SSL_set_bio(ssl_, rbio_, wbio_);
    SSL_set_connect_state(ssl_);

    if (SSL_set_tlsext_host_name(ssl_, url_.host.c_str()) != 1) {
        set_last_error("failed to set SNI host: " + openssl_error_string());
        return false;
    }
    if (verify_peer_ && SSL_set1_host(ssl_, url_.host.c_str()) != 1) {
        set_last_error("failed to set verification host: " + openssl_error_string());
        return false;
    }
    return true;
}

void LibuvWebSocketTransport::start_tls_handshake() {
    phase_ = Phase::TLS_HANDSHAKE;
    continue_tls_handshake();
}

void LibuvWebSocketTransport::continue_tls_handshake() {
    ERR_clear_error();
    int rc = SSL_do_handshake(ssl_);
    flush_tls_output();
    if (closing_) {
        return;
    }
    if (rc == 1) {
        send_upgrade_request();
        return;
    }

    int err = SSL_get_error(ssl_, rc);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return;
    }

    long verify = SSL_get_verify_result(ssl_);
    std::string reason = verify != X509_V_OK ? X509_verify_cert_error_string(verify) : openssl_error_string();
    fail(-1, "TLS handshake with " + url_.host + " failed: " + reason);
}

void LibuvWebSocketTransport::send_upgrade_request() {
    phase_ = Phase::UPGRADE;

    unsigned char key[16];
    if (RAND_bytes(key, sizeof(key)) != 1) {
        fail(-1, "failed to generate Sec-WebSocket-Key");
        return;
    }
    websocket_key_ = base64_encode(key, sizeof(key));

    bool default_port = (url_.secure && url_.port == 443) || (!url_.secure && url_.port == 80);

    std::ostringstream request;
    request << "GET " << url_.target << " HTTP/1.1\r\n";
    request << "Host: " << url_.host;
    if (!default_port) {
        request << ":" << url_.port;
    }
    request << "\r\n";
    request << "Upgrade: websocket\r\n";
    request << "Connection: Upgrade\r\n";
    request << "Sec-WebSocket-Key: " << websocket_key_ << "\r\n";
    request << "Sec-WebSocket-Version: 13\r\n";
    request << "User-Agent: trade-ingest/1.0\r\n";
    request << "\r\n";

    write_plain(request.str());
}

void LibuvWebSocketTransport::handle_ciphertext(const char* data, size_t size) {
    if (BIO_write(rbio_, data, static_cast<int>(size)) <= 0) {
        fail(-1, "failed to buffer TLS input");
        return;
    }

    if (phase_ == Phase::TLS_HANDSHAKE) {
        continue_tls_handshake();
        if (closing_ || phase_ == Phase::TLS_HANDSHAKE) {
            return;
        }
    }

    char plain[16384];
    while (!closing_) {
        ERR_clear_error();
        int n = SSL_read(ssl_, plain, sizeof(plain));
        if (n > 0) {
            handle_plaintext(plain, static_cast<size_t>(n));
            continue;
        }
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            break;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            fail(0, "TLS session closed by peer");
        } else {
            fail(-1, "TLS read failed: " + openssl_error_string());
        }
        return;
    }
    if (!closing_) {
        flush_tls_output();
    }
}

void LibuvWebSocketTransport::handle_plaintext(const char* data, size_t size) {
    switch (phase_) {
        case Phase::UPGRADE:
            handle_upgrade_response(data, size);
            break;
        case Phase::OPEN:
            parser_.feed(data, size);
            process_frames();
            break;
        default:
            break;
    }
}

void LibuvWebSocketTransport::handle_upgrade_response(const char* data, size_t size) {
    upgrade_buffer_.append(data, size);
    size_t end = upgrade_buffer_.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (upgrade_buffer_.size() > kMaxUpgradeResponseBytes) {
            fail(-1, "upgrade response too large");
        }
        return;
    }

    std::string head = upgrade_buffer_.substr(0, end);
    std::string rest = upgrade_buffer_.substr(end + 4);
    upgrade_buffer_.clear();

    std::istringstream lines(head);
    std::string status_line;
    std::getline(lines, status_line);
    status_line = trim(status_line);
    if (status_line.size() < 12 || status_line.compare(0, 5, "HTTP/") != 0 ||
        status_line.find(" 101") == std::string::npos) {
        fail(-1, "upgrade rejected: " + status_line);
        return;
    }

    std::map<std::string, std::string> headers;
    std::string line;
    while (std::getline(lines, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (to_lower(headers["upgrade"]) != "websocket") {
        fail(-1, "upgrade response missing 'Upgrade: websocket'");
        return;
    }
    if (headers["sec-websocket-accept"] != compute_accept_key(websocket_key_)) {
        fail(-1, "Sec-WebSocket-Accept mismatch");
        return;
    }

    phase_ = Phase::OPEN;
    finish_connect(true);
    arm_timeout(read_timeout_seconds_);
    if (ping_interval_seconds_ > 0) {
        uint64_t interval_ms = static_cast<uint64_t>(ping_interval_seconds_) * 1000;
        uv_timer_start(&ping_timer_, on_ping_timer, interval_ms, interval_ms);
    }
    LOG_DEBUG_COMP(kComponent, "WebSocket open to " + url_.host + ":" + std::to_string(url_.port));

    if (!rest.empty()) {
        parser_.feed(rest.data(), rest.size());
        process_frames();
    }
}

void LibuvWebSocketTransport::process_frames() {
    WebSocketFrame frame;
    std::string error;
    while (!closing_) {
        auto result = parser_.next(frame, error);
        if (result == WebSocketFrameParser::Result::NEED_MORE) {
            return;
        }
        if (result == WebSocketFrameParser::Result::PROTOCOL_ERROR) {
            fail(-1, "protocol error: " + error);
            return;
        }
        handle_frame(frame);
    }
}

void LibuvWebSocketTransport::handle_frame(const WebSocketFrame& frame) {
    switch (frame.opcode) {
        case WebSocketFrame::OPCODE_TEXT:
        case WebSocketFrame::OPCODE_BINARY:
            if (in_fragment_) {
                fail(-1, "protocol error: data frame inside a fragmented message");
                return;
            }
            if (frame.fin) {
                deliver_message(frame.payload, frame.opcode == WebSocketFrame::OPCODE_BINARY);
            } else {
                in_fragment_ = true;
                fragment_binary_ = frame.opcode == WebSocketFrame::OPCODE_BINARY;
                fragment_buffer_ = frame.payload;
            }
            break;

        case WebSocketFrame::OPCODE_CONTINUATION:
            if (!in_fragment_) {
                fail(-1, "protocol error: continuation without a started message");
                return;
            }
            fragment_buffer_ += frame.payload;
            if (frame.fin) {
                in_fragment_ = false;
                std::string message;
                message.swap(fragment_buffer_);
                deliver_message(std::move(message), fragment_binary_);
            }
            break;

        case WebSocketFrame::OPCODE_PING:
            write_frame(WebSocketFrame::OPCODE_PONG, frame.payload);
            break;

        case WebSocketFrame::OPCODE_PONG:
            break;

        case WebSocketFrame::OPCODE_CLOSE: {
            int code = 1005;
            std::string reason;
            if (frame.payload.size() >= 2) {
                code = (static_cast<uint8_t>(frame.payload[0]) << 8) | static_cast<uint8_t>(frame.payload[1]);
                reason = frame.payload.substr(2);
            }
            if (!close_sent_) {
                write_frame(WebSocketFrame::OPCODE_CLOSE, frame.payload.substr(0, 2));
                close_sent_ = true;
            }
            set_last_error("closed by server (code " + std::to_string(code) +
                           (reason.empty() ? std::string(")") : "): " + reason));
            LOG_INFO_COMP(kComponent, "Server closed " + url_.host + " with code " + std::to_string(code));
            state_.store(WebSocketState::DISCONNECTED);
            close_handles();
            break;
        }

        default:
            break;
    }
}

void LibuvWebSocketTransport::deliver_message(std::string data, bool binary) {
    WebSocketMessage message;
    message.data = std::move(data);
    message.is_binary = binary;
    message.timestamp_us = now_us();
    error_handling::safe_callback(message_callback_, kComponent, "message", message);
}

void LibuvWebSocketTransport::write_frame(uint8_t opcode, const std::string& payload) {
    uint8_t mask_key[4];
    if (RAND_bytes(mask_key, sizeof(mask_key)) != 1) {
        fail(-1, "failed to generate frame mask");
        return;
    }
    write_plain(encode_frame(opcode, payload, mask_key));
}

void LibuvWebSocketTransport::write_plain(const std::string& data) {
    if (closing_) {
        return;
    }
    if (!url_.secure) {
        write_raw(data);
        return;
    }

    ERR_clear_error();
    int n = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
    if (n <= 0) {
        fail(-1, "TLS write failed: " + openssl_error_string());
        return;
    }
    flush_tls_output();
}

void LibuvWebSocketTransport::write_raw(std::string data) {
    if (!tcp_initialized_ || closing_ || data.empty()) {
        return;
    }

    auto* request = new WriteRequest();
    request->owner = this;
    request->data = std::move(data);
    request->req.data = request;

    uv_buf_t buf = uv_buf_init(&request->data[0], static_cast<unsigned int>(request->data.size()));
    int rc = uv_write(&request->req, reinterpret_cast<uv_stream_t*>(&tcp_), &buf, 1, on_tcp_write);
    if (rc != 0) {
        delete request;
        fail(rc, std::string("write failed: ") + uv_strerror(rc));
    }
}

void LibuvWebSocketTransport::flush_tls_output() {
    size_t pending = 0;
    while (!closing_ && (pending = BIO_ctrl_pending(wbio_)) > 0) {
        std::string out(pending, '\0');
        int n = BIO_read(wbio_, &out[0], static_cast<int>(pending));
        if (n <= 0) {
            break;
        }
        out.resize(static_cast<size_t>(n));
        write_raw(std::move(out));
    }
}

void LibuvWebSocketTransport::drain_outbox() {
    std::deque<std::string> pending;
    bool ping = false;
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        pending.swap(outbox_);
        ping = ping_requested_;
        ping_requested_ = false;
    }
    if (phase_ != Phase::OPEN) {
        return;
    }
    for (const auto& frame : pending) {
        write_plain(frame);
    }
    if (ping) {
        write_frame(WebSocketFrame::OPCODE_PING, "");
    }
}

void LibuvWebSocketTransport::arm_timeout(int seconds) {
    if (seconds <= 0) {
        uv_timer_stop(&timeout_timer_);
        return;
    }
    uv_timer_start(&timeout_timer_, on_timeout_timer, static_cast<uint64_t>(seconds) * 1000, 0);
}

void LibuvWebSocketTransport::finish_connect(bool ok) {
    connect_done_ = true;
    connect_ok_ = ok;
    if (ok) {
        state_.store(WebSocketState::CONNECTED);
    } else if (stop_requested_.load()) {
        state_.store(WebSocketState::DISCONNECTED);
    } else {
        state_.store(WebSocketState::ERROR);
    }
}

void LibuvWebSocketTransport::fail(int code, const std::string& error) {
    if (closing_) {
        return;
    }
    set_last_error(error);
    LOG_WARN_COMP(kComponent, error);

    if (!connect_done_) {
        finish_connect(false);
    } else {
        state_.store(WebSocketState::ERROR);
    }
    error_handling::safe_callback(error_callback_, kComponent, "error", code, error);
    close_handles();
}

void LibuvWebSocketTransport::close_handles() {
    if (closing_ || !loop_initialized_) {
        return;
    }
    closing_ = true;
    phase_ = Phase::CLOSED;

    if (resolver_pending_) {
        uv_cancel(reinterpret_cast<uv_req_t*>(&resolver_));
    }

    uv_timer_stop(&ping_timer_);
    uv_timer_stop(&timeout_timer_);
    if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&ping_timer_))) {
        uv_close(reinterpret_cast<uv_handle_t*>(&ping_timer_), nullptr);
    }
    if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&timeout_timer_))) {
        uv_close(reinterpret_cast<uv_handle_t*>(&timeout_timer_), nullptr);
    }

    if (tcp_initialized_ && !uv_is_closing(reinterpret_cast<uv_handle_t*>(&tcp_))) {
        uv_read_stop(reinterpret_cast<uv_stream_t*>(&tcp_));
        uv_close(reinterpret_cast<uv_handle_t*>(&tcp_), nullptr);
    }

    std::lock_guard<std::mutex> lock(async_mutex_);
    if (async_open_) {
        async_open_ = false;
        outbox_.clear();
        uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
    }
}

void LibuvWebSocketTransport::set_last_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

} // namespace websocket_transport
