#pragma once
#include "i_websocket_transport.hpp"

namespace websocket_transport {

// Transport factory
class WebSocketTransportFactory {
public:
    /**
     * Create the production transport (libuv + OpenSSL)
     * @param verify_peer Verify the server certificate on wss:// URLs
     */
    static std::unique_ptr<IWebSocketTransport> create(bool verify_peer = true);

    // Factory function suitable for IngestClient
    static WebSocketTransportFactoryFn make_factory(bool verify_peer = true);
};

} // namespace websocket_transport
