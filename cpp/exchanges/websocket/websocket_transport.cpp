#include "websocket_transport.hpp"
#include "libuv_websocket_transport.hpp"

namespace websocket_transport {

std::unique_ptr<IWebSocketTransport> WebSocketTransportFactory::create(bool verify_peer) {
    auto transport = std::make_unique<LibuvWebSocketTransport>();
    transport->set_verify_peer(verify_peer);
    return transport;
}

WebSocketTransportFactoryFn WebSocketTransportFactory::make_factory(bool verify_peer) {
    return [verify_peer]() { return create(verify_peer); };
}

} // namespace websocket_transport
