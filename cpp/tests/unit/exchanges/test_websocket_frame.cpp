#include "doctest.h"
#include "../../../exchanges/websocket/websocket_frame.hpp"

using websocket_transport::WebSocketFrame;
using websocket_transport::WebSocketFrameParser;

namespace {
// Server frames are unmasked
std::string server_frame(uint8_t opcode, const std::string& payload, bool fin = true) {
    std::string out;
    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | opcode));
    if (payload.size() < 126) {
        out.push_back(static_cast<char>(payload.size()));
    } else {
        out.push_back(static_cast<char>(126));
        out.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
        out.push_back(static_cast<char>(payload.size() & 0xFF));
    }
    return out + payload;
}
}

TEST_CASE("WebSocketFrame - Accept Key Matches RFC 6455 Example") {
    CHECK(websocket_transport::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("WebSocketFrame - Parser Reassembles Split Input") {
    WebSocketFrameParser parser;
    std::string bytes = server_frame(WebSocketFrame::OPCODE_TEXT, R"({"e":"trade"})");

    WebSocketFrame frame;
    std::string error;

    parser.feed(bytes.data(), 3);
    CHECK(parser.next(frame, error) == WebSocketFrameParser::Result::NEED_MORE);

    parser.feed(bytes.data() + 3, bytes.size() - 3);
    REQUIRE(parser.next(frame, error) == WebSocketFrameParser::Result::FRAME);
    CHECK(frame.fin);
    CHECK(frame.opcode == WebSocketFrame::OPCODE_TEXT);
    CHECK(frame.payload == R"({"e":"trade"})");
    CHECK(parser.buffered() == 0);
}

TEST_CASE("WebSocketFrame - Extended Length And Back To Back Frames") {
    WebSocketFrameParser parser;
    std::string big(300, 'x');
    std::string bytes = server_frame(WebSocketFrame::OPCODE_TEXT, big) +
                        server_frame(WebSocketFrame::OPCODE_PING, "hb");
    parser.feed(bytes.data(), bytes.size());

    WebSocketFrame frame;
    std::string error;
    REQUIRE(parser.next(frame, error) == WebSocketFrameParser::Result::FRAME);
    CHECK(frame.payload.size() == 300);

    REQUIRE(parser.next(frame, error) == WebSocketFrameParser::Result::FRAME);
    CHECK(frame.opcode == WebSocketFrame::OPCODE_PING);
    CHECK(frame.is_control());
    CHECK(frame.payload == "hb");

    CHECK(parser.next(frame, error) == WebSocketFrameParser::Result::NEED_MORE);
}

TEST_CASE("WebSocketFrame - Masked Client Frame Decodes") {
    const uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
    std::string encoded = websocket_transport::encode_frame(WebSocketFrame::OPCODE_TEXT, "Hello", mask);

    CHECK(static_cast<uint8_t>(encoded[0]) == 0x81);
    CHECK((static_cast<uint8_t>(encoded[1]) & 0x80) != 0);
    CHECK(encoded.size() == 2 + 4 + 5);

    WebSocketFrameParser parser;
    parser.feed(encoded.data(), encoded.size());
    WebSocketFrame frame;
    std::string error;
    REQUIRE(parser.next(frame, error) == WebSocketFrameParser::Result::FRAME);
    CHECK(frame.payload == "Hello");
}

TEST_CASE("WebSocketFrame - Protocol Errors") {
    WebSocketFrame frame;
    std::string error;

    SUBCASE("Fragmented control frame") {
        WebSocketFrameParser parser;
        std::string bytes = server_frame(WebSocketFrame::OPCODE_PING, "x", false);
        parser.feed(bytes.data(), bytes.size());
        CHECK(parser.next(frame, error) == WebSocketFrameParser::Result::PROTOCOL_ERROR);
    }
    SUBCASE("Payload above limit") {
        WebSocketFrameParser parser(8);
        std::string bytes = server_frame(WebSocketFrame::OPCODE_TEXT, "0123456789");
        parser.feed(bytes.data(), bytes.size());
        CHECK(parser.next(frame, error) == WebSocketFrameParser::Result::PROTOCOL_ERROR);
        CHECK_FALSE(error.empty());
    }
    SUBCASE("Unknown opcode") {
        WebSocketFrameParser parser;
        std::string bytes = server_frame(0x3, "x");
        parser.feed(bytes.data(), bytes.size());
        CHECK(parser.next(frame, error) == WebSocketFrameParser::Result::PROTOCOL_ERROR);
    }
}

TEST_CASE("WebSocketFrame - Url Parsing") {
    websocket_transport::WebSocketUrl url;

    REQUIRE(websocket_transport::parse_websocket_url("wss://stream.binance.com:9443/stream?streams=btcusdt@trade", url));
    CHECK(url.secure);
    CHECK(url.host == "stream.binance.com");
    CHECK(url.port == 9443);
    CHECK(url.target == "/stream?streams=btcusdt@trade");

    REQUIRE(websocket_transport::parse_websocket_url("ws://localhost", url));
    CHECK_FALSE(url.secure);
    CHECK(url.port == 80);
    CHECK(url.target == "/");

    CHECK_FALSE(websocket_transport::parse_websocket_url("https://stream.binance.com", url));
    CHECK_FALSE(websocket_transport::parse_websocket_url("wss://:9443/", url));
}
