#include "websocket_frame.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace websocket_transport {

namespace {
const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
}

void WebSocketFrameParser::feed(const char* data, size_t size) {
    // Compact consumed bytes before growing the buffer
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data, size);
}

WebSocketFrameParser::Result WebSocketFrameParser::next(WebSocketFrame& frame, std::string& error) {
    size_t available = buffer_.size() - offset_;
    if (available < 2) {
        return Result::NEED_MORE;
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(buffer_.data() + offset_);

    bool fin = (bytes[0] & 0x80) != 0;
    if ((bytes[0] & 0x70) != 0) {
        error = "reserved bits set without a negotiated extension";
        return Result::PROTOCOL_ERROR;
    }
    uint8_t opcode = bytes[0] & 0x0F;
    bool masked = (bytes[1] & 0x80) != 0;
    uint64_t payload_length = bytes[1] & 0x7F;

    size_t header_size = 2;
    if (payload_length == 126) {
        if (available < 4) return Result::NEED_MORE;
        payload_length = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
        header_size = 4;
    } else if (payload_length == 127) {
        if (available < 10) return Result::NEED_MORE;
        payload_length = 0;
        for (int i = 0; i < 8; ++i) {
            payload_length = (payload_length << 8) | bytes[2 + i];
        }
        header_size = 10;
    }

    if (payload_length > max_payload_) {
        error = "frame payload of " + std::to_string(payload_length) + " bytes exceeds limit";
        return Result::PROTOCOL_ERROR;
    }

    bool control = (opcode & 0x8) != 0;
    if (control && (!fin || payload_length > 125)) {
        error = "fragmented or oversized control frame";
        return Result::PROTOCOL_ERROR;
    }
    if (opcode != WebSocketFrame::OPCODE_CONTINUATION && opcode != WebSocketFrame::OPCODE_TEXT &&
        opcode != WebSocketFrame::OPCODE_BINARY && !control) {
        error = "unknown opcode " + std::to_string(opcode);
        return Result::PROTOCOL_ERROR;
    }

    uint8_t mask_key[4] = {0, 0, 0, 0};
    if (masked) {
        if (available < header_size + 4) return Result::NEED_MORE;
        for (int i = 0; i < 4; ++i) {
            mask_key[i] = bytes[header_size + i];
        }
        header_size += 4;
    }

    if (available < header_size + payload_length) {
        return Result::NEED_MORE;
    }

    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload.assign(buffer_.data() + offset_ + header_size, static_cast<size_t>(payload_length));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask_key[i % 4]);
        }
    }

    offset_ += header_size + static_cast<size_t>(payload_length);
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return Result::FRAME;
}

std::string encode_frame(uint8_t opcode, const std::string& payload, const uint8_t mask_key[4], bool fin) {
    std::string out;
    out.reserve(payload.size() + 14);

    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    uint64_t length = payload.size();
    if (length < 126) {
        out.push_back(static_cast<char>(0x80 | length));
    } else if (length < 65536) {
        out.push_back(static_cast<char>(0x80 | 126));
        out.push_back(static_cast<char>((length >> 8) & 0xFF));
        out.push_back(static_cast<char>(length & 0xFF));
    } else {
        out.push_back(static_cast<char>(0x80 | 127));
        for (int i = 7; i >= 0; --i) {
            out.push_back(static_cast<char>((length >> (i * 8)) & 0xFF));
        }
    }

    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>(mask_key[i]));
    }
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(payload[i] ^ mask_key[i % 4]));
    }
    return out;
}

std::string base64_encode(const unsigned char* data, size_t size) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(b64);
        BIO_free(mem);
        throw std::runtime_error("BIO allocation failed");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* bio = BIO_push(b64, mem);

    BIO_write(bio, data, static_cast<int>(size));
    (void)BIO_flush(bio);

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);
    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);

    return result;
}

std::string compute_accept_key(const std::string& websocket_key) {
    std::string input = websocket_key + kWebSocketGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return base64_encode(digest, SHA_DIGEST_LENGTH);
}

bool parse_websocket_url(const std::string& url, WebSocketUrl& out) {
    std::string remaining;
    if (url.compare(0, 5, "ws://") == 0) {
        out.secure = false;
        remaining = url.substr(5);
    } else if (url.compare(0, 6, "wss://") == 0) {
        out.secure = true;
        remaining = url.substr(6);
    } else {
        return false;
    }

    size_t path_pos = remaining.find_first_of("/?");
    if (path_pos != std::string::npos) {
        out.target = remaining.substr(path_pos);
        if (out.target[0] == '?') {
            out.target = "/" + out.target;
        }
        remaining = remaining.substr(0, path_pos);
    } else {
        out.target = "/";
    }

    size_t colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos) {
        out.host = remaining.substr(0, colon_pos);
        try {
            out.port = std::stoi(remaining.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return false;
        }
    } else {
        out.host = remaining;
        out.port = out.secure ? 443 : 80;
    }

    return !out.host.empty() && out.port > 0 && out.port <= 65535;
}

} // namespace websocket_transport
