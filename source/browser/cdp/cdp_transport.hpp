#ifndef TABSCOUT_CDP_TRANSPORT_HPP
#define TABSCOUT_CDP_TRANSPORT_HPP

// Duplex text transport to a CDP target.
// The connection layer only talks to Transport; the WebSocket implementation
// lives in cdp_transport.cpp and is created through create_websocket_transport().

#include <memory>
#include <string>

namespace cdp_transport {

enum class ReceiveStatus {
    Message, // out_message holds one complete text frame
    Timeout, // nothing arrived within the timeout
    Closed   // the peer closed or the connection failed
};

class Transport {
public:
    virtual ~Transport() = default;

    // Opens the connection to a ws:// URL. Returns true once the handshake completed.
    virtual bool open(const std::string &websocket_url) = 0;

    // Writes one text frame. Returns false if the write failed.
    virtual bool send_text(const std::string &payload) = 0;

    // Blocks up to timeout_milliseconds for the next complete inbound message.
    virtual ReceiveStatus receive_text(std::string &out_message, int timeout_milliseconds) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

// Parsed pieces of a ws:// URL.
struct WebSocketAddress {
    std::string host = "127.0.0.1";
    int port = 9222;
    std::string path = "/";
};

// Splits ws://host:port/path (host may be a bracketed IPv6 literal).
// Returns false if the port is not a number in 1..65535.
bool parse_websocket_url(const std::string &websocket_url, WebSocketAddress &out_address);

// libwebsockets client transport.
std::unique_ptr<Transport> create_websocket_transport();

} // namespace cdp_transport

#endif // TABSCOUT_CDP_TRANSPORT_HPP
