#include "browser/cdp/cdp_transport.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <deque>
#include <vector>

namespace cdp_transport {

bool parse_websocket_url(const std::string &websocket_url, WebSocketAddress &out_address) {
    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.compare(0, 5, "ws://") == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port;
    out_address.path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        out_address.path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    // Split host from port. IPv6 literals come bracketed: [::1]:9222.
    std::string port_text;
    if (!host_and_port.empty() && host_and_port[0] == '[') {
        auto bracket_position = host_and_port.find(']');
        if (bracket_position == std::string::npos || bracket_position == 1) {
            return false;
        }
        out_address.host = host_and_port.substr(1, bracket_position - 1);
        std::string after_bracket = host_and_port.substr(bracket_position + 1);
        if (after_bracket.empty()) {
            return true;
        }
        if (after_bracket[0] != ':') {
            return false;
        }
        port_text = after_bracket.substr(1);
    } else {
        auto colon_position = host_and_port.find(':');
        if (colon_position == std::string::npos) {
            if (!host_and_port.empty()) {
                out_address.host = host_and_port;
            }
            return true;
        }
        out_address.host = host_and_port.substr(0, colon_position);
        port_text = host_and_port.substr(colon_position + 1);
    }

    try {
        size_t consumed = 0;
        out_address.port = std::stoi(port_text, &consumed);
        if (consumed != port_text.size()) {
            return false;
        }
    } catch (const std::exception &) {
        return false;
    }
    return out_address.port > 0 && out_address.port <= 65535;
}

namespace {

constexpr int kConnectTimeoutMilliseconds = 10000;

class WebSocketTransport : public Transport {
public:
    ~WebSocketTransport() override { close(); }

    bool open(const std::string &websocket_url) override;
    bool send_text(const std::string &payload) override;
    ReceiveStatus receive_text(std::string &out_message, int timeout_milliseconds) override;
    void close() override;
    bool is_open() const override { return connected_ && !closed_; }

    static int callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                        void *user_data, void *incoming_data, size_t incoming_length);

private:
    void handle_receive(struct lws *websocket_instance, const char *data_pointer, size_t length);

    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;
    bool connected_ = false;
    bool connection_failed_ = false;
    bool closed_ = false;

    // Partial frame being assembled, and complete messages not yet consumed.
    std::string receive_buffer_;
    std::deque<std::string> inbound_messages_;
};

const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        WebSocketTransport::callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

int WebSocketTransport::callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                                 void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    if (websocket_instance == nullptr) {
        return 0;
    }
    auto *transport = static_cast<WebSocketTransport *>(
        lws_context_user(lws_get_context(websocket_instance)));
    if (transport == nullptr) {
        return 0;
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        transport->connected_ = true;
        debug_log::log("CDP WebSocket connected.");
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE:
        transport->handle_receive(websocket_instance, static_cast<const char *>(incoming_data),
                                  incoming_length);
        break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        debug_log::warn("CDP WebSocket connection error: " + std::string(error_message));
        transport->connected_ = false;
        transport->connection_failed_ = true;
        transport->closed_ = true;
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        debug_log::log("CDP WebSocket closed.");
        transport->connected_ = false;
        transport->closed_ = true;
        break;

    default:
        break;
    }

    return 0;
}

void WebSocketTransport::handle_receive(struct lws *websocket_instance, const char *data_pointer,
                                        size_t length) {
    receive_buffer_.append(data_pointer, length);

    // A message may span several rx buffers and several fragments.
    if (lws_is_final_fragment(websocket_instance) &&
        lws_remaining_packet_payload(websocket_instance) == 0) {
        inbound_messages_.push_back(std::move(receive_buffer_));
        receive_buffer_.clear();
    }
}

bool WebSocketTransport::open(const std::string &websocket_url) {
    close();
    connected_ = false;
    connection_failed_ = false;
    closed_ = false;
    receive_buffer_.clear();
    inbound_messages_.clear();

    WebSocketAddress address;
    if (!parse_websocket_url(websocket_url, address)) {
        debug_log::warn("Failed to parse port from WebSocket URL: " + websocket_url);
        return false;
    }

    // Create libwebsockets context.
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        debug_log::warn("Failed to create libwebsockets context.");
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = address.host.c_str();
    connect_info.port = address.port;
    connect_info.path = address.path.c_str();
    connect_info.host = address.host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;
    connect_info.pwsi = &websocket_connection_;

    debug_log::log("open() host=" + address.host + " port=" + std::to_string(address.port) +
                   " path=" + address.path);
    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        debug_log::warn("Failed to initiate CDP WebSocket connection to " + websocket_url);
        close();
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!connected_) {
        lws_service(websocket_context_, 50);

        if (connection_failed_) {
            close();
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > kConnectTimeoutMilliseconds) {
            debug_log::warn("Timed out connecting to CDP WebSocket: " + websocket_url);
            close();
            return false;
        }
    }

    return true;
}

bool WebSocketTransport::send_text(const std::string &payload) {
    if (!is_open() || websocket_connection_ == nullptr) {
        return false;
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + payload.size());
    memcpy(send_buffer.data() + LWS_PRE, payload.data(), payload.size());

    int bytes_written = lws_write(websocket_connection_, send_buffer.data() + LWS_PRE,
                                  payload.size(), LWS_WRITE_TEXT);
    return bytes_written >= static_cast<int>(payload.size());
}

ReceiveStatus WebSocketTransport::receive_text(std::string &out_message, int timeout_milliseconds) {
    auto start_time = std::chrono::steady_clock::now();

    while (true) {
        if (!inbound_messages_.empty()) {
            out_message = std::move(inbound_messages_.front());
            inbound_messages_.pop_front();
            return ReceiveStatus::Message;
        }
        if (closed_ || websocket_context_ == nullptr) {
            return ReceiveStatus::Closed;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_milliseconds) {
            return ReceiveStatus::Timeout;
        }

        lws_service(websocket_context_, 10);
    }
}

void WebSocketTransport::close() {
    if (websocket_context_ != nullptr) {
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
        debug_log::log("close(): WebSocket context destroyed.");
    }
    websocket_connection_ = nullptr;
    connected_ = false;
    closed_ = true;
}

} // namespace

std::unique_ptr<Transport> create_websocket_transport() {
    return std::make_unique<WebSocketTransport>();
}

} // namespace cdp_transport
