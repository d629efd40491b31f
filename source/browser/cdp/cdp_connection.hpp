#ifndef TABSCOUT_CDP_CONNECTION_HPP
#define TABSCOUT_CDP_CONNECTION_HPP

// CDP command dispatcher.
// Owns one transport at a time, correlates responses by message id and applies
// the reconnect policy: one transport failure triggers a single reconnect and
// resend; a second failure is terminal for that command.

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>

#include "browser/cdp/cdp_target_discovery.hpp"
#include "browser/cdp/cdp_transport.hpp"

namespace cdp_connection {

using json = nlohmann::json;

enum class ConnectionStatus {
    Disconnected,
    Connected,
    Reconnecting
};

enum class ErrorKind {
    None,
    NoTargetAvailable, // discovery exhausted
    ConnectionFailure, // transport could not be opened or broke during the initial connect
    CommandFailure     // reconnect and resend both failed for a command
};

const char *error_kind_name(ErrorKind kind);

// Outcome of one command. success means a correlated response arrived;
// a protocol-level {id, error} reply still counts as success.
struct CommandResult {
    bool success = false;
    json response;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_detail;

    bool has_protocol_error() const { return response.contains("error"); }
    std::string protocol_error_message() const;

    // response["result"], or an empty object.
    json result() const;
};

// Capability the interaction primitives are written against.
class CommandChannel {
public:
    virtual ~CommandChannel() = default;
    virtual CommandResult send_command(const std::string &method, const json &params) = 0;
};

struct ConnectionOptions {
    int command_timeout_milliseconds = 10000;
};

class CdpConnection : public CommandChannel {
public:
    using EndpointResolver = std::function<cdp_target_discovery::DiscoveryResult()>;
    using TransportFactory = std::function<std::unique_ptr<cdp_transport::Transport>()>;

    CdpConnection(EndpointResolver resolve_endpoint, TransportFactory create_transport,
                  ConnectionOptions options = {});
    ~CdpConnection() override;

    CdpConnection(const CdpConnection &) = delete;
    CdpConnection &operator=(const CdpConnection &) = delete;

    // Discovers a target, opens a fresh transport and enables Page, DOM and Runtime.
    // No-op when already connected. On failure, last_error_kind() says why.
    bool connect();

    // Tears the transport down. The next command connects again.
    void close();

    CommandResult send_command(const std::string &method, const json &params) override;

    ConnectionStatus status() const { return status_; }
    ErrorKind last_error_kind() const { return last_error_kind_; }
    const std::string &last_error_detail() const { return last_error_detail_; }
    const std::string &endpoint_url() const { return endpoint_url_; }

    // Number of transports opened so far (one per connection epoch).
    int epoch() const { return epoch_; }

private:
    enum class ExchangeStatus { Response, TransportFailure };

    bool open_epoch();
    ExchangeStatus exchange(const std::string &method, const json &params, CommandResult &out_result,
                            std::string &out_failure_detail);
    void discard_transport();

    EndpointResolver resolve_endpoint_;
    TransportFactory create_transport_;
    ConnectionOptions options_;

    std::unique_ptr<cdp_transport::Transport> transport_;
    std::string endpoint_url_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    int next_message_id_ = 1;
    int epoch_ = 0;

    ErrorKind last_error_kind_ = ErrorKind::None;
    std::string last_error_detail_;
};

} // namespace cdp_connection

#endif // TABSCOUT_CDP_CONNECTION_HPP
