#include "browser/cdp/cdp_connection.hpp"
#include "utils/deadline.hpp"
#include "utils/debug_log.hpp"

namespace cdp_connection {

// Domains every primitive relies on: lifecycle, DOM queries, script evaluation.
static const char *const kRequiredDomains[] = {"Page.enable", "DOM.enable", "Runtime.enable"};

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::NoTargetAvailable:
        return "NoTargetAvailable";
    case ErrorKind::ConnectionFailure:
        return "ConnectionFailure";
    case ErrorKind::CommandFailure:
        return "CommandFailure";
    }
    return "Unknown";
}

std::string CommandResult::protocol_error_message() const {
    if (!has_protocol_error()) {
        return "";
    }
    const json &error = response["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

json CommandResult::result() const {
    if (response.contains("result") && response["result"].is_object()) {
        return response["result"];
    }
    return json::object();
}

CdpConnection::CdpConnection(EndpointResolver resolve_endpoint, TransportFactory create_transport,
                             ConnectionOptions options)
    : resolve_endpoint_(std::move(resolve_endpoint)),
      create_transport_(std::move(create_transport)),
      options_(options) {}

CdpConnection::~CdpConnection() {
    close();
}

bool CdpConnection::connect() {
    if (status_ == ConnectionStatus::Connected && transport_ && transport_->is_open()) {
        return true;
    }
    return open_epoch();
}

void CdpConnection::close() {
    if (transport_) {
        debug_log::log("close(): closing CDP connection to " + endpoint_url_);
    }
    discard_transport();
    status_ = ConnectionStatus::Disconnected;
}

void CdpConnection::discard_transport() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

bool CdpConnection::open_epoch() {
    discard_transport();

    cdp_target_discovery::DiscoveryResult discovery = resolve_endpoint_();
    if (!discovery.success) {
        last_error_kind_ = ErrorKind::NoTargetAvailable;
        last_error_detail_ = discovery.error_detail.empty() ? "No CDP target available." : discovery.error_detail;
        status_ = ConnectionStatus::Disconnected;
        return false;
    }
    endpoint_url_ = discovery.target.websocket_debugger_url;

    // Each epoch gets its own transport and its own id sequence.
    transport_ = create_transport_();
    ++epoch_;
    next_message_id_ = 1;
    debug_log::log("open_epoch: epoch " + std::to_string(epoch_) + " connecting to " + endpoint_url_);

    if (!transport_ || !transport_->open(endpoint_url_)) {
        last_error_kind_ = ErrorKind::ConnectionFailure;
        last_error_detail_ = "Could not establish WebSocket connection to: " + endpoint_url_;
        discard_transport();
        status_ = ConnectionStatus::Disconnected;
        return false;
    }

    for (const char *domain_method : kRequiredDomains) {
        CommandResult enable_result;
        std::string failure_detail;
        if (exchange(domain_method, json::object(), enable_result, failure_detail) != ExchangeStatus::Response) {
            last_error_kind_ = ErrorKind::ConnectionFailure;
            last_error_detail_ = std::string(domain_method) + " failed: " + failure_detail;
            discard_transport();
            status_ = ConnectionStatus::Disconnected;
            return false;
        }
        if (enable_result.has_protocol_error()) {
            debug_log::log(std::string(domain_method) + " returned: " + enable_result.protocol_error_message());
        }
    }

    last_error_kind_ = ErrorKind::None;
    last_error_detail_.clear();
    status_ = ConnectionStatus::Connected;
    return true;
}

CdpConnection::ExchangeStatus CdpConnection::exchange(const std::string &method, const json &params,
                                                      CommandResult &out_result,
                                                      std::string &out_failure_detail) {
    if (!transport_) {
        out_failure_detail = "no transport";
        return ExchangeStatus::TransportFailure;
    }

    int message_id = next_message_id_++;
    json command;
    command["id"] = message_id;
    command["method"] = method;
    command["params"] = params.is_object() ? params : json::object();

    std::string serialized_command = command.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!transport_->send_text(serialized_command)) {
        out_failure_detail = "failed to send " + method + " via WebSocket";
        return ExchangeStatus::TransportFailure;
    }

    deadline::Deadline response_deadline = deadline::Deadline::after_milliseconds(options_.command_timeout_milliseconds);
    while (true) {
        std::string raw_message;
        cdp_transport::ReceiveStatus receive_status =
            transport_->receive_text(raw_message, response_deadline.remaining_milliseconds());

        if (receive_status == cdp_transport::ReceiveStatus::Timeout) {
            out_failure_detail = "timed out waiting for response to " + method;
            return ExchangeStatus::TransportFailure;
        }
        if (receive_status == cdp_transport::ReceiveStatus::Closed) {
            out_failure_detail = "connection closed while waiting for response to " + method;
            return ExchangeStatus::TransportFailure;
        }

        json message;
        try {
            message = json::parse(raw_message);
        } catch (const json::parse_error &parse_error) {
            debug_log::log("Dropping unparsable CDP message: " + std::string(parse_error.what()));
            continue;
        }

        // Events carry no id; stale responses carry another one. Both are dropped.
        if (message.is_object() && message.contains("id") && message["id"].is_number_integer() &&
            message["id"].get<int>() == message_id) {
            out_result.success = true;
            out_result.response = std::move(message);
            return ExchangeStatus::Response;
        }
    }
}

CommandResult CdpConnection::send_command(const std::string &method, const json &params) {
    CommandResult result;

    if (status_ != ConnectionStatus::Connected && !connect()) {
        result.error_kind = last_error_kind_;
        result.error_detail = last_error_detail_;
        return result;
    }

    std::string failure_detail;
    if (exchange(method, params, result, failure_detail) == ExchangeStatus::Response) {
        return result;
    }

    debug_log::warn("CDP command " + method + " failed (" + failure_detail + "), reconnecting once.");
    status_ = ConnectionStatus::Reconnecting;
    if (!open_epoch()) {
        result = CommandResult();
        result.error_kind = ErrorKind::CommandFailure;
        result.error_detail = "CDP reconnect failed for " + method + ": " + last_error_detail_;
        last_error_kind_ = ErrorKind::CommandFailure;
        last_error_detail_ = result.error_detail;
        return result;
    }

    result = CommandResult();
    if (exchange(method, params, result, failure_detail) == ExchangeStatus::Response) {
        return result;
    }

    discard_transport();
    status_ = ConnectionStatus::Disconnected;
    result = CommandResult();
    result.error_kind = ErrorKind::CommandFailure;
    result.error_detail = "CDP command failed for " + method + ": " + failure_detail;
    last_error_kind_ = ErrorKind::CommandFailure;
    last_error_detail_ = result.error_detail;
    return result;
}

} // namespace cdp_connection
