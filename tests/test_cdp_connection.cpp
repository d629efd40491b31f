// Tests for the CDP command dispatcher: id correlation, domain enabling and
// the reconnect-once policy. Runs against an in-memory transport.

#include "browser/cdp/cdp_connection.hpp"

#include <deque>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_cdp_connection {

namespace {

struct SentCommand {
    int epoch;
    int id;
    std::string method;
};

// Shared by every transport the connection creates, so tests can look across epochs.
struct FakeBrowser {
    int transports_opened = 0;
    bool refuse_open = false;
    std::vector<SentCommand> sent;
    std::map<std::string, int> drops_remaining;  // method -> connection drops before replying
    std::set<std::string> silent_methods;        // never answered
    std::map<std::string, json> results;         // method -> result payload
    std::map<std::string, json> errors;          // method -> protocol error payload
    bool emit_noise = true;                      // event and stale reply before each response

    std::vector<std::string> methods_in_epoch(int epoch) const {
        std::vector<std::string> methods;
        for (const auto &command : sent) {
            if (command.epoch == epoch) {
                methods.push_back(command.method);
            }
        }
        return methods;
    }
};

class FakeTransport : public cdp_transport::Transport {
public:
    explicit FakeTransport(FakeBrowser &browser) : browser_(browser) {}

    bool open(const std::string &) override {
        browser_.transports_opened++;
        epoch_ = browser_.transports_opened;
        open_ = !browser_.refuse_open;
        return open_;
    }

    bool send_text(const std::string &payload) override {
        if (!open_) {
            return false;
        }
        json command = json::parse(payload);
        std::string method = command["method"].get<std::string>();
        int id = command["id"].get<int>();
        browser_.sent.push_back({epoch_, id, method});

        int &drops = browser_.drops_remaining[method];
        if (drops > 0) {
            drops--;
            open_ = false;
            return true;
        }
        if (browser_.silent_methods.count(method) != 0) {
            return true;
        }

        if (browser_.emit_noise) {
            inbound_.push_back(R"({"method":"Page.frameNavigated","params":{"frame":{}}})");
            inbound_.push_back(json({{"id", id + 1000}, {"result", json::object()}}).dump());
            inbound_.push_back("not json at all");
        }
        json reply;
        reply["id"] = id;
        if (browser_.errors.count(method) != 0) {
            reply["error"] = browser_.errors[method];
        } else {
            reply["result"] = browser_.results.count(method) != 0 ? browser_.results[method] : json::object();
        }
        inbound_.push_back(reply.dump());
        return true;
    }

    cdp_transport::ReceiveStatus receive_text(std::string &out_message, int) override {
        if (!inbound_.empty()) {
            out_message = inbound_.front();
            inbound_.pop_front();
            return cdp_transport::ReceiveStatus::Message;
        }
        return open_ ? cdp_transport::ReceiveStatus::Timeout : cdp_transport::ReceiveStatus::Closed;
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

private:
    FakeBrowser &browser_;
    std::deque<std::string> inbound_;
    int epoch_ = 0;
    bool open_ = false;
};

cdp_connection::CdpConnection make_connection(FakeBrowser &browser, bool target_available = true,
                                              int command_timeout_milliseconds = 20) {
    cdp_connection::ConnectionOptions options;
    options.command_timeout_milliseconds = command_timeout_milliseconds;
    return cdp_connection::CdpConnection(
        [target_available]() {
            cdp_target_discovery::DiscoveryResult discovery;
            if (!target_available) {
                discovery.error_detail = "No CDP targets found at port 9222.";
                return discovery;
            }
            discovery.success = true;
            discovery.target.websocket_debugger_url = "ws://127.0.0.1:9222/devtools/page/T";
            return discovery;
        },
        [&browser]() { return std::unique_ptr<cdp_transport::Transport>(new FakeTransport(browser)); }, options);
}

} // namespace

static bool report(bool success, const std::string &label, const std::string &failure_detail) {
    if (success) {
        std::cout << "  OK: " << label << std::endl;
    } else {
        std::cout << "  FAIL: " << label << ": " << failure_detail << std::endl;
    }
    return success;
}

// Test: connect() enables Page, DOM and Runtime with ids starting at 1.
static bool test_connect_enables_domains() {
    FakeBrowser browser;
    auto connection = make_connection(browser);
    bool connected = connection.connect();
    bool connected_again = connection.connect();
    std::vector<std::string> expected = {"Page.enable", "DOM.enable", "Runtime.enable"};
    bool success = connected && connected_again && browser.methods_in_epoch(1) == expected &&
                   browser.sent[0].id == 1 && browser.sent[2].id == 3 && browser.transports_opened == 1 &&
                   connection.status() == cdp_connection::ConnectionStatus::Connected &&
                   connection.endpoint_url() == "ws://127.0.0.1:9222/devtools/page/T";
    return report(success, "connect enables domains once", std::to_string(browser.sent.size()) + " commands sent");
}

// Test: Events, stale ids and garbage are skipped until the matching reply.
static bool test_response_correlation() {
    FakeBrowser browser;
    browser.results["Runtime.evaluate"] = {{"result", {{"type", "number"}, {"value", 42}}}};
    auto connection = make_connection(browser);
    cdp_connection::CommandResult result = connection.send_command("Runtime.evaluate", {{"expression", "6*7"}});
    bool success = result.success && !result.has_protocol_error() &&
                   result.result()["result"]["value"] == 42 && browser.sent.back().id == 4;
    return report(success, "send_command returns the reply with the matching id", result.error_detail);
}

// Test: A protocol-level error still counts as a delivered response.
static bool test_protocol_error_is_delivered() {
    FakeBrowser browser;
    browser.errors["DOM.getBoxModel"] = {{"code", -32000}, {"message", "Could not compute box model."}};
    auto connection = make_connection(browser);
    cdp_connection::CommandResult result = connection.send_command("DOM.getBoxModel", {{"nodeId", 7}});
    bool success = result.success && result.has_protocol_error() &&
                   result.protocol_error_message() == "Could not compute box model." && browser.transports_opened == 1;
    return report(success, "Protocol errors are returned without reconnecting", result.protocol_error_message());
}

// Test: One dropped connection triggers a reconnect and a resend in a new epoch.
static bool test_reconnect_once() {
    FakeBrowser browser;
    browser.drops_remaining["Page.navigate"] = 1;
    auto connection = make_connection(browser);
    cdp_connection::CommandResult result = connection.send_command("Page.navigate", {{"url", "https://x.test/"}});

    std::vector<std::string> second_epoch = browser.methods_in_epoch(2);
    std::vector<std::string> expected = {"Page.enable", "DOM.enable", "Runtime.enable", "Page.navigate"};
    bool ids_restart = false;
    for (const auto &command : browser.sent) {
        if (command.epoch == 2) {
            ids_restart = command.id == 1;
            break;
        }
    }
    bool success = result.success && connection.epoch() == 2 && browser.transports_opened == 2 &&
                   second_epoch == expected && ids_restart &&
                   connection.status() == cdp_connection::ConnectionStatus::Connected;
    return report(success, "Transport failure reconnects once and resends with fresh ids", result.error_detail);
}

// Test: A second failure is terminal for the command and names it.
static bool test_double_failure_is_command_failure() {
    FakeBrowser browser;
    browser.drops_remaining["Page.navigate"] = 2;
    auto connection = make_connection(browser);
    cdp_connection::CommandResult result = connection.send_command("Page.navigate", {{"url", "https://x.test/"}});
    bool failed_properly = !result.success && result.error_kind == cdp_connection::ErrorKind::CommandFailure &&
                           result.error_detail.find("Page.navigate") != std::string::npos &&
                           connection.status() == cdp_connection::ConnectionStatus::Disconnected &&
                           browser.transports_opened == 2;

    // The next command connects afresh.
    cdp_connection::CommandResult next_result = connection.send_command("Runtime.evaluate", {{"expression", "1"}});
    bool success = failed_properly && next_result.success && browser.transports_opened == 3;
    return report(success, "Second failure yields CommandFailure naming the method", result.error_detail);
}

// Test: A silent browser times out, then fails after the single retry.
static bool test_timeout_counts_as_transport_failure() {
    FakeBrowser browser;
    browser.silent_methods.insert("Page.captureScreenshot");
    auto connection = make_connection(browser);
    cdp_connection::CommandResult result = connection.send_command("Page.captureScreenshot", json::object());
    bool success = !result.success && result.error_kind == cdp_connection::ErrorKind::CommandFailure &&
                   result.error_detail.find("timed out") != std::string::npos && browser.transports_opened == 2;
    return report(success, "Response timeout triggers the reconnect policy", result.error_detail);
}

// Test: Initial connect failures carry their own kind.
static bool test_initial_connect_failures() {
    FakeBrowser no_target_browser;
    auto no_target = make_connection(no_target_browser, false);
    cdp_connection::CommandResult no_target_result = no_target.send_command("Page.navigate", json::object());

    FakeBrowser refusing_browser;
    refusing_browser.refuse_open = true;
    auto refusing = make_connection(refusing_browser);
    cdp_connection::CommandResult refused_result = refusing.send_command("Page.navigate", json::object());

    bool success = !no_target_result.success &&
                   no_target_result.error_kind == cdp_connection::ErrorKind::NoTargetAvailable &&
                   no_target_browser.transports_opened == 0 && !refused_result.success &&
                   refused_result.error_kind == cdp_connection::ErrorKind::ConnectionFailure &&
                   refusing_browser.transports_opened == 1;
    return report(success, "Missing target and refused connection are reported by kind",
                  std::string(cdp_connection::error_kind_name(no_target_result.error_kind)) + " / " +
                      cdp_connection::error_kind_name(refused_result.error_kind));
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_connect_enables_domains();
    all_passed &= test_response_correlation();
    all_passed &= test_protocol_error_is_delivered();
    all_passed &= test_reconnect_once();
    all_passed &= test_double_failure_is_command_failure();
    all_passed &= test_timeout_counts_as_transport_failure();
    all_passed &= test_initial_connect_failures();
    return all_passed;
}

} // namespace test_cdp_connection
