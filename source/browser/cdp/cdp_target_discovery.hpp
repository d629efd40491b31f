#ifndef TABSCOUT_CDP_TARGET_DISCOVERY_HPP
#define TABSCOUT_CDP_TARGET_DISCOVERY_HPP

// Target discovery over the DevTools HTTP endpoint of an already running browser.

#include <optional>
#include <string>
#include <vector>

#include "browser/cdp/cdp_http_client.hpp"

namespace cdp_target_discovery {

// One entry of the /json listing.
struct TargetInfo {
    std::string target_id;
    std::string type; // e.g. "page", "background_page", "service_worker"
    std::string title;
    std::string url;
    std::string websocket_debugger_url;
};

struct DiscoveryOptions {
    std::string host = "127.0.0.1";
    int port = 9222;
    int request_timeout_milliseconds = 1000;
    // Pause between asking for a new target and listing again.
    int new_target_settle_milliseconds = 200;
};

struct DiscoveryResult {
    bool success = false;
    TargetInfo target;
    bool created_new_target = false;
    std::string error_detail;
};

// Parses a /json listing body. Malformed bodies and non-object entries yield no targets.
std::vector<TargetInfo> parse_target_list(const std::string &body);

// Preference: a "page" target with a debugger URL, else any target with one.
std::optional<TargetInfo> select_target(const std::vector<TargetInfo> &targets);

// "http://<host>:<port>" + path
std::string build_endpoint_url(const DiscoveryOptions &options, const std::string &path);

// Lists targets; if none is debuggable, asks the browser for a new tab and lists once more.
DiscoveryResult discover(cdp_http_client::HttpClient &http_client, const DiscoveryOptions &options);

} // namespace cdp_target_discovery

#endif // TABSCOUT_CDP_TARGET_DISCOVERY_HPP
