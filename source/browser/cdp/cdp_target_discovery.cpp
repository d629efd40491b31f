#include "browser/cdp/cdp_target_discovery.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace cdp_target_discovery {

static std::string string_field(const json &object, const char *key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

std::vector<TargetInfo> parse_target_list(const std::string &body) {
    std::vector<TargetInfo> targets;
    json listing;
    try {
        listing = json::parse(body);
    } catch (const json::parse_error &parse_error) {
        debug_log::log("parse_target_list: invalid JSON: " + std::string(parse_error.what()));
        return targets;
    }
    if (!listing.is_array()) {
        return targets;
    }

    for (const auto &entry : listing) {
        if (!entry.is_object()) {
            continue;
        }
        TargetInfo target;
        target.target_id = string_field(entry, "id");
        target.type = string_field(entry, "type");
        target.title = string_field(entry, "title");
        target.url = string_field(entry, "url");
        target.websocket_debugger_url = string_field(entry, "webSocketDebuggerUrl");
        targets.push_back(target);
    }
    return targets;
}

std::optional<TargetInfo> select_target(const std::vector<TargetInfo> &targets) {
    for (const auto &target : targets) {
        if (target.type == "page" && !target.websocket_debugger_url.empty()) {
            return target;
        }
    }
    for (const auto &target : targets) {
        if (!target.websocket_debugger_url.empty()) {
            return target;
        }
    }
    return std::nullopt;
}

std::string build_endpoint_url(const DiscoveryOptions &options, const std::string &path) {
    return "http://" + options.host + ":" + std::to_string(options.port) + path;
}

static std::vector<TargetInfo> list_targets(cdp_http_client::HttpClient &http_client,
                                            const DiscoveryOptions &options) {
    cdp_http_client::HttpResponse response =
        http_client.request("GET", build_endpoint_url(options, "/json"), options.request_timeout_milliseconds);
    if (!response.ok()) {
        debug_log::log("list_targets: listing failed: " +
                       (response.error_detail.empty() ? "HTTP " + std::to_string(response.status_code)
                                                      : response.error_detail));
        return {};
    }
    return parse_target_list(response.body);
}

DiscoveryResult discover(cdp_http_client::HttpClient &http_client, const DiscoveryOptions &options) {
    DiscoveryResult result;

    std::optional<TargetInfo> chosen = select_target(list_targets(http_client, options));
    if (chosen) {
        result.success = true;
        result.target = *chosen;
        debug_log::log("discover: using target id=" + chosen->target_id + " type=" + chosen->type);
        return result;
    }

    // Recent browsers only accept PUT on /json/new; older ones only GET.
    debug_log::log("discover: no debuggable target, requesting a new tab.");
    const std::string new_target_url = build_endpoint_url(options, "/json/new?about:blank");
    cdp_http_client::HttpResponse create_response =
        http_client.request("PUT", new_target_url, options.request_timeout_milliseconds);
    if (!create_response.ok()) {
        create_response = http_client.request("GET", new_target_url, options.request_timeout_milliseconds);
    }
    if (!create_response.ok()) {
        debug_log::log("discover: new tab request failed.");
    }

    if (options.new_target_settle_milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(options.new_target_settle_milliseconds));
    }

    std::optional<TargetInfo> created = select_target(list_targets(http_client, options));
    if (created) {
        result.success = true;
        result.target = *created;
        result.created_new_target = true;
        debug_log::log("discover: using new target id=" + created->target_id + " type=" + created->type);
        return result;
    }

    result.error_detail = "No CDP targets found at port " + std::to_string(options.port) +
                          ". Start the browser with --remote-debugging-port=" + std::to_string(options.port) +
                          " or run tabscout with --launch.";
    return result;
}

} // namespace cdp_target_discovery
