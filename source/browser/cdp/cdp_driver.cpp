#include "browser/cdp/cdp_driver.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <thread>

namespace cdp_driver {

using browser_driver::DriverResult;
using browser_driver::EvaluateResult;
using browser_driver::EvaluateValueKind;

static void sleep_milliseconds(int milliseconds) {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }
}

int select_all_modifier() {
#if defined(__APPLE__)
    return 4; // Meta
#else
    return 2; // Ctrl
#endif
}

std::vector<std::string> split_utf8_characters(const std::string &text) {
    std::vector<std::string> characters;
    size_t position = 0;
    while (position < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[position]);
        size_t length = 1;
        if (lead >= 0xF0u && lead <= 0xF4u) {
            length = 4;
        } else if (lead >= 0xE0u) {
            length = 3;
        } else if (lead >= 0xC2u && lead <= 0xDFu) {
            length = 2;
        }
        if (position + length > text.size()) {
            length = 1;
        }
        // Truncated or malformed sequences are split byte by byte.
        for (size_t offset = 1; offset < length; offset++) {
            unsigned char continuation = static_cast<unsigned char>(text[position + offset]);
            if (continuation < 0x80u || continuation > 0xBFu) {
                length = 1;
                break;
            }
        }
        characters.push_back(text.substr(position, length));
        position += length;
    }
    return characters;
}

CdpDriver::CdpDriver(cdp_connection::CommandChannel &channel, DriverTiming timing)
    : channel_(channel), timing_(timing) {}

browser_driver::NavigateResult CdpDriver::navigate(const std::string &url) {
    browser_driver::NavigateResult result;

    json navigate_params;
    navigate_params["url"] = url;
    cdp_connection::CommandResult navigate_response = channel_.send_command("Page.navigate", navigate_params);

    if (!navigate_response.success) {
        result.error_text = navigate_response.error_detail;
        return result;
    }
    if (navigate_response.has_protocol_error()) {
        result.error_text = navigate_response.protocol_error_message();
        return result;
    }

    json navigate_result = navigate_response.result();
    if (navigate_result.contains("frameId") && navigate_result["frameId"].is_string()) {
        result.frame_id = navigate_result["frameId"].get<std::string>();
    }
    if (navigate_result.contains("errorText") && navigate_result["errorText"].is_string()) {
        result.error_text = navigate_result["errorText"].get<std::string>();
        return result;
    }

    debug_log::log("navigate: " + url + " ok, settling " + std::to_string(timing_.navigation_settle_milliseconds) + " ms");
    sleep_milliseconds(timing_.navigation_settle_milliseconds);
    result.success = true;
    return result;
}

std::optional<browser_driver::NodeId> CdpDriver::query_selector(const std::string &selector) {
    cdp_connection::CommandResult document_response = channel_.send_command("DOM.getDocument", json::object());
    if (!document_response.success || document_response.has_protocol_error()) {
        return std::nullopt;
    }
    json document_result = document_response.result();
    if (!document_result.contains("root") || !document_result["root"].contains("nodeId") ||
        !document_result["root"]["nodeId"].is_number_integer()) {
        return std::nullopt;
    }
    int root_node_id = document_result["root"]["nodeId"].get<int>();

    json query_params;
    query_params["nodeId"] = root_node_id;
    query_params["selector"] = selector;
    cdp_connection::CommandResult query_response = channel_.send_command("DOM.querySelector", query_params);
    if (!query_response.success || query_response.has_protocol_error()) {
        return std::nullopt;
    }
    json query_result = query_response.result();
    if (!query_result.contains("nodeId") || !query_result["nodeId"].is_number_integer()) {
        return std::nullopt;
    }
    int node_id = query_result["nodeId"].get<int>();
    if (node_id == 0) {
        return std::nullopt;
    }
    return node_id;
}

DriverResult CdpDriver::click_element(const std::string &selector) {
    DriverResult result;

    std::optional<browser_driver::NodeId> node_id = query_selector(selector);
    if (!node_id) {
        result.error_detail = "Element not found: " + selector;
        result.message = "click_element failed.";
        return result;
    }

    json box_params;
    box_params["nodeId"] = *node_id;
    cdp_connection::CommandResult box_response = channel_.send_command("DOM.getBoxModel", box_params);
    json box_result = box_response.result();
    if (!box_response.success || box_response.has_protocol_error() || !box_result.contains("model") ||
        !box_result["model"].contains("content") || !box_result["model"]["content"].is_array() ||
        box_result["model"]["content"].size() < 8) {
        result.error_detail = "Element has no box model: " + selector;
        result.message = "click_element failed.";
        return result;
    }

    // Content quad is x1,y1 .. x4,y4 clockwise from top-left.
    const json &content = box_result["model"]["content"];
    if (!content[0].is_number() || !content[1].is_number() || !content[4].is_number() || !content[5].is_number()) {
        result.error_detail = "Element box model is malformed: " + selector;
        result.message = "click_element failed.";
        return result;
    }
    double left = content[0].get<double>();
    double top = content[1].get<double>();
    double right = content[4].get<double>();
    double bottom = content[5].get<double>();
    double x = (left + right) / 2;
    double y = (top + bottom) / 2;

    json mouse_press;
    mouse_press["type"] = "mousePressed";
    mouse_press["x"] = x;
    mouse_press["y"] = y;
    mouse_press["button"] = "left";
    mouse_press["clickCount"] = 1;
    json mouse_release = mouse_press;
    mouse_release["type"] = "mouseReleased";

    for (const json *mouse_event : {&mouse_press, &mouse_release}) {
        DriverResult event_result = dispatch_input_event("Input.dispatchMouseEvent", *mouse_event);
        if (!event_result.success) {
            event_result.message = "click_element failed.";
            return event_result;
        }
    }

    result.success = true;
    result.message = "Clicked.";
    return result;
}

DriverResult CdpDriver::dispatch_input_event(const std::string &method, const json &event_params) {
    DriverResult result;
    cdp_connection::CommandResult event_response = channel_.send_command(method, event_params);
    if (!event_response.success) {
        result.error_detail = event_response.error_detail;
        return result;
    }
    if (event_response.has_protocol_error()) {
        result.error_detail = event_response.protocol_error_message();
        return result;
    }
    result.success = true;
    return result;
}

DriverResult CdpDriver::dispatch_key_event(const json &event_params) {
    return dispatch_input_event("Input.dispatchKeyEvent", event_params);
}

DriverResult CdpDriver::type_text(const std::string &text) {
    for (const auto &character : split_utf8_characters(text)) {
        json char_event;
        char_event["type"] = "char";
        char_event["text"] = character;
        DriverResult key_result = dispatch_key_event(char_event);
        if (!key_result.success) {
            key_result.message = "type_text failed.";
            return key_result;
        }
    }
    DriverResult result;
    result.success = true;
    result.message = "Typed " + std::to_string(text.size()) + " bytes.";
    return result;
}

DriverResult CdpDriver::fill_field(const std::string &selector, const std::string &text) {
    DriverResult click_result = click_element(selector);
    if (!click_result.success) {
        debug_log::log("fill_field: click failed for " + selector + ", nothing typed.");
        click_result.message = "fill_field skipped.";
        return click_result;
    }

    json select_all;
    select_all["type"] = "keyDown";
    select_all["key"] = "a";
    select_all["code"] = "KeyA";
    select_all["windowsVirtualKeyCode"] = 65;
    select_all["modifiers"] = select_all_modifier();
    select_all["commands"] = json::array({"selectAll"});
    DriverResult select_result = dispatch_key_event(select_all);
    if (!select_result.success) {
        select_result.message = "fill_field failed.";
        return select_result;
    }

    DriverResult type_result = type_text(text);
    if (type_result.success) {
        type_result.message = "Field filled.";
    }
    return type_result;
}

DriverResult CdpDriver::key_press(const std::string &key_name) {
    // Only keyDown is sent; callers relying on keyup handlers will not see one.
    json key_down;
    key_down["type"] = "keyDown";
    key_down["key"] = key_name;
    DriverResult result = dispatch_key_event(key_down);
    result.message = result.success ? "Key pressed." : "key_press failed.";
    return result;
}

EvaluateResult classify_evaluate_response(const cdp_connection::CommandResult &command_result) {
    EvaluateResult evaluate_result;

    if (!command_result.success) {
        evaluate_result.description = command_result.error_detail;
        return evaluate_result;
    }
    if (command_result.has_protocol_error()) {
        evaluate_result.description = command_result.protocol_error_message();
        return evaluate_result;
    }

    json response_result = command_result.result();
    if (response_result.contains("exceptionDetails")) {
        const json &exception_details = response_result["exceptionDetails"];
        if (exception_details.contains("exception") && exception_details["exception"].contains("description") &&
            exception_details["exception"]["description"].is_string()) {
            evaluate_result.description = exception_details["exception"]["description"].get<std::string>();
        } else if (exception_details.contains("text") && exception_details["text"].is_string()) {
            evaluate_result.description = exception_details["text"].get<std::string>();
        }
        return evaluate_result;
    }
    if (!response_result.contains("result") || !response_result["result"].is_object()) {
        return evaluate_result;
    }

    const json &remote_object = response_result["result"];
    std::string type = remote_object.contains("type") && remote_object["type"].is_string()
                           ? remote_object["type"].get<std::string>()
                           : "undefined";

    if (remote_object.contains("value")) {
        const json &value = remote_object["value"];
        evaluate_result.kind = (value.is_array() || value.is_object()) ? EvaluateValueKind::Structured
                                                                       : EvaluateValueKind::Primitive;
        evaluate_result.value = value;
        return evaluate_result;
    }
    if (type == "undefined") {
        return evaluate_result;
    }
    if (type == "object" && remote_object.contains("subtype") && remote_object["subtype"] == "null") {
        evaluate_result.kind = EvaluateValueKind::Primitive;
        evaluate_result.value = nullptr;
        return evaluate_result;
    }
    // NaN, Infinity, -0 and bigint only travel as text.
    if (remote_object.contains("unserializableValue") && remote_object["unserializableValue"].is_string()) {
        evaluate_result.kind = EvaluateValueKind::Opaque;
        evaluate_result.description = remote_object["unserializableValue"].get<std::string>();
        return evaluate_result;
    }
    if (remote_object.contains("description") && remote_object["description"].is_string()) {
        evaluate_result.kind = EvaluateValueKind::Opaque;
        evaluate_result.description = remote_object["description"].get<std::string>();
    }
    return evaluate_result;
}

EvaluateResult CdpDriver::evaluate_javascript(const std::string &script) {
    json eval_params;
    eval_params["expression"] = script;
    eval_params["returnByValue"] = true;
    EvaluateResult evaluate_result = classify_evaluate_response(channel_.send_command("Runtime.evaluate", eval_params));
    if (evaluate_result.kind == EvaluateValueKind::None && !evaluate_result.description.empty()) {
        debug_log::log("evaluate_javascript: no value: " + evaluate_result.description);
    }
    return evaluate_result;
}

bool CdpDriver::wait_for_selector(const std::string &selector, const deadline::Deadline &wait_deadline,
                                  const deadline::CancellationToken *cancellation) {
    while (true) {
        if (cancellation != nullptr && cancellation->is_cancelled()) {
            return false;
        }
        if (query_selector(selector)) {
            return true;
        }
        if (wait_deadline.expired()) {
            debug_log::log("wait_for_selector: timed out waiting for " + selector);
            return false;
        }
        sleep_milliseconds(std::min(timing_.selector_poll_interval_milliseconds,
                                    wait_deadline.remaining_milliseconds()));
    }
}

bool CdpDriver::wait_for_selector(const std::string &selector, int timeout_milliseconds) {
    return wait_for_selector(selector, deadline::Deadline::after_milliseconds(timeout_milliseconds));
}

browser_driver::CaptureScreenshotResult CdpDriver::capture_screenshot(
    const browser_driver::CaptureScreenshotOptions &options) {
    browser_driver::CaptureScreenshotResult result;

    std::string format = (options.format == "png") ? "png" : "jpeg";
    json capture_params;
    capture_params["format"] = format;
    if (format == "jpeg") {
        capture_params["quality"] = std::max(1, std::min(100, options.quality));
    }
    cdp_connection::CommandResult capture_response = channel_.send_command("Page.captureScreenshot", capture_params);

    if (!capture_response.success) {
        result.error_detail = capture_response.error_detail;
        return result;
    }
    if (capture_response.has_protocol_error()) {
        result.error_detail = capture_response.protocol_error_message();
        return result;
    }
    json capture_result = capture_response.result();
    if (!capture_result.contains("data") || !capture_result["data"].is_string()) {
        result.error_detail = "Page.captureScreenshot did not return image data.";
        return result;
    }

    result.image_base64 = capture_result["data"].get<std::string>();
    result.mime_type = "image/" + format;
    debug_log::log("capture_screenshot: captured " + std::to_string(result.image_base64.size()) + " bytes base64");

    if (options.output_path.empty()) {
        result.success = true;
        return result;
    }

    std::vector<char> decoded(result.image_base64.size() * 3 / 4 + 4);
    int decoded_length = lws_b64_decode_string(result.image_base64.c_str(), decoded.data(),
                                               static_cast<int>(decoded.size()));
    if (decoded_length < 0) {
        result.error_detail = "Screenshot payload is not valid base64.";
        return result;
    }

    std::ofstream output_file(options.output_path, std::ios::binary | std::ios::trunc);
    if (!output_file.is_open()) {
        result.error_detail = "Cannot open screenshot file for writing: " + options.output_path;
        return result;
    }
    output_file.write(decoded.data(), decoded_length);
    if (!output_file) {
        result.error_detail = "Failed to write screenshot file: " + options.output_path;
        return result;
    }

    result.saved_path = options.output_path;
    result.success = true;
    return result;
}

} // namespace cdp_driver
