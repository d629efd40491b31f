#ifndef TABSCOUT_CDP_DRIVER_HPP
#define TABSCOUT_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// Interaction primitives (navigate, click, type, evaluate, wait, screenshot)
// built purely on a CommandChannel. Node ids are never kept between calls:
// every selector is resolved against a freshly fetched document root.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "browser/cdp/cdp_connection.hpp"

namespace cdp_driver {

using json = nlohmann::json;

struct DriverTiming {
    // Fixed pause after Page.navigate; not tied to load events.
    int navigation_settle_milliseconds = 2000;
    int selector_poll_interval_milliseconds = 500;
};

// Modifier bit CDP uses for the platform select-all chord (Ctrl=2, Meta=4).
int select_all_modifier();

// Splits UTF-8 text into one string per character; invalid bytes stand alone.
std::vector<std::string> split_utf8_characters(const std::string &text);

class CdpDriver : public browser_driver::PageDriver {
public:
    explicit CdpDriver(cdp_connection::CommandChannel &channel, DriverTiming timing = {});

    browser_driver::NavigateResult navigate(const std::string &url) override;

    // Fresh DOM.getDocument, then DOM.querySelector from its root.
    std::optional<browser_driver::NodeId> query_selector(const std::string &selector);

    // Mouse press and release at the center of the element's content box.
    // Fails without dispatching anything if there is no match or no box model.
    browser_driver::DriverResult click_element(const std::string &selector);

    // One "char" key event per character.
    browser_driver::DriverResult type_text(const std::string &text);

    // Click into the field, select all, then type. No-op if the click fails.
    browser_driver::DriverResult fill_field(const std::string &selector, const std::string &text);

    // Dispatches keyDown only.
    browser_driver::DriverResult key_press(const std::string &key_name);

    browser_driver::EvaluateResult evaluate_javascript(const std::string &script) override;

    bool wait_for_selector(const std::string &selector, const deadline::Deadline &wait_deadline,
                           const deadline::CancellationToken *cancellation = nullptr) override;
    bool wait_for_selector(const std::string &selector, int timeout_milliseconds);

    browser_driver::CaptureScreenshotResult capture_screenshot(
        const browser_driver::CaptureScreenshotOptions &options = {});

private:
    // Input.* command; a protocol error reply counts as failure.
    browser_driver::DriverResult dispatch_input_event(const std::string &method, const json &event_params);
    browser_driver::DriverResult dispatch_key_event(const json &event_params);

    cdp_connection::CommandChannel &channel_;
    DriverTiming timing_;
};

// Maps a Runtime.evaluate reply to the tagged result. Exposed for tests.
browser_driver::EvaluateResult classify_evaluate_response(const cdp_connection::CommandResult &command_result);

} // namespace cdp_driver

#endif // TABSCOUT_CDP_DRIVER_HPP
