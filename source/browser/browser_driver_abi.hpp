#ifndef TABSCOUT_BROWSER_DRIVER_ABI_HPP
#define TABSCOUT_BROWSER_DRIVER_ABI_HPP

// Browser driver abstraction interface.
// The search pipeline and the extraction adapter only see PageDriver; the CDP
// driver implements it, and tests substitute scripted drivers.

#include <nlohmann/json.hpp>
#include <string>

#include "utils/deadline.hpp"

namespace browser_driver {

using json = nlohmann::json;

// Handle to a node of the currently loaded document. Invalid after navigation.
using NodeId = int;

// Result of a browser driver operation.
struct DriverResult {
    bool success = false;
    std::string message;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    std::string frame_id;
    std::string error_text; // CDP errorText or dispatcher failure
};

// Tag of an evaluate_javascript result.
enum class EvaluateValueKind {
    None,       // execution error, thrown exception, undefined, or no response
    Primitive,  // string, number, boolean or null; value is exact
    Structured, // array or object returned by value; value is exact
    Opaque      // only a textual description could be captured
};

struct EvaluateResult {
    EvaluateValueKind kind = EvaluateValueKind::None;
    json value;              // Primitive / Structured
    std::string description; // Opaque, or exception text when kind is None

    bool has_value() const {
        return kind == EvaluateValueKind::Primitive || kind == EvaluateValueKind::Structured;
    }
};

// Options for capture_screenshot. quality applies to jpeg only.
struct CaptureScreenshotOptions {
    std::string format = "jpeg"; // "png" | "jpeg"
    int quality = 80;            // 1..100
    std::string output_path;     // empty: return base64 payload only
};

// Result of capturing a screenshot of the current tab.
struct CaptureScreenshotResult {
    bool success = false;
    std::string image_base64;
    std::string mime_type;   // e.g. "image/jpeg"
    std::string saved_path;  // set when output_path was given and written
    std::string error_detail;
};

// The page-level operations the search pipeline depends on.
class PageDriver {
public:
    virtual ~PageDriver() = default;

    virtual NavigateResult navigate(const std::string &url) = 0;

    // Polls until the selector matches, the deadline expires or cancellation is requested.
    virtual bool wait_for_selector(const std::string &selector, const deadline::Deadline &wait_deadline,
                                   const deadline::CancellationToken *cancellation = nullptr) = 0;

    virtual EvaluateResult evaluate_javascript(const std::string &script) = 0;
};

} // namespace browser_driver

#endif // TABSCOUT_BROWSER_DRIVER_ABI_HPP
