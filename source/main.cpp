// tabscout: paginated candidate search over a browser's DevTools port.
// Entry point: parses arguments, wires the CDP stack to the search pipeline.
// With --launch a local browser is started first; otherwise one must already
// be listening on CHROME_CDP_HOST:CHROME_CDP_PORT.
//
// The search result is written to stdout as JSON. Logs go to stderr.

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/cdp/cdp_connection.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_http_client.hpp"
#include "browser/cdp/cdp_target_discovery.hpp"
#include "browser/cdp/cdp_transport.hpp"
#include "config/app_config.hpp"
#include "search/candidate_search.hpp"
#include "search/candidate_store.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

struct CommandLine {
    std::string query;
    std::string location;
    int page_limit = 0;        // 0: use config
    double min_score = -1.0;   // negative: use config
    int target_count = 0;      // 0: use config
    std::string screenshot_path;
    bool launch_browser = false;
};

static void print_usage() {
    std::cerr << "usage: tabscout <query> [location] [--pages N] [--min-score X] [--target N] [--screenshot PATH] [--launch]"
              << std::endl;
}

static bool parse_command_line(int argc, char **argv, CommandLine &out_command_line) {
    std::vector<std::string> positional;
    for (int index = 1; index < argc; index++) {
        std::string argument = argv[index];
        bool has_value = index + 1 < argc;
        try {
            if (argument == "--launch") {
                out_command_line.launch_browser = true;
            } else if (argument == "--pages" && has_value) {
                out_command_line.page_limit = std::stoi(argv[++index]);
            } else if (argument == "--min-score" && has_value) {
                out_command_line.min_score = std::stod(argv[++index]);
            } else if (argument == "--target" && has_value) {
                out_command_line.target_count = std::stoi(argv[++index]);
            } else if (argument == "--screenshot" && has_value) {
                out_command_line.screenshot_path = argv[++index];
            } else if (argument.compare(0, 2, "--") == 0) {
                std::cerr << "[tabscout] Unknown or incomplete option: " << argument << std::endl;
                return false;
            } else {
                positional.push_back(argument);
            }
        } catch (const std::exception &) {
            std::cerr << "[tabscout] Invalid value for " << argument << std::endl;
            return false;
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return false;
    }
    out_command_line.query = positional[0];
    if (positional.size() == 2) {
        out_command_line.location = positional[1];
    }
    return true;
}

static candidate_search::SearchOptions build_search_options(const config::AppConfig &app_config,
                                                            const CommandLine &command_line) {
    candidate_search::SearchOptions options;
    options.query = command_line.query;
    options.location = command_line.location;
    options.page_limit = command_line.page_limit > 0 ? command_line.page_limit : app_config.max_pages_per_search;
    options.min_score = command_line.min_score >= 0.0 ? command_line.min_score : app_config.min_search_score;
    options.target_count =
        command_line.target_count > 0 ? command_line.target_count : app_config.target_candidates;
    options.network_filter = app_config.network_filter;
    options.min_page_delay_milliseconds = config::seconds_to_milliseconds(app_config.min_delay_seconds);
    options.max_page_delay_milliseconds = config::seconds_to_milliseconds(app_config.max_delay_seconds);
    return options;
}

int main(int argc, char **argv) {
    CommandLine command_line;
    if (!parse_command_line(argc, argv, command_line)) {
        print_usage();
        return 1;
    }

    config::AppConfig app_config = config::load_from_environment();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[tabscout] curl_global_init failed." << std::endl;
        return 1;
    }

    // A launched headless browser is ours to stop; a visible one is left for the user.
    cdp_chrome_launch::ChromeLaunchResult launched_browser;
    if (command_line.launch_browser) {
        cdp_chrome_launch::LaunchOptions launch_options;
        launch_options.chrome_binary = app_config.chrome_binary;
        launch_options.user_data_directory_base = app_config.user_data_directory;
        launch_options.port = app_config.cdp_port;
        launch_options.headless = app_config.headless;
        launched_browser = cdp_chrome_launch::launch_chrome(launch_options);
        if (!launched_browser.success) {
            debug_log::warn(launched_browser.error_message);
            curl_global_cleanup();
            return 1;
        }
        app_config.cdp_host = "127.0.0.1";
        app_config.cdp_port = launched_browser.debug_port;
    }

    int exit_code = 1;
    {
        std::unique_ptr<cdp_http_client::HttpClient> http_client = cdp_http_client::create_curl_http_client();

        cdp_target_discovery::DiscoveryOptions discovery_options;
        discovery_options.host = app_config.cdp_host;
        discovery_options.port = app_config.cdp_port;

        cdp_connection::CdpConnection connection(
            [&http_client, &discovery_options]() {
                return cdp_target_discovery::discover(*http_client, discovery_options);
            },
            []() { return cdp_transport::create_websocket_transport(); });
        cdp_driver::CdpDriver driver(connection);
        candidate_store::JsonFileCandidateStore store(app_config.results_directory);

        debug_log::log("Using browser at " + app_config.cdp_host + ":" + std::to_string(app_config.cdp_port));
        search_types::SearchResult search_result =
            candidate_search::smart_candidate_search(driver, store, build_search_options(app_config, command_line));

        if (!command_line.screenshot_path.empty() && search_result.success) {
            browser_driver::CaptureScreenshotOptions screenshot_options;
            screenshot_options.output_path = command_line.screenshot_path;
            browser_driver::CaptureScreenshotResult screenshot = driver.capture_screenshot(screenshot_options);
            if (screenshot.success) {
                debug_log::log("Screenshot saved to " + screenshot.saved_path);
            } else {
                debug_log::warn("Screenshot failed: " + screenshot.error_detail);
            }
        }

        std::cout << search_types::search_result_to_json(search_result).dump(2, ' ', false,
                                                                            json::error_handler_t::replace)
                  << std::endl;
        if (!search_result.success) {
            debug_log::warn("Search failed: " + search_result.error_detail);
        }
        exit_code = search_result.success ? 0 : 1;
        connection.close();
    }

    if (launched_browser.success && app_config.headless) {
        cdp_chrome_launch::stop_chrome(launched_browser);
    }

    curl_global_cleanup();
    return exit_code;
}
