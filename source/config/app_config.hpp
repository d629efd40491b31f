#ifndef TABSCOUT_APP_CONFIG_HPP
#define TABSCOUT_APP_CONFIG_HPP

// Runtime settings, read from the environment.

#include <functional>
#include <string>

namespace config {

// Upper bounds accepted from the environment.
constexpr double kMaximumDelaySeconds = 3600.0;
constexpr double kMaximumSearchScore = 1000.0;

struct AppConfig {
    std::string cdp_host = "127.0.0.1";
    int cdp_port = 9222;

    // Random pause between result pages.
    double min_delay_seconds = 1.0;
    double max_delay_seconds = 3.0;

    int max_pages_per_search = 3;
    double min_search_score = 3.0;
    int target_candidates = 10;

    // "F", "S" or "O"; empty disables the network filter.
    std::string network_filter;
    std::string results_directory = "results";

    // Used only with --launch.
    std::string chrome_binary;                        // empty: search well-known locations
    std::string user_data_directory = "./chrome_data"; // profile is <dir>-<port>
    bool headless = true;
};

// Returns the value of a variable, or nullptr when unset.
using EnvironmentLookup = std::function<const char *(const char *)>;

// Reads every field from its environment variable. Invalid values are reported
// on stderr and the default is kept.
AppConfig load_from_environment();
AppConfig load_from_environment(const EnvironmentLookup &lookup);

// Delay in whole milliseconds, clamped to [0, kMaximumDelaySeconds]. Non-finite input yields 0.
int seconds_to_milliseconds(double seconds);

} // namespace config

#endif // TABSCOUT_APP_CONFIG_HPP
