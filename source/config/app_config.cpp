#include "config/app_config.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace config {

static bool read_int(const EnvironmentLookup &lookup, const char *name, int minimum, int &out_value) {
    const char *raw_value = lookup(name);
    if (raw_value == nullptr || raw_value[0] == '\0') {
        return false;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(raw_value, &consumed);
        if (consumed != std::string(raw_value).size() || parsed < minimum) {
            debug_log::warn(std::string("Ignoring invalid ") + name + "=" + raw_value);
            return false;
        }
        out_value = parsed;
        return true;
    } catch (const std::exception &) {
        debug_log::warn(std::string("Ignoring invalid ") + name + "=" + raw_value);
        return false;
    }
}

static bool read_double(const EnvironmentLookup &lookup, const char *name, double minimum, double maximum,
                        double &out_value) {
    const char *raw_value = lookup(name);
    if (raw_value == nullptr || raw_value[0] == '\0') {
        return false;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(raw_value, &consumed);
        // stod accepts "nan" and "inf"; NaN also passes every range comparison.
        if (consumed != std::string(raw_value).size() || !std::isfinite(parsed) || parsed < minimum ||
            parsed > maximum) {
            debug_log::warn(std::string("Ignoring invalid ") + name + "=" + raw_value);
            return false;
        }
        out_value = parsed;
        return true;
    } catch (const std::exception &) {
        debug_log::warn(std::string("Ignoring invalid ") + name + "=" + raw_value);
        return false;
    }
}

int seconds_to_milliseconds(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return 0;
    }
    double milliseconds = std::min(seconds, kMaximumDelaySeconds) * 1000.0;
    return static_cast<int>(milliseconds);
}

static bool read_bool(const EnvironmentLookup &lookup, const char *name, bool &out_value) {
    const char *raw_value = lookup(name);
    if (raw_value == nullptr || raw_value[0] == '\0') {
        return false;
    }
    std::string lowered(raw_value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        out_value = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        out_value = false;
        return true;
    }
    debug_log::warn(std::string("Ignoring invalid ") + name + "=" + raw_value);
    return false;
}

static void read_string(const EnvironmentLookup &lookup, const char *name, std::string &out_value) {
    const char *raw_value = lookup(name);
    if (raw_value != nullptr && raw_value[0] != '\0') {
        out_value = raw_value;
    }
}

AppConfig load_from_environment() {
    return load_from_environment([](const char *name) -> const char * { return std::getenv(name); });
}

AppConfig load_from_environment(const EnvironmentLookup &lookup) {
    AppConfig app_config;

    read_string(lookup, "CHROME_CDP_HOST", app_config.cdp_host);
    int cdp_port = app_config.cdp_port;
    if (read_int(lookup, "CHROME_CDP_PORT", 1, cdp_port)) {
        if (cdp_port > 65535) {
            debug_log::warn("Ignoring out of range CHROME_CDP_PORT=" + std::to_string(cdp_port));
        } else {
            app_config.cdp_port = cdp_port;
        }
    }

    read_double(lookup, "MIN_DELAY_SECONDS", 0.0, kMaximumDelaySeconds, app_config.min_delay_seconds);
    read_double(lookup, "MAX_DELAY_SECONDS", 0.0, kMaximumDelaySeconds, app_config.max_delay_seconds);
    if (app_config.max_delay_seconds < app_config.min_delay_seconds) {
        app_config.max_delay_seconds = app_config.min_delay_seconds;
    }

    read_int(lookup, "MAX_PAGES_PER_SEARCH", 1, app_config.max_pages_per_search);
    read_double(lookup, "MIN_SEARCH_SCORE", 0.0, kMaximumSearchScore, app_config.min_search_score);
    read_int(lookup, "TARGET_QUALITY_CANDIDATES", 1, app_config.target_candidates);

    std::string network_filter;
    read_string(lookup, "LINKEDIN_NETWORK_FILTER", network_filter);
    if (network_filter == "F" || network_filter == "S" || network_filter == "O") {
        app_config.network_filter = network_filter;
    } else if (!network_filter.empty()) {
        debug_log::warn("Ignoring LINKEDIN_NETWORK_FILTER=" + network_filter + " (expected F, S or O)");
    }

    read_string(lookup, "RESULTS_DIRECTORY", app_config.results_directory);

    read_string(lookup, "CHROME_BIN", app_config.chrome_binary);
    read_string(lookup, "USER_DATA_DIR", app_config.user_data_directory);
    read_bool(lookup, "HEADLESS_MODE", app_config.headless);
    return app_config;
}

} // namespace config
