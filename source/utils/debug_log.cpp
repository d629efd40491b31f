#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <string>

namespace debug_log {

static bool read_debug_flag() {
    const char *value = std::getenv("TABSCOUT_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    // Read once; the search loop logs per candidate.
    static const bool enabled = read_debug_flag();
    return enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[tabscout] " << message << std::endl;
}

void warn(const std::string &message) {
    std::cerr << "[tabscout] " << message << std::endl;
}

} // namespace debug_log
