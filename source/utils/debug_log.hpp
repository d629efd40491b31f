#ifndef TABSCOUT_DEBUG_LOG_HPP
#define TABSCOUT_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if TABSCOUT_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [tabscout] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [tabscout] prefix unconditionally.
void warn(const std::string &message);

} // namespace debug_log

#endif // TABSCOUT_DEBUG_LOG_HPP
