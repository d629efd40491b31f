#ifndef TABSCOUT_URL_ENCODE_HPP
#define TABSCOUT_URL_ENCODE_HPP

#include <string>

namespace url_encode {

// Form-style query encoding: unreserved bytes pass through, space becomes '+',
// everything else becomes %XX (uppercase hex). Operates on raw UTF-8 bytes.
std::string encode_query_component(const std::string &text);

} // namespace url_encode

#endif // TABSCOUT_URL_ENCODE_HPP
