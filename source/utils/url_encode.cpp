#include "utils/url_encode.hpp"

#include <cctype>

namespace url_encode {

namespace {

bool is_unreserved(unsigned char byte) {
    return std::isalnum(byte) != 0 || byte == '-' || byte == '_' || byte == '.' || byte == '~';
}

} // namespace

std::string encode_query_component(const std::string &text) {
    static const char kHexDigits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (char character : text) {
        unsigned char byte = static_cast<unsigned char>(character);
        if (is_unreserved(byte)) {
            encoded.push_back(character);
        } else if (byte == ' ') {
            encoded.push_back('+');
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[byte >> 4]);
            encoded.push_back(kHexDigits[byte & 0x0F]);
        }
    }
    return encoded;
}

} // namespace url_encode
