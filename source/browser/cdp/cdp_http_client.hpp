#ifndef TABSCOUT_CDP_HTTP_CLIENT_HPP
#define TABSCOUT_CDP_HTTP_CLIENT_HPP

// Minimal HTTP client for the DevTools discovery endpoints (/json, /json/new).

#include <memory>
#include <string>

namespace cdp_http_client {

struct HttpResponse {
    bool success = false;   // transfer completed (any status code)
    long status_code = 0;
    std::string body;
    std::string error_detail;

    bool ok() const { return success && status_code >= 200 && status_code < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // method is "GET" or "PUT"; the request carries no body.
    virtual HttpResponse request(const std::string &method, const std::string &url,
                                 int timeout_milliseconds) = 0;
};

// libcurl-backed client. curl_global_init must have run (main does it).
std::unique_ptr<HttpClient> create_curl_http_client();

} // namespace cdp_http_client

#endif // TABSCOUT_CDP_HTTP_CLIENT_HPP
