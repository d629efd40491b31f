#include "browser/cdp/cdp_http_client.hpp"
#include "utils/debug_log.hpp"

#include <curl/curl.h>

namespace cdp_http_client {

namespace {

// Discovery listings are small; anything larger is not a DevTools endpoint.
constexpr size_t kMaximumBodyBytes = 4 * 1024 * 1024;

size_t write_body_callback(char *data, size_t size, size_t count, void *user_data) {
    auto *body = static_cast<std::string *>(user_data);
    size_t total = size * count;
    if (body->size() + total > kMaximumBodyBytes) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    body->append(data, total);
    return total;
}

class CurlHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string &method, const std::string &url,
                         int timeout_milliseconds) override {
        HttpResponse response;

        CURL *curl = curl_easy_init();
        if (curl == nullptr) {
            response.error_detail = "curl_easy_init failed";
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "tabscout/1.0");
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_milliseconds));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_milliseconds));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode result_code = curl_easy_perform(curl);
        if (result_code != CURLE_OK) {
            response.error_detail = std::string("curl error: ") + curl_easy_strerror(result_code);
            debug_log::log(method + " " + url + " failed: " + response.error_detail);
            curl_easy_cleanup(curl);
            return response;
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        curl_easy_cleanup(curl);
        response.success = true;
        debug_log::log(method + " " + url + " -> HTTP " + std::to_string(response.status_code));
        return response;
    }
};

} // namespace

std::unique_ptr<HttpClient> create_curl_http_client() {
    return std::make_unique<CurlHttpClient>();
}

} // namespace cdp_http_client
