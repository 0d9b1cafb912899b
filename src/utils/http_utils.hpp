#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <utility>

namespace SellManager {
namespace API {

enum class HttpMethod {
    GET,
    POST,
    DELETE_METHOD
};

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    HttpMethod method;
    std::string url;
    std::string body;                // for POST; leave empty otherwise
    int timeout_seconds;
    bool enable_ssl_verification;
    int retries;                     // transport-level attempts
    int retry_delay_milliseconds;

    HttpRequest(HttpMethod request_method, const std::string& request_url, int timeout = 30, bool ssl_verify = true,
                int retry_count = 1, std::string request_body = "")
        : method(request_method), url(request_url), body(std::move(request_body)), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), retries(retry_count), retry_delay_milliseconds(250) {}
};

struct HttpResponse {
    long status_code;
    std::string body;

    HttpResponse() : status_code(0) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

/**
 * Performs the request and returns whatever status the server answered with.
 * Transport failures are raised as BrokerConnectionError (nothing listening, unresolved host)
 * or TransientNetworkError (timeouts, resets).
 */
HttpResponse perform_http_request(const HttpRequest& http_request);

// 429 -> PacingViolationError, 401 -> BrokerConnectionError, 408/5xx -> TransientNetworkError,
// any other non-2xx -> std::runtime_error.
void raise_for_http_status(const HttpResponse& http_response, const std::string& request_description);

std::string url_encode(const std::string& raw_value);

} // namespace API
} // namespace SellManager

#endif // HTTP_UTILS_HPP
