#include "http_utils.hpp"
#include "trader/errors/trading_errors.hpp"
#include <chrono>
#include <cctype>
#include <curl/curl.h>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace SellManager {
namespace API {

namespace {

std::once_flag curl_global_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_global_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:
            return "GET";
        case HttpMethod::POST:
            return "POST";
        case HttpMethod::DELETE_METHOD:
            return "DELETE";
    }
    return "GET";
}

bool is_connection_refused(CURLcode curl_result) {
    return curl_result == CURLE_COULDNT_CONNECT || curl_result == CURLE_COULDNT_RESOLVE_HOST ||
           curl_result == CURLE_COULDNT_RESOLVE_PROXY;
}

} // namespace

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse perform_http_request(const HttpRequest& http_request) {
    ensure_curl_initialized();

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle(curl_easy_init(), &curl_easy_cleanup);
    if (!curl_handle) {
        throw std::runtime_error(std::string("Failed to initialize CURL for HTTP ") + method_name(http_request.method) + " request");
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);

    HttpResponse http_response;
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));
    if (http_request.method == HttpMethod::POST) {
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
        curl_easy_setopt(curl_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
    } else if (http_request.method == HttpMethod::DELETE_METHOD) {
        curl_easy_setopt(curl_handle.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    }
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_USERAGENT, "sell_manager");
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &http_response.body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    CURLcode curl_result = CURLE_OK;
    int attempt_count = http_request.retries > 0 ? http_request.retries : 1;

    for (int retry_attempt = 0; retry_attempt < attempt_count; ++retry_attempt) {
        http_response.body.clear();
        curl_result = curl_easy_perform(curl_handle.get());
        if (curl_result == CURLE_OK || is_connection_refused(curl_result)) {
            break;
        }
        if (retry_attempt < attempt_count - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.retry_delay_milliseconds));
        }
    }

    if (curl_result != CURLE_OK) {
        std::string error_message = std::string("HTTP ") + method_name(http_request.method) + " failed: " +
                                    curl_easy_strerror(curl_result) + " URL: " + http_request.url;
        if (is_connection_refused(curl_result)) {
            throw Core::BrokerConnectionError(error_message);
        }
        throw Core::TransientNetworkError(error_message);
    }

    curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_response.status_code);
    return http_response;
}

void raise_for_http_status(const HttpResponse& http_response, const std::string& request_description) {
    long status_code = http_response.status_code;
    if (status_code >= 200 && status_code < 300) {
        return;
    }

    std::string error_message = request_description + " returned HTTP " + std::to_string(status_code);
    if (!http_response.body.empty()) {
        error_message += ": " + http_response.body.substr(0, 200);
    }

    if (status_code == 429) {
        throw Core::PacingViolationError(error_message);
    }
    if (status_code == 401) {
        throw Core::BrokerConnectionError(error_message);
    }
    if (status_code == 408 || status_code >= 500) {
        throw Core::TransientNetworkError(error_message);
    }
    throw std::runtime_error(error_message);
}

std::string url_encode(const std::string& raw_value) {
    std::ostringstream encoded_stream;
    encoded_stream << std::hex << std::uppercase;
    for (unsigned char character : raw_value) {
        if (std::isalnum(character) || character == '-' || character == '_' || character == '.' || character == '~') {
            encoded_stream << character;
        } else {
            encoded_stream << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(character);
        }
    }
    return encoded_stream.str();
}

} // namespace API
} // namespace SellManager
