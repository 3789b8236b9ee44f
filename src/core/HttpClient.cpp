/**
 * @file HttpClient.cpp
 * @brief libcurl transport implementation
 */

#include "HttpClient.hpp"
#include <curl/curl.h>
#include <mutex>

namespace afg {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

} // namespace

CurlHttpClient::CurlHttpClient() : options_() {
    ensure_curl_initialized();
}

CurlHttpClient::CurlHttpClient(const Options& options) : options_(options) {
    ensure_curl_initialized();
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.transport_error = "Failed to initialize CURL";
        logger_.error(response.transport_error);
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    logger_.trace("GET " + url);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.transport_error = curl_easy_strerror(res);
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        response.body.clear();
        logger_.debug("CURL request failed: " + response.transport_error);
        curl_easy_cleanup(curl);
        return response;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    response.status_code = http_code;
    if (!response.ok()) {
        logger_.debug("HTTP status " + std::to_string(http_code) + " from " + url);
    }
    return response;
}

} // namespace afg
