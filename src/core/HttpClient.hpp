/**
 * @file HttpClient.hpp
 * @brief Minimal HTTP GET transport used by the terrain service
 */

#pragma once

#include "Logger.hpp"
#include <string>

namespace afg {

/**
 * @brief Outcome of one HTTP exchange
 *
 * status_code is 0 when no response was received; transport_error then
 * describes why and timed_out tells a timeout apart from other failures.
 */
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string transport_error;
    bool timed_out = false;

    bool received() const { return status_code != 0; }
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Abstract GET transport
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;
};

/**
 * @brief libcurl-backed transport, one easy handle per request
 */
class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::string user_agent;
        long timeout_seconds;
        long connect_timeout_seconds;

        Options()
            : user_agent("AutoFlightGenerator/1.0"),
              timeout_seconds(10),
              connect_timeout_seconds(5) {}
    };

    CurlHttpClient();
    explicit CurlHttpClient(const Options& options);

    HttpResponse get(const std::string& url) override;

private:
    Options options_;
    Logger logger_{"HttpClient"};
};

} // namespace afg
