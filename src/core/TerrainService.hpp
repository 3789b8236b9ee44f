/**
 * @file TerrainService.hpp
 * @brief Ground elevation lookup with caching, rate limiting and retry
 *
 * Elevations come from an OpenTopoData-compatible HTTP endpoint
 * (GET <base_url>?locations=lat,lon, reply {"results":[{"elevation":...}]}).
 * Coordinates are rounded to 4 decimal places before lookup; the rounded
 * value is both the cache key and the coordinate sent to the endpoint.
 *
 * Failures never raise. lookup() reports them as a TerrainError next to the
 * default elevation, and get_elevation() returns the default outright.
 */

#pragma once

#include "HttpClient.hpp"
#include "Logger.hpp"
#include "TerrainTileCache.hpp"
#include "auto_flight_generator.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace afg {

enum class TerrainError {
    TIMEOUT,             // Request or caller deadline elapsed
    TRANSPORT,           // No HTTP response (DNS, connect, TLS...)
    HTTP_STATUS,         // Non-success status other than 429
    RATE_LIMITED,        // 429 on every attempt
    MALFORMED_RESPONSE,  // Body is not the expected JSON
    NULL_ELEVATION,      // Endpoint has no data for the point
    INVALID_COORDINATE,
    OFFLINE              // Network lookups disabled by configuration
};

const char* to_string(TerrainError error);

/**
 * @brief Elevation plus the reason it is a fallback, if it is one
 */
struct TerrainLookup {
    double elevation_m = 0.0;
    std::optional<TerrainError> error;
    std::string detail;

    bool ok() const { return !error.has_value(); }
};

struct TerrainStats {
    size_t requests = 0;       // Calls to lookup()
    size_t cache_hits = 0;
    size_t shared_waits = 0;   // Callers that joined another caller's request
    size_t network_calls = 0;  // HTTP requests actually sent
    size_t retries = 0;
    size_t failures = 0;       // Lookups that ended with an error
    size_t timeouts = 0;       // Caller deadlines hit in lookup_with_timeout
    size_t tile_hits = 0;

    double hit_rate() const {
        return requests > 0 ? static_cast<double>(cache_hits) / requests : 0.0;
    }
};

class TerrainService {
public:
    struct Config {
        std::string base_url = "https://api.opentopodata.org/v1/srtm90m";
        std::chrono::milliseconds min_request_interval{1000};
        int max_attempts = 3;
        std::chrono::milliseconds backoff_base{1000};  // Delay after attempt n: base * 2^(n-1)
        size_t max_workers = 4;
        bool cache_failures = true;
        bool offline = false;
        double default_elevation_m = 0.0;

        bool use_tile_cache = false;
        TerrainTileCache::Config tile_cache;
    };

    static constexpr double KEY_SCALE = 1e4;

    explicit TerrainService(std::shared_ptr<HttpClient> http);
    TerrainService(std::shared_ptr<HttpClient> http, const Config& config);

    /**
     * @brief Joins background lookups started by lookup_with_timeout()
     */
    ~TerrainService();

    TerrainService(const TerrainService&) = delete;
    TerrainService& operator=(const TerrainService&) = delete;

    /**
     * @brief Error-carrying elevation lookup
     *
     * Concurrent callers for the same rounded coordinate share a single
     * outbound request.
     */
    TerrainLookup lookup(const Coordinate& c);

    /**
     * @brief Elevation in meters, or the default elevation on any failure
     */
    double get_elevation(const Coordinate& c);

    /**
     * @brief Lookups for many coordinates, results in input order
     *
     * Runs on up to Config::max_workers threads; the shared rate limiter
     * bounds the aggregate request rate.
     */
    std::vector<TerrainLookup> lookup_batch(const std::vector<Coordinate>& coords);
    std::vector<double> get_elevation_batch(const std::vector<Coordinate>& coords);

    /**
     * @brief Lookup bounded by a caller deadline
     *
     * The lookup runs on a background thread. If the deadline passes first, a
     * TIMEOUT result is returned; the request keeps running and may still fill
     * the cache.
     */
    TerrainLookup lookup_with_timeout(const Coordinate& c, std::chrono::milliseconds timeout);
    double get_elevation_with_timeout(const Coordinate& c, double timeout_seconds);

    /**
     * @brief Coordinate rounded to the cache key precision (4 decimals)
     */
    static Coordinate round_coordinate(const Coordinate& c);

    TerrainStats get_stats() const;
    size_t cache_size() const;
    void clear_cache();

    const Config& get_config() const { return config_; }

private:
    struct CoordinateKey {
        long long lat_e4 = 0;
        long long lon_e4 = 0;

        bool operator==(const CoordinateKey& other) const = default;
    };

    struct CoordinateKeyHash {
        size_t operator()(const CoordinateKey& key) const {
            return std::hash<long long>()(key.lat_e4 * 3600007LL + key.lon_e4);
        }
    };

    struct BackgroundLookup {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Config config_;
    std::shared_ptr<HttpClient> http_;
    std::unique_ptr<TerrainTileCache> tile_cache_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<CoordinateKey, TerrainLookup, CoordinateKeyHash> cache_;
    std::unordered_map<CoordinateKey, std::shared_future<TerrainLookup>, CoordinateKeyHash> in_flight_;

    std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point next_request_time_;

    std::mutex tile_mutex_;

    mutable std::mutex stats_mutex_;
    TerrainStats stats_;

    std::mutex background_mutex_;
    std::vector<BackgroundLookup> background_;

    Logger logger_{"TerrainService"};

    static CoordinateKey make_key(const Coordinate& c);
    TerrainLookup failure(TerrainError error, const std::string& detail) const;

    TerrainLookup fetch(const Coordinate& rounded);
    std::optional<double> fetch_via_tile(const Coordinate& rounded);

    /**
     * @brief GET with rate limiting and retry; body is filled on success
     */
    TerrainLookup request_with_retry(const std::string& url, std::string& body);
    TerrainLookup parse_point_response(const std::string& body) const;

    std::string build_url(const std::vector<Coordinate>& locations) const;
    void wait_for_rate_limit();
    void reap_finished_background();
};

} // namespace afg
