/**
 * @file TerrainService.cpp
 * @brief Ground elevation lookup with caching, rate limiting and retry
 */

#include "TerrainService.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

using json = nlohmann::json;

namespace afg {

const char* to_string(TerrainError error) {
    switch (error) {
        case TerrainError::TIMEOUT:            return "timeout";
        case TerrainError::TRANSPORT:          return "transport error";
        case TerrainError::HTTP_STATUS:        return "HTTP error";
        case TerrainError::RATE_LIMITED:       return "rate limited";
        case TerrainError::MALFORMED_RESPONSE: return "malformed response";
        case TerrainError::NULL_ELEVATION:     return "no elevation data";
        case TerrainError::INVALID_COORDINATE: return "invalid coordinate";
        case TerrainError::OFFLINE:            return "offline";
    }
    return "unknown";
}

TerrainService::TerrainService(std::shared_ptr<HttpClient> http)
    : TerrainService(std::move(http), Config{}) {
}

TerrainService::TerrainService(std::shared_ptr<HttpClient> http, const Config& config)
    : config_(config), http_(std::move(http)),
      next_request_time_(std::chrono::steady_clock::now()) {
    if (config_.max_attempts < 1) {
        config_.max_attempts = 1;
    }
    if (config_.max_workers < 1) {
        config_.max_workers = 1;
    }
    if (!http_ && !config_.offline) {
        logger_.warning("No HTTP client configured; terrain lookups run offline");
        config_.offline = true;
    }
    if (config_.use_tile_cache) {
        tile_cache_ = std::make_unique<TerrainTileCache>(config_.tile_cache);
    }
    logger_.detailed("Terrain endpoint: " + config_.base_url +
                     (config_.offline ? " (offline)" : ""));
}

TerrainService::~TerrainService() {
    std::vector<BackgroundLookup> pending;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        pending.swap(background_);
    }
    for (auto& task : pending) {
        if (task.worker.joinable()) {
            task.worker.join();
        }
    }
}

// ============================================================================
// Keys and helpers
// ============================================================================

TerrainService::CoordinateKey TerrainService::make_key(const Coordinate& c) {
    return CoordinateKey{std::llround(c.lat * KEY_SCALE), std::llround(c.lon * KEY_SCALE)};
}

Coordinate TerrainService::round_coordinate(const Coordinate& c) {
    const auto key = make_key(c);
    return Coordinate(static_cast<double>(key.lat_e4) / KEY_SCALE,
                      static_cast<double>(key.lon_e4) / KEY_SCALE);
}

TerrainLookup TerrainService::failure(TerrainError error, const std::string& detail) const {
    TerrainLookup result;
    result.elevation_m = config_.default_elevation_m;
    result.error = error;
    result.detail = detail;
    return result;
}

std::string TerrainService::build_url(const std::vector<Coordinate>& locations) const {
    std::ostringstream url;
    url << config_.base_url << "?locations=" << std::fixed << std::setprecision(4);
    for (size_t i = 0; i < locations.size(); ++i) {
        if (i > 0) {
            url << "%7C";  // '|' separates locations
        }
        url << locations[i].lat << "," << locations[i].lon;
    }
    return url.str();
}

// ============================================================================
// Public lookups
// ============================================================================

TerrainLookup TerrainService::lookup(const Coordinate& c) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.requests++;
    }

    if (!c.is_valid()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.failures++;
        return failure(TerrainError::INVALID_COORDINATE, "coordinate out of range");
    }

    const CoordinateKey key = make_key(c);
    std::promise<TerrainLookup> promise;
    std::shared_future<TerrainLookup> shared;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);

        auto cached = cache_.find(key);
        if (cached != cache_.end()) {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.cache_hits++;
            return cached->second;
        }

        auto pending = in_flight_.find(key);
        if (pending != in_flight_.end()) {
            shared = pending->second;
        } else {
            shared = promise.get_future().share();
            in_flight_.emplace(key, shared);
            owner = true;
        }
    }

    if (!owner) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.shared_waits++;
        }
        return shared.get();
    }

    const Coordinate rounded = round_coordinate(c);
    TerrainLookup result;
    try {
        result = fetch(rounded);
    } catch (const std::exception& e) {
        // Waiters on this key must always be released
        result = failure(TerrainError::TRANSPORT, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (result.ok() || config_.cache_failures) {
            cache_[key] = result;
        }
        in_flight_.erase(key);
    }
    promise.set_value(result);

    if (!result.ok()) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.failures++;
        }
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(4) << "Elevation unavailable at ("
            << rounded.lat << ", " << rounded.lon << "): " << to_string(*result.error);
        if (!result.detail.empty()) {
            msg << " (" << result.detail << ")";
        }
        msg << "; using " << config_.default_elevation_m << " m";
        logger_.warning(msg.str());
    }
    return result;
}

double TerrainService::get_elevation(const Coordinate& c) {
    return lookup(c).elevation_m;
}

std::vector<TerrainLookup> TerrainService::lookup_batch(const std::vector<Coordinate>& coords) {
    std::vector<TerrainLookup> results(coords.size());
    if (coords.empty()) {
        return results;
    }

    const size_t workers = std::min(config_.max_workers, coords.size());
    if (workers <= 1) {
        for (size_t i = 0; i < coords.size(); ++i) {
            results[i] = lookup(coords[i]);
        }
        return results;
    }

    logger_.debug("Batch lookup of " + std::to_string(coords.size()) + " points on " +
                  std::to_string(workers) + " workers");

    std::atomic<size_t> next_index{0};
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [this, &coords, &results, &next_index] {
            for (size_t i = next_index++; i < coords.size(); i = next_index++) {
                results[i] = lookup(coords[i]);
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    return results;
}

std::vector<double> TerrainService::get_elevation_batch(const std::vector<Coordinate>& coords) {
    auto lookups = lookup_batch(coords);
    std::vector<double> elevations;
    elevations.reserve(lookups.size());
    for (const auto& result : lookups) {
        elevations.push_back(result.elevation_m);
    }
    return elevations;
}

TerrainLookup TerrainService::lookup_with_timeout(const Coordinate& c,
                                                  std::chrono::milliseconds timeout) {
    reap_finished_background();

    auto promise = std::make_shared<std::promise<TerrainLookup>>();
    std::future<TerrainLookup> future = promise->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread worker([this, c, promise, done] {
        TerrainLookup result;
        try {
            result = lookup(c);
        } catch (const std::exception& e) {
            result = failure(TerrainError::TRANSPORT, e.what());
        }
        promise->set_value(result);
        done->store(true);
    });

    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        background_.push_back(BackgroundLookup{std::move(worker), done});
    }

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.timeouts++;
    }
    logger_.warning("Elevation lookup exceeded " + std::to_string(timeout.count()) +
                    " ms; continuing with default elevation");
    return failure(TerrainError::TIMEOUT, "caller deadline elapsed");
}

double TerrainService::get_elevation_with_timeout(const Coordinate& c, double timeout_seconds) {
    const auto timeout = std::chrono::milliseconds(
        static_cast<long long>(std::max(0.0, timeout_seconds) * 1000.0));
    return lookup_with_timeout(c, timeout).elevation_m;
}

void TerrainService::reap_finished_background() {
    std::vector<BackgroundLookup> finished;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        auto split = std::partition(background_.begin(), background_.end(),
                                    [](const BackgroundLookup& task) { return !task.done->load(); });
        std::move(split, background_.end(), std::back_inserter(finished));
        background_.erase(split, background_.end());
    }
    for (auto& task : finished) {
        if (task.worker.joinable()) {
            task.worker.join();
        }
    }
}

TerrainStats TerrainService::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

size_t TerrainService::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void TerrainService::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

// ============================================================================
// Fetching
// ============================================================================

TerrainLookup TerrainService::fetch(const Coordinate& rounded) {
    if (tile_cache_) {
        if (auto elevation = fetch_via_tile(rounded)) {
            TerrainLookup result;
            result.elevation_m = *elevation;
            return result;
        }
    }

    if (config_.offline) {
        return failure(TerrainError::OFFLINE, "network lookups disabled");
    }

    std::string body;
    TerrainLookup transfer = request_with_retry(build_url({rounded}), body);
    if (!transfer.ok()) {
        return transfer;
    }
    return parse_point_response(body);
}

std::optional<double> TerrainService::fetch_via_tile(const Coordinate& rounded) {
    if (auto elevation = tile_cache_->lookup(rounded)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.tile_hits++;
        return elevation;
    }

    if (config_.offline) {
        return std::nullopt;
    }

    // One tile download at a time; a second caller finds the tile on re-check
    std::lock_guard<std::mutex> tile_lock(tile_mutex_);
    const TileKey key = TerrainTileCache::tile_for(rounded);
    if (!tile_cache_->has_tile(key)) {
        std::string body;
        TerrainLookup transfer = request_with_retry(
            build_url(TerrainTileCache::sample_locations(key)), body);
        if (!transfer.ok()) {
            logger_.debug("Tile " + TerrainTileCache::tile_filename(key) +
                          " unavailable; falling back to point query");
            return std::nullopt;
        }
        if (!tile_cache_->store(key, body)) {
            logger_.debug("Tile " + TerrainTileCache::tile_filename(key) +
                          " had no usable samples; falling back to point query");
            return std::nullopt;
        }
        logger_.detailed("Cached terrain tile " + TerrainTileCache::tile_filename(key));
    }

    auto elevation = tile_cache_->lookup(rounded);
    if (elevation) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.tile_hits++;
    }
    return elevation;
}

void TerrainService::wait_for_rate_limit() {
    std::chrono::steady_clock::time_point slot;
    {
        // Reserve the next send slot so concurrent workers queue up in order
        std::lock_guard<std::mutex> lock(rate_mutex_);
        slot = std::max(std::chrono::steady_clock::now(), next_request_time_);
        next_request_time_ = slot + config_.min_request_interval;
    }
    std::this_thread::sleep_until(slot);
}

TerrainLookup TerrainService::request_with_retry(const std::string& url, std::string& body) {
    TerrainLookup last = failure(TerrainError::TRANSPORT, "no attempt made");

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        if (attempt > 1) {
            logger_.debug("Retry " + std::to_string(attempt) + "/" +
                          std::to_string(config_.max_attempts) + " for " + url);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.retries++;
        }

        wait_for_rate_limit();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.network_calls++;
        }

        HttpResponse response = http_->get(url);

        if (!response.received()) {
            last = failure(response.timed_out ? TerrainError::TIMEOUT : TerrainError::TRANSPORT,
                           response.transport_error);
        } else if (response.status_code == 429) {
            last = failure(TerrainError::RATE_LIMITED, "HTTP 429");
        } else if (response.status_code >= 500) {
            last = failure(TerrainError::HTTP_STATUS, "HTTP " + std::to_string(response.status_code));
        } else if (!response.ok()) {
            return failure(TerrainError::HTTP_STATUS, "HTTP " + std::to_string(response.status_code));
        } else {
            body = std::move(response.body);
            return TerrainLookup{};
        }

        if (attempt < config_.max_attempts) {
            // Exponential backoff: base, 2*base, 4*base, ...
            const auto delay = config_.backoff_base * (1LL << (attempt - 1));
            std::this_thread::sleep_for(delay);
        }
    }

    return last;
}

TerrainLookup TerrainService::parse_point_response(const std::string& body) const {
    try {
        json response = json::parse(body);

        const std::string status = response.value("status", "OK");
        if (status != "OK") {
            return failure(TerrainError::MALFORMED_RESPONSE,
                           "status " + status + ": " + response.value("error", ""));
        }

        const auto& results = response.at("results");
        if (!results.is_array() || results.empty()) {
            return failure(TerrainError::MALFORMED_RESPONSE, "empty results");
        }

        const auto& first = results.at(0);
        if (!first.contains("elevation")) {
            return failure(TerrainError::MALFORMED_RESPONSE, "missing elevation field");
        }
        const auto& elevation = first.at("elevation");
        if (elevation.is_null()) {
            return failure(TerrainError::NULL_ELEVATION, "elevation is null");
        }
        if (!elevation.is_number()) {
            return failure(TerrainError::MALFORMED_RESPONSE, "elevation is not a number");
        }

        TerrainLookup result;
        result.elevation_m = elevation.get<double>();
        return result;
    } catch (const json::exception& e) {
        return failure(TerrainError::MALFORMED_RESPONSE, e.what());
    }
}

} // namespace afg
