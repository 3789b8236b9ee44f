/**
 * @file TerrainTileCache.cpp
 * @brief Disk-backed terrain tile cache
 */

#include "TerrainTileCache.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <limits>

using json = nlohmann::json;

namespace afg {

TerrainTileCache::TerrainTileCache() : TerrainTileCache(Config{}) {
}

TerrainTileCache::TerrainTileCache(const Config& config) : config_(config) {
    if (config_.persist_to_disk) {
        disk_available_ = ensure_cache_directory();
    }
    logger_.detailed("Terrain tile cache at " + config_.cache_directory +
                     (disk_available_ ? "" : " (memory only)"));
}

TileKey TerrainTileCache::tile_for(const Coordinate& c) {
    // Nudge so that values sitting on a tile edge (40.0) never floor to 39.9
    return TileKey{static_cast<int>(std::floor(c.lat * 10.0 + 1e-9)),
                   static_cast<int>(std::floor(c.lon * 10.0 + 1e-9))};
}

Coordinate TerrainTileCache::tile_origin(const TileKey& key) {
    return Coordinate(key.lat_index * TILE_SIZE_DEG, key.lon_index * TILE_SIZE_DEG);
}

std::vector<Coordinate> TerrainTileCache::sample_locations(const TileKey& key) {
    const Coordinate origin = tile_origin(key);
    std::vector<Coordinate> samples;
    samples.reserve(SAMPLES_PER_AXIS * SAMPLES_PER_AXIS);
    for (int row = 0; row < SAMPLES_PER_AXIS; ++row) {
        for (int col = 0; col < SAMPLES_PER_AXIS; ++col) {
            samples.emplace_back(origin.lat + row * SAMPLE_STEP_DEG,
                                 origin.lon + col * SAMPLE_STEP_DEG);
        }
    }
    return samples;
}

std::string TerrainTileCache::tile_filename(const TileKey& key) {
    const Coordinate origin = tile_origin(key);
    std::ostringstream name;
    name << std::fixed << std::setprecision(1)
         << (key.lat_index >= 0 ? 'N' : 'S') << std::abs(origin.lat)
         << (key.lon_index >= 0 ? 'E' : 'W') << std::abs(origin.lon)
         << ".json";
    return name.str();
}

std::optional<double> TerrainTileCache::lookup(const Coordinate& c) {
    const TileKey key = tile_for(c);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    stats_.point_queries++;

    auto it = tiles_.find(key);
    if (it == tiles_.end()) {
        auto loaded = load_from_disk(key);
        if (!loaded) {
            return std::nullopt;
        }
        it = tiles_.emplace(key, std::move(*loaded)).first;
        stats_.tiles_loaded_from_disk++;
    }

    const Sample* nearest = nullptr;
    double best = std::numeric_limits<double>::max();
    for (const auto& sample : it->second) {
        const double dlat = sample.position.lat - c.lat;
        const double dlon = sample.position.lon - c.lon;
        const double d2 = dlat * dlat + dlon * dlon;
        if (d2 < best) {
            best = d2;
            nearest = &sample;
        }
    }

    if (!nearest) {
        return std::nullopt;
    }
    stats_.point_hits++;
    return nearest->elevation_m;
}

bool TerrainTileCache::store(const TileKey& key, const std::string& raw_response) {
    auto samples = parse_samples(key, raw_response);
    if (!samples) {
        return false;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    tiles_[key] = std::move(*samples);
    stats_.tiles_stored++;

    if (disk_available_ && !write_to_disk(key, raw_response)) {
        stats_.disk_errors++;
    }
    return true;
}

bool TerrainTileCache::has_tile(const TileKey& key) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return tiles_.count(key) > 0;
}

TileCacheStats TerrainTileCache::get_stats() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return stats_;
}

std::optional<std::vector<TerrainTileCache::Sample>>
TerrainTileCache::parse_samples(const TileKey& key, const std::string& raw_response) const {
    const auto expected = sample_locations(key);

    try {
        json response = json::parse(raw_response);
        const auto& results = response.at("results");
        if (!results.is_array()) {
            logger_.debug("Tile response 'results' is not an array");
            return std::nullopt;
        }

        std::vector<Sample> samples;
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& entry = results[i];
            if (!entry.contains("elevation") || !entry["elevation"].is_number()) {
                continue;
            }

            Coordinate position;
            if (entry.contains("location") && entry["location"].is_object()) {
                position.lat = entry["location"].value("lat", 0.0);
                position.lon = entry["location"].value("lng", 0.0);
            } else if (i < expected.size()) {
                position = expected[i];
            } else {
                continue;
            }
            samples.push_back(Sample{position, entry["elevation"].get<double>()});
        }

        if (samples.empty()) {
            return std::nullopt;
        }
        return samples;
    } catch (const json::exception& e) {
        logger_.debug("Malformed tile response for " + tile_filename(key) + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<TerrainTileCache::Sample>> TerrainTileCache::load_from_disk(const TileKey& key) {
    if (!config_.persist_to_disk) {
        return std::nullopt;
    }

    const auto path = std::filesystem::path(config_.cache_directory) / tile_filename(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        logger_.warning("Cannot read cached terrain tile " + path.string());
        stats_.disk_errors++;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto samples = parse_samples(key, buffer.str());
    if (!samples) {
        logger_.warning("Ignoring corrupt terrain tile " + path.string());
        stats_.disk_errors++;
        return std::nullopt;
    }

    logger_.debug("Loaded terrain tile " + path.string());
    return samples;
}

bool TerrainTileCache::write_to_disk(const TileKey& key, const std::string& raw_response) {
    const auto path = std::filesystem::path(config_.cache_directory) / tile_filename(key);

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        logger_.warning("Failed to write terrain tile " + path.string());
        return false;
    }
    file << raw_response;
    if (!file.good()) {
        logger_.warning("Incomplete write of terrain tile " + path.string());
        return false;
    }
    return true;
}

bool TerrainTileCache::ensure_cache_directory() {
    std::error_code ec;
    std::filesystem::create_directories(config_.cache_directory, ec);
    if (ec) {
        logger_.warning("Cannot create terrain cache directory " + config_.cache_directory +
                        ": " + ec.message() + "; continuing without disk cache");
        return false;
    }
    return true;
}

} // namespace afg
