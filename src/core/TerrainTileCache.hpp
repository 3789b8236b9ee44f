/**
 * @file TerrainTileCache.hpp
 * @brief Disk-backed cache of coarse terrain sample tiles
 *
 * The world is partitioned into 0.1 degree tiles. Each tile stores a 3x3 grid
 * of elevation samples (offsets 0, 0.05 and 0.1 degrees from the south-west
 * corner) as the raw elevation API response, one JSON file per tile. Point
 * queries are answered from the nearest sample of the containing tile.
 */

#pragma once

#include "Logger.hpp"
#include "auto_flight_generator.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <optional>

namespace afg {

/**
 * @brief Integer tile index: floor(degrees / 0.1)
 */
struct TileKey {
    int lat_index = 0;
    int lon_index = 0;

    bool operator==(const TileKey& other) const = default;
};

struct TileKeyHash {
    size_t operator()(const TileKey& key) const {
        return std::hash<long long>()(
            (static_cast<long long>(key.lat_index) << 32) ^
            static_cast<long long>(static_cast<unsigned int>(key.lon_index)));
    }
};

struct TileCacheStats {
    size_t point_queries = 0;
    size_t point_hits = 0;
    size_t tiles_stored = 0;
    size_t tiles_loaded_from_disk = 0;
    size_t disk_errors = 0;

    double hit_rate() const {
        return point_queries > 0 ? static_cast<double>(point_hits) / point_queries : 0.0;
    }
};

class TerrainTileCache {
public:
    static constexpr double TILE_SIZE_DEG = 0.1;
    static constexpr double SAMPLE_STEP_DEG = 0.05;
    static constexpr int SAMPLES_PER_AXIS = 3;

    struct Config {
        std::string cache_directory = "cache/terrain_tiles";
        bool persist_to_disk = true;
    };

    TerrainTileCache();
    explicit TerrainTileCache(const Config& config);

    static TileKey tile_for(const Coordinate& c);
    static Coordinate tile_origin(const TileKey& key);

    /**
     * @brief The 3x3 sample positions of a tile, row-major from the south-west
     */
    static std::vector<Coordinate> sample_locations(const TileKey& key);

    /**
     * @brief File name of a tile, e.g. "N40.0W75.0.json"
     */
    static std::string tile_filename(const TileKey& key);

    /**
     * @brief Nearest-sample elevation for a point, from memory or disk
     * @return nullopt when the containing tile is not cached
     */
    std::optional<double> lookup(const Coordinate& c);

    /**
     * @brief Parse a raw multi-location API response and cache it for a tile
     *
     * Samples with a null elevation are skipped. The response is persisted to
     * disk when possible; a disk failure is logged and the tile stays in memory.
     *
     * @return false if the response holds no usable sample
     */
    bool store(const TileKey& key, const std::string& raw_response);

    bool has_tile(const TileKey& key) const;

    /**
     * @brief Whether tiles are being written to disk
     *
     * Turns false after the first failure to create the cache directory.
     */
    bool disk_available() const { return disk_available_; }

    TileCacheStats get_stats() const;

    const std::string& get_cache_directory() const { return config_.cache_directory; }

private:
    struct Sample {
        Coordinate position;
        double elevation_m;
    };

    Config config_;
    std::unordered_map<TileKey, std::vector<Sample>, TileKeyHash> tiles_;
    mutable std::mutex cache_mutex_;
    TileCacheStats stats_;
    bool disk_available_ = false;
    Logger logger_{"TerrainTileCache"};

    std::optional<std::vector<Sample>> parse_samples(const TileKey& key,
                                                     const std::string& raw_response) const;
    std::optional<std::vector<Sample>> load_from_disk(const TileKey& key);
    bool write_to_disk(const TileKey& key, const std::string& raw_response);
    bool ensure_cache_directory();
};

} // namespace afg
