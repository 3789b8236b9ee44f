/**
 * @file test_terrain_tile_cache.cpp
 * @brief Tile keys, nearest-sample lookup and disk persistence
 */

#include "core/TerrainTileCache.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace afg;
using afg::testing::TempDir;

namespace {

/// A 3x3 tile response with elevation = 100 * row + 10 * col, no location fields
std::string grid_response() {
    std::ostringstream body;
    body << R"({"results":[)";
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            if (row || col) body << ",";
            body << R"({"elevation":)" << (100 * row + 10 * col) << "}";
        }
    }
    body << R"(],"status":"OK"})";
    return body.str();
}

TerrainTileCache::Config disk_config(const TempDir& dir) {
    TerrainTileCache::Config config;
    config.cache_directory = dir.path().string();
    config.persist_to_disk = true;
    return config;
}

} // namespace

TEST(TerrainTileCacheTest, TileKeysFloorToTenthsOfADegree) {
    EXPECT_EQ(TerrainTileCache::tile_for({40.0, -75.0}), (TileKey{400, -750}));
    EXPECT_EQ(TerrainTileCache::tile_for({40.05, -74.95}), (TileKey{400, -750}));
    EXPECT_EQ(TerrainTileCache::tile_for({40.0999, -74.9001}), (TileKey{400, -750}));
    EXPECT_EQ(TerrainTileCache::tile_for({-33.86, 151.21}), (TileKey{-339, 1512}));
}

TEST(TerrainTileCacheTest, FilenamesUseHemisphereLetters) {
    EXPECT_EQ(TerrainTileCache::tile_filename({400, -750}), "N40.0W75.0.json");
    EXPECT_EQ(TerrainTileCache::tile_filename({-339, 1512}), "S33.9E151.2.json");
}

TEST(TerrainTileCacheTest, SampleLocationsCoverTheTile) {
    auto samples = TerrainTileCache::sample_locations({400, -750});
    ASSERT_EQ(samples.size(), 9u);
    EXPECT_NEAR(samples.front().lat, 40.0, 1e-9);
    EXPECT_NEAR(samples.front().lon, -75.0, 1e-9);
    EXPECT_NEAR(samples.back().lat, 40.1, 1e-9);
    EXPECT_NEAR(samples.back().lon, -74.9, 1e-9);
    EXPECT_NEAR(samples[4].lat, 40.05, 1e-9);
    EXPECT_NEAR(samples[4].lon, -74.95, 1e-9);
}

TEST(TerrainTileCacheTest, LookupUsesNearestSample) {
    TerrainTileCache::Config config;
    config.persist_to_disk = false;
    TerrainTileCache cache(config);

    const TileKey key{400, -750};
    ASSERT_TRUE(cache.store(key, grid_response()));
    EXPECT_TRUE(cache.has_tile(key));

    EXPECT_DOUBLE_EQ(*cache.lookup({40.001, -74.999}), 0.0);     // SW corner
    EXPECT_DOUBLE_EQ(*cache.lookup({40.049, -74.951}), 110.0);   // Centre
    EXPECT_DOUBLE_EQ(*cache.lookup({40.004, -74.91}), 20.0);     // SE corner
    EXPECT_DOUBLE_EQ(*cache.lookup({40.09, -74.96}), 210.0);     // North middle
}

TEST(TerrainTileCacheTest, LookupMissesUncachedTiles) {
    TerrainTileCache::Config config;
    config.persist_to_disk = false;
    TerrainTileCache cache(config);

    EXPECT_FALSE(cache.lookup({40.0, -75.0}).has_value());
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.point_queries, 1u);
    EXPECT_EQ(stats.point_hits, 0u);
}

TEST(TerrainTileCacheTest, ExplicitLocationsOverrideGridOrder) {
    TerrainTileCache::Config config;
    config.persist_to_disk = false;
    TerrainTileCache cache(config);

    const std::string body = R"({"results":[
        {"elevation":5,"location":{"lat":40.1,"lng":-74.9}},
        {"elevation":7,"location":{"lat":40.0,"lng":-75.0}}]})";
    ASSERT_TRUE(cache.store({400, -750}, body));
    EXPECT_DOUBLE_EQ(*cache.lookup({40.09, -74.91}), 5.0);
    EXPECT_DOUBLE_EQ(*cache.lookup({40.01, -74.99}), 7.0);
}

TEST(TerrainTileCacheTest, NullSamplesAreSkipped) {
    TerrainTileCache::Config config;
    config.persist_to_disk = false;
    TerrainTileCache cache(config);

    const std::string body = R"({"results":[{"elevation":null},{"elevation":null},{"elevation":42}]})";
    ASSERT_TRUE(cache.store({400, -750}, body));
    // Only the third sample (40.0, -74.9) survives
    EXPECT_DOUBLE_EQ(*cache.lookup({40.0, -75.0}), 42.0);
}

TEST(TerrainTileCacheTest, RejectsUnusableResponses) {
    TerrainTileCache::Config config;
    config.persist_to_disk = false;
    TerrainTileCache cache(config);

    EXPECT_FALSE(cache.store({400, -750}, "not json"));
    EXPECT_FALSE(cache.store({400, -750}, R"({"results":[{"elevation":null}]})"));
    EXPECT_FALSE(cache.store({400, -750}, R"({"status":"INVALID_REQUEST"})"));
    EXPECT_FALSE(cache.has_tile({400, -750}));
}

TEST(TerrainTileCacheTest, StoredTilesPersistAcrossInstances) {
    TempDir dir;
    const TileKey key{400, -750};
    {
        TerrainTileCache cache(disk_config(dir));
        EXPECT_TRUE(cache.disk_available());
        ASSERT_TRUE(cache.store(key, grid_response()));
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "N40.0W75.0.json"));

    TerrainTileCache reloaded(disk_config(dir));
    EXPECT_FALSE(reloaded.has_tile(key));
    EXPECT_DOUBLE_EQ(*reloaded.lookup({40.049, -74.951}), 110.0);
    EXPECT_EQ(reloaded.get_stats().tiles_loaded_from_disk, 1u);
    EXPECT_TRUE(reloaded.has_tile(key));
}

TEST(TerrainTileCacheTest, CorruptTileFileIsIgnored) {
    TempDir dir;
    {
        std::ofstream file(dir.path() / "N40.0W75.0.json");
        file << "{ truncated";
    }

    TerrainTileCache cache(disk_config(dir));
    EXPECT_FALSE(cache.lookup({40.01, -74.99}).has_value());
    EXPECT_EQ(cache.get_stats().disk_errors, 1u);
}

TEST(TerrainTileCacheTest, UnwritableDirectoryFallsBackToMemory) {
    TempDir dir;
    // A regular file where the cache directory should be
    const auto blocker = dir.path() / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }

    TerrainTileCache::Config config;
    config.cache_directory = (blocker / "tiles").string();
    TerrainTileCache cache(config);
    EXPECT_FALSE(cache.disk_available());

    ASSERT_TRUE(cache.store({400, -750}, grid_response()));
    EXPECT_DOUBLE_EQ(*cache.lookup({40.0, -75.0}), 0.0);
}
