/**
 * @file main.cpp
 * @brief Main entry point for afg-plan
 *
 * Generates terrain-following UAV missions and writes them as
 * QGroundControl plan files.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "auto_flight_generator.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/HttpClient.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/MissionAssembler.hpp"
#include "core/TerrainService.hpp"
#include "export/PlanFileExporter.hpp"
#include "version.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

using namespace afg;

/**
 * @brief Terrain service for this run; offline runs get no transport
 */
std::unique_ptr<TerrainService> make_terrain_service(const RunSettings& settings) {
    TerrainService::Config config;
    config.base_url = settings.terrain_url;
    config.offline = settings.offline;
    config.use_tile_cache = settings.terrain_tiles;
    config.tile_cache.cache_directory = settings.terrain_cache_dir;

    std::shared_ptr<HttpClient> http;
    if (!settings.offline) {
        http = std::make_shared<CurlHttpClient>();
    }
    return std::make_unique<TerrainService>(http, config);
}

void print_terrain_summary(const Logger& logger, const TerrainStats& stats) {
    std::ostringstream msg;
    msg << "Terrain: " << stats.requests << " lookups, " << stats.network_calls << " requests, "
        << stats.retries << " retries, " << stats.failures << " failures, "
        << std::fixed << std::setprecision(0) << stats.hit_rate() * 100.0 << "% cache hits";
    if (stats.tile_hits > 0) {
        msg << ", " << stats.tile_hits << " tile hits";
    }
    logger.info(msg.str());
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger logger("afg-plan");

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or usage error
        }

        const MissionConfig& config = cli.get_config();
        const RunSettings& settings = cli.get_settings();

        if (cli.log_level() > 0) {
            std::cout << "AutoFlightGenerator v" << AFG_VERSION_STRING << "\n";
        }
        if (cli.log_level() >= 4) {
            cli.print_config();
        }

        if (cli.is_dry_run()) {
            InputValidator validator;
            ValidationResult validation = validator.validate(config);
            if (!validation.is_valid) {
                std::cerr << validation.format_error_message();
                return EXIT_INVALID_INPUT;
            }
            if (cli.log_level() > 0) {
                if (cli.log_level() < 4) {
                    cli.print_config();
                }
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return EXIT_OK;
        }

        auto terrain = make_terrain_service(settings);
        MissionAssembler assembler(*terrain);
        MissionResult result = assembler.assemble(config);

        PlanFileExporter exporter;
        if (!exporter.write_plan_file(result.plan, settings.output_file)) {
            return EXIT_WRITE_FAILURE;
        }
        if (settings.waypoint_file &&
            !exporter.write_waypoint_file(result.plan, *settings.waypoint_file)) {
            return EXIT_WRITE_FAILURE;
        }

        print_terrain_summary(logger, result.terrain_stats);
        if (result.terrain_degraded) {
            logger.warning("Some altitudes use 0 m terrain; check clearance before flight");
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (cli.log_level() > 0) {
            std::cout << "Mission written to " << settings.output_file << " in "
                      << total_duration.count() << "ms\n";
        }
        return EXIT_OK;

    } catch (const MissingLocationError& e) {
        logger.error(e.what());
        return EXIT_INVALID_INPUT;
    } catch (const InvalidParameterError& e) {
        logger.error(e.what());
        return EXIT_INVALID_INPUT;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_INVALID_INPUT;
    }
}
