/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "../core/AircraftProfile.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace afg {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("afg-plan",
        "Generate terrain-following UAV missions as QGroundControl .plan files");

    // Configuration file options
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // Mission options
    parser.add_option("scenario", "", "Mission scenario");
    parser.add_option("aircraft", "a", "Aircraft kind");
    parser.add_option("start", "", "Start coordinate (lat,lon)");
    parser.add_option("end", "", "End coordinate (lat,lon)");
    parser.add_option("waypoint", "w", "Waypoints, ';'-separated");
    parser.add_option("polygon", "p", "Area polygon, ';'-separated");
    parser.add_option("tower", "", "Tower coordinate (lat,lon)");
    parser.add_option("terminal", "", "Terminal action");
    parser.add_option("delivery-action", "", "Delivery action");
    parser.add_option("pattern", "", "Patrol pattern");

    // Distances
    parser.add_option("altitude", "", "Cruise altitude above ground");
    parser.add_option("interval", "i", "Waypoint interval");
    parser.add_option("geofence-buffer", "", "Geofence buffer distance");
    parser.add_option("tower-offset", "", "Tower station offset");
    parser.add_option("inward-margin", "", "Patrol inset from the area boundary");
    parser.add_option("grid-spacing", "", "Patrol grid spacing");
    parser.add_option("units", "u", "Units for bare distance numbers");
    parser.add_option("cruise-speed", "", "Cruise speed in m/s");
    parser.add_option("hover-speed", "", "Hover speed in m/s");

    // Output and terrain
    parser.add_option("output", "o", "Plan file path");
    parser.add_option("waypoint-file", "", "QGC WPL 110 waypoint file path");
    parser.add_option("terrain-url", "", "Elevation API endpoint");
    parser.add_option("terrain-cache-dir", "", "Terrain tile cache directory");
    parser.add_flag("terrain-tiles", "", "Prefetch terrain in 0.1 degree tiles");
    parser.add_flag("offline", "", "Disable network terrain lookups");

    // Logging and utility options
    parser.add_flag("silent", "s", "Suppress all output (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Validate and print the configuration without generating");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? EXIT_OK : EXIT_INVALID_INPUT;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "AutoFlightGenerator afg-plan v" << AFG_VERSION_STRING << std::endl;
        std::cout << "Terrain-aware mission planning for QGroundControl" << std::endl;
        std::cout << "Built with libcurl, nlohmann_json, GDAL, Eigen" << std::endl;
        exit_code_ = EXIT_OK;
        return false;
    }

    configure_logging(parser);

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = EXIT_WRITE_FAILURE;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = EXIT_OK;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = EXIT_INVALID_INPUT;
            return false;
        }
    }

    parse_all_options(parser);
    return true;
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser) {
    // Priority, lowest to highest: ENV, --log-level, --silent/--verbose

    // 1. Environment
    const char* env_log_level = std::getenv("AFG_LOG_LEVEL");
    if (env_log_level) {
        std::string env_config(env_log_level);
        if (!Logger::parseLogConfig(env_config)) {
            std::cerr << "Ignoring invalid AFG_LOG_LEVEL: " << env_config << std::endl;
        } else if (env_config.find('=') == std::string::npos) {
            log_level_ = std::atoi(env_config.c_str());
        }
    }

    // 2. --log-level, either "4" or "3,TerrainService=6"
    if (auto value = parser.get("log-level")) {
        const std::string log_config = value.value();
        if (!Logger::parseLogConfig(log_config)) {
            throw InvalidParameterError("Invalid --log-level: " + log_config);
        }
        const std::string first_part = log_config.substr(0, log_config.find(','));
        if (first_part.find('=') == std::string::npos) {
            log_level_ = std::atoi(first_part.c_str());
        }
    }

    // 3. Shorthand flags
    if (parser.get_flag("silent")) {
        log_level_ = 0;
        Logger::setDefaultLevel(LogLevel::SILENT);
    } else if (parser.get_flag("verbose")) {
        log_level_ = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // 4. Log file, CLI overrides environment
    const char* env_log_file = std::getenv("AFG_LOG_FILE");
    if (env_log_file) {
        log_file_ = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        log_file_ = value.value();
    }
    if (log_file_) {
        Logger::setGlobalLogFile(log_file_);
    }
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    UnitPreferences prefs;
    if (auto value = parser.get("units")) {
        prefs.set_distance_units(value.value());
    }
    const UnitParser unit_parser(prefs);

    auto distance = [&parser, &unit_parser](const std::string& name, double& target) {
        if (auto value = parser.get(name)) {
            target = unit_parser.parse_distance(value.value()).meters;
        }
    };

    if (auto value = parser.get("scenario")) {
        config_.scenario = ConfigurationManager::parse_scenario(value.value());
    }
    if (auto value = parser.get("aircraft")) {
        config_.aircraft = ConfigurationManager::parse_aircraft(value.value());
    }

    if (auto value = parser.get("start")) config_.start = unit_parser.parse_coordinate(value.value());
    if (auto value = parser.get("end")) config_.end = unit_parser.parse_coordinate(value.value());
    if (auto value = parser.get("tower")) config_.tower = unit_parser.parse_coordinate(value.value());
    if (auto value = parser.get("waypoint")) {
        config_.waypoints = unit_parser.parse_coordinate_list(value.value());
    }
    if (auto value = parser.get("polygon")) {
        config_.polygon = unit_parser.parse_coordinate_list(value.value());
    }

    distance("altitude", config_.altitude_agl_m);
    distance("interval", config_.interval_m);
    distance("geofence-buffer", config_.geofence_buffer_m);
    distance("tower-offset", config_.tower_offset_m);
    distance("inward-margin", config_.inward_margin_m);
    distance("grid-spacing", config_.grid_spacing_m);

    auto speed = [&parser](const std::string& name, std::optional<double>& target) {
        if (auto value = parser.get(name)) {
            size_t consumed = 0;
            try {
                target = std::stod(value.value(), &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value->size()) {
                throw InvalidParameterError("Invalid --" + name + ": '" + value.value() + "'. Give a speed in m/s");
            }
        }
    };
    speed("cruise-speed", config_.cruise_speed_mps);
    speed("hover-speed", config_.hover_speed_mps);

    if (auto value = parser.get("terminal")) {
        config_.terminal_action = ConfigurationManager::parse_terminal_action(value.value());
    }
    if (auto value = parser.get("delivery-action")) {
        config_.delivery_action = ConfigurationManager::parse_delivery_action(value.value());
    }
    if (auto value = parser.get("pattern")) {
        config_.patrol_pattern = ConfigurationManager::parse_patrol_pattern(value.value());
    }

    if (auto value = parser.get("output")) settings_.output_file = value.value();
    if (auto value = parser.get("waypoint-file")) settings_.waypoint_file = value.value();
    if (auto value = parser.get("terrain-url")) settings_.terrain_url = value.value();
    if (auto value = parser.get("terrain-cache-dir")) settings_.terrain_cache_dir = value.value();
    if (parser.get_flag("terrain-tiles")) settings_.terrain_tiles = true;
    if (parser.get_flag("offline")) settings_.offline = true;
    if (parser.get_flag("dry-run")) settings_.dry_run = true;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << ConfigurationManager::default_config_text();
    return !file.fail();
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    return config_manager_.load_from_file(filename, config_, settings_);
}

void CommandLineInterface::print_config() const {
    auto point = [](const Coordinate& c) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(6) << c.lat << "," << c.lon;
        return out.str();
    };

    std::cout << "\n=== Mission Configuration ===\n";
    std::cout << "Scenario: " << ConfigurationManager::to_string(config_.scenario) << "\n";
    std::cout << "Aircraft: " << to_string(config_.aircraft) << "\n";
    if (config_.start) std::cout << "Start: " << point(*config_.start) << "\n";
    if (config_.end) std::cout << "End: " << point(*config_.end) << "\n";
    if (config_.tower) std::cout << "Tower: " << point(*config_.tower) << "\n";
    if (!config_.waypoints.empty()) std::cout << "Waypoints: " << config_.waypoints.size() << "\n";
    if (!config_.polygon.empty()) std::cout << "Polygon vertices: " << config_.polygon.size() << "\n";
    std::cout << "Altitude: " << config_.altitude_agl_m << "m AGL\n";
    std::cout << "Interval: " << config_.interval_m << "m\n";
    std::cout << "Geofence buffer: " << config_.geofence_buffer_m << "m\n";
    std::cout << "Terminal action: "
              << (config_.terminal_action ? ConfigurationManager::to_string(*config_.terminal_action)
                                          : std::string("scenario default"))
              << "\n";
    std::cout << "Output: " << settings_.output_file << "\n";
    if (settings_.waypoint_file) std::cout << "Waypoint file: " << *settings_.waypoint_file << "\n";
    std::cout << "Terrain: " << (settings_.offline ? std::string("offline") : settings_.terrain_url) << "\n";
    std::cout << "=============================\n\n";
}

} // namespace afg
