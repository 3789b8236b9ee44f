/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration files for mission generation
 */

#pragma once

#include "auto_flight_generator.hpp"
#include "UnitParser.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace afg {

/**
 * @brief Settings of one afg-plan run that are not part of the mission itself
 */
struct RunSettings {
    std::string output_file = "mission.plan";
    std::optional<std::string> waypoint_file;
    std::string terrain_url = "https://api.opentopodata.org/v1/srtm90m";
    std::string terrain_cache_dir = "cache/terrain_tiles";
    bool terrain_tiles = false;   // Prefetch 0.1 degree tiles instead of single points
    bool offline = false;
    bool dry_run = false;
};

/**
 * @brief Loads and saves mission configurations as JSON
 *
 * Distances may be numbers (meters, or the "units" key) or strings with a
 * unit suffix. Coordinates may be "lat,lon" strings (decimal or DMS),
 * [lat, lon] arrays or {"lat": .., "lon": ..} objects.
 */
class ConfigurationManager {
public:
    using json = nlohmann::json;

    ConfigurationManager() = default;

    /**
     * @brief Apply a configuration document on top of existing values
     *
     * Keys that are absent leave the current value untouched.
     *
     * @throws InvalidParameterError (or UnitParseError) for malformed values
     */
    void apply(const json& document, MissionConfig& config, RunSettings& settings) const;

    json to_json(const MissionConfig& config, const RunSettings& settings) const;

    /**
     * @brief Load configuration from file
     * @return false if the file cannot be opened or is not valid JSON
     * @throws InvalidParameterError for malformed values inside valid JSON
     */
    bool load_from_file(const std::string& filename, MissionConfig& config,
                        RunSettings& settings) const;

    /**
     * @brief Save configuration to file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename, const MissionConfig& config,
                      const RunSettings& settings) const;

    /**
     * @brief Example configuration written by --create-config
     */
    static std::string default_config_text();

    // Enum text used on the command line and in configuration files
    static MissionConfig::Scenario parse_scenario(const std::string& text);
    static AircraftKind parse_aircraft(const std::string& text);
    static MissionConfig::TerminalAction parse_terminal_action(const std::string& text);
    static MissionConfig::DeliveryAction parse_delivery_action(const std::string& text);
    static MissionConfig::PatrolPattern parse_patrol_pattern(const std::string& text);

    static std::string to_string(MissionConfig::Scenario scenario);
    static std::string to_string(MissionConfig::TerminalAction action);
    static std::string to_string(MissionConfig::DeliveryAction action);
    static std::string to_string(MissionConfig::PatrolPattern pattern);

private:
    Coordinate parse_coordinate(const json& value, const std::string& key,
                                const UnitParser& parser) const;
    std::vector<Coordinate> parse_coordinate_list(const json& value, const std::string& key,
                                                  const UnitParser& parser) const;
    double parse_distance(const json& value, const std::string& key,
                          const UnitParser& parser) const;
};

} // namespace afg
