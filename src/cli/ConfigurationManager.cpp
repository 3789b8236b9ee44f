/**
 * @file ConfigurationManager.cpp
 * @brief JSON configuration files for mission generation
 */

#include "ConfigurationManager.hpp"
#include "../core/AircraftProfile.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace afg {

namespace {

/// Lower case with '_' and ' ' folded to '-'
std::string normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c == '_' || c == ' ') {
            out.push_back('-');
        } else {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

double overlap_fraction(double value) {
    // 80 and 0.8 both mean 80 %
    return value > 1.0 ? value / 100.0 : value;
}

} // namespace

// ============================================================================
// Enum text
// ============================================================================

MissionConfig::Scenario ConfigurationManager::parse_scenario(const std::string& text) {
    using Scenario = MissionConfig::Scenario;
    const std::string key = normalize(text);
    if (key == "a-to-b" || key == "atob" || key == "a2b") return Scenario::A_TO_B;
    if (key == "delivery") return Scenario::DELIVERY;
    if (key == "multi-delivery" || key == "multidelivery") return Scenario::MULTI_DELIVERY;
    if (key == "linear-route" || key == "linear") return Scenario::LINEAR_ROUTE;
    if (key == "security-patrol" || key == "patrol" || key == "security") return Scenario::SECURITY_PATROL;
    if (key == "mapping-survey" || key == "mapping" || key == "survey") return Scenario::MAPPING_SURVEY;
    if (key == "tower-inspection" || key == "tower") return Scenario::TOWER_INSPECTION;
    throw InvalidParameterError("Unknown scenario: '" + text + "'. Use: a-to-b, delivery, "
                                "multi-delivery, linear-route, security-patrol, mapping-survey, "
                                "tower-inspection");
}

AircraftKind ConfigurationManager::parse_aircraft(const std::string& text) {
    const std::string key = normalize(text);
    if (key == "multicopter" || key == "mc" || key == "quad" || key == "copter") {
        return AircraftKind::MULTICOPTER;
    }
    if (key == "fixed-wing" || key == "fixedwing" || key == "fw" || key == "plane") {
        return AircraftKind::FIXED_WING;
    }
    if (key == "vtol") {
        return AircraftKind::VTOL;
    }
    throw InvalidParameterError("Unknown aircraft: '" + text + "'. Use: multicopter, fixed-wing, vtol");
}

MissionConfig::TerminalAction ConfigurationManager::parse_terminal_action(const std::string& text) {
    using Terminal = MissionConfig::TerminalAction;
    const std::string key = normalize(text);
    if (key == "land") return Terminal::LAND;
    if (key == "return" || key == "return-to-start" || key == "rtl") return Terminal::RETURN_TO_START;
    if (key == "payload" || key == "payload-release" || key == "release") return Terminal::PAYLOAD_RELEASE;
    if (key == "land-and-return" || key == "land-return") return Terminal::LAND_AND_RETURN;
    throw InvalidParameterError("Unknown terminal action: '" + text +
                                "'. Use: land, return, payload, land-and-return");
}

MissionConfig::DeliveryAction ConfigurationManager::parse_delivery_action(const std::string& text) {
    const std::string key = normalize(text);
    if (key == "payload" || key == "release" || key == "gripper") {
        return MissionConfig::DeliveryAction::PAYLOAD;
    }
    if (key == "land-and-takeoff" || key == "land") {
        return MissionConfig::DeliveryAction::LAND_AND_TAKEOFF;
    }
    throw InvalidParameterError("Unknown delivery action: '" + text + "'. Use: payload, land-and-takeoff");
}

MissionConfig::PatrolPattern ConfigurationManager::parse_patrol_pattern(const std::string& text) {
    const std::string key = normalize(text);
    if (key == "perimeter") return MissionConfig::PatrolPattern::PERIMETER;
    if (key == "grid") return MissionConfig::PatrolPattern::GRID;
    throw InvalidParameterError("Unknown patrol pattern: '" + text + "'. Use: perimeter, grid");
}

std::string ConfigurationManager::to_string(MissionConfig::Scenario scenario) {
    using Scenario = MissionConfig::Scenario;
    switch (scenario) {
        case Scenario::A_TO_B:           return "a-to-b";
        case Scenario::DELIVERY:         return "delivery";
        case Scenario::MULTI_DELIVERY:   return "multi-delivery";
        case Scenario::LINEAR_ROUTE:     return "linear-route";
        case Scenario::SECURITY_PATROL:  return "security-patrol";
        case Scenario::MAPPING_SURVEY:   return "mapping-survey";
        case Scenario::TOWER_INSPECTION: return "tower-inspection";
    }
    return "unknown";
}

std::string ConfigurationManager::to_string(MissionConfig::TerminalAction action) {
    using Terminal = MissionConfig::TerminalAction;
    switch (action) {
        case Terminal::LAND:            return "land";
        case Terminal::RETURN_TO_START: return "return";
        case Terminal::PAYLOAD_RELEASE: return "payload";
        case Terminal::LAND_AND_RETURN: return "land-and-return";
    }
    return "unknown";
}

std::string ConfigurationManager::to_string(MissionConfig::DeliveryAction action) {
    return action == MissionConfig::DeliveryAction::PAYLOAD ? "payload" : "land-and-takeoff";
}

std::string ConfigurationManager::to_string(MissionConfig::PatrolPattern pattern) {
    return pattern == MissionConfig::PatrolPattern::PERIMETER ? "perimeter" : "grid";
}

// ============================================================================
// Value parsing
// ============================================================================

Coordinate ConfigurationManager::parse_coordinate(const json& value, const std::string& key,
                                                  const UnitParser& parser) const {
    if (value.is_string()) {
        return parser.parse_coordinate(value.get<std::string>());
    }
    if (value.is_array() && value.size() == 2 && value[0].is_number() && value[1].is_number()) {
        return Coordinate(value[0].get<double>(), value[1].get<double>());
    }
    if (value.is_object() && value.contains("lat") && value.contains("lon")) {
        return Coordinate(value["lat"].get<double>(), value["lon"].get<double>());
    }
    throw InvalidParameterError("'" + key + "' must be \"lat,lon\", [lat, lon] or {\"lat\", \"lon\"}");
}

std::vector<Coordinate> ConfigurationManager::parse_coordinate_list(const json& value,
                                                                    const std::string& key,
                                                                    const UnitParser& parser) const {
    if (value.is_string()) {
        return parser.parse_coordinate_list(value.get<std::string>());
    }
    if (!value.is_array()) {
        throw InvalidParameterError("'" + key + "' must be a list of coordinates");
    }
    std::vector<Coordinate> points;
    points.reserve(value.size());
    for (const auto& entry : value) {
        points.push_back(parse_coordinate(entry, key, parser));
    }
    return points;
}

double ConfigurationManager::parse_distance(const json& value, const std::string& key,
                                            const UnitParser& parser) const {
    if (value.is_number()) {
        return UnitParser::convert_distance(value.get<double>(),
                                            parser.preferences().distance_unit,
                                            DistanceUnit::METERS);
    }
    if (value.is_string()) {
        return parser.parse_distance(value.get<std::string>()).meters;
    }
    throw InvalidParameterError("'" + key + "' must be a number or a string such as \"150ft\"");
}

// ============================================================================
// Documents
// ============================================================================

void ConfigurationManager::apply(const json& document, MissionConfig& config,
                                 RunSettings& settings) const {
    if (!document.is_object()) {
        throw InvalidParameterError("Configuration must be a JSON object");
    }

    try {
        UnitPreferences prefs;
        if (document.contains("units")) {
            prefs.set_distance_units(document["units"].get<std::string>());
        }
        const UnitParser parser(prefs);

        auto has = [&document](const char* key) {
            return document.contains(key) && !document[key].is_null();
        };
        auto distance = [&](const char* key, double& target) {
            if (has(key)) target = parse_distance(document[key], key, parser);
        };

        if (has("scenario")) config.scenario = parse_scenario(document["scenario"].get<std::string>());
        if (has("aircraft")) config.aircraft = parse_aircraft(document["aircraft"].get<std::string>());

        if (has("start")) config.start = parse_coordinate(document["start"], "start", parser);
        if (has("end")) config.end = parse_coordinate(document["end"], "end", parser);
        if (has("tower")) config.tower = parse_coordinate(document["tower"], "tower", parser);
        if (has("waypoints")) {
            config.waypoints = parse_coordinate_list(document["waypoints"], "waypoints", parser);
        }
        if (has("polygon")) config.polygon = parse_coordinate_list(document["polygon"], "polygon", parser);

        distance("altitude", config.altitude_agl_m);
        distance("interval", config.interval_m);
        distance("geofence_buffer", config.geofence_buffer_m);
        distance("inward_margin", config.inward_margin_m);
        distance("grid_spacing", config.grid_spacing_m);
        distance("tower_offset", config.tower_offset_m);
        distance("tower_low_altitude", config.tower_low_agl_m);
        distance("tower_high_altitude", config.tower_high_agl_m);
        distance("proximity_threshold", config.proximity_threshold_m);

        // Speeds are m/s regardless of "units"
        if (has("cruise_speed")) config.cruise_speed_mps = document["cruise_speed"].get<double>();
        if (has("hover_speed")) config.hover_speed_mps = document["hover_speed"].get<double>();

        if (has("terminal_action")) {
            config.terminal_action = parse_terminal_action(document["terminal_action"].get<std::string>());
        }
        if (has("delivery_action")) {
            config.delivery_action = parse_delivery_action(document["delivery_action"].get<std::string>());
        }
        if (has("patrol_pattern")) {
            config.patrol_pattern = parse_patrol_pattern(document["patrol_pattern"].get<std::string>());
        }

        if (has("camera")) {
            const json& camera = document["camera"];
            CameraSpec& spec = config.camera;
            spec.sensor_width_mm = camera.value("sensor_width_mm", spec.sensor_width_mm);
            spec.sensor_height_mm = camera.value("sensor_height_mm", spec.sensor_height_mm);
            spec.focal_length_mm = camera.value("focal_length_mm", spec.focal_length_mm);
            spec.image_width_px = camera.value("image_width_px", spec.image_width_px);
            spec.image_height_px = camera.value("image_height_px", spec.image_height_px);
            spec.frontal_overlap = overlap_fraction(camera.value("frontal_overlap", spec.frontal_overlap));
            spec.side_overlap = overlap_fraction(camera.value("side_overlap", spec.side_overlap));
            spec.survey_angle_deg = camera.value("survey_angle_deg", spec.survey_angle_deg);
        }

        if (has("output")) settings.output_file = document["output"].get<std::string>();
        if (has("waypoint_file")) settings.waypoint_file = document["waypoint_file"].get<std::string>();
        if (has("terrain")) {
            const json& terrain = document["terrain"];
            settings.terrain_url = terrain.value("url", settings.terrain_url);
            settings.terrain_cache_dir = terrain.value("cache_dir", settings.terrain_cache_dir);
            settings.terrain_tiles = terrain.value("tiles", settings.terrain_tiles);
            settings.offline = terrain.value("offline", settings.offline);
        }
    } catch (const json::exception& e) {
        throw InvalidParameterError(std::string("Configuration value has the wrong type: ") + e.what());
    }
}

ConfigurationManager::json ConfigurationManager::to_json(const MissionConfig& config,
                                                         const RunSettings& settings) const {
    auto point = [](const Coordinate& c) { return json::array({c.lat, c.lon}); };
    auto points = [&point](const std::vector<Coordinate>& list) {
        json out = json::array();
        for (const auto& c : list) out.push_back(point(c));
        return out;
    };

    json document = {
        {"scenario", to_string(config.scenario)},
        {"aircraft", afg::to_string(config.aircraft)},
        {"start", config.start ? point(*config.start) : json(nullptr)},
        {"end", config.end ? point(*config.end) : json(nullptr)},
        {"tower", config.tower ? point(*config.tower) : json(nullptr)},
        {"waypoints", points(config.waypoints)},
        {"polygon", points(config.polygon)},
        {"units", "meters"},
        {"altitude", config.altitude_agl_m},
        {"interval", config.interval_m},
        {"geofence_buffer", config.geofence_buffer_m},
        {"terminal_action", config.terminal_action ? json(to_string(*config.terminal_action)) : json(nullptr)},
        {"delivery_action", to_string(config.delivery_action)},
        {"patrol_pattern", to_string(config.patrol_pattern)},
        {"inward_margin", config.inward_margin_m},
        {"grid_spacing", config.grid_spacing_m},
        {"camera", {
            {"sensor_width_mm", config.camera.sensor_width_mm},
            {"sensor_height_mm", config.camera.sensor_height_mm},
            {"focal_length_mm", config.camera.focal_length_mm},
            {"image_width_px", config.camera.image_width_px},
            {"image_height_px", config.camera.image_height_px},
            {"frontal_overlap", config.camera.frontal_overlap},
            {"side_overlap", config.camera.side_overlap},
            {"survey_angle_deg", config.camera.survey_angle_deg}
        }},
        {"tower_offset", config.tower_offset_m},
        {"tower_low_altitude", config.tower_low_agl_m},
        {"tower_high_altitude", config.tower_high_agl_m},
        {"proximity_threshold", config.proximity_threshold_m},
        {"cruise_speed", config.cruise_speed_mps ? json(*config.cruise_speed_mps) : json(nullptr)},
        {"hover_speed", config.hover_speed_mps ? json(*config.hover_speed_mps) : json(nullptr)},
        {"output", settings.output_file},
        {"waypoint_file", settings.waypoint_file ? json(*settings.waypoint_file) : json(nullptr)},
        {"terrain", {
            {"url", settings.terrain_url},
            {"cache_dir", settings.terrain_cache_dir},
            {"tiles", settings.terrain_tiles},
            {"offline", settings.offline}
        }}
    };
    return document;
}

bool ConfigurationManager::load_from_file(const std::string& filename, MissionConfig& config,
                                          RunSettings& settings) const {
    Logger logger("ConfigurationManager");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not open config file: " + filename);
        return false;
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        logger.error("Config file " + filename + " is not valid JSON: " + e.what());
        return false;
    }

    apply(document, config, settings);
    logger.detailed("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename, const MissionConfig& config,
                                        const RunSettings& settings) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << to_json(config, settings).dump(2) << "\n";
    return !file.fail();
}

std::string ConfigurationManager::default_config_text() {
    return R"({
  "scenario": "delivery",
  "aircraft": "multicopter",
  "start": "40.0000,-75.0000",
  "end": "40.0100,-75.0000",
  "waypoints": [],
  "polygon": [],
  "tower": null,
  "units": "meters",
  "altitude": 50,
  "interval": "50m",
  "geofence_buffer": 50,
  "terminal_action": null,
  "delivery_action": "payload",
  "patrol_pattern": "perimeter",
  "inward_margin": 50,
  "grid_spacing": 111.32,
  "camera": {
    "sensor_width_mm": 6.17,
    "sensor_height_mm": 4.55,
    "focal_length_mm": 4.49,
    "image_width_px": 4000,
    "image_height_px": 3000,
    "frontal_overlap": 80,
    "side_overlap": 80,
    "survey_angle_deg": 0
  },
  "tower_offset": 50,
  "tower_low_altitude": "10ft",
  "tower_high_altitude": "100ft",
  "proximity_threshold": "50ft",
  "cruise_speed": null,
  "hover_speed": null,
  "output": "mission.plan",
  "waypoint_file": null,
  "terrain": {
    "url": "https://api.opentopodata.org/v1/srtm90m",
    "cache_dir": "cache/terrain_tiles",
    "tiles": false,
    "offline": false
  }
}
)";
}

} // namespace afg
