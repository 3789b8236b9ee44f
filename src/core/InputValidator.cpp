/**
 * @file InputValidator.cpp
 * @brief Implementation of mission configuration validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <utility>

namespace afg {

namespace {

std::string describe(const Coordinate& c) {
    std::ostringstream oss;
    oss << std::setprecision(8) << c.lat << "," << c.lon;
    return oss.str();
}

ParameterConflict missing(const std::string& name, const std::string& option,
                          const std::string& hint) {
    ParameterConflict conflict;
    conflict.kind = ParameterConflict::Kind::MISSING_LOCATION;
    conflict.description = "Missing required location: " + name;
    conflict.involved_params = {option};
    conflict.suggestions = {hint};
    conflict.location_name = name;
    return conflict;
}

} // namespace

const ParameterConflict* ValidationResult::first_missing_location() const {
    for (const auto& conflict : conflicts) {
        if (conflict.kind == ParameterConflict::Kind::MISSING_LOCATION) {
            return &conflict;
        }
    }
    return nullptr;
}

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid mission parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nMission generation aborted.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const MissionConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    auto add = [&result](const std::optional<ParameterConflict>& conflict) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    };

    for (const auto& conflict : check_required_locations(config)) {
        add(conflict);
    }
    add(check_distances(config));
    add(check_coordinates(config));
    add(check_camera(config));
    add(check_speeds(config));
    add(check_terminal_action(config));
    add(check_tower_altitudes(config));

    return result;
}

std::vector<std::string> InputValidator::required_locations(MissionConfig::Scenario scenario) {
    using Scenario = MissionConfig::Scenario;
    switch (scenario) {
        case Scenario::A_TO_B:
        case Scenario::DELIVERY:
            return {"start", "end"};
        case Scenario::MULTI_DELIVERY:
            return {"start", "delivery points"};
        case Scenario::LINEAR_ROUTE:
            return {"start", "route waypoints"};
        case Scenario::SECURITY_PATROL:
        case Scenario::MAPPING_SURVEY:
            return {"start", "polygon"};
        case Scenario::TOWER_INSPECTION:
            return {"start", "tower"};
    }
    return {"start"};
}

std::vector<ParameterConflict> InputValidator::check_required_locations(
    const MissionConfig& config) const {

    std::vector<ParameterConflict> conflicts;
    for (const auto& name : required_locations(config.scenario)) {
        if (name == "start" && !config.start) {
            conflicts.push_back(missing(name, "--start", "Set the takeoff location with --start LAT,LON"));
        } else if (name == "end" && !config.end) {
            conflicts.push_back(missing(name, "--end", "Set the destination with --end LAT,LON"));
        } else if (name == "tower" && !config.tower) {
            conflicts.push_back(missing(name, "--tower", "Set the tower location with --tower LAT,LON"));
        } else if ((name == "delivery points" || name == "route waypoints") &&
                   config.waypoints.empty()) {
            conflicts.push_back(missing(name, "--waypoint",
                "Add at least one point with --waypoint \"LAT,LON;LAT,LON\""));
        } else if (name == "polygon" && config.polygon.size() < 3) {
            auto conflict = missing(name, "--polygon",
                "Provide at least 3 vertices with --polygon \"LAT,LON;LAT,LON;LAT,LON\"");
            if (!config.polygon.empty()) {
                conflict.description += " (only " + std::to_string(config.polygon.size()) +
                                        " vertices given)";
            }
            conflicts.push_back(conflict);
        }
    }
    return conflicts;
}

std::optional<ParameterConflict> InputValidator::check_distances(const MissionConfig& config) const {
    ParameterConflict conflict;
    conflict.description = "Distances out of range";

    auto require_positive = [&conflict](double value, const std::string& option) {
        if (!std::isfinite(value) || value <= 0.0) {
            conflict.involved_params.push_back(option + " " + std::to_string(value));
            conflict.suggestions.push_back("Use a positive value for " + option);
        }
    };

    require_positive(config.interval_m, "--interval");
    require_positive(config.geofence_buffer_m, "--geofence-buffer");
    require_positive(config.grid_spacing_m, "--grid-spacing");
    require_positive(config.tower_offset_m, "--tower-offset");

    if (!std::isfinite(config.altitude_agl_m) || config.altitude_agl_m < 0.0) {
        conflict.involved_params.push_back("--altitude " + std::to_string(config.altitude_agl_m));
        conflict.suggestions.push_back("Altitude above ground must be zero or more");
    }
    if (!std::isfinite(config.inward_margin_m) || config.inward_margin_m < 0.0) {
        conflict.involved_params.push_back("--inward-margin " + std::to_string(config.inward_margin_m));
        conflict.suggestions.push_back("Inward margin must be zero or more");
    }
    if (!std::isfinite(config.proximity_threshold_m) || config.proximity_threshold_m < 0.0) {
        conflict.involved_params.push_back("proximity_threshold " +
                                           std::to_string(config.proximity_threshold_m));
        conflict.suggestions.push_back("Proximity threshold must be zero or more");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_speeds(const MissionConfig& config) const {
    ParameterConflict conflict;
    conflict.description = "Vehicle speeds must be positive";

    auto check = [&conflict](const std::optional<double>& speed, const std::string& option) {
        if (speed && (!std::isfinite(*speed) || *speed <= 0.0)) {
            conflict.involved_params.push_back(option + " " + std::to_string(*speed));
            conflict.suggestions.push_back("Give " + option + " in m/s, or omit it for the aircraft default");
        }
    };
    check(config.cruise_speed_mps, "--cruise-speed");
    check(config.hover_speed_mps, "--hover-speed");

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_coordinates(const MissionConfig& config) const {
    ParameterConflict conflict;
    conflict.description = "Coordinates outside -90..90 latitude / -180..180 longitude";

    auto check = [&conflict](const Coordinate& c, const std::string& label) {
        if (!c.is_valid()) {
            conflict.involved_params.push_back(label + " " + describe(c));
        }
    };

    if (config.start) check(*config.start, "--start");
    if (config.end) check(*config.end, "--end");
    if (config.tower) check(*config.tower, "--tower");
    for (size_t i = 0; i < config.waypoints.size(); ++i) {
        check(config.waypoints[i], "--waypoint #" + std::to_string(i + 1));
    }
    for (size_t i = 0; i < config.polygon.size(); ++i) {
        check(config.polygon[i], "--polygon #" + std::to_string(i + 1));
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.suggestions = {"Check for swapped latitude and longitude",
                            "Use decimal degrees or DMS such as 40°00'36\"N"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_camera(const MissionConfig& config) const {
    if (config.scenario != MissionConfig::Scenario::MAPPING_SURVEY) {
        return std::nullopt;
    }

    const CameraSpec& camera = config.camera;
    ParameterConflict conflict;
    conflict.description = "Camera parameters cannot produce a survey footprint";

    if (!(camera.focal_length_mm > 0.0)) {
        conflict.involved_params.push_back("focal_length_mm " + std::to_string(camera.focal_length_mm));
    }
    if (!(camera.sensor_width_mm > 0.0) || !(camera.sensor_height_mm > 0.0)) {
        conflict.involved_params.push_back("sensor " + std::to_string(camera.sensor_width_mm) +
                                           " x " + std::to_string(camera.sensor_height_mm) + " mm");
    }
    for (const auto& [name, overlap] : {std::pair{"frontal_overlap", camera.frontal_overlap},
                                        std::pair{"side_overlap", camera.side_overlap}}) {
        if (!(overlap >= 0.0 && overlap < 1.0)) {
            conflict.involved_params.push_back(std::string(name) + " " + std::to_string(overlap));
            conflict.suggestions.push_back(std::string("Use a ") + name + " between 0 and 0.95");
        }
    }
    if (!(config.altitude_agl_m > 0.0)) {
        conflict.involved_params.push_back("--altitude " + std::to_string(config.altitude_agl_m));
        conflict.suggestions.push_back("A survey needs a positive altitude to cover ground");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_terminal_action(const MissionConfig& config) const {
    using Scenario = MissionConfig::Scenario;
    using Terminal = MissionConfig::TerminalAction;

    if (!config.terminal_action) {
        return std::nullopt;
    }
    const Terminal action = *config.terminal_action;

    const bool area_or_tower = config.scenario == Scenario::SECURITY_PATROL ||
                               config.scenario == Scenario::MAPPING_SURVEY ||
                               config.scenario == Scenario::TOWER_INSPECTION;
    if (area_or_tower && action != Terminal::RETURN_TO_START && action != Terminal::LAND) {
        ParameterConflict conflict;
        conflict.description = "Terminal action has no destination in this scenario";
        conflict.involved_params = {"--scenario", "--terminal"};
        conflict.suggestions = {"Use --terminal return or --terminal land"};
        return conflict;
    }

    if (config.scenario == Scenario::TOWER_INSPECTION && action == Terminal::LAND) {
        ParameterConflict conflict;
        conflict.description = "Tower inspection always returns to the takeoff point";
        conflict.involved_params = {"--scenario tower", "--terminal land"};
        conflict.suggestions = {"Omit --terminal or use --terminal return"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_tower_altitudes(const MissionConfig& config) const {
    if (config.scenario != MissionConfig::Scenario::TOWER_INSPECTION) {
        return std::nullopt;
    }
    if (config.tower_low_agl_m >= 0.0 && config.tower_high_agl_m > config.tower_low_agl_m) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Tower pass altitudes are inverted or negative";
    conflict.involved_params = {
        "low pass " + std::to_string(config.tower_low_agl_m) + " m",
        "high pass " + std::to_string(config.tower_high_agl_m) + " m"
    };
    conflict.suggestions = {"Use a low pass below the high pass, both zero or more"};
    return conflict;
}

} // namespace afg
