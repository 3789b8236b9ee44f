/**
 * @file PlanFileExporter.cpp
 * @brief Implementation of plan document export and import
 */

#include "PlanFileExporter.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace afg {

namespace {

using json = nlohmann::json;

constexpr int PLAN_FILE_VERSION = 1;
constexpr int MISSION_VERSION = 2;
constexpr int GEOFENCE_VERSION = 2;
constexpr int POLYGON_VERSION = 1;
constexpr int RALLY_VERSION = 2;
constexpr int LANDING_PATTERN_VERSION = 2;
constexpr int SURVEY_VERSION = 5;
constexpr int TRANSECT_STYLE_VERSION = 2;
constexpr int CAMERA_CALC_VERSION = 2;

json param_value(double value) {
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

double read_param(const json& value) {
    if (value.is_null()) {
        return kNullParam;
    }
    return value.get<double>();
}

json simple_item_json(const SimpleItem& item) {
    json j;
    if (item.amsl_alt_above_terrain) j["AMSLAltAboveTerrain"] = *item.amsl_alt_above_terrain;
    if (item.altitude) j["Altitude"] = *item.altitude;
    if (item.altitude_mode) j["AltitudeMode"] = *item.altitude_mode;
    j["autoContinue"] = item.auto_continue;
    j["command"] = item.command;
    j["doJumpId"] = item.do_jump_id;
    j["frame"] = item.frame;

    json params = json::array();
    for (double p : item.params) {
        params.push_back(param_value(p));
    }
    j["params"] = params;
    j["type"] = "SimpleItem";
    return j;
}

json landing_pattern_json(const LandingPatternItem& item) {
    return json{
        {"altitudesAreRelative", item.altitudes_are_relative},
        {"complexItemType", "fwLandingPattern"},
        {"landCoordinate", {item.land_coordinate.lat, item.land_coordinate.lon, item.land_altitude_m}},
        {"landingApproachCoordinate", {item.approach_coordinate.lat, item.approach_coordinate.lon,
                                       item.approach_altitude_m}},
        {"loiterClockwise", item.loiter_clockwise},
        {"loiterRadius", item.loiter_radius_m},
        {"stopTakingPhotos", item.stop_taking_photos},
        {"stopVideoPhotos", item.stop_video_photos},
        {"type", "ComplexItem"},
        {"useLoiterToAlt", item.use_loiter_to_alt},
        {"valueSetIsDistance", item.value_set_is_distance},
        {"version", LANDING_PATTERN_VERSION}
    };
}

json lat_lon_array(const FlightPath& points) {
    json array = json::array();
    for (const auto& c : points) {
        array.push_back({c.lat, c.lon});
    }
    return array;
}

FlightPath lat_lon_points(const json& array) {
    FlightPath points;
    for (const auto& vertex : array) {
        points.emplace_back(vertex.at(0).get<double>(), vertex.at(1).get<double>());
    }
    return points;
}

// Ground sample distance in cm per pixel
double image_density(const SurveyPatternItem& item) {
    const CameraSpec& camera = item.camera;
    if (camera.focal_length_mm <= 0.0 || camera.image_width_px <= 0) {
        return 0.0;
    }
    return camera.sensor_width_mm * item.altitude_m * 100.0 /
           (camera.focal_length_mm * camera.image_width_px);
}

json survey_json(const SurveyPatternItem& item) {
    json nested = json::array();
    for (const auto& simple : item.items) {
        nested.push_back(simple_item_json(simple));
    }

    const json camera_calc = {
        {"AdjustedFootprintFrontal", item.frontal_footprint_m},
        {"AdjustedFootprintSide", item.side_footprint_m},
        {"CameraName", "Custom Camera"},
        {"DistanceMode", mav::ALTITUDE_MODE_TERRAIN_FRAME},
        {"DistanceToSurface", item.altitude_m},
        {"FixedOrientation", false},
        {"FocalLength", item.camera.focal_length_mm},
        {"FrontalOverlap", item.camera.frontal_overlap * 100.0},
        {"ImageDensity", image_density(item)},
        {"ImageHeight", item.camera.image_height_px},
        {"ImageWidth", item.camera.image_width_px},
        {"Landscape", true},
        {"MinTriggerInterval", 0},
        {"SensorHeight", item.camera.sensor_height_mm},
        {"SensorWidth", item.camera.sensor_width_mm},
        {"SideOverlap", item.camera.side_overlap * 100.0},
        {"ValueSetIsDistance", false},
        {"version", CAMERA_CALC_VERSION}
    };

    return json{
        {"TransectStyleComplexItem", {
            {"CameraCalc", camera_calc},
            {"CameraShots", item.camera_shots},
            {"CameraTriggerInTurnAround", item.trigger_in_turnaround},
            {"HoverAndCapture", item.hover_and_capture},
            {"Items", nested},
            {"Refly90Degrees", item.refly_90_degrees},
            {"TurnAroundDistance", item.turnaround_m},
            {"VisualTransectPoints", lat_lon_array(item.transect_points)},
            {"version", TRANSECT_STYLE_VERSION}
        }},
        {"angle", item.angle_deg},
        {"complexItemType", "survey"},
        {"entryLocation", 0},
        {"flyAlternateTransects", false},
        {"polygon", lat_lon_array(item.polygon)},
        {"splitConcavePolygons", false},
        {"type", "ComplexItem"},
        {"version", SURVEY_VERSION}
    };
}

SimpleItem simple_item_from_json(const json& j) {
    SimpleItem item;
    item.command = j.at("command").get<int>();
    item.do_jump_id = j.value("doJumpId", 0);
    item.frame = j.at("frame").get<int>();
    item.auto_continue = j.value("autoContinue", true);

    const json& params = j.at("params");
    if (!params.is_array() || params.size() != item.params.size()) {
        throw PlanFormatError("SimpleItem params must have 7 entries");
    }
    for (size_t i = 0; i < item.params.size(); ++i) {
        item.params[i] = read_param(params[i]);
    }

    if (j.contains("AMSLAltAboveTerrain") && !j["AMSLAltAboveTerrain"].is_null()) {
        item.amsl_alt_above_terrain = j["AMSLAltAboveTerrain"].get<double>();
    }
    if (j.contains("Altitude")) item.altitude = j["Altitude"].get<double>();
    if (j.contains("AltitudeMode")) item.altitude_mode = j["AltitudeMode"].get<int>();
    return item;
}

LandingPatternItem landing_pattern_from_json(const json& j) {
    LandingPatternItem item;
    const json& land = j.at("landCoordinate");
    const json& approach = j.at("landingApproachCoordinate");
    if (land.size() < 3 || approach.size() < 3) {
        throw PlanFormatError("landing pattern coordinates need lat, lon and altitude");
    }
    item.land_coordinate = Coordinate(land[0].get<double>(), land[1].get<double>());
    item.land_altitude_m = land[2].get<double>();
    item.approach_coordinate = Coordinate(approach[0].get<double>(), approach[1].get<double>());
    item.approach_altitude_m = approach[2].get<double>();
    item.loiter_radius_m = j.value("loiterRadius", item.loiter_radius_m);
    item.loiter_clockwise = j.value("loiterClockwise", item.loiter_clockwise);
    item.altitudes_are_relative = j.value("altitudesAreRelative", item.altitudes_are_relative);
    item.use_loiter_to_alt = j.value("useLoiterToAlt", item.use_loiter_to_alt);
    item.value_set_is_distance = j.value("valueSetIsDistance", item.value_set_is_distance);
    item.stop_taking_photos = j.value("stopTakingPhotos", item.stop_taking_photos);
    item.stop_video_photos = j.value("stopVideoPhotos", item.stop_video_photos);
    return item;
}

SurveyPatternItem survey_from_json(const json& j) {
    SurveyPatternItem item;
    item.polygon = lat_lon_points(j.at("polygon"));
    if (item.polygon.size() < 3) {
        throw PlanFormatError("survey polygon needs at least 3 vertices");
    }
    item.angle_deg = j.value("angle", 0.0);

    const json& transect = j.at("TransectStyleComplexItem");
    item.camera_shots = transect.value("CameraShots", 0);
    item.trigger_in_turnaround = transect.value("CameraTriggerInTurnAround", item.trigger_in_turnaround);
    item.hover_and_capture = transect.value("HoverAndCapture", item.hover_and_capture);
    item.refly_90_degrees = transect.value("Refly90Degrees", item.refly_90_degrees);
    item.turnaround_m = transect.value("TurnAroundDistance", item.turnaround_m);
    for (const auto& nested : transect.value("Items", json::array())) {
        if (nested.value("type", std::string()) != "SimpleItem") {
            throw PlanFormatError("survey items must be SimpleItems");
        }
        item.items.push_back(simple_item_from_json(nested));
    }
    if (transect.contains("VisualTransectPoints")) {
        item.transect_points = lat_lon_points(transect["VisualTransectPoints"]);
    }

    if (transect.contains("CameraCalc")) {
        const json& calc = transect["CameraCalc"];
        CameraSpec& camera = item.camera;
        item.altitude_m = calc.value("DistanceToSurface", item.altitude_m);
        item.frontal_footprint_m = calc.value("AdjustedFootprintFrontal", item.frontal_footprint_m);
        item.side_footprint_m = calc.value("AdjustedFootprintSide", item.side_footprint_m);
        camera.focal_length_mm = calc.value("FocalLength", camera.focal_length_mm);
        camera.sensor_width_mm = calc.value("SensorWidth", camera.sensor_width_mm);
        camera.sensor_height_mm = calc.value("SensorHeight", camera.sensor_height_mm);
        camera.image_width_px = calc.value("ImageWidth", camera.image_width_px);
        camera.image_height_px = calc.value("ImageHeight", camera.image_height_px);
        camera.frontal_overlap = calc.value("FrontalOverlap", camera.frontal_overlap * 100.0) / 100.0;
        camera.side_overlap = calc.value("SideOverlap", camera.side_overlap * 100.0) / 100.0;
    }
    item.camera.survey_angle_deg = item.angle_deg;
    return item;
}

} // namespace

PlanFileExporter::PlanFileExporter()
    : options_() {}

PlanFileExporter::PlanFileExporter(const Options& options)
    : options_(options) {}

json PlanFileExporter::to_json(const MissionPlan& plan) {
    json items = json::array();
    for (const auto& item : plan.items) {
        if (const auto* simple = std::get_if<SimpleItem>(&item)) {
            items.push_back(simple_item_json(*simple));
        } else if (const auto* survey = std::get_if<SurveyPatternItem>(&item)) {
            items.push_back(survey_json(*survey));
        } else {
            items.push_back(landing_pattern_json(std::get<LandingPatternItem>(item)));
        }
    }

    json polygons = json::array();
    if (!plan.geofence.polygon.empty()) {
        polygons.push_back({
            {"inclusion", plan.geofence.inclusion},
            {"polygon", lat_lon_array(plan.geofence.polygon)},
            {"version", POLYGON_VERSION}
        });
    }

    return json{
        {"fileType", "Plan"},
        {"geoFence", {
            {"circles", json::array()},
            {"polygons", polygons},
            {"version", GEOFENCE_VERSION}
        }},
        {"groundStation", "QGroundControl"},
        {"mission", {
            {"cruiseSpeed", plan.vehicle.cruise_speed},
            {"firmwareType", plan.vehicle.firmware_type},
            {"globalPlanAltitudeMode", plan.global_plan_altitude_mode},
            {"hoverSpeed", plan.vehicle.hover_speed},
            {"items", items},
            {"plannedHomePosition", {plan.home.lat, plan.home.lon, plan.home_elevation_m}},
            {"vehicleType", plan.vehicle.vehicle_type},
            {"version", MISSION_VERSION}
        }},
        {"rallyPoints", {
            {"points", json::array()},
            {"version", RALLY_VERSION}
        }},
        {"version", PLAN_FILE_VERSION}
    };
}

MissionPlan PlanFileExporter::from_json(const json& document) {
    try {
        if (document.at("fileType").get<std::string>() != "Plan") {
            throw PlanFormatError("fileType is not \"Plan\"");
        }

        MissionPlan plan;
        const json& mission = document.at("mission");

        const json& home = mission.at("plannedHomePosition");
        if (!home.is_array() || home.size() < 3) {
            throw PlanFormatError("plannedHomePosition needs lat, lon and altitude");
        }
        plan.home = Coordinate(home[0].get<double>(), home[1].get<double>());
        plan.home_elevation_m = home[2].get<double>();

        plan.vehicle.cruise_speed = mission.value("cruiseSpeed", plan.vehicle.cruise_speed);
        plan.vehicle.hover_speed = mission.value("hoverSpeed", plan.vehicle.hover_speed);
        plan.vehicle.firmware_type = mission.value("firmwareType", plan.vehicle.firmware_type);
        plan.vehicle.vehicle_type = mission.value("vehicleType", plan.vehicle.vehicle_type);
        plan.global_plan_altitude_mode = mission.value("globalPlanAltitudeMode", 0);

        for (const auto& item : mission.at("items")) {
            const std::string type = item.at("type").get<std::string>();
            if (type == "SimpleItem") {
                plan.items.emplace_back(simple_item_from_json(item));
                continue;
            }
            if (type != "ComplexItem") {
                throw PlanFormatError("unsupported mission item type: " + type);
            }
            const std::string complex_type = item.value("complexItemType", std::string());
            if (complex_type == "fwLandingPattern") {
                plan.items.emplace_back(landing_pattern_from_json(item));
            } else if (complex_type == "survey") {
                plan.items.emplace_back(survey_from_json(item));
            } else {
                throw PlanFormatError("unsupported complex item type: " + complex_type);
            }
        }

        if (document.contains("geoFence")) {
            const json& polygons = document["geoFence"].value("polygons", json::array());
            if (!polygons.empty()) {
                const json& fence = polygons.front();
                plan.geofence.inclusion = fence.value("inclusion", true);
                plan.geofence.polygon = lat_lon_points(fence.at("polygon"));
            }
        }

        return plan;
    } catch (const json::exception& e) {
        throw PlanFormatError(e.what());
    }
}

bool PlanFileExporter::write_plan_file(const MissionPlan& plan, const std::string& filename) const {
    Logger logger("PlanFileExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create plan file: " + filename);
        return false;
    }

    file << to_json(plan).dump(options_.indent) << "\n";
    file.close();
    if (file.fail()) {
        logger.error("Failed writing plan file: " + filename);
        return false;
    }

    logger.info("Exported plan: " + filename + " (" + std::to_string(plan.items.size()) + " items)");
    return true;
}

std::optional<MissionPlan> PlanFileExporter::read_plan_file(const std::string& filename) const {
    Logger logger("PlanFileExporter");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to open plan file: " + filename);
        return std::nullopt;
    }

    try {
        json document;
        file >> document;
        return from_json(document);
    } catch (const json::exception& e) {
        logger.error("Failed to parse plan file " + filename + ": " + e.what());
    } catch (const PlanFormatError& e) {
        logger.error(filename + ": " + e.what());
    }
    return std::nullopt;
}

std::string PlanFileExporter::to_waypoint_text(const MissionPlan& plan) const {
    std::ostringstream out;
    out << "QGC WPL 110\n";

    auto write_line = [&out, this](int seq, int current, int frame, int command,
                                   const std::array<double, 7>& params, bool auto_continue) {
        out << seq << '\t' << current << '\t' << frame << '\t' << command;
        out << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < 4; ++i) {
            out << '\t' << (std::isnan(params[i]) ? 0.0 : params[i]);
        }
        out << std::setprecision(options_.text_precision);
        out << '\t' << params[4] << '\t' << params[5];
        out << std::setprecision(6) << '\t' << params[6];
        out << '\t' << (auto_continue ? 1 : 0) << '\n';
    };

    write_line(0, 1, mav::FRAME_GLOBAL, mav::CMD_NAV_WAYPOINT,
               {0.0, 0.0, 0.0, 0.0, plan.home.lat, plan.home.lon, plan.home_elevation_m}, true);

    int seq = 1;
    for (const auto& item : plan.items) {
        if (const auto* simple = std::get_if<SimpleItem>(&item)) {
            write_line(seq++, 0, simple->frame, simple->command, simple->params, simple->auto_continue);
        } else if (const auto* survey = std::get_if<SurveyPatternItem>(&item)) {
            for (const auto& nested : survey->items) {
                write_line(seq++, 0, nested.frame, nested.command, nested.params, nested.auto_continue);
            }
        } else {
            const auto& pattern = std::get<LandingPatternItem>(item);
            write_line(seq++, 0, mav::FRAME_GLOBAL_RELATIVE_ALT, mav::CMD_NAV_LAND,
                       {0.0, 0.0, 0.0, 0.0, pattern.land_coordinate.lat,
                        pattern.land_coordinate.lon, pattern.land_altitude_m}, true);
        }
    }
    return out.str();
}

bool PlanFileExporter::write_waypoint_file(const MissionPlan& plan, const std::string& filename) const {
    Logger logger("PlanFileExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create waypoint file: " + filename);
        return false;
    }

    file << to_waypoint_text(plan);
    file.close();
    if (file.fail()) {
        logger.error("Failed writing waypoint file: " + filename);
        return false;
    }

    logger.info("Exported waypoints: " + filename);
    return true;
}

} // namespace afg
