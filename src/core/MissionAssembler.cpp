/**
 * @file MissionAssembler.cpp
 * @brief Turns a mission configuration into a complete MissionPlan
 */

#include "MissionAssembler.hpp"
#include "AircraftProfile.hpp"
#include "AltitudeComposer.hpp"
#include "AreaPatternGenerator.hpp"
#include "GeoMath.hpp"
#include "InputValidator.hpp"
#include "MissionItems.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace afg {

namespace {

using Scenario = MissionConfig::Scenario;
using Terminal = MissionConfig::TerminalAction;

/**
 * @brief Mutable state of one generation run
 *
 * Tracks the aircraft position so each leg starts where the last one ended.
 */
class MissionBuild {
public:
    MissionBuild(const MissionConfig& config, const AircraftProfile& profile,
                 AltitudeComposer& composer)
        : config_(config), profile_(profile), composer_(composer) {}

    void takeoff(const Coordinate& at, double agl_m) {
        Waypoint wp = compose(at, agl_m);
        wp.kind = CommandKind::TAKEOFF;
        append(profile_.takeoff_items(wp));
        record(wp);
        protect(at);
        position_ = at;
    }

    /**
     * @brief Fly from the current position to target
     *
     * The leg is interpolated at the configured interval unless interpolate is
     * false, in which case only target is emitted. The starting point is never
     * repeated.
     */
    void fly_to(const Coordinate& target, double agl_m, bool interpolate = true) {
        FlightPath leg;
        if (interpolate) {
            leg = GeoMath::interpolate(position_, target, config_.interval_m);
            leg.erase(leg.begin());
        } else {
            leg.push_back(target);
        }

        for (Waypoint& wp : composer_.compose_path(leg, agl_m)) {
            items_.push_back(items::waypoint(wp));
            record(wp);
        }
        position_ = target;
    }

    void deliver_at(const Coordinate& at) {
        append(profile_.delivery_items(at));
        protect(at);
    }

    void land_and_takeoff_at(const Coordinate& at) {
        const Waypoint wp = compose(at, config_.altitude_agl_m);
        append(profile_.land_and_takeoff_items(wp, config_.altitude_agl_m));
        protect(at);
    }

    void land_at(const Coordinate& at) {
        append(profile_.landing_items(at, config_.altitude_agl_m));
        protect(at);
    }

    void add(const SimpleItem& item) { items_.push_back(item); }

    /**
     * @brief Move the items appended since first_item into a survey complex item
     */
    void enclose_in_survey(size_t first_item, SurveyPatternItem survey) {
        const auto first = items_.begin() + static_cast<std::ptrdiff_t>(first_item);
        for (auto it = first; it != items_.end(); ++it) {
            survey.items.push_back(std::get<SimpleItem>(*it));
        }
        items_.erase(first, items_.end());
        items_.emplace_back(std::move(survey));
    }

    const Coordinate& position() const { return position_; }
    std::vector<MissionItem>& items() { return items_; }
    const FlightPath& path() const { return path_; }
    const std::vector<Waypoint>& waypoints() const { return waypoints_; }
    const std::vector<Coordinate>& protected_points() const { return protected_; }

private:
    Waypoint compose(const Coordinate& at, double agl_m) {
        const ComposedAltitude alt = composer_.compose(at, agl_m);
        Waypoint wp;
        wp.position = at;
        wp.agl_altitude_m = alt.agl_m;
        wp.amsl_altitude_m = alt.amsl_m;
        wp.terrain_elevation_m = alt.terrain_m;
        wp.terrain_degraded = alt.degraded;
        return wp;
    }

    void record(Waypoint wp) {
        wp.sequence = static_cast<int>(waypoints_.size());
        path_.push_back(wp.position);
        waypoints_.push_back(wp);
    }

    void append(const std::vector<MissionItem>& items) {
        items_.insert(items_.end(), items.begin(), items.end());
    }

    void protect(const Coordinate& point) {
        if (std::find(protected_.begin(), protected_.end(), point) == protected_.end()) {
            protected_.push_back(point);
        }
    }

    const MissionConfig& config_;
    const AircraftProfile& profile_;
    AltitudeComposer& composer_;

    Coordinate position_;
    std::vector<MissionItem> items_;
    FlightPath path_;
    std::vector<Waypoint> waypoints_;
    std::vector<Coordinate> protected_;
};

void finish_at_start_or_land(MissionBuild& build, const MissionConfig& config, Terminal terminal,
                             double agl_m) {
    if (terminal == Terminal::LAND) {
        build.land_at(build.position());
        return;
    }
    build.fly_to(*config.start, agl_m);
    build.land_at(*config.start);
}

void build_route(MissionBuild& build, const MissionConfig& config, Terminal terminal) {
    const double agl = config.altitude_agl_m;
    const bool multi = config.scenario == Scenario::MULTI_DELIVERY;

    std::vector<Coordinate> stops;
    if (config.scenario == Scenario::A_TO_B || config.scenario == Scenario::DELIVERY) {
        stops.push_back(*config.end);
    } else {
        stops = config.waypoints;
        if (config.scenario == Scenario::LINEAR_ROUTE && config.end) {
            stops.push_back(*config.end);
        }
    }

    build.takeoff(*config.start, agl);
    for (size_t i = 0; i < stops.size(); ++i) {
        build.fly_to(stops[i], agl);
        if (!multi) {
            continue;
        }
        const bool last = i + 1 == stops.size();
        if (config.delivery_action == MissionConfig::DeliveryAction::LAND_AND_TAKEOFF) {
            if (!(last && terminal == Terminal::LAND)) {
                build.land_and_takeoff_at(stops[i]);
            }
        } else {
            build.deliver_at(stops[i]);
        }
    }

    const Coordinate destination = stops.back();
    switch (terminal) {
        case Terminal::LAND:
            build.land_at(destination);
            return;
        case Terminal::PAYLOAD_RELEASE:
            if (!multi) build.deliver_at(destination);
            break;
        case Terminal::LAND_AND_RETURN:
            if (!multi) build.land_and_takeoff_at(destination);
            break;
        case Terminal::RETURN_TO_START:
            break;
    }

    // Back along the outbound route
    for (auto it = stops.rbegin() + 1; it != stops.rend(); ++it) {
        build.fly_to(*it, agl);
    }
    build.fly_to(*config.start, agl);
    build.land_at(*config.start);
}

void build_patrol(MissionBuild& build, const MissionConfig& config, Terminal terminal,
                  const GeofenceBuilder& fences, const AreaPatternGenerator& patterns,
                  std::vector<PlanWarning>& warnings, const Logger& logger) {
    const ShrinkResult shrunk = fences.shrink_polygon(config.polygon, config.inward_margin_m);
    warnings.insert(warnings.end(), shrunk.warnings.begin(), shrunk.warnings.end());

    FlightPath route;
    if (config.patrol_pattern == MissionConfig::PatrolPattern::GRID) {
        route = patterns.grid_points(shrunk.polygon, config.grid_spacing_m, *config.start);
        if (route.empty()) {
            logger.warning("Grid pattern produced no points; patrolling the perimeter instead");
        }
    }
    if (route.empty()) {
        route = AreaPatternGenerator::perimeter_route(shrunk.polygon, *config.start);
    }

    build.takeoff(*config.start, config.altitude_agl_m);
    for (const auto& point : route) {
        build.fly_to(point, config.altitude_agl_m);
    }
    finish_at_start_or_land(build, config, terminal, config.altitude_agl_m);
}

void build_survey(MissionBuild& build, const MissionConfig& config, Terminal terminal,
                  const AreaPatternGenerator& patterns, std::vector<PlanWarning>& warnings) {
    const double agl = config.altitude_agl_m;
    const SurveyPattern pattern = patterns.survey(config.polygon, config.camera, agl);
    if (pattern.transects.empty()) {
        throw InvalidParameterError("Survey polygon is too small or degenerate for any transect");
    }
    if (pattern.truncated) {
        std::ostringstream msg;
        msg << "Survey limited to " << AreaPatternGenerator::MAX_TRANSECTS
            << " transects; spacing widened to " << std::fixed << std::setprecision(1)
            << pattern.spacing_m << " m";
        warnings.push_back({PlanWarning::Kind::SURVEY_TRUNCATED, msg.str()});
    }

    build.takeoff(*config.start, agl);
    build.fly_to(pattern.transects.front().entry, agl);

    const size_t first_survey_item = build.items().size();
    build.add(items::camera_trigger_distance(pattern.trigger_distance_m));
    for (size_t i = 0; i < pattern.transects.size(); ++i) {
        if (i > 0) {
            build.fly_to(pattern.transects[i].entry, agl);
        }
        build.fly_to(pattern.transects[i].exit, agl);
    }
    build.add(items::camera_trigger_distance(0.0));

    const CameraFootprint footprint = AreaPatternGenerator::camera_footprint(config.camera, agl);
    SurveyPatternItem survey;
    survey.polygon = config.polygon;
    survey.angle_deg = config.camera.survey_angle_deg;
    survey.altitude_m = agl;
    survey.camera = config.camera;
    survey.frontal_footprint_m = footprint.frontal_m;
    survey.side_footprint_m = footprint.side_m;
    for (const auto& transect : pattern.transects) {
        survey.transect_points.push_back(transect.entry);
        survey.transect_points.push_back(transect.exit);
        const double length = GeoMath::haversine_distance(transect.entry, transect.exit);
        survey.camera_shots += 1;
        if (pattern.trigger_distance_m > 0.0) {
            survey.camera_shots += static_cast<int>(std::floor(length / pattern.trigger_distance_m));
        }
    }
    build.enclose_in_survey(first_survey_item, std::move(survey));

    finish_at_start_or_land(build, config, terminal, agl);
}

std::vector<Coordinate> tower_stations(const MissionConfig& config) {
    const double o = config.tower_offset_m;
    const Coordinate& tower = *config.tower;
    return {
        GeoMath::offset_meters(tower, o, o),
        GeoMath::offset_meters(tower, -o, o),
        GeoMath::offset_meters(tower, -o, -o),
        GeoMath::offset_meters(tower, o, -o)
    };
}

void build_tower(MissionBuild& build, const MissionConfig& config) {
    const auto stations = tower_stations(config);

    build.takeoff(*config.start, config.tower_low_agl_m);
    build.add(items::region_of_interest(*config.tower));
    build.fly_to(stations.front(), config.tower_high_agl_m);
    for (const auto& station : stations) {
        build.fly_to(station, config.tower_low_agl_m, false);
        build.fly_to(station, config.tower_high_agl_m, false);
    }
    build.fly_to(*config.start, config.tower_high_agl_m);
    build.land_at(*config.start);
}

void number_items(std::vector<MissionItem>& items) {
    int next_id = 1;
    for (auto& item : items) {
        if (auto* simple = std::get_if<SimpleItem>(&item)) {
            simple->do_jump_id = next_id++;
        } else if (auto* survey = std::get_if<SurveyPatternItem>(&item)) {
            for (auto& nested : survey->items) {
                nested.do_jump_id = next_id++;
            }
        }
    }
}

// Every fixed-wing landing loiters on a circle around its approach point
std::vector<LoiterCircle> landing_loiters(const std::vector<MissionItem>& items) {
    std::vector<LoiterCircle> circles;
    for (const auto& item : items) {
        if (const auto* pattern = std::get_if<LandingPatternItem>(&item)) {
            circles.push_back({pattern->approach_coordinate, pattern->loiter_radius_m});
        }
    }
    return circles;
}

} // namespace

bool MissionResult::has_warning(PlanWarning::Kind kind) const {
    return std::any_of(warnings.begin(), warnings.end(),
                       [kind](const PlanWarning& w) { return w.kind == kind; });
}

MissionAssembler::MissionAssembler(TerrainService& terrain)
    : terrain_(terrain), options_() {
}

MissionAssembler::MissionAssembler(TerrainService& terrain, const Options& options)
    : terrain_(terrain), options_(options) {
}

MissionConfig::TerminalAction MissionAssembler::default_terminal_action(const MissionConfig& config) {
    switch (config.scenario) {
        case Scenario::A_TO_B:
        case Scenario::LINEAR_ROUTE:
            return Terminal::LAND;
        case Scenario::DELIVERY:
            return config.delivery_action == MissionConfig::DeliveryAction::LAND_AND_TAKEOFF
                ? Terminal::LAND_AND_RETURN
                : Terminal::PAYLOAD_RELEASE;
        case Scenario::MULTI_DELIVERY:
        case Scenario::SECURITY_PATROL:
        case Scenario::MAPPING_SURVEY:
        case Scenario::TOWER_INSPECTION:
            return Terminal::RETURN_TO_START;
    }
    return Terminal::LAND;
}

void MissionAssembler::validate(const MissionConfig& config) const {
    InputValidator validator;
    const ValidationResult validation = validator.validate(config);
    if (!validation.has_errors()) {
        return;
    }

    logger_.error(validation.format_error_message());
    if (const ParameterConflict* missing = validation.first_missing_location()) {
        throw MissingLocationError(missing->location_name);
    }
    throw InvalidParameterError(validation.conflicts.front().description);
}

MissionResult MissionAssembler::assemble(const MissionConfig& config) {
    validate(config);

    const auto profile = AircraftProfile::create(config.aircraft);
    const Terminal terminal = config.terminal_action.value_or(default_terminal_action(config));
    logger_.info("Generating " + profile->name() + " mission");

    AltitudeComposer composer(terrain_);
    GeofenceBuilder fences(options_.geofence);
    AreaPatternGenerator patterns;
    MissionBuild build(config, *profile, composer);
    MissionResult result;

    switch (config.scenario) {
        case Scenario::A_TO_B:
        case Scenario::DELIVERY:
        case Scenario::MULTI_DELIVERY:
        case Scenario::LINEAR_ROUTE:
            build_route(build, config, terminal);
            break;
        case Scenario::SECURITY_PATROL:
            build_patrol(build, config, terminal, fences, patterns, result.warnings, logger_);
            break;
        case Scenario::MAPPING_SURVEY:
            build_survey(build, config, terminal, patterns, result.warnings);
            break;
        case Scenario::TOWER_INSPECTION:
            build_tower(build, config);
            break;
    }

    number_items(build.items());

    MissionPlan& plan = result.plan;
    plan.items = std::move(build.items());
    plan.home = *config.start;
    plan.home_elevation_m = build.waypoints().front().terrain_elevation_m;
    plan.vehicle = profile->vehicle_info();
    plan.vehicle.cruise_speed = config.cruise_speed_mps.value_or(plan.vehicle.cruise_speed);
    plan.vehicle.hover_speed = config.hover_speed_mps.value_or(plan.vehicle.hover_speed);
    plan.global_plan_altitude_mode = 0;

    if (config.scenario == Scenario::TOWER_INSPECTION) {
        std::vector<Coordinate> bounds = tower_stations(config);
        bounds.push_back(*config.start);
        bounds.push_back(*config.tower);
        plan.geofence = GeofenceBuilder::bounding_rectangle(
            bounds, options_.tower_fence_lat_margin_deg, options_.tower_fence_lon_margin_deg);
    } else {
        GeofenceResult fence = fences.build(build.path(), config.geofence_buffer_m,
                                            build.protected_points(),
                                            profile->loiter_radius(config.altitude_agl_m),
                                            landing_loiters(plan.items));
        plan.geofence = std::move(fence.geofence);
        result.warnings.insert(result.warnings.end(), fence.warnings.begin(), fence.warnings.end());
    }

    result.flight_path = build.path();
    result.waypoints = build.waypoints();
    result.proximity_warnings =
        AltitudeComposer::check_proximity(result.waypoints, config.proximity_threshold_m);

    const auto degraded = std::count_if(result.waypoints.begin(), result.waypoints.end(),
                                        [](const Waypoint& wp) { return wp.terrain_degraded; });
    if (degraded > 0) {
        result.terrain_degraded = true;
        result.warnings.push_back({PlanWarning::Kind::TERRAIN_UNAVAILABLE,
            "Terrain data incomplete: " + std::to_string(degraded) + " of " +
            std::to_string(result.waypoints.size()) +
            " points use the default elevation; verify clearance manually"});
    }

    result.terrain_stats = terrain_.get_stats();
    report(result, config);
    return result;
}

void MissionAssembler::report(const MissionResult& result, const MissionConfig& config) const {
    for (const auto& warning : result.warnings) {
        logger_.warning(warning.message);
    }
    for (const auto& proximity : result.proximity_warnings) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(6) << "Waypoint " << proximity.waypoint_index
            << " at " << proximity.position.lat << "," << proximity.position.lon
            << std::setprecision(1) << " is " << proximity.clearance_m
            << " m above terrain (threshold " << proximity.threshold_m << " m)";
        logger_.debug(msg.str());
    }
    if (!result.proximity_warnings.empty()) {
        logger_.warning(std::to_string(result.proximity_warnings.size()) +
                        " waypoints below the " + std::to_string(config.proximity_threshold_m) +
                        " m terrain clearance threshold");
    }

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(0) << result.plan.items.size() << " mission items, "
            << result.flight_path.size() << " navigation points, "
            << GeoMath::path_length(result.flight_path) << " m path, geofence with "
            << result.plan.geofence.polygon.size() << " vertices";
    logger_.info(summary.str());
}

} // namespace afg
