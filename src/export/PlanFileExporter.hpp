/**
 * @file PlanFileExporter.hpp
 * @brief QGroundControl plan document export and import
 *
 * Writes MissionPlans as QGC .plan JSON (mission, geofence and rally points)
 * and as the legacy QGC WPL 110 waypoint text format.
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace afg {

/**
 * @brief A plan document is missing required fields or has the wrong shape
 */
class PlanFormatError : public std::runtime_error {
public:
    explicit PlanFormatError(const std::string& message)
        : std::runtime_error("Invalid plan document: " + message) {}
};

class PlanFileExporter {
public:
    using json = nlohmann::json;

    struct Options {
        int indent = 4;            // dump() indent; -1 writes a single line
        int text_precision = 8;    // Decimal places in waypoint files

        Options() = default;
    };

    PlanFileExporter();
    explicit PlanFileExporter(const Options& options);

    /**
     * @brief Plan document for a MissionPlan
     *
     * NaN params are written as null.
     */
    static json to_json(const MissionPlan& plan);

    /**
     * @brief MissionPlan from a plan document; null params read back as NaN
     *
     * Complex items of type fwLandingPattern and survey are understood; any
     * other complex item type is rejected.
     *
     * @throws PlanFormatError if required fields are missing or mistyped
     */
    static MissionPlan from_json(const json& document);

    /**
     * @brief Write a .plan file
     * @return true if the file was written completely
     */
    bool write_plan_file(const MissionPlan& plan, const std::string& filename) const;

    /**
     * @brief Read a .plan file; nullopt (with an ERROR log) if unreadable or invalid
     */
    std::optional<MissionPlan> read_plan_file(const std::string& filename) const;

    /**
     * @brief Write the plan as QGC WPL 110 text
     *
     * Line 0 is the home position. Landing patterns are written as a plain
     * land command at their touchdown point.
     */
    bool write_waypoint_file(const MissionPlan& plan, const std::string& filename) const;

    std::string to_waypoint_text(const MissionPlan& plan) const;

private:
    Options options_;
};

} // namespace afg
