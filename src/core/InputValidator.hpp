/**
 * @file InputValidator.hpp
 * @brief Validation of mission configurations before generation
 *
 * Detects invalid values, missing locations and contradictory options, and
 * provides clear error messages with suggested solutions.
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace afg {

/**
 * @brief Represents a problem detected in a mission configuration
 */
struct ParameterConflict {
    enum class Kind { INVALID_PARAMETER, MISSING_LOCATION };

    Kind kind = Kind::INVALID_PARAMETER;
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
    std::string location_name;                 // Set for MISSING_LOCATION
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    /**
     * @brief First missing-location conflict, if any
     */
    const ParameterConflict* first_missing_location() const;

    std::string format_error_message() const;
};

/**
 * @brief Validates mission configurations
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const MissionConfig& config) const;

    /**
     * @brief Locations the scenario cannot be generated without
     */
    static std::vector<std::string> required_locations(MissionConfig::Scenario scenario);

private:
    /**
     * @brief interval, buffer and altitude must be finite; interval and buffer positive
     */
    std::optional<ParameterConflict> check_distances(const MissionConfig& config) const;

    std::optional<ParameterConflict> check_camera(const MissionConfig& config) const;

    // cruise and hover speed overrides, when given
    std::optional<ParameterConflict> check_speeds(const MissionConfig& config) const;

    /**
     * @brief Every supplied coordinate must be within WGS84 bounds
     */
    std::optional<ParameterConflict> check_coordinates(const MissionConfig& config) const;

    std::vector<ParameterConflict> check_required_locations(const MissionConfig& config) const;

    /**
     * @brief Terminal actions the scenario cannot honor
     */
    std::optional<ParameterConflict> check_terminal_action(const MissionConfig& config) const;

    std::optional<ParameterConflict> check_tower_altitudes(const MissionConfig& config) const;
};

} // namespace afg
