/**
 * @file UnitParser.hpp
 * @brief Text input for mission distances and coordinates
 *
 * Distances: "200", "200m", "1.5km", "400ft", "2mi". Bare numbers take the
 * preferred unit, so "--units feet --altitude 400" flies at 121.92 m.
 *
 * Coordinates: decimal degrees ("40.01,-75.125") or DMS
 * ("40°00'36"N,75°07'30"W", "40d00m36sN"). Lists are ';'-separated.
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <string>
#include <utility>
#include <vector>

namespace afg {

/**
 * @brief Malformed distance or coordinate text
 */
class UnitParseError : public InvalidParameterError {
public:
    explicit UnitParseError(const std::string& message)
        : InvalidParameterError("Unit parsing error: " + message) {}
};

enum class DistanceUnit {
    METERS,
    KILOMETERS,
    FEET,
    MILES
};

struct UnitPreferences {
    DistanceUnit distance_unit = DistanceUnit::METERS;  // For numbers without a suffix

    /**
     * @brief Accepts meters/metric/m, kilometers/km, feet/imperial/ft, miles/mi
     * @throws UnitParseError for anything else
     */
    void set_distance_units(const std::string& unit);
};

struct ParsedDistance {
    double meters = 0.0;
    DistanceUnit unit = DistanceUnit::METERS;  // Unit the text was written in
    bool explicit_unit = false;                // Text carried a suffix
};

class UnitParser {
public:
    UnitParser() = default;
    explicit UnitParser(const UnitPreferences& prefs) : preferences_(prefs) {}

    const UnitPreferences& preferences() const { return preferences_; }

    /**
     * @brief Distance in meters; a missing suffix means default_unit
     *
     *   parse_distance("100", FEET)    -> 30.48 m
     *   parse_distance("5km", METERS)  -> 5000 m
     */
    ParsedDistance parse_distance(const std::string& input, DistanceUnit default_unit) const;

    ParsedDistance parse_distance(const std::string& input) const {
        return parse_distance(input, preferences_.distance_unit);
    }

    /**
     * @brief Latitude in degrees, -90..90
     *
     *   "40°00'36"N" -> 40.01
     *   "33d51m54sS" -> -33.865
     */
    double parse_latitude(const std::string& input) const;

    double parse_longitude(const std::string& input) const;

    /**
     * @brief "lat,lon" pair
     */
    Coordinate parse_coordinate(const std::string& input) const;

    /**
     * @brief ';'-separated pairs; empty entries such as a trailing ';' are skipped
     */
    std::vector<Coordinate> parse_coordinate_list(const std::string& input) const;

    static double convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit);
    static double meters_per(DistanceUnit unit);

    /**
     * @throws UnitParseError if the suffix is not m, km, ft or mi (or spelled out)
     */
    static DistanceUnit parse_unit_suffix(const std::string& suffix);

    static std::string unit_suffix(DistanceUnit unit);

private:
    UnitPreferences preferences_;

    // "10.5 ft" -> ("10.5", "ft")
    std::pair<std::string, std::string> split_number_and_suffix(const std::string& input) const;

    /**
     * @brief Degrees, minutes and seconds with an optional hemisphere letter
     *
     * The separators may be °, ', " or d, m, s or plain spaces.
     */
    double parse_dms(const std::string& input, bool is_latitude) const;

    bool looks_like_dms(const std::string& input) const;

    double parse_decimal_degrees(const std::string& input, bool is_latitude) const;
};

} // namespace afg
