#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace afg {

namespace {

constexpr const char* kWhitespace = " \t\n\r";
constexpr const char* kDegreeSign = "°";

std::string trim(const std::string& input) {
    const auto first = input.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    return input.substr(first, input.find_last_not_of(kWhitespace) - first + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* axis_name(bool is_latitude) {
    return is_latitude ? "Latitude" : "Longitude";
}

double axis_limit(bool is_latitude) {
    return is_latitude ? 90.0 : 180.0;
}

void check_axis_range(double degrees, bool is_latitude) {
    const double limit = axis_limit(is_latitude);
    if (degrees < -limit || degrees > limit) {
        std::ostringstream msg;
        msg << axis_name(is_latitude) << " out of range [" << -limit << ", " << limit
            << "]: " << degrees;
        throw UnitParseError(msg.str());
    }
}

} // namespace

void UnitPreferences::set_distance_units(const std::string& unit) {
    const std::string name = to_lower(trim(unit));
    if (name == "metric") {
        distance_unit = DistanceUnit::METERS;
    } else if (name == "imperial") {
        distance_unit = DistanceUnit::FEET;
    } else if (name == "m" || name == "meters" || name == "km" || name == "kilometers" ||
               name == "ft" || name == "feet" || name == "mi" || name == "miles") {
        distance_unit = UnitParser::parse_unit_suffix(name);
    } else {
        throw UnitParseError("Invalid units: " + unit + ". Use: meters, km, feet, or miles");
    }
}

double UnitParser::meters_per(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return 1.0;
        case DistanceUnit::KILOMETERS: return 1000.0;
        case DistanceUnit::FEET:       return 0.3048;
        case DistanceUnit::MILES:      return 1609.344;
    }
    throw UnitParseError("Unknown distance unit");
}

double UnitParser::convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }
    return value * meters_per(from_unit) / meters_per(to_unit);
}

DistanceUnit UnitParser::parse_unit_suffix(const std::string& suffix) {
    const std::string name = to_lower(suffix);
    if (name == "m" || name == "meters") {
        return DistanceUnit::METERS;
    }
    if (name == "km" || name == "kilometers") {
        return DistanceUnit::KILOMETERS;
    }
    if (name == "ft" || name == "feet" || name == "'") {
        return DistanceUnit::FEET;
    }
    if (name == "mi" || name == "miles") {
        return DistanceUnit::MILES;
    }
    throw UnitParseError("Unrecognized unit: '" + suffix + "'. Supported units: m, km, ft, mi");
}

std::string UnitParser::unit_suffix(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return "m";
        case DistanceUnit::KILOMETERS: return "km";
        case DistanceUnit::FEET:       return "ft";
        case DistanceUnit::MILES:      return "mi";
    }
    return "unknown";
}

std::pair<std::string, std::string> UnitParser::split_number_and_suffix(const std::string& input) const {
    const std::string text = trim(input);
    if (text.empty()) {
        throw UnitParseError("Empty input string");
    }

    size_t end = 0;
    if (text[0] == '-' || text[0] == '+') {
        end = 1;
    }
    bool seen_point = false;
    bool seen_digit = false;
    for (; end < text.size(); ++end) {
        const char c = text[end];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }

    if (!seen_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }
    return {text.substr(0, end), trim(text.substr(end))};
}

ParsedDistance UnitParser::parse_distance(const std::string& input, DistanceUnit default_unit) const {
    const auto [number, suffix] = split_number_and_suffix(input);

    double value = 0.0;
    try {
        value = std::stod(number);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + number + "'");
    }

    ParsedDistance parsed;
    parsed.explicit_unit = !suffix.empty();
    parsed.unit = parsed.explicit_unit ? parse_unit_suffix(suffix) : default_unit;
    parsed.meters = value * meters_per(parsed.unit);
    return parsed;
}

// A hemisphere letter only counts as the final character, so "1.5e1" stays decimal
bool UnitParser::looks_like_dms(const std::string& input) const {
    const std::string text = trim(input);
    if (text.empty()) {
        return false;
    }
    const char last = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    return text.find(kDegreeSign) != std::string::npos ||
           text.find_first_of("d'\"") != std::string::npos ||
           text.find(' ') != std::string::npos ||
           std::string("NSEW").find(last) != std::string::npos;
}

double UnitParser::parse_dms(const std::string& input, bool is_latitude) const {
    std::string work = trim(input);

    char hemisphere = '\0';
    if (!work.empty()) {
        const char last = static_cast<char>(std::toupper(static_cast<unsigned char>(work.back())));
        if (std::string("NSEW").find(last) != std::string::npos) {
            hemisphere = last;
            work.pop_back();
        }
    }

    const bool lat_hemisphere = hemisphere == 'N' || hemisphere == 'S';
    const bool lon_hemisphere = hemisphere == 'E' || hemisphere == 'W';
    if ((is_latitude && lon_hemisphere) || (!is_latitude && lat_hemisphere)) {
        throw UnitParseError(std::string("Wrong hemisphere for ") + to_lower(axis_name(is_latitude)) +
                             ": '" + input + "'");
    }

    const std::string degree_sign(kDegreeSign);
    for (size_t pos = work.find(degree_sign); pos != std::string::npos; pos = work.find(degree_sign, pos)) {
        work.replace(pos, degree_sign.size(), " ");
    }
    std::replace_if(work.begin(), work.end(),
                    [](char c) { return std::string("d'\"ms").find(c) != std::string::npos; }, ' ');

    std::istringstream fields(work);
    double degrees = 0.0;
    double minutes = 0.0;
    double seconds = 0.0;
    if (!(fields >> degrees)) {
        throw UnitParseError("Invalid DMS format: '" + input + "'");
    }
    if (fields >> minutes) {
        if (!(fields >> seconds)) {
            seconds = 0.0;
        }
    } else {
        minutes = 0.0;
    }

    if (minutes < 0.0 || minutes >= 60.0) {
        throw UnitParseError("Invalid minutes value: " + std::to_string(minutes));
    }
    if (seconds < 0.0 || seconds >= 60.0) {
        throw UnitParseError("Invalid seconds value: " + std::to_string(seconds));
    }

    const double magnitude = std::abs(degrees) + minutes / 60.0 + seconds / 3600.0;
    bool negative = std::signbit(degrees);
    if (hemisphere != '\0') {
        negative = hemisphere == 'S' || hemisphere == 'W';
    }
    const double decimal = negative ? -magnitude : magnitude;

    check_axis_range(decimal, is_latitude);
    return decimal;
}

double UnitParser::parse_decimal_degrees(const std::string& input, bool is_latitude) const {
    const std::string text = trim(input);
    const std::string invalid = std::string("Invalid ") + to_lower(axis_name(is_latitude)) +
                                " format: '" + input + "'";

    double degrees = 0.0;
    size_t consumed = 0;
    try {
        degrees = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw UnitParseError(invalid);
    }
    if (consumed != text.size() || !std::isfinite(degrees)) {
        throw UnitParseError(invalid);
    }

    check_axis_range(degrees, is_latitude);
    return degrees;
}

double UnitParser::parse_latitude(const std::string& input) const {
    return looks_like_dms(input) ? parse_dms(input, true) : parse_decimal_degrees(input, true);
}

double UnitParser::parse_longitude(const std::string& input) const {
    return looks_like_dms(input) ? parse_dms(input, false) : parse_decimal_degrees(input, false);
}

Coordinate UnitParser::parse_coordinate(const std::string& input) const {
    const size_t comma = input.find(',');
    if (comma == std::string::npos) {
        throw UnitParseError("Coordinate pair must be separated by comma: '" + input + "'");
    }
    return Coordinate(parse_latitude(input.substr(0, comma)),
                      parse_longitude(input.substr(comma + 1)));
}

std::vector<Coordinate> UnitParser::parse_coordinate_list(const std::string& input) const {
    std::vector<Coordinate> points;
    std::istringstream stream(input);
    std::string entry;
    while (std::getline(stream, entry, ';')) {
        if (!trim(entry).empty()) {
            points.push_back(parse_coordinate(entry));
        }
    }
    return points;
}

} // namespace afg
