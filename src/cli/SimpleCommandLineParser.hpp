/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for afg-plan
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace afg {

/**
 * @brief Option parser for afg-plan
 *
 * Accepts --name VALUE, --name=VALUE, -x VALUE and bare flags. A repeated
 * option keeps its last value. Values may begin with '-' when they are
 * numeric, so "--start -33.9,151.2" works. Positional arguments are rejected.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool takes_value = true;
    };

    SimpleCommandLineParser(std::string program_name, std::string summary)
        : program_name_(std::move(program_name)), summary_(std::move(summary)) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option(Option{long_name, short_name, description, true});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option{long_name, short_name, description, false});
    }

    /**
     * @return false on --help or on a usage error (already reported on stderr)
     */
    bool parse(int argc, char* argv[]) {
        const std::vector<std::string> args(argv + 1, argv + argc);
        values_.clear();
        help_requested_ = false;

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h" || arg == "-?" || arg == "--?") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            std::string name;
            std::optional<std::string> inline_value;

            if (arg.starts_with("--")) {
                name = arg.substr(2);
                if (const size_t eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.erase(eq);
                }
            } else if (arg.size() > 1 && arg[0] == '-' && !looks_numeric(arg)) {
                auto alias = short_to_long_.find(arg.substr(1));
                if (alias == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                name = alias->second;
            } else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }

            auto found = options_.find(name);
            if (found == options_.end()) {
                std::cerr << "Unknown option: --" << name << std::endl;
                return false;
            }

            if (!found->second.takes_value) {
                values_[name] = "true";
            } else if (inline_value) {
                values_[name] = *inline_value;
            } else if (i + 1 < args.size() && is_value(args[i + 1])) {
                values_[name] = args[++i];
            } else {
                std::cerr << "Option " << arg << " requires a value" << std::endl;
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = values_.find(option_name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool get_flag(const std::string& option_name) const {
        return get(option_name) == std::optional<std::string>("true");
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << program_name_ << " - " << summary_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # Point to point flight at 50 m above ground\n";
        std::cout << "    " << program_name_ << " --scenario a-to-b --start 40.0,-75.0 --end 40.01,-75.0\n";
        std::cout << "    \n";
        std::cout << "    # Create an example configuration file, edit it, then run it\n";
        std::cout << "    " << program_name_ << " --create-config delivery.json\n";
        std::cout << "    " << program_name_ << " --config delivery.json\n\n";

        std::cout << "COORDINATES:\n";
        std::cout << "    Decimal degrees or DMS in lat,lon format:\n";
        std::cout << "    --start 40.0125,-75.1250    --end \"40°00'36\\\"N,75°07'30\\\"W\"\n";
        std::cout << "    Lists are separated by ';':\n";
        std::cout << "    --polygon \"40.00,-75.00;40.01,-75.00;40.01,-74.99\"\n\n";

        std::cout << "MISSION OPTIONS:\n";
        print_help_section("scenario", "a-to-b, delivery, multi-delivery, linear-route, security-patrol,\n"
                                       "                          mapping-survey, tower-inspection (default: a-to-b)");
        print_help_section("aircraft", "multicopter, fixed-wing, vtol (default: multicopter)");
        print_help_section("start", "Start (home) coordinate");
        print_help_section("end", "End coordinate for a-to-b and delivery");
        print_help_section("waypoint", "Delivery points or route vertices, ';'-separated");
        print_help_section("polygon", "Patrol or survey area vertices, ';'-separated");
        print_help_section("tower", "Tower coordinate for tower-inspection");
        print_help_section("terminal", "land, return, payload, land-and-return (default: per scenario)");
        print_help_section("delivery-action", "payload or land-and-takeoff (default: payload)");
        print_help_section("pattern", "Patrol pattern: perimeter or grid (default: perimeter)");
        print_help_section("cruise-speed", "Cruise speed in m/s (default: 15)");
        print_help_section("hover-speed", "Hover speed in m/s (default: 5)");
        std::cout << "\n";

        std::cout << "DISTANCE OPTIONS (suffix m, km, ft, mi; bare numbers use --units):\n";
        print_help_section("altitude", "Cruise altitude above ground (default: 50m)");
        print_help_section("interval", "Waypoint spacing along each leg (default: 50m)");
        print_help_section("geofence-buffer", "Fence distance around the route (default: 50m)");
        print_help_section("tower-offset", "Inspection station distance from the tower (default: 50m)");
        print_help_section("inward-margin", "Patrol inset from the area boundary (default: 50m)");
        print_help_section("grid-spacing", "Patrol grid spacing (default: 111.32m)");
        print_help_section("units", "Units for bare numbers: meters, km, feet, miles (default: meters)");
        std::cout << "\n";

        std::cout << "OUTPUT AND TERRAIN:\n";
        print_help_section("output", "Plan file path (default: mission.plan)");
        print_help_section("waypoint-file", "Also write a QGC WPL 110 waypoint file");
        print_help_section("terrain-url", "Elevation API endpoint (default: OpenTopoData SRTM 90 m)");
        print_help_section("terrain-cache-dir", "Tile cache directory (default: cache/terrain_tiles)");
        print_help_section("terrain-tiles", "Fetch terrain in cached 0.1 degree tiles");
        print_help_section("offline", "No network lookups; unknown elevations read as 0 m");
        std::cout << "\n";

        std::cout << "GENERAL:\n";
        print_help_section("config", "Load configuration from JSON file");
        print_help_section("create-config", "Write an example configuration file and exit");
        print_help_section("dry-run", "Validate and print the configuration without generating");
        print_help_section("silent", "Suppress all output (same as --log-level 0)");
        print_help_section("verbose", "Enable verbose logging (same as --log-level 6)");
        print_help_section("log-level", "Verbosity: 0=SILENT, 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED,\n"
                                        "                          5=DEBUG, 6=TRACE; per facility: \"3,TerrainService=5\"");
        print_help_section("log-file", "Log to specified file (append if exists)");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXIT CODES:\n";
        std::cout << "    0  Plan written (terrain problems are reported as warnings)\n";
        std::cout << "    1  Invalid or missing input\n";
        std::cout << "    2  Output could not be written\n";
    }

private:
    void register_option(const Option& option) {
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    // Negative numbers and coordinate text such as "-33.9,151.2"
    static bool looks_numeric(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    static bool is_value(const std::string& arg) {
        return !arg.starts_with("-") || looks_numeric(arg);
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string flag = "--" + option.long_name;
            if (option.takes_value) {
                flag += " VALUE";
            }
            std::cout << "    " << flag;
            if (flag.size() < 22) {
                std::cout << std::string(22 - flag.size(), ' ');
            } else {
                std::cout << "\n" << std::string(26, ' ');
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string summary_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> values_;
    bool help_requested_ = false;
};

} // namespace afg
