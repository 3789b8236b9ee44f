/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for afg-plan
 */

#pragma once

#include "auto_flight_generator.hpp"
#include "ConfigurationManager.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include <optional>
#include <string>

namespace afg {

/// Process exit codes of afg-plan
constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID_INPUT = 1;
constexpr int EXIT_WRITE_FAILURE = 2;

/**
 * @brief Command line interface for parsing arguments and configuring the planner
 *
 * Values are layered: built-in defaults, then --config, then individual
 * options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a mission should be generated; false when the run is
     *         over (help, --version, --create-config or a usage error), in
     *         which case exit_code() holds the process status
     * @throws InvalidParameterError for malformed option values
     */
    bool parse_arguments(int argc, char* argv[]);

    const MissionConfig& get_config() const { return config_; }
    const RunSettings& get_settings() const { return settings_; }
    bool is_dry_run() const { return settings_.dry_run; }
    int log_level() const { return log_level_; }
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

private:
    MissionConfig config_;
    RunSettings settings_;
    int log_level_ = 3;
    std::optional<std::string> log_file_;
    int exit_code_ = EXIT_OK;
    ConfigurationManager config_manager_;

    void configure_logging(const SimpleCommandLineParser& parser);
    void parse_all_options(const SimpleCommandLineParser& parser);

    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);
};

} // namespace afg
