/**
 * @file Logger.hpp
 * @brief Facility-scoped logging with verbosity control
 *
 * Each component owns a Logger named after itself ("TerrainService",
 * "MissionAssembler", ...). A line is printed when its level is at or below
 * the facility's level, or the process default when the facility has none.
 * Lines go to stdout and, when configured, to a shared log file.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace afg {

/**
 * @brief Verbosity levels, 0 silences everything
 *
 * WARNING marks a degraded plan (terrain fallback, truncated survey).
 * DETAILED traces codepaths, DEBUG covers requests and cache hits,
 * TRACE dumps values.
 */
enum class LogLevel {
    SILENT = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* log_level_tag(LogLevel level);

class Logger {
public:
    explicit Logger(std::string facility);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Print a message that passes this facility's level
     *
     * Identical consecutive messages are counted and reported once as
     * "The previous message occurred N times."
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }
    void trace(const std::string& message) const { outputMessage(LogLevel::TRACE, message); }

    void flush() const;

    bool enabled(LogLevel level) const;

    static void setDefaultLevel(LogLevel level);
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Level for a facility, or the default when none was set
     */
    static LogLevel levelFor(const std::string& facility);

    /**
     * @brief Apply a level string such as "5", "TerrainService=6" or "3,TerrainService=6"
     *
     * "default=N" is the same as "N". Levels outside [0, 6] are clamped.
     *
     * @return false if any token could not be parsed (the valid ones still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Forget per-facility levels and restore the INFO default
     */
    static void resetLevels();

    /**
     * @brief Append every logged line to a file as well, nullopt to stop
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

private:
    std::string facility_;
    mutable std::mutex output_mutex_;

    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;
    mutable bool has_last_message_ = false;

    void emitRepeatSummary() const;
    void writeLine(LogLevel level, const std::string& message) const;
};

} // namespace afg
