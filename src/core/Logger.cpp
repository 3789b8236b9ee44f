/**
 * @file Logger.cpp
 * @brief Facility-scoped logging implementation
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>

namespace afg {

namespace {

// Shared by every Logger instance
struct Registry {
    std::mutex mutex;
    std::unordered_map<std::string, LogLevel> facility_levels;
    LogLevel default_level = LogLevel::INFO;
    std::unique_ptr<std::ofstream> log_file;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(" \t\n\r") - first + 1);
}

std::string clock_stamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
    return buffer;
}

std::unique_ptr<std::ofstream> open_log_file(const std::string& path) {
    std::error_code ec;
    const std::filesystem::path file(path);
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
    }
    auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        // The sink itself failed, so this cannot go through a Logger
        std::cerr << "Warning: Failed to open log file: " << path << std::endl;
        return nullptr;
    }
    return stream;
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::SILENT:   return "SILENT";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?";
}

Logger::Logger(std::string facility) : facility_(std::move(facility)) {}

Logger::~Logger() {
    flush();
}

bool Logger::enabled(LogLevel level) const {
    return level != LogLevel::SILENT &&
           static_cast<int>(level) <= static_cast<int>(levelFor(facility_));
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && level == last_level_ && message == last_message_) {
        ++repeat_count_;
        return;
    }

    emitRepeatSummary();
    writeLine(level, message);

    last_message_ = message;
    last_level_ = level;
    has_last_message_ = true;
}

void Logger::flush() const {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        emitRepeatSummary();
    }
    std::cout.flush();

    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (reg.log_file) {
        reg.log_file->flush();
    }
}

void Logger::emitRepeatSummary() const {
    if (repeat_count_ == 0) {
        return;
    }
    writeLine(last_level_, "The previous message occurred " +
              std::to_string(repeat_count_ + 1) + " times.");
    repeat_count_ = 0;
}

void Logger::writeLine(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    line << "[" << clock_stamp() << "] " << log_level_tag(level) << " " << facility_ << ": " << message;

    std::cout << line.str() << std::endl;

    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (reg.log_file) {
        *reg.log_file << line.str() << '\n';
    }
}

void Logger::setDefaultLevel(LogLevel level) {
    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.default_level = level;
}

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.facility_levels[facility] = level;
}

LogLevel Logger::levelFor(const std::string& facility) {
    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    auto it = reg.facility_levels.find(facility);
    return it != reg.facility_levels.end() ? it->second : reg.default_level;
}

bool Logger::parseLogConfig(const std::string& config) {
    bool all_valid = true;
    std::istringstream tokens(config);
    std::string token;

    while (std::getline(tokens, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility = "default";
        std::string level_text = token;
        if (const size_t eq = token.find('='); eq != std::string::npos) {
            facility = trim(token.substr(0, eq));
            level_text = trim(token.substr(eq + 1));
        }

        int number = 0;
        size_t consumed = 0;
        try {
            number = std::stoi(level_text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != level_text.size()) {
            std::cerr << "Warning: Invalid log level '" << level_text
                      << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        const LogLevel level = static_cast<LogLevel>(std::clamp(number, 0, 6));
        if (facility == "default") {
            setDefaultLevel(level);
        } else {
            setFacilityLevel(facility, level);
        }
    }
    return all_valid;
}

void Logger::resetLevels() {
    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.facility_levels.clear();
    reg.default_level = LogLevel::INFO;
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::unique_ptr<std::ofstream> stream;
    if (log_file) {
        stream = open_log_file(*log_file);
    }

    Registry& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (reg.log_file) {
        reg.log_file->flush();
    }
    reg.log_file = std::move(stream);
}

} // namespace afg
