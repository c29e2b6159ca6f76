/**
 * StageConfigLoader.h - JSON configuration for the stage and the simulator
 *
 * Example document:
 *   {
 *     "steps_per_mm": 6400,
 *     "expected_lengths_mm": [1000, 750],
 *     "keepout_zones_mm": [[20, 30], null],
 *     "end_buffer_mm": 5,
 *     "allowed_length_deviation_mm": 5,
 *     "variant": "standard",
 *     "otter_safe_x_mm": 550,
 *     "poll_interval_ms": 100,
 *     "settle_interval_ms": 250,
 *     "log_level": "info",
 *     "log_file": "stage.log",
 *     "simulator": { "axes_mask": 3, "lengths_mm": [1000, 750] }
 *   }
 *
 * Missing keys keep their compile-time defaults (Config.h). Every parse
 * ends with the matching Validators check.
 */

#pragma once

#include <string>

#include "core/Types.h"
#include "core/UtilityEngine.h"

struct LoggingConfig {
    LogLevel level;
    std::string filePath;   // Empty = console only

    LoggingConfig() :
        level(LogLevel::LOG_INFO) {}
};

namespace StageConfigLoader {

/**
 * Parse stage configuration
 * @param errorMsg Output: Error message if parsing or validation fails
 * @return false on malformed JSON, wrong value types, or invalid values
 */
bool parse(const std::string& json, StageConfig& config, std::string& errorMsg);

/**
 * Parse the "simulator" section (plus the top-level steps_per_mm)
 */
bool parseSimulator(const std::string& json, SimulatedStageConfig& config, std::string& errorMsg);

/**
 * Parse "log_level" and "log_file"
 */
bool parseLogging(const std::string& json, LoggingConfig& config, std::string& errorMsg);

/**
 * Apply logging configuration to the global engine
 * @return false if the log file could not be opened
 */
bool applyLogging(const LoggingConfig& config, std::string& errorMsg);

/**
 * Read a whole file into a string
 */
bool readFile(const std::string& path, std::string& contents, std::string& errorMsg);

} // namespace StageConfigLoader
