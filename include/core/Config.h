// ============================================================================
// CONFIG.H - Compile-time defaults for the stage controller
// ============================================================================
// Mechanics: uStepperS drivers, 200 steps/rev, 256 microsteps, 8mm lead screw
//   → 200 * 256 / 8 = 6400 microsteps per mm
// Every value here is a DEFAULT: StageConfig (Types.h) carries the runtime
// copy and StageConfigLoader can override it from JSON.
// ============================================================================

#pragma once

#include <cstddef>

// ============================================================================
// MECHANICS
// ============================================================================
constexpr int MOTOR_STEPS_PER_REV = 200;        // Full steps per revolution
constexpr int MICRO_STEPPING = 256;             // Microsteps per full step
constexpr double SCREW_PITCH_MM = 8.0;          // Lead screw travel per revolution
constexpr double DEFAULT_STEPS_PER_MM =
    static_cast<double>(MOTOR_STEPS_PER_REV * MICRO_STEPPING) / SCREW_PITCH_MM;

// ============================================================================
// AXES
// ============================================================================
constexpr int MAX_AXES = 3;                     // Controller box has 3 driver slots
constexpr int ALL_AXES = -1;                    // Axis argument meaning "every discovered axis"

// ============================================================================
// SAFETY MARGINS
// ============================================================================
constexpr double ALLOWED_LENGTH_DEVIATION_MM = 5.0;  // Measured vs expected axis length
constexpr double END_BUFFER_MM = 5.0;                // No goto within this of either end
constexpr double OTTER_SAFE_X_MM = 550.0;            // Axis 1 position that clears axis 2 homing

// ============================================================================
// TIMING (milliseconds)
// ============================================================================
constexpr unsigned long WAIT_POLL_INTERVAL_MS = 100;     // Home/jog completion polling
constexpr unsigned long SETTLE_CHECK_INTERVAL_MS = 250;  // Goto stop detection polling
constexpr unsigned long HOME_TIMEOUT_MS = 130000;
constexpr unsigned long OTTER_HOME_TIMEOUT_MS = 250000;
constexpr unsigned long JOG_TIMEOUT_MS = 80000;
constexpr unsigned long WAIT_TIMEOUT_MS = 80000;
constexpr unsigned long MOTION_TIMEOUT_MS = 80000;

// ============================================================================
// SELF-TEST
// ============================================================================
constexpr double SELFTEST_MOVE_MM = 20.0;       // Relative move distance (forward then back)

// ============================================================================
// SIMULATOR
// ============================================================================
constexpr double SIM_DEFAULT_LENGTH_MM = 500.0;     // Axis length when none is configured
constexpr double SIM_DEFAULT_SPEED_MM = 50.0;       // Travel per query
constexpr unsigned SIM_DEFAULT_HOMING_QUERIES = 3;  // Queries until homing completes
constexpr size_t SIM_COMMAND_LOG_SIZE = 4096;       // Commands kept for inspection

// ============================================================================
// LOGGING
// ============================================================================
constexpr size_t LOG_HISTORY_SIZE = 200;        // Entries kept in memory
constexpr size_t LOG_FILE_BUFFER_LINES = 16;    // Lines buffered before a file flush
