// ============================================================================
// VALIDATORS.H - Configuration validation
// ============================================================================
// Pure checks on loaded configuration. Each returns true when valid and
// fills errorMsg with the first problem found otherwise.
// ============================================================================

#pragma once

#include <string>

#include "core/Types.h"

namespace Validators {

/**
 * Check every field of a stage configuration
 * @param errorMsg Output: Error message if validation fails
 */
bool validateStageConfig(const StageConfig& config, std::string& errorMsg);

/**
 * Check a simulator configuration
 * @param errorMsg Output: Error message if validation fails
 */
bool validateSimulatorConfig(const SimulatedStageConfig& config, std::string& errorMsg);

/** Finite and strictly positive */
bool isPositive(double value);

/** Finite and >= 0 */
bool isNonNegative(double value);

} // namespace Validators
