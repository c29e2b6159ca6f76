// ============================================================================
// VALIDATORS - Implementation
// ============================================================================

#include "core/Validators.h"

#include <cmath>

#include "core/TextUtils.h"

namespace Validators {

bool isPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool isNonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

bool validateStageConfig(const StageConfig& config, std::string& errorMsg) {
    if (!isPositive(config.stepsPerMM)) {
        errorMsg = "steps_per_mm must be > 0 (got " + TextUtils::fixed(config.stepsPerMM, 3) + ")";
        return false;
    }

    if (config.expectedLengthsMM.size() > static_cast<size_t>(MAX_AXES)) {
        errorMsg = "at most " + std::to_string(MAX_AXES) + " expected lengths allowed";
        return false;
    }
    for (size_t i = 0; i < config.expectedLengthsMM.size(); i++) {
        if (!isPositive(config.expectedLengthsMM[i])) {
            errorMsg = "expected length of axis " + std::to_string(i + 1) + " must be > 0";
            return false;
        }
    }

    if (config.keepoutZones.size() > static_cast<size_t>(MAX_AXES)) {
        errorMsg = "at most " + std::to_string(MAX_AXES) + " keepout zones allowed";
        return false;
    }
    for (size_t i = 0; i < config.keepoutZones.size(); i++) {
        const KeepoutZone& zone = config.keepoutZones[i];
        if (zone.isEmpty()) continue;
        if (!isNonNegative(zone.minMM) || !isNonNegative(zone.maxMM) || zone.minMM > zone.maxMM) {
            errorMsg = "keepout zone of axis " + std::to_string(i + 1) + " is not a valid interval";
            return false;
        }
    }

    if (!isNonNegative(config.endBufferMM)) {
        errorMsg = "end_buffer_mm must be >= 0";
        return false;
    }
    if (!isNonNegative(config.allowedLengthDeviationMM)) {
        errorMsg = "allowed_length_deviation_mm must be >= 0";
        return false;
    }
    if (config.variant == StageVariant::STAGE_OTTER) {
        if (!isPositive(config.otterSafeXMM)) {
            errorMsg = "otter_safe_x_mm must be > 0";
            return false;
        }
        if (config.expectedLengthsMM.size() < 2) {
            errorMsg = "otter stage needs expected lengths for axes 1 and 2";
            return false;
        }
    }

    // Poll / settle intervals of 0 are valid (busy polling, used in tests)
    return true;
}

bool validateSimulatorConfig(const SimulatedStageConfig& config, std::string& errorMsg) {
    if (config.axesMask < 0 || config.axesMask >= (1L << MAX_AXES)) {
        errorMsg = "simulator axes_mask must be in [0, " + std::to_string((1L << MAX_AXES) - 1) + "]";
        return false;
    }
    for (size_t i = 0; i < config.lengthsMM.size(); i++) {
        if (!isPositive(config.lengthsMM[i])) {
            errorMsg = "simulator length " + std::to_string(i + 1) + " must be > 0";
            return false;
        }
    }
    if (!isPositive(config.stepsPerMM)) {
        errorMsg = "simulator steps_per_mm must be > 0";
        return false;
    }
    if (config.stepsPerQuery <= 0) {
        errorMsg = "simulator steps_per_query must be > 0";
        return false;
    }
    return true;
}

} // namespace Validators
